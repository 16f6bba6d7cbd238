// ==============================================================================
// Layer 0: Core Utility - Sample Types
// ==============================================================================
// Typed mono and stereo sample values with a fixed, flat memory layout.
//
// A buffer of StereoSample is bit-for-bit an interleaved L,R,L,R... float
// buffer, and a buffer of MonoSample is a plain float buffer. The flat views
// below rely on that and the static_asserts at the bottom pin it down.
//
// The views reinterpret_cast between float and sample pointers. Strictly, no
// MonoSample/StereoSample objects live in float storage (and vice versa), so
// access through the other type is outside the C++ object model. They rely on
// the layout static_asserts and on every supported compiler/ABI treating a
// single-float or two-float standard-layout aggregate as its float members.
//
// Constitution Compliance:
// - Principle II:  Real-Time Safety (aggregates, no allocations)
// - Principle III: Modern C++ (C++20, defaulted comparisons)
// - Principle IX:  Layer 0 (no dependencies on other DSP layers)
// ==============================================================================

#pragma once

#include <autovec/dsp/core/mix_contract.h>

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace Autovec::DSP {

/// @brief One mono amplitude value.
///
/// Same size and alignment as a bare float. Exists so that a mono buffer
/// cannot be passed where a stereo buffer is expected.
struct MonoSample {
    float value = 0.0f;

    friend constexpr bool operator==(const MonoSample&, const MonoSample&) = default;
};

/// @brief One left/right amplitude pair.
///
/// Field order is part of the contract: left at offset 0, right at offset 4.
/// Audio output APIs and the vector kernels expect exactly this interleaving.
struct StereoSample {
    float left = 0.0f;   ///< Left channel sample
    float right = 0.0f;  ///< Right channel sample

    friend constexpr bool operator==(const StereoSample&, const StereoSample&) = default;
};

static_assert(std::is_standard_layout_v<MonoSample>);
static_assert(std::is_trivially_copyable_v<MonoSample>);
static_assert(sizeof(MonoSample) == sizeof(float));
static_assert(alignof(MonoSample) == alignof(float));

static_assert(std::is_standard_layout_v<StereoSample>);
static_assert(std::is_trivially_copyable_v<StereoSample>);
static_assert(sizeof(StereoSample) == 2 * sizeof(float), "StereoSample must not be padded");
static_assert(alignof(StereoSample) == alignof(float));
static_assert(offsetof(StereoSample, left) == 0);
static_assert(offsetof(StereoSample, right) == sizeof(float));

// =============================================================================
// Flat Views
// =============================================================================

/// @brief View a mono sample buffer as plain floats (same element count).
[[nodiscard]] inline std::span<const float> asFloats(std::span<const MonoSample> samples) noexcept {
    return {reinterpret_cast<const float*>(samples.data()), samples.size()};
}

/// @brief View a stereo sample buffer as interleaved floats (2x element count).
[[nodiscard]] inline std::span<float> asFloats(std::span<StereoSample> samples) noexcept {
    return {reinterpret_cast<float*>(samples.data()), samples.size() * 2};
}

[[nodiscard]] inline std::span<const float> asFloats(std::span<const StereoSample> samples) noexcept {
    return {reinterpret_cast<const float*>(samples.data()), samples.size() * 2};
}

/// @brief View a plain float buffer as mono samples (same element count).
/// @note Layout-punned view; see the file header.
[[nodiscard]] inline std::span<const MonoSample> asMonoSamples(std::span<const float> samples) noexcept {
    return {reinterpret_cast<const MonoSample*>(samples.data()), samples.size()};
}

/// @brief View an interleaved float buffer as stereo samples.
/// @note Layout-punned view; see the file header.
/// @throws MixPreconditionError if the float count is odd
[[nodiscard]] inline std::span<StereoSample> asStereoSamples(std::span<float> interleaved) {
    if (interleaved.size() % 2 != 0) {
        throw MixPreconditionError(
            "asStereoSamples: interleaved buffer has odd length " +
            std::to_string(interleaved.size()));
    }
    return {reinterpret_cast<StereoSample*>(interleaved.data()), interleaved.size() / 2};
}

} // namespace Autovec::DSP
