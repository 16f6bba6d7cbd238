// ==============================================================================
// Layer 1: DSP Primitive - Mono to Stereo Mix
// ==============================================================================
// Scalar mono -> interleaved stereo mixing with independent left/right gains.
//
//   dst[2i]     = src[i] * gainL
//   dst[2i + 1] = src[i] * gainR
//
// Three loop shapes over the same arithmetic:
// - mixMonoToStereoScalar():  plain indexed loop over flat floats. Reference
//                             output for every other mixer.
// - mixMonoToStereoBounded(): same, with the destination sliced to its exact
//                             extent before the loop.
// - mixMonoToStereo():        loop over MonoSample/StereoSample. One load,
//                             two stores to adjacent fields per iteration,
//                             which compilers vectorize reliably. Preferred
//                             default when no hand-written SIMD is wanted.
//
// Explicit SIMD versions live in core/mix_simd.h and core/mix_foreign.h.
//
// Constitution Compliance:
// - Principle II:  Real-Time Safety (no allocations; throws only on misuse)
// - Principle III: Modern C++ (C++20, std::span)
// - Principle IX:  Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <autovec/dsp/core/mix_contract.h>
#include <autovec/dsp/core/sample_types.h>

#include <cstddef>
#include <span>

namespace Autovec::DSP {

/// @brief Mix mono into interleaved stereo with a plain indexed loop.
///
/// @param src    Mono input, N floats
/// @param dst    Interleaved stereo output, exactly 2N floats (overwritten)
/// @param gainL  Left channel gain (not clamped)
/// @param gainR  Right channel gain (not clamped)
/// @throws MixPreconditionError if dst.size() != 2 * src.size()
inline void mixMonoToStereoScalar(std::span<const float> src, std::span<float> dst,
                                  float gainL, float gainR) {
    requireInterleavedSize("mixMonoToStereoScalar", src.size(), dst.size());

    for (std::size_t i = 0; i < src.size(); ++i) {
        dst[i * 2 + 0] = src[i] * gainL;
        dst[i * 2 + 1] = src[i] * gainR;
    }
}

/// @brief Mix mono into interleaved stereo over a pre-sliced destination.
///
/// Same contract as mixMonoToStereoScalar(). The loop runs over
/// dst.first(2 * src.size()) so its trip count and the destination extent
/// are tied together. The stride-2 store pattern still tends to defeat
/// auto-vectorization.
///
/// @throws MixPreconditionError if dst.size() != 2 * src.size()
inline void mixMonoToStereoBounded(std::span<const float> src, std::span<float> dst,
                                   float gainL, float gainR) {
    requireInterleavedSize("mixMonoToStereoBounded", src.size(), dst.size());

    const auto bounded = dst.first(src.size() * 2);
    for (std::size_t i = 0; i < src.size(); ++i) {
        bounded[i * 2 + 0] = src[i] * gainL;
        bounded[i * 2 + 1] = src[i] * gainR;
    }
}

/// @brief Mix mono samples into stereo samples.
///
/// Writes the first src.size() elements of dst. Elements past that are left
/// untouched, so dst may be larger than src.
///
/// @param src    Mono input, N samples
/// @param dst    Stereo output, at least N samples
/// @param gainL  Left channel gain (not clamped)
/// @param gainR  Right channel gain (not clamped)
/// @throws MixPreconditionError if dst.size() < src.size()
///
/// @par Example
/// @code
/// std::array<MonoSample, 2> in{{{1.0f}, {2.0f}}};
/// std::array<StereoSample, 2> out{};
/// mixMonoToStereo(in, out, 0.5f, 2.0f);
/// // out = {{0.5, 2.0}, {1.0, 4.0}}
/// @endcode
inline void mixMonoToStereo(std::span<const MonoSample> src, std::span<StereoSample> dst,
                            float gainL, float gainR) {
    requireDestinationCapacity("mixMonoToStereo", src.size(), dst.size());

    const auto bounded = dst.first(src.size());
    for (std::size_t i = 0; i < src.size(); ++i) {
        bounded[i].left = src[i].value * gainL;
        bounded[i].right = src[i].value * gainR;
    }
}

} // namespace Autovec::DSP
