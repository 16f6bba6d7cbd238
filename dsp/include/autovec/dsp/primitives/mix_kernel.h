// ==============================================================================
// Layer 1: DSP Primitive - Mix Kernel Selection
// ==============================================================================
// Names the five mono -> stereo entry points so tools and benchmarks can pick
// one at runtime and drive it over flat float buffers.
// ==============================================================================

#pragma once

#include <autovec/dsp/core/mix_foreign.h>
#include <autovec/dsp/core/mix_simd.h>
#include <autovec/dsp/core/sample_types.h>
#include <autovec/dsp/primitives/mono_to_stereo.h>

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace Autovec::DSP {

enum class MixKernel : uint8_t {
    Scalar = 0,   ///< mixMonoToStereoScalar
    Bounded,      ///< mixMonoToStereoBounded
    Structured,   ///< mixMonoToStereo over MonoSample/StereoSample views
    Simd,         ///< mixMonoToStereoSimd (Highway)
    Foreign       ///< mixMonoToStereoForeign (C intrinsics)
};

inline constexpr std::array<MixKernel, 5> kAllMixKernels = {
    MixKernel::Scalar, MixKernel::Bounded, MixKernel::Structured,
    MixKernel::Simd, MixKernel::Foreign};

[[nodiscard]] constexpr std::string_view mixKernelName(MixKernel kernel) noexcept {
    switch (kernel) {
        case MixKernel::Scalar:     return "scalar";
        case MixKernel::Bounded:    return "bounded";
        case MixKernel::Structured: return "structured";
        case MixKernel::Simd:       return "simd";
        case MixKernel::Foreign:    return "foreign";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<MixKernel> parseMixKernel(std::string_view name) noexcept {
    for (const auto kernel : kAllMixKernels) {
        if (mixKernelName(kernel) == name) {
            return kernel;
        }
    }
    return std::nullopt;
}

/// @brief True for kernels that reject sources not divisible by kMixVectorWidth.
[[nodiscard]] constexpr bool requiresVectorBlocks(MixKernel kernel) noexcept {
    return kernel == MixKernel::Simd || kernel == MixKernel::Foreign;
}

/// @brief Run one kernel over a flat source and interleaved destination.
///
/// The structured kernel sees src/dst through asMonoSamples/asStereoSamples,
/// so every kernel is driven with the same buffers. The flat-buffer rule
/// dst.size() == 2 * src.size() holds for all of them, including the
/// structured kernel, which on its own would accept a longer destination.
///
/// @throws MixPreconditionError on any buffer-shape violation of the kernel
inline void runMixKernel(MixKernel kernel, std::span<const float> src, std::span<float> dst,
                         float gainL, float gainR) {
    switch (kernel) {
        case MixKernel::Scalar:
            mixMonoToStereoScalar(src, dst, gainL, gainR);
            break;
        case MixKernel::Bounded:
            mixMonoToStereoBounded(src, dst, gainL, gainR);
            break;
        case MixKernel::Structured:
            requireInterleavedSize("runMixKernel", src.size(), dst.size());
            mixMonoToStereo(asMonoSamples(src), asStereoSamples(dst), gainL, gainR);
            break;
        case MixKernel::Simd:
            mixMonoToStereoSimd(src, dst, gainL, gainR);
            break;
        case MixKernel::Foreign:
            mixMonoToStereoForeign(src, dst, gainL, gainR);
            break;
    }
}

} // namespace Autovec::DSP
