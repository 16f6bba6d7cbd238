// ==============================================================================
// Layer 0: Core Utility - SIMD Mono to Stereo Mix
// ==============================================================================
// Google Highway kernel, compiled once for HWY_STATIC_TARGET. This file does
// not use foreach_target.h: the mixer has no runtime dispatch, and
// HWY_STATIC_DISPATCH resolves to the baseline target chosen by the compiler
// flags.
// ==============================================================================

#include "hwy/highway.h"

#include <autovec/dsp/core/mix_contract.h>
#include <autovec/dsp/core/mix_simd.h>

#include <cstddef>

// =============================================================================
// SIMD Kernel (static target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Autovec {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// MixMonoToStereoImpl: src[] -> interleaved {L, R} dst[]
// -----------------------------------------------------------------------------
// numSamples must be a multiple of 4 and dst must hold 2 * numSamples floats.

// NOLINTNEXTLINE(misc-use-internal-linkage) called via HWY_STATIC_DISPATCH
void MixMonoToStereoImpl(const float* HWY_RESTRICT src, float* HWY_RESTRICT dst,
                         size_t numSamples, float gainL, float gainR) {
    // Always 128 bits, even if the target has wider vectors.
    const hn::FixedTag<float, 4> d;

    // mulL = | gainL | gainL | gainL | gainL |
    // mulR = | gainR | gainR | gainR | gainR |
    const auto mulL = hn::Set(d, gainL);
    const auto mulR = hn::Set(d, gainR);

    for (size_t i = 0; i < numSamples; i += 4) {
        // in = | src[i] | src[i+1] | src[i+2] | src[i+3] |
        const auto in = hn::LoadU(d, src + i);

        // outL = | src[i]*gainL | ... | src[i+3]*gainL |
        // outR = | src[i]*gainR | ... | src[i+3]*gainR |
        const auto outL = hn::Mul(in, mulL);
        const auto outR = hn::Mul(in, mulR);

        // outLo = | src[i]*gainL   | src[i]*gainR   | src[i+1]*gainL | src[i+1]*gainR |
        // outHi = | src[i+2]*gainL | src[i+2]*gainR | src[i+3]*gainL | src[i+3]*gainR |
        const auto outLo = hn::InterleaveLower(d, outL, outR);
        const auto outHi = hn::InterleaveUpper(d, outL, outR);

        hn::StoreU(outLo, d, dst + 2 * i + 0);
        hn::StoreU(outHi, d, dst + 2 * i + 4);
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Autovec

HWY_AFTER_NAMESPACE();

// =============================================================================
// Checked Entry Point
// =============================================================================

namespace Autovec::DSP {

void mixMonoToStereoSimd(std::span<const float> src, std::span<float> dst,
                         float gainL, float gainR) {
    requireVectorBlocks("mixMonoToStereoSimd", src.size());
    requireInterleavedSize("mixMonoToStereoSimd", src.size(), dst.size());
    requireDisjoint("mixMonoToStereoSimd", src, dst);

    HWY_STATIC_DISPATCH(MixMonoToStereoImpl)(src.data(), dst.data(), src.size(), gainL, gainR);
}

} // namespace Autovec::DSP
