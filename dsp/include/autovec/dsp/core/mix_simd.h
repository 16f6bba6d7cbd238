// ==============================================================================
// Layer 0: Core Utility - SIMD Mono to Stereo Mix
// ==============================================================================
// Hand-vectorized mono -> interleaved stereo mix using Google Highway with a
// fixed 128-bit (4 x float) vector.
//
// The kernel is compiled for Highway's static target only. There is no
// runtime ISA dispatch: the build must target a CPU with 128-bit float
// vectors (SSE2 on x86-64, NEON on AArch64).
// ==============================================================================

#pragma once

#include <cstddef>
#include <span>

namespace Autovec::DSP {

/// @brief Mix mono into interleaved stereo, four source samples per step.
///
/// Per block of 4: broadcast gains, load 4 inputs, multiply by each gain,
/// interleave the two products low/high, store 8 outputs. Results are
/// bit-identical to mixMonoToStereoScalar().
///
/// @param src    Mono input, N floats, N a multiple of kMixVectorWidth
/// @param dst    Interleaved stereo output, exactly 2N floats (overwritten)
/// @param gainL  Left channel gain
/// @param gainR  Right channel gain
/// @throws MixPreconditionError if N % 4 != 0, dst.size() != 2N, or src and
///         dst overlap
/// @note No scalar tail. Remainders are rejected, not processed.
void mixMonoToStereoSimd(std::span<const float> src, std::span<float> dst,
                         float gainL, float gainR);

} // namespace Autovec::DSP
