// ==============================================================================
// Layer 0: Core Utility - Foreign Mono to Stereo Mix (checked wrapper)
// ==============================================================================
// Safe C++ entry point for the C-linkage intrinsics kernel in
// mix_intrinsics.c. The kernel trusts its raw pointers completely; every
// precondition it relies on is checked in mix_foreign.cpp first, in the same
// call. Only mix_foreign.cpp includes the raw declaration (mix_intrinsics.h).
// ==============================================================================

#pragma once

#include <span>

namespace Autovec::DSP {

/// @brief Mix mono into interleaved stereo through the C intrinsics kernel.
///
/// @param src    Mono input, N floats, N a multiple of kMixVectorWidth
/// @param dst    Interleaved stereo output, exactly 2N floats (overwritten)
/// @param gainL  Left channel gain
/// @param gainR  Right channel gain
/// @throws MixPreconditionError if N % 4 != 0, dst.size() != 2N, N does not
///         fit the kernel's int32_t count, or src and dst overlap
void mixMonoToStereoForeign(std::span<const float> src, std::span<float> dst,
                            float gainL, float gainR);

} // namespace Autovec::DSP
