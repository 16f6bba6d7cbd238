/* ==============================================================================
 * Layer 0: Core Utility - C Intrinsics Mono to Stereo Mix (raw boundary)
 * ==============================================================================
 * C-linkage kernel compiled from mix_intrinsics.c as C99.
 *
 * NO CHECKS are performed on this side. The caller guarantees that:
 * - samples >= 0 and samples % 4 == 0
 * - src points to samples readable floats
 * - dst points to 2 * samples writable floats
 * - the two ranges do not overlap
 * Anything else is undefined behavior. C++ code should call
 * Autovec::DSP::mixMonoToStereoForeign() (mix_foreign.h) instead.
 * ============================================================================== */

#ifndef AUTOVEC_DSP_CORE_MIX_INTRINSICS_H
#define AUTOVEC_DSP_CORE_MIX_INTRINSICS_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

void autovec_mix_mono_to_stereo_intrinsics(int32_t samples, float* dst, const float* src,
                                           float gain_l, float gain_r);

#ifdef __cplusplus
}
#endif

#endif /* AUTOVEC_DSP_CORE_MIX_INTRINSICS_H */
