// ==============================================================================
// Layer 0: Core Utility - Foreign Mono to Stereo Mix (checked wrapper)
// ==============================================================================

#include <autovec/dsp/core/mix_contract.h>
#include <autovec/dsp/core/mix_foreign.h>

#include "mix_intrinsics.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace Autovec::DSP {

void mixMonoToStereoForeign(std::span<const float> src, std::span<float> dst,
                            float gainL, float gainR) {
    constexpr const char* kEntryPoint = "mixMonoToStereoForeign";

    requireVectorBlocks(kEntryPoint, src.size());
    requireInterleavedSize(kEntryPoint, src.size(), dst.size());

    if (src.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        throw MixPreconditionError(std::string(kEntryPoint) + ": source length " +
                                   std::to_string(src.size()) + " exceeds int32_t range");
    }

    requireDisjoint(kEntryPoint, src, dst);

    if (src.empty()) {
        return;
    }

    autovec_mix_mono_to_stereo_intrinsics(static_cast<std::int32_t>(src.size()),
                                          dst.data(), src.data(), gainL, gainR);
}

} // namespace Autovec::DSP
