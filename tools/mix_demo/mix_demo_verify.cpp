// ==============================================================================
// Mix Demo - Output Verification
// ==============================================================================

#include "mix_demo_verify.h"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>

namespace MixDemo {

namespace {
constexpr std::uint32_t kUnwrittenBits = 0x7fc0deadu;
} // namespace

void resetDestination(std::span<float> dst) noexcept {
    std::fill(dst.begin(), dst.end(), std::bit_cast<float>(kUnwrittenBits));
}

long long firstMismatch(std::span<const float> expected, std::span<const float> actual) noexcept {
    if (expected.size() != actual.size()) {
        return static_cast<long long>(std::min(expected.size(), actual.size()));
    }
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (std::bit_cast<std::uint32_t>(expected[i]) != std::bit_cast<std::uint32_t>(actual[i])) {
            return static_cast<long long>(i);
        }
    }
    return -1;
}

} // namespace MixDemo
