// ==============================================================================
// Layer 0: Core Utility - Mix Contract
// ==============================================================================
// Buffer-shape preconditions shared by every mono-to-stereo entry point, and
// the error type they raise.
//
// A violated precondition is a programming error. Entry points check before
// touching the destination and throw, so no partial output is ever produced.
// Kernels behind the checks are noexcept and assume the checks passed.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace Autovec::DSP {

/// @brief Mono samples consumed per 128-bit vector operation (4 x float32).
inline constexpr std::size_t kMixVectorWidth = 4;

/// @brief Thrown when a mixer is called with incompatibly shaped buffers.
class MixPreconditionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// @brief Require an interleaved destination of exactly twice the source length.
/// @throws MixPreconditionError otherwise
inline void requireInterleavedSize(const char* entryPoint,
                                   std::size_t srcSize, std::size_t dstSize) {
    // Written as a division so a huge srcSize cannot wrap 2 * srcSize.
    if (dstSize % 2 != 0 || dstSize / 2 != srcSize) {
        throw MixPreconditionError(
            std::string(entryPoint) + ": destination length " + std::to_string(dstSize) +
            " must be exactly twice the source length " + std::to_string(srcSize));
    }
}

/// @brief Require a structured destination with room for every source sample.
/// @throws MixPreconditionError otherwise
inline void requireDestinationCapacity(const char* entryPoint,
                                       std::size_t srcSize, std::size_t dstSize) {
    if (dstSize < srcSize) {
        throw MixPreconditionError(
            std::string(entryPoint) + ": destination holds " + std::to_string(dstSize) +
            " stereo samples, source has " + std::to_string(srcSize));
    }
}

/// @brief Require the source to split into whole vector blocks.
/// @throws MixPreconditionError otherwise
inline void requireVectorBlocks(const char* entryPoint, std::size_t srcSize) {
    if (srcSize % kMixVectorWidth != 0) {
        throw MixPreconditionError(
            std::string(entryPoint) + ": source length " + std::to_string(srcSize) +
            " is not a multiple of " + std::to_string(kMixVectorWidth));
    }
}

/// @brief Require the source and destination byte ranges not to overlap.
///
/// Needed by the vector kernels, which read and write through restrict
/// pointers. Empty ranges never overlap.
/// @throws MixPreconditionError otherwise
inline void requireDisjoint(const char* entryPoint,
                            std::span<const float> src, std::span<const float> dst) {
    if (src.empty() || dst.empty()) {
        return;
    }
    const auto srcBegin = reinterpret_cast<std::uintptr_t>(src.data());
    const auto srcEnd = srcBegin + src.size_bytes();
    const auto dstBegin = reinterpret_cast<std::uintptr_t>(dst.data());
    const auto dstEnd = dstBegin + dst.size_bytes();
    if (srcBegin < dstEnd && dstBegin < srcEnd) {
        throw MixPreconditionError(std::string(entryPoint) +
                                   ": source and destination overlap");
    }
}

} // namespace Autovec::DSP
