// ==============================================================================
// Mix Demo - Output Verification
// ==============================================================================
// Bitwise comparison of a kernel's destination against the scalar reference.
// The destination is reset to a sentinel before each kernel runs, so a kernel
// that writes nothing cannot pass on output left behind by the previous one.
// ==============================================================================

#pragma once

#include <span>

namespace MixDemo {

/// @brief Overwrite every element with the unwritten-output sentinel.
///
/// The sentinel is a quiet NaN with a payload that no product of finite
/// inputs produces.
void resetDestination(std::span<float> dst) noexcept;

/// @brief Index of the first bitwise difference, or -1 if the buffers match.
[[nodiscard]] long long firstMismatch(std::span<const float> expected,
                                      std::span<const float> actual) noexcept;

} // namespace MixDemo
