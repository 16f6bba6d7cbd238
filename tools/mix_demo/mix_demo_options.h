// ==============================================================================
// Mix Demo - Command Line Options
// ==============================================================================
// Parses mix_demo's arguments into MixDemoOptions. Parsing never throws and
// never prints; errors come back as a message for main() to report.
// ==============================================================================

#pragma once

#include <autovec/dsp/primitives/mix_kernel.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace MixDemo {

inline constexpr std::size_t kDefaultSamples = 100000;
inline constexpr int kDefaultIterations = 100;

/// Upper bound for --samples. Source, destination and reference buffers
/// together take 320 MiB at this size.
inline constexpr std::size_t kMaxSamples = std::size_t{1} << 24;

struct MixDemoOptions {
    std::optional<Autovec::DSP::MixKernel> kernel;  ///< nullopt runs every kernel
    std::size_t samples = kDefaultSamples;          ///< Mono samples per call
    float gainL = 1.0f;
    float gainR = 1.0f;
    int iterations = kDefaultIterations;            ///< Timed calls per kernel
    bool verify = false;                            ///< Compare against scalar output
    bool showHelp = false;
};

struct ParseResult {
    std::optional<MixDemoOptions> options;  ///< Set on success
    std::string error;                      ///< Set on failure

    explicit operator bool() const { return options.has_value(); }
};

/// @brief Parse arguments (program name excluded).
[[nodiscard]] ParseResult parseMixDemoOptions(std::span<const std::string_view> args);

/// @brief Parse argc/argv as passed to main().
[[nodiscard]] ParseResult parseMixDemoOptions(int argc, const char* const* argv);

[[nodiscard]] std::string usageText();

} // namespace MixDemo
