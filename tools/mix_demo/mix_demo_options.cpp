// ==============================================================================
// Mix Demo - Command Line Options
// ==============================================================================

#include "mix_demo_options.h"

#include <charconv>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace MixDemo {

using Autovec::DSP::kMixVectorWidth;
using Autovec::DSP::parseMixKernel;
using Autovec::DSP::requiresVectorBlocks;

namespace {

template <typename T>
bool parseNumber(std::string_view text, T& out) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

ParseResult fail(std::string message) {
    ParseResult result;
    result.error = std::move(message);
    return result;
}

} // namespace

ParseResult parseMixDemoOptions(std::span<const std::string_view> args) {
    MixDemoOptions options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
            continue;
        }
        if (arg == "--verify") {
            options.verify = true;
            continue;
        }

        // Remaining options all take a value
        if (arg != "--kernel" && arg != "--samples" && arg != "--gain-l" &&
            arg != "--gain-r" && arg != "--iterations") {
            return fail("unknown option '" + std::string(arg) + "'");
        }
        if (i + 1 >= args.size()) {
            return fail("option '" + std::string(arg) + "' needs a value");
        }
        const std::string_view value = args[++i];

        if (arg == "--kernel") {
            if (value == "all") {
                options.kernel.reset();
            } else if (const auto kernel = parseMixKernel(value)) {
                options.kernel = *kernel;
            } else {
                return fail("unknown kernel '" + std::string(value) + "'");
            }
        } else if (arg == "--samples") {
            if (!parseNumber(value, options.samples) || options.samples == 0) {
                return fail("--samples expects a positive integer, got '" + std::string(value) + "'");
            }
            if (options.samples > kMaxSamples) {
                return fail("--samples must not exceed " + std::to_string(kMaxSamples) +
                            ", got '" + std::string(value) + "'");
            }
        } else if (arg == "--gain-l") {
            if (!parseNumber(value, options.gainL)) {
                return fail("--gain-l expects a number, got '" + std::string(value) + "'");
            }
        } else if (arg == "--gain-r") {
            if (!parseNumber(value, options.gainR)) {
                return fail("--gain-r expects a number, got '" + std::string(value) + "'");
            }
        } else if (arg == "--iterations") {
            if (!parseNumber(value, options.iterations) || options.iterations <= 0) {
                return fail("--iterations expects a positive integer, got '" + std::string(value) + "'");
            }
        }
    }

    if (options.kernel && requiresVectorBlocks(*options.kernel) &&
        options.samples % kMixVectorWidth != 0) {
        return fail("kernel '" + std::string(Autovec::DSP::mixKernelName(*options.kernel)) +
                    "' needs --samples divisible by " + std::to_string(kMixVectorWidth));
    }

    ParseResult result;
    result.options = options;
    return result;
}

ParseResult parseMixDemoOptions(int argc, const char* const* argv) {
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseMixDemoOptions(args);
}

std::string usageText() {
    return "Usage: mix_demo [options]\n"
           "  --kernel NAME      scalar|bounded|structured|simd|foreign|all (default: all)\n"
           "  --samples N        mono samples per call (default: 100000)\n"
           "  --gain-l G         left gain (default: 1.0)\n"
           "  --gain-r G         right gain (default: 1.0)\n"
           "  --iterations K     timed calls per kernel (default: 100)\n"
           "  --verify           compare each kernel bit-for-bit with the scalar mixer\n"
           "  -h, --help         show this help\n";
}

} // namespace MixDemo
