// ==============================================================================
// Mix Demo Tests - Command Line Options
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "mix_demo_options.h"

#include <string>
#include <string_view>
#include <vector>

using namespace MixDemo;
using Autovec::DSP::MixKernel;

namespace {

ParseResult parse(std::vector<std::string_view> args) {
    return parseMixDemoOptions(args);
}

} // namespace

TEST_CASE("No arguments gives the defaults", "[mix_demo][options]") {
    const auto result = parse({});

    REQUIRE(result.options.has_value());
    const auto& options = *result.options;
    REQUIRE_FALSE(options.kernel.has_value());
    REQUIRE(options.samples == kDefaultSamples);
    REQUIRE(options.gainL == 1.0f);
    REQUIRE(options.gainR == 1.0f);
    REQUIRE(options.iterations == kDefaultIterations);
    REQUIRE_FALSE(options.verify);
    REQUIRE_FALSE(options.showHelp);
}

TEST_CASE("Every option is parsed", "[mix_demo][options]") {
    const auto result = parse({"--kernel", "simd", "--samples", "64", "--gain-l", "0.25",
                               "--gain-r", "-2", "--iterations", "7", "--verify"});

    REQUIRE(result.options.has_value());
    const auto& options = *result.options;
    REQUIRE(options.kernel == MixKernel::Simd);
    REQUIRE(options.samples == 64);
    REQUIRE(options.gainL == 0.25f);
    REQUIRE(options.gainR == -2.0f);
    REQUIRE(options.iterations == 7);
    REQUIRE(options.verify);
}

TEST_CASE("Kernel 'all' clears a previous selection", "[mix_demo][options]") {
    const auto result = parse({"--kernel", "foreign", "--kernel", "all"});

    REQUIRE(result.options.has_value());
    REQUIRE_FALSE(result.options->kernel.has_value());
}

TEST_CASE("Help flag is recognized", "[mix_demo][options]") {
    REQUIRE(parse({"--help"}).options->showHelp);
    REQUIRE(parse({"-h"}).options->showHelp);
    REQUIRE_FALSE(usageText().empty());
}

TEST_CASE("Bad arguments are reported, not thrown", "[mix_demo][options][edge]") {
    SECTION("unknown option") {
        const auto result = parse({"--fast"});
        REQUIRE_FALSE(result.options.has_value());
        REQUIRE(result.error.find("--fast") != std::string::npos);
    }

    SECTION("missing value") {
        const auto result = parse({"--samples"});
        REQUIRE_FALSE(result.options.has_value());
        REQUIRE(result.error.find("needs a value") != std::string::npos);
    }

    SECTION("unknown kernel") {
        REQUIRE_FALSE(parse({"--kernel", "avx512"}).options.has_value());
    }

    SECTION("non-numeric and out-of-range numbers") {
        REQUIRE_FALSE(parse({"--samples", "lots"}).options.has_value());
        REQUIRE_FALSE(parse({"--samples", "0"}).options.has_value());
        REQUIRE_FALSE(parse({"--samples", "-8"}).options.has_value());
        REQUIRE_FALSE(parse({"--samples", "12x"}).options.has_value());
        REQUIRE_FALSE(parse({"--gain-l", "loud"}).options.has_value());
        REQUIRE_FALSE(parse({"--iterations", "0"}).options.has_value());
    }
}

TEST_CASE("Vector kernels need a whole number of blocks", "[mix_demo][options][edge]") {
    SECTION("simd with 10 samples is rejected") {
        const auto result = parse({"--kernel", "simd", "--samples", "10"});
        REQUIRE_FALSE(result.options.has_value());
        REQUIRE(result.error.find("divisible by 4") != std::string::npos);
    }

    SECTION("foreign with 10 samples is rejected") {
        REQUIRE_FALSE(parse({"--kernel", "foreign", "--samples", "10"}).options.has_value());
    }

    SECTION("scalar kernels accept any count") {
        REQUIRE(parse({"--kernel", "structured", "--samples", "10"}).options.has_value());
        REQUIRE(parse({"--kernel", "bounded", "--samples", "10"}).options.has_value());
    }

    SECTION("all kernels with 10 samples is allowed; vector kernels are skipped at run time") {
        REQUIRE(parse({"--samples", "10"}).options.has_value());
    }
}

TEST_CASE("Sample count is capped", "[mix_demo][options][edge]") {
    const std::string atCap = std::to_string(kMaxSamples);
    const std::string overCap = std::to_string(kMaxSamples + 4);

    SECTION("the cap itself is accepted") {
        const auto result = parse({"--samples", atCap});
        REQUIRE(result.options.has_value());
        REQUIRE(result.options->samples == kMaxSamples);
    }

    SECTION("one block over the cap is rejected") {
        const auto result = parse({"--samples", overCap});
        REQUIRE_FALSE(result.options.has_value());
        REQUIRE(result.error.find("must not exceed") != std::string::npos);
    }

    SECTION("a count that would not fit in memory is rejected") {
        const auto result = parse({"--samples", "18446744073709551615"});
        REQUIRE_FALSE(result.options.has_value());
    }
}
