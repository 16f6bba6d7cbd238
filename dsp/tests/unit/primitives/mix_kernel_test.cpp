// ==============================================================================
// Layer 1: DSP Primitive Tests - Mix Kernel Selection
// ==============================================================================
// Cross-kernel equivalence: every entry point, driven through runMixKernel()
// with identical buffers, produces the scalar output bit-for-bit.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_range.hpp>

#include <autovec/dsp/primitives/mix_kernel.h>

#include <mix_buffers.h>

#include <string>
#include <tuple>
#include <vector>

using namespace Autovec::DSP;

TEST_CASE("MixKernel names round-trip through the parser", "[mix_kernel]") {
    for (const auto kernel : kAllMixKernels) {
        const auto parsed = parseMixKernel(mixKernelName(kernel));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == kernel);
    }

    REQUIRE_FALSE(parseMixKernel("").has_value());
    REQUIRE_FALSE(parseMixKernel("SIMD").has_value());
    REQUIRE_FALSE(parseMixKernel("avx").has_value());
}

TEST_CASE("Only the explicit vector kernels need whole blocks", "[mix_kernel]") {
    STATIC_REQUIRE_FALSE(requiresVectorBlocks(MixKernel::Scalar));
    STATIC_REQUIRE_FALSE(requiresVectorBlocks(MixKernel::Bounded));
    STATIC_REQUIRE_FALSE(requiresVectorBlocks(MixKernel::Structured));
    STATIC_REQUIRE(requiresVectorBlocks(MixKernel::Simd));
    STATIC_REQUIRE(requiresVectorBlocks(MixKernel::Foreign));
}

TEST_CASE("All kernels agree with the scalar mixer", "[mix_kernel][equivalence]") {
    const auto kernel = GENERATE(from_range(kAllMixKernels));
    const auto size = GENERATE(as<size_t>{}, 0, 4, 8, 256, 4096);
    const auto gains = GENERATE(table<float, float>({
        {0.25f, 2.0f},
        {0.0f, 0.0f},
        {1.0f, 1.0f},
        {-1.0f, 0.5f},
        {1e-3f, 1e3f}}));
    const float gainL = std::get<0>(gains);
    const float gainR = std::get<1>(gains);

    const std::string kernelName(mixKernelName(kernel));
    CAPTURE(kernelName, size, gainL, gainR);

    const auto src = TestHelpers::makeNoise(size, 1234);
    std::vector<float> reference(size * 2);
    mixMonoToStereoScalar(src, reference, gainL, gainR);

    std::vector<float> actual(size * 2, -99.0f);
    runMixKernel(kernel, src, actual, gainL, gainR);

    const auto result = TestHelpers::compareBitwise(reference, actual);
    INFO(result.message());
    REQUIRE(result.passed);
}

TEST_CASE("All kernels satisfy the output law on a ramp", "[mix_kernel]") {
    const auto src = TestHelpers::makeRamp(8);

    for (const auto kernel : kAllMixKernels) {
        const std::string kernelName(mixKernelName(kernel));
        CAPTURE(kernelName);
        std::vector<float> dst(16);
        runMixKernel(kernel, src, dst, 0.25f, 2.0f);
        for (size_t i = 0; i < src.size(); ++i) {
            REQUIRE(dst[2 * i] == src[i] * 0.25f);
            REQUIRE(dst[2 * i + 1] == src[i] * 2.0f);
        }
    }
}

TEST_CASE("Kernels reject a mis-sized interleaved destination", "[mix_kernel][edge]") {
    const auto src = TestHelpers::makeRamp(8);

    for (const auto kernel : kAllMixKernels) {
        const std::string kernelName(mixKernelName(kernel));
        CAPTURE(kernelName);
        std::vector<float> odd(15);
        REQUIRE_THROWS_AS(runMixKernel(kernel, src, odd, 1.0f, 1.0f), MixPreconditionError);

        // Even but oversized: the structured views alone would accept this
        std::vector<float> oversized(18, -1.0f);
        REQUIRE_THROWS_AS(runMixKernel(kernel, src, oversized, 1.0f, 1.0f), MixPreconditionError);
        for (float s : oversized) {
            REQUIRE(s == -1.0f);
        }
    }
}

TEST_CASE("Vector kernels reject partial blocks, scalar kernels accept them", "[mix_kernel][edge]") {
    const auto src = TestHelpers::makeRamp(10);

    for (const auto kernel : kAllMixKernels) {
        const std::string kernelName(mixKernelName(kernel));
        CAPTURE(kernelName);
        std::vector<float> dst(20);
        if (requiresVectorBlocks(kernel)) {
            REQUIRE_THROWS_AS(runMixKernel(kernel, src, dst, 1.0f, 1.0f), MixPreconditionError);
        } else {
            REQUIRE_NOTHROW(runMixKernel(kernel, src, dst, 1.0f, 1.0f));
            REQUIRE(dst[18] == 10.0f);
            REQUIRE(dst[19] == 10.0f);
        }
    }
}
