// ==============================================================================
// Mix Demo - Auto Vectorization Comparison
// ==============================================================================
// Runs the mono -> stereo mixers over one buffer and reports time per call.
//
// Usage:
//   mix_demo [--kernel NAME|all] [--samples N] [--gain-l G] [--gain-r G]
//            [--iterations K] [--verify]
//
// Exit codes: 0 success, 1 verification mismatch, 2 bad arguments.
// ==============================================================================

#include "mix_demo_options.h"
#include "mix_demo_verify.h"

#include <autovec/dsp/core/mix_contract.h>
#include <autovec/dsp/primitives/mix_kernel.h>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <vector>

using namespace Autovec::DSP;

namespace {

constexpr int kWarmupCalls = 3;

} // namespace

int main(int argc, char* argv[]) {
    const auto parsed = MixDemo::parseMixDemoOptions(argc, argv);
    if (!parsed) {
        std::cerr << "mix_demo: " << parsed.error << "\n\n" << MixDemo::usageText();
        return 2;
    }
    const auto& options = *parsed.options;
    if (options.showHelp) {
        std::cout << MixDemo::usageText();
        return 0;
    }

    std::vector<MixKernel> kernels;
    if (options.kernel) {
        kernels.push_back(*options.kernel);
    } else {
        kernels.assign(kAllMixKernels.begin(), kAllMixKernels.end());
    }

    // Noise input, fixed seed so runs are comparable
    std::vector<float> src(options.samples);
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    for (auto& s : src) {
        s = dist(rng);
    }

    std::vector<float> reference;
    if (options.verify) {
        reference.resize(options.samples * 2);
        mixMonoToStereoScalar(src, reference, options.gainL, options.gainR);
    }

    std::cout << "Auto Vectorization Demo\n";
    std::cout << "Samples: " << options.samples
              << "  Gains: L=" << options.gainL << " R=" << options.gainR
              << "  Iterations: " << options.iterations << "\n";
    std::cout << "=================================================================\n";

    bool allMatch = true;
    std::vector<float> dst(options.samples * 2);

    try {
        for (const auto kernel : kernels) {
            const auto name = mixKernelName(kernel);

            if (requiresVectorBlocks(kernel) && options.samples % kMixVectorWidth != 0) {
                std::cout << std::left << std::setw(12) << name
                          << "skipped (samples not a multiple of " << kMixVectorWidth << ")\n";
                continue;
            }

            MixDemo::resetDestination(dst);

            for (int i = 0; i < kWarmupCalls; ++i) {
                runMixKernel(kernel, src, dst, options.gainL, options.gainR);
            }

            const auto start = std::chrono::high_resolution_clock::now();
            for (int i = 0; i < options.iterations; ++i) {
                runMixKernel(kernel, src, dst, options.gainL, options.gainR);
            }
            const auto end = std::chrono::high_resolution_clock::now();

            const double totalUs = std::chrono::duration<double, std::micro>(end - start).count();
            const double perCallUs = totalUs / options.iterations;
            const double perSampleNs = perCallUs * 1000.0 / static_cast<double>(options.samples);

            std::cout << std::left << std::setw(12) << name << std::right << std::fixed
                      << std::setprecision(2) << std::setw(10) << perCallUs << " us/call  "
                      << std::setprecision(3) << std::setw(8) << perSampleNs << " ns/sample";

            if (options.verify) {
                const auto mismatch = MixDemo::firstMismatch(reference, dst);
                if (mismatch < 0) {
                    std::cout << "  [match]";
                } else {
                    allMatch = false;
                    std::cout << "  [MISMATCH at " << mismatch << "]";
                }
            }
            std::cout << "\n";
            std::cout.unsetf(std::ios::fixed);
        }
    } catch (const MixPreconditionError& e) {
        std::cerr << "mix_demo: " << e.what() << "\n";
        return 2;
    }

    std::cout << "=================================================================\n";
    if (options.verify) {
        std::cout << "Verification: " << (allMatch ? "PASS" : "FAIL") << "\n";
    }
    return allMatch ? 0 : 1;
}
