/**
 * FFT benchmark
 *
 * Runs forward + inverse transforms over random inputs for every size in
 * [2^min_log, 2^max_log], prints the timings and checks that the inverse
 * restores the input.
 */

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <cuda_runtime.h>

#include "common/config.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "common/scoped_timer.hpp"
#include "gpu/cuda_memory.hpp"
#include "gpu/pipeline.hpp"
#include "ntt/evaluation_domain.hpp"
#include "ntt/fft_plan.hpp"
#include "ntt/twiddles.hpp"
#include "types/gpu_field.hpp"
#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"

using namespace gpu_poly;

namespace {

struct BenchOptions {
    uint32_t min_log = 14;
    uint32_t max_log = 20;
    std::string field = "bfe";
    std::string config_path;
    bool coset = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "  --min-log <k>     smallest transform size 2^k (default 14)\n"
              << "  --max-log <k>     largest transform size 2^k (default 20)\n"
              << "  --field bfe|xfe   element type (default bfe)\n"
              << "  --coset           transform over the coset 7 * <w>\n"
              << "  --config <path>   engine config JSON\n"
              << "  --help\n";
}

uint32_t parse_log(const std::string& flag, const std::string& value) {
    unsigned long v = 0;
    try {
        v = std::stoul(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    if (v < kMinLog2TransformSize || v > kMaxLog2TransformSize) {
        throw std::invalid_argument(flag + " must be in [" + std::to_string(kMinLog2TransformSize) + ", " +
                                    std::to_string(kMaxLog2TransformSize) + "]");
    }
    return static_cast<uint32_t>(v);
}

BenchOptions parse_args(int argc, char* argv[]) {
    BenchOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " needs a value");
            }
            return argv[++i];
        };
        if (arg == "--min-log") {
            opts.min_log = parse_log(arg, next());
        } else if (arg == "--max-log") {
            opts.max_log = parse_log(arg, next());
        } else if (arg == "--field") {
            opts.field = next();
            if (opts.field != "bfe" && opts.field != "xfe") {
                throw std::invalid_argument("--field must be bfe or xfe");
            }
        } else if (arg == "--config") {
            opts.config_path = next();
        } else if (arg == "--coset") {
            opts.coset = true;
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
    if (opts.min_log > opts.max_log) {
        throw std::invalid_argument("--min-log exceeds --max-log");
    }
    return opts;
}

BFieldElement random_bfe(std::mt19937_64& rng) {
    return BFieldElement(rng());
}

void random_fill(std::vector<BFieldElement>& v, std::mt19937_64& rng) {
    for (auto& x : v) x = random_bfe(rng);
}

void random_fill(std::vector<XFieldElement>& v, std::mt19937_64& rng) {
    for (auto& x : v) x = XFieldElement(random_bfe(rng), random_bfe(rng), random_bfe(rng));
}

template<typename F>
bool bench_size(gpu::KernelLibrary& library, TwiddleCache& twiddles, const gpu::CudaStream& stream,
                uint32_t log_n, bool coset, std::mt19937_64& rng) {
    const size_t n = size_t(1) << log_n;
    EvaluationDomain domain = EvaluationDomain::of_size(n);
    if (coset) {
        domain = domain.with_offset(BFieldElement::generator());
    }

    const std::string label = std::to_string(n) + (coset ? " coset" : "");
    double plan_ms = 0;
    std::unique_ptr<GpuFft<F>> fft;
    {
        ScopedTimer timer("plan n=" + label);
        fft = std::make_unique<GpuFft<F>>(library, twiddles, domain, stream.get());
        plan_ms = timer.elapsed_ms();
    }

    std::vector<F> input(n);
    random_fill(input, rng);

    gpu::DeviceBuffer<F> buffer = gpu::copy_to_private_buffer(stream.get(), input);

    double fwd_ms = 0;
    {
        ScopedTimer timer("forward n=" + label);
        fft->forward(buffer);
        fwd_ms = timer.elapsed_ms();
    }

    double inv_ms = 0;
    {
        ScopedTimer timer("inverse n=" + label);
        fft->inverse(buffer);
        inv_ms = timer.elapsed_ms();
    }

    std::vector<F> restored;
    gpu::copy_from_private_buffer(stream.get(), buffer, restored);
    bool ok = restored == input;

    std::cout << "  2^" << std::setw(2) << log_n
              << "  plan " << std::setw(9) << std::fixed << std::setprecision(3) << plan_ms << "ms"
              << "  forward " << std::setw(9) << fwd_ms << "ms"
              << "  inverse " << std::setw(9) << inv_ms << "ms"
              << "  dispatches " << fft->forward_plan().dispatch_count()
              << "  " << (ok ? "OK" : "MISMATCH") << std::endl;
    return ok;
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    try {
        BenchOptions opts = parse_args(argc, argv);

        EngineConfig config;
        if (opts.config_path.empty()) {
            config = EngineConfig::load();
        } else {
            config = EngineConfig::from_file(opts.config_path);
            config.merge_env();
        }
        config.apply();

        int device_count = 0;
        if (cudaGetDeviceCount(&device_count) != cudaSuccess || device_count == 0) {
            std::cerr << "Error: No CUDA devices found\n";
            return 1;
        }
        if (config.device_id >= device_count) {
            std::cerr << "Error: device " << config.device_id << " not present (" << device_count
                      << " found)\n";
            return 1;
        }
        GPU_POLY_CUDA_CHECK(cudaSetDevice(config.device_id));

        gpu::KernelLibrary library(config.device_id);
        library.module().validate({GpuField<BFieldElement>::name(), GpuField<XFieldElement>::name()});
        const cudaDeviceProp& prop = library.device_properties();
        std::cout << "=== gpu_poly FFT benchmark ===" << std::endl;
        std::cout << "GPU: " << prop.name << " (" << (prop.totalGlobalMem / (1024 * 1024)) << " MB)" << std::endl;
        std::cout << "Field: " << opts.field << (opts.coset ? " (coset)" : "") << std::endl;

        TwiddleCache twiddles(config.cache_twiddles);
        gpu::CudaStream stream;
        std::mt19937_64 rng(0x5eed);

        bool all_ok = true;
        for (uint32_t log_n = opts.min_log; log_n <= opts.max_log; ++log_n) {
            if (opts.field == "xfe") {
                all_ok &= bench_size<XFieldElement>(library, twiddles, stream, log_n, opts.coset, rng);
            } else {
                all_ok &= bench_size<BFieldElement>(library, twiddles, stream, log_n, opts.coset, rng);
            }
        }

        GPU_POLY_PROFILE_PRINT("[profile] pipelines built: %zu, cache hits: %zu\n",
                               library.cached_pipelines(), library.cache_hits());
        return all_ok ? 0 : 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
