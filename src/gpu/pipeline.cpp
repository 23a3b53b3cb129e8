#include "gpu/pipeline.hpp"
#include "common/errors.hpp"
#include "common/debug_control.hpp"
#include "types/b_field_element.hpp"

#include <iostream>
#include <sstream>

namespace gpu_poly {
namespace gpu {

namespace {

uint32_t log2_exact(uint32_t n) {
    uint32_t log_n = 0;
    while ((1u << log_n) < n) log_n++;
    return log_n;
}

// Dynamic shared memory a kernel may use without opting in
constexpr size_t kDefaultSharedLimit = 48 * 1024;

// Makes `device` current for its lifetime and then restores the caller's
// device, so building a pipeline leaves the thread where it was.
class ScopedDevice {
public:
    explicit ScopedDevice(int device) {
        GPU_POLY_CUDA_CHECK(cudaGetDevice(&previous_));
        if (previous_ != device) {
            GPU_POLY_CUDA_CHECK(cudaSetDevice(device));
            switched_ = true;
        }
    }

    ~ScopedDevice() {
        if (switched_) {
            cudaError_t err = cudaSetDevice(previous_);
            if (err != cudaSuccess) {
                std::cerr << "[pipeline] cannot restore device " << previous_ << ": "
                          << cudaGetErrorString(err) << std::endl;
            }
        }
    }

    ScopedDevice(const ScopedDevice&) = delete;
    ScopedDevice& operator=(const ScopedDevice&) = delete;

private:
    int previous_ = 0;
    bool switched_ = false;
};

} // namespace

std::string PipelineKey::to_string() const {
    std::ostringstream oss;
    oss << kernel_name(op, field) << "[n=" << n << ", param=" << param << "]";
    return oss.str();
}

PipelineConstants make_pipeline_constants(const PipelineKey& key) {
    PipelineConstants c;
    c.n = key.n;
    c.log_n = log2_exact(key.n);
    c.param = key.param;
    if (key.op == KernelOp::MulPow) {
        c.base = BFieldElement::primitive_root_of_unity(c.log_n).value();
    }
    return c;
}

KernelLibrary::KernelLibrary(int device_id)
    : KernelLibrary(device_id, KernelModule::compiled()) {}

KernelLibrary::KernelLibrary(int device_id, KernelModule module)
    : device_id_(device_id), module_(std::move(module)) {}

const cudaDeviceProp& KernelLibrary::device_properties() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!have_props_) {
        GPU_POLY_CUDA_CHECK(cudaGetDeviceProperties(&props_, device_id_));
        have_props_ = true;
    }
    return props_;
}

size_t KernelLibrary::cached_pipelines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

size_t KernelLibrary::cache_hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::shared_ptr<const ComputePipeline> KernelLibrary::pipeline(const PipelineKey& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            ++hits_;
            return it->second;
        }
    }

    auto built = compile(key);

    std::lock_guard<std::mutex> lock(mutex_);
    // Another thread may have built the same key meanwhile; keep the first.
    auto inserted = cache_.emplace(key, built);
    GPU_POLY_DEBUG_PRINT("[pipeline] built %s (shared=%zu bytes)\n",
                         key.to_string().c_str(), built->shared_memory_bytes());
    return inserted.first->second;
}

std::shared_ptr<const ComputePipeline> KernelLibrary::compile(const PipelineKey& key) {
    const KernelEntry& entry = module_.lookup(key.op, key.field);
    const cudaDeviceProp& props = device_properties();

    ScopedDevice on_device(device_id_);

    cudaFuncAttributes attr{};
    cudaError_t err = cudaFuncGetAttributes(&attr, entry.symbol);
    if (err != cudaSuccess) {
        throw PipelineCompileError("cannot load " + entry.name + " on device " +
                                   std::to_string(device_id_) + ": " + cudaGetErrorString(err));
    }
    if (attr.maxThreadsPerBlock < static_cast<int>(kThreadgroupSize)) {
        throw PipelineCompileError(entry.name + " supports " + std::to_string(attr.maxThreadsPerBlock) +
                                   " lanes per threadgroup, " + std::to_string(kThreadgroupSize) + " required");
    }

    size_t shared_bytes = entry.shared_elements * entry.element_bytes;
    size_t total_shared = shared_bytes + attr.sharedSizeBytes;
    if (total_shared > props.sharedMemPerBlockOptin) {
        throw PipelineCompileError(entry.name + " needs " + std::to_string(total_shared) +
                                   " bytes of shared memory, device allows " +
                                   std::to_string(props.sharedMemPerBlockOptin));
    }
    if (shared_bytes > kDefaultSharedLimit) {
        err = cudaFuncSetAttribute(entry.symbol, cudaFuncAttributeMaxDynamicSharedMemorySize,
                                   static_cast<int>(shared_bytes));
        if (err != cudaSuccess) {
            throw PipelineCompileError("cannot raise shared memory limit of " + entry.name + ": " +
                                       cudaGetErrorString(err));
        }
    }

    return std::make_shared<const ComputePipeline>(key, entry, make_pipeline_constants(key), shared_bytes);
}

} // namespace gpu
} // namespace gpu_poly
