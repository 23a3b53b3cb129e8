#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>

#include <cuda_runtime.h>

#include "gpu/kernel_module.hpp"

namespace gpu_poly {
namespace gpu {

/**
 * Cache key of a compiled pipeline: (field, operation, n, param).
 * The FFT variant is part of the operation (FftMultiple / FftSingle).
 */
struct PipelineKey {
    std::string field;
    KernelOp op;
    uint32_t n;
    uint32_t param;

    bool operator<(const PipelineKey& rhs) const {
        return std::tie(field, op, n, param) < std::tie(rhs.field, rhs.op, rhs.n, rhs.param);
    }
    bool operator==(const PipelineKey& rhs) const {
        return std::tie(field, op, n, param) == std::tie(rhs.field, rhs.op, rhs.n, rhs.param);
    }

    std::string to_string() const;
};

/**
 * A kernel resolved for one device together with its baked constants.
 * Immutable; safe to share across any number of streams.
 */
class ComputePipeline {
public:
    ComputePipeline(PipelineKey key, KernelEntry entry, PipelineConstants constants, size_t shared_bytes)
        : key_(std::move(key)), entry_(std::move(entry)), constants_(constants), shared_bytes_(shared_bytes) {}

    const PipelineKey& key() const { return key_; }
    const KernelEntry& entry() const { return entry_; }
    const PipelineConstants& constants() const { return constants_; }
    size_t shared_memory_bytes() const { return shared_bytes_; }
    const std::string& name() const { return entry_.name; }

private:
    PipelineKey key_;
    KernelEntry entry_;
    PipelineConstants constants_;
    size_t shared_bytes_;
};

/**
 * Owns the compiled kernel module for one device and a lazily filled,
 * thread-safe pipeline cache. Stages are constructed from a KernelLibrary.
 *
 * Constructing the library does not touch the device; the device is first
 * queried when the first pipeline is built.
 */
class KernelLibrary {
public:
    explicit KernelLibrary(int device_id = 0);
    KernelLibrary(int device_id, KernelModule module);

    KernelLibrary(const KernelLibrary&) = delete;
    KernelLibrary& operator=(const KernelLibrary&) = delete;

    int device_id() const { return device_id_; }
    const KernelModule& module() const { return module_; }

    /**
     * Get or build the pipeline for `key`.
     * The calling thread's current device is unchanged on return.
     * Throws KernelNotFoundError / PipelineCompileError.
     */
    std::shared_ptr<const ComputePipeline> pipeline(const PipelineKey& key);

    size_t cached_pipelines() const;
    size_t cache_hits() const;

    const cudaDeviceProp& device_properties();

private:
    std::shared_ptr<const ComputePipeline> compile(const PipelineKey& key);

    int device_id_;
    KernelModule module_;

    mutable std::mutex mutex_;
    std::map<PipelineKey, std::shared_ptr<const ComputePipeline>> cache_;
    size_t hits_ = 0;

    bool have_props_ = false;
    cudaDeviceProp props_{};
};

/**
 * Constants for `key`, derived on the host (no device access).
 */
PipelineConstants make_pipeline_constants(const PipelineKey& key);

} // namespace gpu
} // namespace gpu_poly
