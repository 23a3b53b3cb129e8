#pragma once

#include <iostream>
#include <stdexcept>
#include <string>

#include <cuda_runtime.h>

namespace gpu_poly {

/**
 * Base class for every failure raised by the engine's GPU layer.
 *
 * Precondition violations (bad sizes, bad box counts) are reported as
 * std::invalid_argument instead; those are caller errors, not device errors.
 */
class GpuError : public std::runtime_error {
public:
    explicit GpuError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * A (operation, field) kernel identifier is absent from the compiled module.
 */
class KernelNotFoundError : public GpuError {
public:
    explicit KernelNotFoundError(const std::string& what) : GpuError(what) {}
};

/**
 * The device refused to build a pipeline for a kernel that does exist
 * (threadgroup too large, shared memory over the opt-in limit, ...).
 */
class PipelineCompileError : public GpuError {
public:
    explicit PipelineCompileError(const std::string& what) : GpuError(what) {}
};

inline std::string cuda_error_message(cudaError_t err, const char* context) {
    return std::string(context) + ": " + cudaGetErrorString(err);
}

} // namespace gpu_poly

#define GPU_POLY_CUDA_CHECK(call) do { \
    cudaError_t err_ = (call); \
    if (err_ != cudaSuccess) { \
        std::cerr << "CUDA error at " << __FILE__ << ":" << __LINE__ << ": " \
                  << cudaGetErrorString(err_) << std::endl; \
        throw gpu_poly::GpuError(gpu_poly::cuda_error_message(err_, #call)); \
    } \
} while(0)
