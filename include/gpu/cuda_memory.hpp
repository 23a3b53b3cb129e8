#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <vector>
#include <stdexcept>
#include <string>

#include <cuda_runtime.h>

#include "common/errors.hpp"

namespace gpu_poly {
namespace gpu {

/**
 * RAII wrapper for device-private memory.
 * Automatically frees memory on destruction. Transfers are stream-ordered
 * only; host data reaches the buffer through copy_to_private_buffer.
 */
template<typename T>
class DeviceBuffer {
public:
    DeviceBuffer() : d_ptr_(nullptr), size_(0) {}
    
    explicit DeviceBuffer(size_t count) : d_ptr_(nullptr), size_(count) {
        if (count > 0) {
            cudaError_t err = cudaMalloc(&d_ptr_, count * sizeof(T));
            if (err != cudaSuccess) {
                throw GpuError("cudaMalloc failed: " + 
                    std::string(cudaGetErrorString(err)));
            }
        }
    }
    
    ~DeviceBuffer() {
        if (d_ptr_) {
            cudaFree(d_ptr_);
        }
    }
    
    // Move only
    DeviceBuffer(DeviceBuffer&& other) noexcept 
        : d_ptr_(other.d_ptr_), size_(other.size_) {
        other.d_ptr_ = nullptr;
        other.size_ = 0;
    }
    
    DeviceBuffer& operator=(DeviceBuffer&& other) noexcept {
        if (this != &other) {
            if (d_ptr_) {
                cudaFree(d_ptr_);
            }
            d_ptr_ = other.d_ptr_;
            size_ = other.size_;
            other.d_ptr_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }
    
    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;
    
    void upload_async(const T* host_data, size_t count, cudaStream_t stream) {
        if (count > size_) {
            throw std::runtime_error("Upload count exceeds buffer size");
        }
        GPU_POLY_CUDA_CHECK(cudaMemcpyAsync(d_ptr_, host_data, count * sizeof(T),
                                            cudaMemcpyHostToDevice, stream));
    }
    
    void download_async(T* host_data, size_t count, cudaStream_t stream) const {
        if (count > size_) {
            throw std::runtime_error("Download count exceeds buffer size");
        }
        GPU_POLY_CUDA_CHECK(cudaMemcpyAsync(host_data, d_ptr_, count * sizeof(T),
                                            cudaMemcpyDeviceToHost, stream));
    }
    
    T* data() { return d_ptr_; }
    const T* data() const { return d_ptr_; }
    size_t size() const { return size_; }
    
private:
    T* d_ptr_;
    size_t size_;
};

/**
 * RAII wrapper for pinned (page-locked, page-aligned) host memory.
 * This is the staging area every upload to device-private memory goes through.
 */
template<typename T>
class PinnedBuffer {
public:
    PinnedBuffer() : h_ptr_(nullptr), size_(0) {}
    
    explicit PinnedBuffer(size_t count) : h_ptr_(nullptr), size_(count) {
        if (count > 0) {
            cudaError_t err = cudaMallocHost(&h_ptr_, count * sizeof(T));
            if (err != cudaSuccess) {
                throw GpuError("cudaMallocHost failed: " +
                    std::string(cudaGetErrorString(err)));
            }
        }
    }
    
    ~PinnedBuffer() {
        if (h_ptr_) {
            cudaFreeHost(h_ptr_);
        }
    }
    
    PinnedBuffer(PinnedBuffer&& other) noexcept
        : h_ptr_(other.h_ptr_), size_(other.size_) {
        other.h_ptr_ = nullptr;
        other.size_ = 0;
    }
    
    PinnedBuffer& operator=(PinnedBuffer&& other) noexcept {
        if (this != &other) {
            if (h_ptr_) {
                cudaFreeHost(h_ptr_);
            }
            h_ptr_ = other.h_ptr_;
            size_ = other.size_;
            other.h_ptr_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }
    
    PinnedBuffer(const PinnedBuffer&) = delete;
    PinnedBuffer& operator=(const PinnedBuffer&) = delete;
    
    T* data() { return h_ptr_; }
    const T* data() const { return h_ptr_; }
    size_t size() const { return size_; }
    
private:
    T* h_ptr_;
    size_t size_;
};

/**
 * Owning handle for a CUDA stream, the queue command sequences are submitted to.
 */
class CudaStream {
public:
    CudaStream() {
        GPU_POLY_CUDA_CHECK(cudaStreamCreateWithFlags(&stream_, cudaStreamNonBlocking));
    }

    ~CudaStream() {
        if (stream_) {
            cudaStreamDestroy(stream_);
        }
    }

    CudaStream(const CudaStream&) = delete;
    CudaStream& operator=(const CudaStream&) = delete;

    cudaStream_t get() const { return stream_; }

private:
    cudaStream_t stream_ = nullptr;
};

/**
 * Copy host data into a freshly allocated device-private buffer.
 *
 * The data is staged through pinned memory and copied on `stream`; the call
 * waits for that copy so the staging area can be released on return.
 */
template<typename T>
DeviceBuffer<T> copy_to_private_buffer(cudaStream_t stream, const T* host_data, size_t count) {
    PinnedBuffer<T> staging(count);
    std::copy(host_data, host_data + count, staging.data());
    DeviceBuffer<T> buffer(count);
    buffer.upload_async(staging.data(), count, stream);
    GPU_POLY_CUDA_CHECK(cudaStreamSynchronize(stream));
    return buffer;
}

template<typename T>
DeviceBuffer<T> copy_to_private_buffer(cudaStream_t stream, const std::vector<T>& host_data) {
    return copy_to_private_buffer(stream, host_data.data(), host_data.size());
}

/**
 * Read a device buffer back through pinned staging memory, waiting on `stream`.
 */
template<typename T>
void copy_from_private_buffer(cudaStream_t stream, const DeviceBuffer<T>& buffer, std::vector<T>& out) {
    PinnedBuffer<T> staging(buffer.size());
    buffer.download_async(staging.data(), buffer.size(), stream);
    GPU_POLY_CUDA_CHECK(cudaStreamSynchronize(stream));
    out.assign(staging.data(), staging.data() + buffer.size());
}

} // namespace gpu
} // namespace gpu_poly
