#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <cuda_runtime.h>

#include "gpu/cuda_memory.hpp"
#include "types/b_field_element.hpp"

namespace gpu_poly {

enum class FftDirection {
    Forward,
    Inverse,
};

const char* to_string(FftDirection direction);

/**
 * Host-side twiddle table for a size-n transform: n/2 powers of the
 * primitive n-th root of unity (its inverse for FftDirection::Inverse),
 * stored in bit-reversed order:
 *
 *   tw[k] = w^bitrev(k, log2(n/2))
 *
 * With this order every pair of one butterfly box shares one twiddle,
 * indexed by the box number, at every stage of the ladder.
 */
std::vector<BFieldElement> compute_twiddles(size_t n, FftDirection direction);

/**
 * In-place bit-reversal permutation of a host vector whose size is a
 * power of two.
 */
template<typename T>
void bit_reverse_permute(std::vector<T>& data) {
    size_t n = data.size();
    size_t log_n = 0;
    while ((size_t(1) << log_n) < n) log_n++;
    for (size_t i = 0; i < n; i++) {
        size_t rev = 0;
        for (size_t j = 0; j < log_n; j++) {
            if (i & (size_t(1) << j)) {
                rev |= size_t(1) << (log_n - 1 - j);
            }
        }
        if (i < rev) {
            std::swap(data[i], data[rev]);
        }
    }
}

/**
 * Read-only device copy of a twiddle table.
 */
class TwiddleBuffer {
public:
    TwiddleBuffer(size_t n, FftDirection direction, cudaStream_t stream);

    size_t n() const { return n_; }
    FftDirection direction() const { return direction_; }
    const gpu::DeviceBuffer<BFieldElement>& buffer() const { return buffer_; }

private:
    size_t n_;
    FftDirection direction_;
    gpu::DeviceBuffer<BFieldElement> buffer_;
};

/**
 * Shares twiddle buffers between all plans of the same (n, direction).
 * With caching disabled every get() builds a fresh buffer.
 */
class TwiddleCache {
public:
    explicit TwiddleCache(bool enabled = true) : enabled_(enabled) {}

    std::shared_ptr<const TwiddleBuffer> get(size_t n, FftDirection direction, cudaStream_t stream);

    size_t size() const;
    void clear();

private:
    bool enabled_;
    mutable std::mutex mutex_;
    std::map<std::pair<size_t, FftDirection>, std::shared_ptr<const TwiddleBuffer>> entries_;
};

} // namespace gpu_poly
