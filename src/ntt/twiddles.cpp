#include "ntt/twiddles.hpp"
#include "ntt/evaluation_domain.hpp"
#include "common/debug_control.hpp"
#include "common/scoped_timer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace gpu_poly {

namespace {

inline size_t reverse_bits(size_t x, uint32_t bits) {
    size_t rev = 0;
    for (uint32_t j = 0; j < bits; j++) {
        rev = (rev << 1) | ((x >> j) & 1);
    }
    return rev;
}

constexpr size_t kTwiddleChunk = 4096;

} // namespace

const char* to_string(FftDirection direction) {
    return direction == FftDirection::Forward ? "forward" : "inverse";
}

std::vector<BFieldElement> compute_twiddles(size_t n, FftDirection direction) {
    if (n < 2 || !is_power_of_two(n)) {
        throw std::invalid_argument("twiddle table size n=" + std::to_string(n) +
                                    " must be a power of two >= 2");
    }
    const size_t half = n / 2;
    const uint32_t bits = log2_exact(half);
    BFieldElement root = BFieldElement::primitive_root_of_unity(log2_exact(n));
    if (direction == FftDirection::Inverse) {
        root = root.inverse();
    }

    std::vector<BFieldElement> twiddles(half);
    const long num_chunks = static_cast<long>((half + kTwiddleChunk - 1) / kTwiddleChunk);

    #pragma omp parallel for schedule(static) if(num_chunks > 1)
    for (long c = 0; c < num_chunks; ++c) {
        const size_t begin = static_cast<size_t>(c) * kTwiddleChunk;
        const size_t end = std::min(half, begin + kTwiddleChunk);
        BFieldElement w = root.pow(begin);
        for (size_t i = begin; i < end; ++i) {
            twiddles[reverse_bits(i, bits)] = w;
            w *= root;
        }
    }
    return twiddles;
}

TwiddleBuffer::TwiddleBuffer(size_t n, FftDirection direction, cudaStream_t stream)
    : n_(n), direction_(direction) {
    ScopedTimer timer(std::string("twiddles ") + to_string(direction) + " n=" + std::to_string(n));
    buffer_ = gpu::copy_to_private_buffer(stream, compute_twiddles(n, direction));
}

std::shared_ptr<const TwiddleBuffer> TwiddleCache::get(size_t n, FftDirection direction, cudaStream_t stream) {
    if (!enabled_) {
        return std::make_shared<const TwiddleBuffer>(n, direction, stream);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto key = std::make_pair(n, direction);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }
    auto twiddles = std::make_shared<const TwiddleBuffer>(n, direction, stream);
    entries_.emplace(key, twiddles);
    GPU_POLY_DEBUG_PRINT("[twiddles] cached %s table for n=%zu\n", to_string(direction), n);
    return twiddles;
}

size_t TwiddleCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TwiddleCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace gpu_poly
