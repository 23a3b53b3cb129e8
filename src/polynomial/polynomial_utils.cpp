#include "polynomial/polynomial_utils.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace gpu_poly {

namespace {
constexpr size_t kMinChunk = 1024;
}

size_t ceil_power_of_two(size_t value) {
    constexpr size_t kLargestPower = size_t(1) << (std::numeric_limits<size_t>::digits - 1);
    if (value > kLargestPower) {
        throw std::overflow_error("no power of two >= " + std::to_string(value) + " fits in size_t");
    }
    size_t result = 1;
    while (result < value) {
        result <<= 1;
    }
    return result;
}

void fill_vanishing_polynomial(std::vector<BFieldElement>& dst, const EvaluationDomain& vanish_domain,
                               const EvaluationDomain& eval_domain) {
    if (dst.size() != eval_domain.size) {
        throw std::invalid_argument("vanishing polynomial destination holds " + std::to_string(dst.size()) +
                                    " elements, evaluation domain has " + std::to_string(eval_domain.size));
    }
    const uint64_t n = vanish_domain.size;
    // (offset * g^i)^n = offset^n * (g^n)^i
    const BFieldElement scaled_eval_offset = eval_domain.offset.pow(n);
    const BFieldElement scaled_eval_generator = eval_domain.generator.pow(n);
    const BFieldElement scaled_vanish_offset = vanish_domain.offset_pow_size();

    size_t num_threads = 1;
#ifdef _OPENMP
    num_threads = static_cast<size_t>(omp_get_max_threads());
#endif
    const size_t chunk = std::max(dst.size() / num_threads, kMinChunk);
    const long num_chunks = static_cast<long>((dst.size() + chunk - 1) / chunk);

    #pragma omp parallel for schedule(static)
    for (long c = 0; c < num_chunks; ++c) {
        const size_t begin = static_cast<size_t>(c) * chunk;
        const size_t end = std::min(dst.size(), begin + chunk);
        BFieldElement acc = scaled_eval_offset * scaled_eval_generator.pow(begin);
        for (size_t i = begin; i < end; ++i) {
            dst[i] = acc - scaled_vanish_offset;
            acc *= scaled_eval_generator;
        }
    }
}

} // namespace gpu_poly
