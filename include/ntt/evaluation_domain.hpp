#pragma once

#include <cstddef>
#include <cstdint>

#include "types/b_field_element.hpp"

namespace gpu_poly {

// Supported transform sizes: 2^11 .. 2^30
constexpr uint32_t kMinLog2TransformSize = 11;
constexpr uint32_t kMaxLog2TransformSize = 30;
constexpr size_t kMinTransformSize = size_t(1) << kMinLog2TransformSize;
constexpr size_t kMaxTransformSize = size_t(1) << kMaxLog2TransformSize;

inline bool is_power_of_two(size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

inline uint32_t log2_exact(size_t n) {
    uint32_t log_n = 0;
    while ((size_t(1) << log_n) < n) log_n++;
    return log_n;
}

/**
 * Throws std::invalid_argument unless n is a power of two in
 * [kMinTransformSize, kMaxTransformSize].
 */
void check_transform_size(size_t n);

/**
 * Multiplicative subgroup of size n, optionally shifted to the coset
 * offset * <generator>.
 */
struct EvaluationDomain {
    size_t size = 0;
    uint32_t log_size = 0;
    BFieldElement generator;
    BFieldElement generator_inv;
    BFieldElement offset = BFieldElement::one();
    BFieldElement offset_inv = BFieldElement::one();
    BFieldElement size_inv;

    /**
     * Subgroup of order n. Throws std::invalid_argument on unsupported n.
     */
    static EvaluationDomain of_size(size_t n);

    /**
     * Same subgroup shifted by `offset`. Throws std::invalid_argument on zero.
     */
    EvaluationDomain with_offset(BFieldElement new_offset) const;

    bool is_coset() const { return !offset.is_one(); }

    // offset * generator^i
    BFieldElement element(size_t i) const;

    // offset^size
    BFieldElement offset_pow_size() const;
};

} // namespace gpu_poly
