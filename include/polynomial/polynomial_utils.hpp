#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "ntt/evaluation_domain.hpp"
#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"

namespace gpu_poly {

/**
 * Smallest power of two >= value (1 for 0).
 * Throws std::overflow_error when that power does not fit in size_t.
 */
size_t ceil_power_of_two(size_t value);

/**
 * Evaluate c0 + c1*x + ... + c_{k-1}*x^{k-1} at `point` with Horner's rule.
 * Coefficients may live in the base field while the point lives in the
 * extension; an empty coefficient list evaluates to zero.
 */
template<typename C, typename T>
T horner_evaluate(const std::vector<C>& coeffs, const T& point) {
    T result = T::zero();
    for (auto it = coeffs.rbegin(); it != coeffs.rend(); ++it) {
        result = result * point + *it;
    }
    return result;
}

/**
 * Regroup a column of RADIX * m values into m rows of RADIX:
 * row i holds source[i], source[i + m], ..., source[i + (RADIX - 1) * m].
 * Throws std::invalid_argument when source.size() is not a multiple of RADIX.
 */
template<size_t RADIX, typename T>
std::vector<std::array<T, RADIX>> interleave(const std::vector<T>& source) {
    static_assert(RADIX > 0, "interleave needs a positive radix");
    if (source.size() % RADIX != 0) {
        throw std::invalid_argument("cannot interleave " + std::to_string(source.size()) +
                                    " values into rows of " + std::to_string(RADIX));
    }
    const size_t rows = source.size() / RADIX;
    std::vector<std::array<T, RADIX>> result(rows);

    #pragma omp parallel for schedule(static)
    for (long i = 0; i < static_cast<long>(rows); ++i) {
        for (size_t j = 0; j < RADIX; ++j) {
            result[i][j] = source[static_cast<size_t>(i) + j * rows];
        }
    }
    return result;
}

/**
 * Divide the polynomial in `coeffs` by (x^a - b) in place with synthetic
 * division. The remainder is discarded: afterwards coeffs holds the
 * quotient followed by `a` zeros.
 *
 * Only linear divisors (a = 1) are supported. Throws std::invalid_argument
 * for any other `a`, for b = 0, or when coeffs.size() <= a.
 */
template<typename T>
void synthetic_divide(std::vector<T>& coeffs, size_t a, const T& b) {
    if (a == 0) {
        throw std::invalid_argument("synthetic_divide: divisor degree must be positive");
    }
    if (b.is_zero()) {
        throw std::invalid_argument("synthetic_divide: divisor constant must be nonzero");
    }
    if (coeffs.size() <= a) {
        throw std::invalid_argument("synthetic_divide: " + std::to_string(coeffs.size()) +
                                    " coefficients cannot be divided by a degree " + std::to_string(a) +
                                    " divisor");
    }
    if (a != 1) {
        throw std::invalid_argument("synthetic_divide: only x - b divisors are supported, got degree " +
                                    std::to_string(a));
    }
    T carry = T::zero();
    for (auto it = coeffs.rbegin(); it != coeffs.rend(); ++it) {
        T next = *it + b * carry;
        *it = carry;
        carry = next;
    }
}

/**
 * Z(tau) = tau^n - offset^n, the polynomial vanishing on every point of
 * `domain`.
 */
template<typename T>
T evaluate_vanishing_polynomial(const EvaluationDomain& domain, const T& tau) {
    return tau.pow(domain.size) - T(domain.offset_pow_size());
}

/**
 * dst[i] = Z_vanish(eval_domain.element(i)) for every point of
 * `eval_domain`. dst must hold eval_domain.size elements.
 * Throws std::invalid_argument otherwise.
 */
void fill_vanishing_polynomial(std::vector<BFieldElement>& dst, const EvaluationDomain& vanish_domain,
                               const EvaluationDomain& eval_domain);

} // namespace gpu_poly
