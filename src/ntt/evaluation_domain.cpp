#include "ntt/evaluation_domain.hpp"

#include <stdexcept>
#include <string>

namespace gpu_poly {

void check_transform_size(size_t n) {
    if (!is_power_of_two(n)) {
        throw std::invalid_argument("n=" + std::to_string(n) + " is not a power of two");
    }
    if (n < kMinTransformSize || n > kMaxTransformSize) {
        throw std::invalid_argument("n=" + std::to_string(n) + " outside [" +
                                    std::to_string(kMinTransformSize) + ", " +
                                    std::to_string(kMaxTransformSize) + "]");
    }
}

EvaluationDomain EvaluationDomain::of_size(size_t n) {
    check_transform_size(n);
    EvaluationDomain d;
    d.size = n;
    d.log_size = log2_exact(n);
    d.generator = BFieldElement::primitive_root_of_unity(d.log_size);
    d.generator_inv = d.generator.inverse();
    d.size_inv = BFieldElement(static_cast<uint64_t>(n)).inverse();
    return d;
}

EvaluationDomain EvaluationDomain::with_offset(BFieldElement new_offset) const {
    if (new_offset.is_zero()) {
        throw std::invalid_argument("coset offset must be non-zero");
    }
    EvaluationDomain d = *this;
    d.offset = new_offset;
    d.offset_inv = new_offset.inverse();
    return d;
}

BFieldElement EvaluationDomain::element(size_t i) const {
    return offset * generator.pow(static_cast<uint64_t>(i % size));
}

BFieldElement EvaluationDomain::offset_pow_size() const {
    return offset.pow(static_cast<uint64_t>(size));
}

} // namespace gpu_poly
