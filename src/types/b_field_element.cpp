#include "types/b_field_element.hpp"
#include <stdexcept>

namespace gpu_poly {

// Goldilocks reduction of a 128-bit product using 2^64 = 2^32 - 1 and
// 2^96 = -1 (mod p). Same sequence as the device-side gl_reduce128.
uint64_t BFieldElement::reduce(uint128_t value) {
    uint64_t lo = static_cast<uint64_t>(value);
    uint64_t hi = static_cast<uint64_t>(value >> 64);
    uint64_t hi_hi = hi >> 32;
    uint64_t hi_lo = hi & EPSILON;

    uint64_t t0 = lo - hi_hi;
    if (lo < hi_hi) {
        t0 -= EPSILON;
    }
    uint64_t t1 = hi_lo * EPSILON;
    uint64_t t2 = t0 + t1;
    if (t2 < t1) {
        t2 += EPSILON;
    }
    return t2 >= MODULUS ? t2 - MODULUS : t2;
}

BFieldElement BFieldElement::operator+(const BFieldElement& rhs) const {
    uint64_t sum = value_ + rhs.value_;
    uint64_t overflow = static_cast<uint64_t>(sum < value_);
    uint64_t too_large = static_cast<uint64_t>(sum >= MODULUS);
    sum -= MODULUS & (-(overflow | too_large));
    return BFieldElement(sum);
}

BFieldElement BFieldElement::operator-(const BFieldElement& rhs) const {
    uint64_t diff = value_ - rhs.value_;
    uint64_t underflow = static_cast<uint64_t>(value_ < rhs.value_);
    diff += MODULUS & (-underflow);
    return BFieldElement(diff);
}

BFieldElement BFieldElement::operator*(const BFieldElement& rhs) const {
    uint128_t product = static_cast<uint128_t>(value_) * static_cast<uint128_t>(rhs.value_);
    return BFieldElement(reduce(product));
}

BFieldElement BFieldElement::operator-() const {
    if (value_ == 0) return *this;
    return BFieldElement(MODULUS - value_);
}

BFieldElement& BFieldElement::operator+=(const BFieldElement& rhs) {
    *this = *this + rhs;
    return *this;
}

BFieldElement& BFieldElement::operator-=(const BFieldElement& rhs) {
    *this = *this - rhs;
    return *this;
}

BFieldElement& BFieldElement::operator*=(const BFieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

BFieldElement& BFieldElement::operator/=(const BFieldElement& rhs) {
    *this = *this / rhs;
    return *this;
}

BFieldElement BFieldElement::pow(uint64_t exp) const {
    BFieldElement result = BFieldElement::one();
    BFieldElement base = *this;
    
    while (exp > 0) {
        if (exp & 1) {
            result *= base;
        }
        base *= base;
        exp >>= 1;
    }
    
    return result;
}

BFieldElement BFieldElement::inverse() const {
    if (value_ == 0) {
        throw std::domain_error("Cannot invert zero");
    }
    
    // Fermat: a^(-1) = a^(p-2)
    return pow(MODULUS - 2);
}

BFieldElement BFieldElement::operator/(const BFieldElement& rhs) const {
    return *this * rhs.inverse();
}

std::vector<BFieldElement> BFieldElement::batch_inversion(const std::vector<BFieldElement>& elements) {
    const size_t n = elements.size();
    std::vector<BFieldElement> inverses(n, BFieldElement::zero());
    if (n == 0) {
        return inverses;
    }

    std::vector<BFieldElement> prefix_products(n, BFieldElement::one());
    BFieldElement accumulator = BFieldElement::one();
    for (size_t i = 0; i < n; ++i) {
        if (elements[i].is_zero()) {
            throw std::domain_error("batch_inversion encountered zero element");
        }
        prefix_products[i] = accumulator;
        accumulator *= elements[i];
    }

    BFieldElement inverse_acc = accumulator.inverse();
    for (size_t i = n; i-- > 0;) {
        inverses[i] = prefix_products[i] * inverse_acc;
        inverse_acc *= elements[i];
    }

    return inverses;
}

BFieldElement BFieldElement::primitive_root_of_unity(uint32_t log2_order) {
    if (log2_order > TWO_ADICITY) {
        throw std::invalid_argument("log2_order must be <= 32");
    }
    
    // g^((p-1) / 2^k) has order exactly 2^k because 7 generates F_p^*
    BFieldElement g(GENERATOR);
    uint64_t exp = (MODULUS - 1) >> log2_order;
    return g.pow(exp);
}

std::string BFieldElement::to_string() const {
    return std::to_string(value_);
}

std::ostream& operator<<(std::ostream& os, const BFieldElement& elem) {
    return os << elem.value_;
}

} // namespace gpu_poly
