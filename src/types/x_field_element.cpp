#include "types/x_field_element.hpp"
#include <sstream>

namespace gpu_poly {

XFieldElement XFieldElement::operator+(const XFieldElement& rhs) const {
    return XFieldElement(
        coeffs_[0] + rhs.coeffs_[0],
        coeffs_[1] + rhs.coeffs_[1],
        coeffs_[2] + rhs.coeffs_[2]
    );
}

XFieldElement XFieldElement::operator-(const XFieldElement& rhs) const {
    return XFieldElement(
        coeffs_[0] - rhs.coeffs_[0],
        coeffs_[1] - rhs.coeffs_[1],
        coeffs_[2] - rhs.coeffs_[2]
    );
}

XFieldElement XFieldElement::operator*(const XFieldElement& rhs) const {
    // (a0 + a1*X + a2*X^2) * (b0 + b1*X + b2*X^2) modulo X^3 - X + 1
    const auto& a = coeffs_;
    const auto& b = rhs.coeffs_;
    
    BFieldElement c0 = a[0] * b[0];
    BFieldElement c1 = a[0] * b[1] + a[1] * b[0];
    BFieldElement c2 = a[0] * b[2] + a[1] * b[1] + a[2] * b[0];
    BFieldElement c3 = a[1] * b[2] + a[2] * b[1];
    BFieldElement c4 = a[2] * b[2];
    
    // X^3 = X - 1, X^4 = X^2 - X
    return XFieldElement(
        c0 - c3,
        c1 + c3 - c4,
        c2 + c4
    );
}

XFieldElement XFieldElement::operator-() const {
    return XFieldElement(-coeffs_[0], -coeffs_[1], -coeffs_[2]);
}

XFieldElement& XFieldElement::operator+=(const XFieldElement& rhs) {
    *this = *this + rhs;
    return *this;
}

XFieldElement& XFieldElement::operator-=(const XFieldElement& rhs) {
    *this = *this - rhs;
    return *this;
}

XFieldElement& XFieldElement::operator*=(const XFieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

XFieldElement XFieldElement::operator+(const BFieldElement& rhs) const {
    return XFieldElement(coeffs_[0] + rhs, coeffs_[1], coeffs_[2]);
}

XFieldElement XFieldElement::operator*(const BFieldElement& rhs) const {
    return XFieldElement(
        coeffs_[0] * rhs,
        coeffs_[1] * rhs,
        coeffs_[2] * rhs
    );
}

XFieldElement& XFieldElement::operator*=(const BFieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

bool XFieldElement::operator==(const XFieldElement& rhs) const {
    return coeffs_[0] == rhs.coeffs_[0] &&
           coeffs_[1] == rhs.coeffs_[1] &&
           coeffs_[2] == rhs.coeffs_[2];
}

bool XFieldElement::operator!=(const XFieldElement& rhs) const {
    return !(*this == rhs);
}

bool XFieldElement::is_zero() const {
    return coeffs_[0].is_zero() && coeffs_[1].is_zero() && coeffs_[2].is_zero();
}

bool XFieldElement::is_one() const {
    return coeffs_[0].is_one() && coeffs_[1].is_zero() && coeffs_[2].is_zero();
}

XFieldElement XFieldElement::pow(uint64_t exp) const {
    XFieldElement result = XFieldElement::one();
    XFieldElement base = *this;
    
    while (exp > 0) {
        if (exp & 1) {
            result *= base;
        }
        base *= base;
        exp >>= 1;
    }
    
    return result;
}

std::string XFieldElement::to_string() const {
    std::ostringstream oss;
    oss << "(" << coeffs_[0].value() 
        << ", " << coeffs_[1].value() 
        << ", " << coeffs_[2].value() << ")";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const XFieldElement& elem) {
    return os << elem.to_string();
}

XFieldElement operator*(const BFieldElement& lhs, const XFieldElement& rhs) {
    return rhs * lhs;
}

} // namespace gpu_poly
