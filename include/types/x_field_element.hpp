#pragma once

#include "types/b_field_element.hpp"
#include <array>
#include <string>
#include <vector>

namespace gpu_poly {

/**
 * XFieldElement - Extension Field Element
 * 
 * Element of the degree-3 extension of the Goldilocks field,
 * a + b*X + c*X^2 with X^3 = X - 1.
 *
 * GPU layout: three consecutive canonical uint64_t coefficients (24 bytes).
 * Transforms over this field use base-field twiddles, so the engine only
 * needs extension addition/subtraction and extension-by-base scaling on
 * the device; the full product is provided for host-side reference code.
 */
class XFieldElement {
public:
    static constexpr size_t EXTENSION_DEGREE = 3;
    
    constexpr XFieldElement() : coeffs_{BFieldElement::zero(), BFieldElement::zero(), BFieldElement::zero()} {}
    
    constexpr XFieldElement(BFieldElement c0, BFieldElement c1, BFieldElement c2)
        : coeffs_{c0, c1, c2} {}
    
    // Embed a base field element as a constant polynomial
    constexpr explicit XFieldElement(BFieldElement base)
        : coeffs_{base, BFieldElement::zero(), BFieldElement::zero()} {}
    
    static constexpr XFieldElement zero() { 
        return XFieldElement(); 
    }
    
    static constexpr XFieldElement one() { 
        return XFieldElement(BFieldElement::one(), BFieldElement::zero(), BFieldElement::zero()); 
    }
    
    constexpr const std::array<BFieldElement, 3>& coefficients() const { return coeffs_; }
    constexpr BFieldElement coeff(size_t i) const { return coeffs_[i]; }
    
    XFieldElement operator+(const XFieldElement& rhs) const;
    XFieldElement operator-(const XFieldElement& rhs) const;
    XFieldElement operator*(const XFieldElement& rhs) const;
    XFieldElement operator-() const;
    
    XFieldElement& operator+=(const XFieldElement& rhs);
    XFieldElement& operator-=(const XFieldElement& rhs);
    XFieldElement& operator*=(const XFieldElement& rhs);
    
    // Mixed arithmetic with BFieldElement
    XFieldElement operator+(const BFieldElement& rhs) const;
    XFieldElement operator*(const BFieldElement& rhs) const;
    XFieldElement& operator*=(const BFieldElement& rhs);
    
    bool operator==(const XFieldElement& rhs) const;
    bool operator!=(const XFieldElement& rhs) const;
    
    XFieldElement pow(uint64_t exp) const;
    bool is_zero() const;
    bool is_one() const;
    
    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream& os, const XFieldElement& elem);
    friend XFieldElement operator*(const BFieldElement& lhs, const XFieldElement& rhs);

private:
    std::array<BFieldElement, 3> coeffs_;
};

using XFE = XFieldElement;

} // namespace gpu_poly
