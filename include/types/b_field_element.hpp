#pragma once

#include <cstdint>
#include <string>
#include <ostream>
#include <vector>

namespace gpu_poly {

// 128-bit unsigned integer type for intermediate calculations
using uint128_t = __uint128_t;

/**
 * BFieldElement - Base Field Element
 * 
 * Element of the Goldilocks prime field with modulus p = 2^64 - 2^32 + 1.
 * Stored canonically as a single uint64_t, which is also its GPU buffer layout.
 */
class BFieldElement {
public:
    // The Goldilocks prime: 2^64 - 2^32 + 1
    static constexpr uint64_t MODULUS = 18446744069414584321ULL;

    // 2^64 mod p
    static constexpr uint64_t EPSILON = 4294967295ULL;
    
    // Generator of the multiplicative group
    static constexpr uint64_t GENERATOR = 7ULL;

    // Largest k such that 2^k divides p - 1
    static constexpr uint32_t TWO_ADICITY = 32;

    constexpr BFieldElement() : value_(0) {}
    constexpr explicit BFieldElement(uint64_t value) : value_(value % MODULUS) {}
    
    static constexpr BFieldElement zero() { return BFieldElement(0); }
    static constexpr BFieldElement one() { return BFieldElement(1); }
    static constexpr BFieldElement generator() { return BFieldElement(GENERATOR); }
    
    constexpr uint64_t value() const { return value_; }
    
    BFieldElement operator+(const BFieldElement& rhs) const;
    BFieldElement operator-(const BFieldElement& rhs) const;
    BFieldElement operator*(const BFieldElement& rhs) const;
    BFieldElement operator/(const BFieldElement& rhs) const;
    BFieldElement operator-() const;
    
    BFieldElement& operator+=(const BFieldElement& rhs);
    BFieldElement& operator-=(const BFieldElement& rhs);
    BFieldElement& operator*=(const BFieldElement& rhs);
    BFieldElement& operator/=(const BFieldElement& rhs);
    
    bool operator==(const BFieldElement& rhs) const { return value_ == rhs.value_; }
    bool operator!=(const BFieldElement& rhs) const { return value_ != rhs.value_; }
    
    BFieldElement inverse() const;
    BFieldElement pow(uint64_t exp) const;
    bool is_zero() const { return value_ == 0; }
    bool is_one() const { return value_ == 1; }

    static std::vector<BFieldElement> batch_inversion(const std::vector<BFieldElement>& elements);
    
    /**
     * Primitive root of unity of order 2^log2_order.
     * Throws std::invalid_argument if log2_order > TWO_ADICITY.
     */
    static BFieldElement primitive_root_of_unity(uint32_t log2_order);
    
    std::string to_string() const;
    
    friend std::ostream& operator<<(std::ostream& os, const BFieldElement& elem);

private:
    uint64_t value_;
    
    static uint64_t reduce(uint128_t value);
};

using BFE = BFieldElement;

} // namespace gpu_poly
