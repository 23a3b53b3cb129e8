#include <gtest/gtest.h>
#include <random>
#include "types/b_field_element.hpp"

using namespace gpu_poly;

class BFieldElementTest : public ::testing::Test {
protected:
    std::mt19937_64 rng_{42};

    BFieldElement random_bfield() {
        return BFieldElement(rng_());
    }

    // Schoolbook reference for a * b mod p
    static uint64_t mul_reference(uint64_t a, uint64_t b) {
        unsigned __int128 product = static_cast<unsigned __int128>(a) * b;
        return static_cast<uint64_t>(product % BFieldElement::MODULUS);
    }
};

TEST_F(BFieldElementTest, CanonicalConstruction) {
    EXPECT_EQ(BFieldElement().value(), 0ULL);
    EXPECT_EQ(BFieldElement(42).value(), 42ULL);
    EXPECT_EQ(BFieldElement(BFieldElement::MODULUS + 5).value(), 5ULL);
    EXPECT_EQ(BFieldElement(BFieldElement::MODULUS).value(), 0ULL);
}

TEST_F(BFieldElementTest, ModulusValue) {
    // 2^64 - 2^32 + 1
    EXPECT_EQ(BFieldElement::MODULUS, 0xFFFFFFFF00000001ULL);
    EXPECT_EQ(BFieldElement::EPSILON, 0xFFFFFFFFULL);
}

TEST_F(BFieldElementTest, AdditionWraps) {
    BFieldElement a(BFieldElement::MODULUS - 5);
    EXPECT_EQ((a + BFieldElement(10)).value(), 5ULL);
    EXPECT_EQ((BFieldElement(5) - BFieldElement(10)).value(), BFieldElement::MODULUS - 5);
    EXPECT_TRUE((a + (-a)).is_zero());
    EXPECT_TRUE((-BFieldElement::zero()).is_zero());
}

TEST_F(BFieldElementTest, MultiplicationReducesTwoToThe64) {
    // 2^64 = 2^32 - 1 mod p
    BFieldElement a(1ULL << 32);
    EXPECT_EQ((a * a).value(), (1ULL << 32) - 1);
}

TEST_F(BFieldElementTest, MultiplicationMatchesWideReference) {
    for (int i = 0; i < 2000; ++i) {
        BFieldElement a = random_bfield();
        BFieldElement b = random_bfield();
        EXPECT_EQ((a * b).value(), mul_reference(a.value(), b.value()))
            << a << " * " << b;
    }
    BFieldElement max(BFieldElement::MODULUS - 1);
    EXPECT_EQ((max * max).value(), 1ULL);
}

TEST_F(BFieldElementTest, Pow) {
    BFieldElement five(5);
    EXPECT_TRUE(five.pow(0).is_one());
    EXPECT_EQ(five.pow(1), five);
    EXPECT_EQ(BFieldElement(2).pow(10).value(), 1024ULL);
    // Fermat
    EXPECT_TRUE(random_bfield().pow(BFieldElement::MODULUS - 1).is_one());
}

TEST_F(BFieldElementTest, InverseAndDivision) {
    for (int i = 0; i < 100; ++i) {
        BFieldElement a = random_bfield();
        if (a.is_zero()) continue;
        EXPECT_TRUE((a * a.inverse()).is_one());
    }
    EXPECT_EQ((BFieldElement(100) / BFieldElement(5)).value(), 20ULL);
    EXPECT_THROW(BFieldElement::zero().inverse(), std::domain_error);
}

TEST_F(BFieldElementTest, BatchInversion) {
    std::vector<BFieldElement> values;
    for (uint64_t v = 1; v <= 64; ++v) {
        values.push_back(BFieldElement(v * 7919));
    }
    auto inverses = BFieldElement::batch_inversion(values);
    ASSERT_EQ(inverses.size(), values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        EXPECT_EQ(inverses[i], values[i].inverse());
    }
    EXPECT_TRUE(BFieldElement::batch_inversion({}).empty());
}

TEST_F(BFieldElementTest, PrimitiveRootsHaveExactOrder) {
    for (uint32_t log_n = 0; log_n <= BFieldElement::TWO_ADICITY; ++log_n) {
        BFieldElement root = BFieldElement::primitive_root_of_unity(log_n);
        EXPECT_TRUE(root.pow(1ULL << log_n).is_one()) << "log_n=" << log_n;
        if (log_n > 0) {
            EXPECT_FALSE(root.pow(1ULL << (log_n - 1)).is_one()) << "log_n=" << log_n;
        }
    }
}

TEST_F(BFieldElementTest, PrimitiveRootsSquareDown) {
    // w_{2n}^2 = w_n keeps the twiddle tables of different sizes consistent
    for (uint32_t log_n = 1; log_n <= BFieldElement::TWO_ADICITY; ++log_n) {
        BFieldElement big = BFieldElement::primitive_root_of_unity(log_n);
        EXPECT_EQ(big * big, BFieldElement::primitive_root_of_unity(log_n - 1));
    }
}

TEST_F(BFieldElementTest, PrimitiveRootBeyondTwoAdicityThrows) {
    EXPECT_THROW(BFieldElement::primitive_root_of_unity(BFieldElement::TWO_ADICITY + 1), std::invalid_argument);
}

TEST_F(BFieldElementTest, ToString) {
    EXPECT_EQ(BFieldElement(123456789).to_string(), "123456789");
}
