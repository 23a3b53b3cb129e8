#include <gtest/gtest.h>
#include <random>
#include "types/x_field_element.hpp"
#include "types/gpu_field.hpp"

using namespace gpu_poly;

class XFieldElementTest : public ::testing::Test {
protected:
    std::mt19937_64 rng_{7};

    XFieldElement random_xfield() {
        return XFieldElement(BFieldElement(rng_()), BFieldElement(rng_()), BFieldElement(rng_()));
    }
};

TEST_F(XFieldElementTest, Construction) {
    XFieldElement elem(BFieldElement(1), BFieldElement(2), BFieldElement(3));
    EXPECT_EQ(elem.coeff(0).value(), 1ULL);
    EXPECT_EQ(elem.coeff(1).value(), 2ULL);
    EXPECT_EQ(elem.coeff(2).value(), 3ULL);

    XFieldElement lifted(BFieldElement(42));
    EXPECT_EQ(lifted, XFieldElement(BFieldElement(42), BFieldElement::zero(), BFieldElement::zero()));
    EXPECT_TRUE(XFieldElement::zero().is_zero());
    EXPECT_TRUE(XFieldElement::one().is_one());
}

TEST_F(XFieldElementTest, AdditionIsComponentwise) {
    XFieldElement a(BFieldElement(1), BFieldElement(2), BFieldElement(3));
    XFieldElement b(BFieldElement(4), BFieldElement(5), BFieldElement(6));
    EXPECT_EQ(a + b, XFieldElement(BFieldElement(5), BFieldElement(7), BFieldElement(9)));
    EXPECT_EQ((a + b) - b, a);
    EXPECT_TRUE((a + (-a)).is_zero());
}

TEST_F(XFieldElementTest, XCubedIsXMinusOne) {
    XFieldElement x(BFieldElement::zero(), BFieldElement::one(), BFieldElement::zero());
    XFieldElement expected(-BFieldElement::one(), BFieldElement::one(), BFieldElement::zero());
    EXPECT_EQ(x * x * x, expected);
    EXPECT_EQ(x.pow(3), expected);
}

TEST_F(XFieldElementTest, MultiplicationIsCommutativeAndAssociative) {
    for (int i = 0; i < 200; ++i) {
        XFieldElement a = random_xfield();
        XFieldElement b = random_xfield();
        XFieldElement c = random_xfield();
        EXPECT_EQ(a * b, b * a);
        EXPECT_EQ((a * b) * c, a * (b * c));
        EXPECT_EQ(a * (b + c), a * b + a * c);
    }
}

TEST_F(XFieldElementTest, BaseFieldScalingMatchesLiftedProduct) {
    for (int i = 0; i < 200; ++i) {
        XFieldElement a = random_xfield();
        BFieldElement s(rng_());
        EXPECT_EQ(a * s, a * XFieldElement(s));
        EXPECT_EQ(s * a, a * s);
        XFieldElement scaled = a;
        scaled *= s;
        EXPECT_EQ(scaled, a * s);
    }
}

TEST_F(XFieldElementTest, MixedAddition) {
    XFieldElement a(BFieldElement(1), BFieldElement(2), BFieldElement(3));
    EXPECT_EQ(a + BFieldElement(10), XFieldElement(BFieldElement(11), BFieldElement(2), BFieldElement(3)));
}

TEST_F(XFieldElementTest, Pow) {
    XFieldElement a = random_xfield();
    EXPECT_TRUE(a.pow(0).is_one());
    EXPECT_EQ(a.pow(1), a);
    EXPECT_EQ(a.pow(5), a * a * a * a * a);
}

TEST_F(XFieldElementTest, DeviceLayout) {
    EXPECT_EQ(sizeof(XFieldElement), 3 * sizeof(uint64_t));
    EXPECT_EQ(GpuField<XFieldElement>::element_bytes, 24u);
    EXPECT_STREQ(GpuField<XFieldElement>::name(), "p18446744069414584321_fq3");
    EXPECT_STREQ(GpuField<BFieldElement>::name(), "p18446744069414584321");
}

TEST_F(XFieldElementTest, ToString) {
    XFieldElement a(BFieldElement(1), BFieldElement(2), BFieldElement(3));
    EXPECT_EQ(a.to_string(), "(1, 2, 3)");
}
