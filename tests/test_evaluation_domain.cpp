#include <gtest/gtest.h>
#include "ntt/evaluation_domain.hpp"

using namespace gpu_poly;

TEST(EvaluationDomainTest, AcceptsSupportedSizes) {
    EXPECT_NO_THROW(check_transform_size(kMinTransformSize));
    EXPECT_NO_THROW(check_transform_size(1 << 20));
    EXPECT_NO_THROW(check_transform_size(kMaxTransformSize));
}

TEST(EvaluationDomainTest, RejectsSizesOutsideRange) {
    EXPECT_THROW(check_transform_size(1024), std::invalid_argument);
    EXPECT_THROW(check_transform_size(size_t(1) << 31), std::invalid_argument);
    EXPECT_THROW(check_transform_size(0), std::invalid_argument);
}

TEST(EvaluationDomainTest, RejectsNonPowerOfTwo) {
    EXPECT_THROW(check_transform_size(3000), std::invalid_argument);
    EXPECT_THROW(check_transform_size(kMinTransformSize + 1), std::invalid_argument);
    try {
        check_transform_size(6144);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("not a power of two"), std::string::npos);
    }
}

TEST(EvaluationDomainTest, Log2Helpers) {
    EXPECT_TRUE(is_power_of_two(1));
    EXPECT_TRUE(is_power_of_two(2048));
    EXPECT_FALSE(is_power_of_two(0));
    EXPECT_FALSE(is_power_of_two(2049));
    EXPECT_EQ(log2_exact(1), 0u);
    EXPECT_EQ(log2_exact(2048), 11u);
    EXPECT_EQ(log2_exact(size_t(1) << 30), 30u);
}

TEST(EvaluationDomainTest, SubgroupOfSize) {
    auto d = EvaluationDomain::of_size(4096);
    EXPECT_EQ(d.size, 4096u);
    EXPECT_EQ(d.log_size, 12u);
    EXPECT_TRUE(d.generator.pow(4096).is_one());
    EXPECT_FALSE(d.generator.pow(2048).is_one());
    EXPECT_TRUE((d.generator * d.generator_inv).is_one());
    EXPECT_TRUE((d.size_inv * BFieldElement(4096)).is_one());
    EXPECT_FALSE(d.is_coset());
    EXPECT_TRUE(d.offset_pow_size().is_one());
}

TEST(EvaluationDomainTest, Coset) {
    auto d = EvaluationDomain::of_size(2048).with_offset(BFieldElement::generator());
    EXPECT_TRUE(d.is_coset());
    EXPECT_TRUE((d.offset * d.offset_inv).is_one());
    EXPECT_EQ(d.element(0), BFieldElement::generator());
    EXPECT_EQ(d.element(5), BFieldElement::generator() * d.generator.pow(5));
    EXPECT_EQ(d.element(2048), d.element(0));
    EXPECT_EQ(d.offset_pow_size(), BFieldElement::generator().pow(2048));
    EXPECT_THROW(d.with_offset(BFieldElement::zero()), std::invalid_argument);
}
