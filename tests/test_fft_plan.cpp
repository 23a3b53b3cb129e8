#include <gtest/gtest.h>
#include <random>

#include "ntt/fft_plan.hpp"
#include "ntt/twiddles.hpp"
#include "polynomial/polynomial_utils.hpp"

using namespace gpu_poly;

namespace {

uint32_t total_stages(const std::vector<LadderStep>& ladder) {
    uint32_t total = 0;
    for (const auto& step : ladder) total += step.stages;
    return total;
}

/**
 * Host model of the dispatch ladder: the same pairing and twiddle indexing
 * the butterfly kernels use, one stage at a time.
 */
template<typename F>
void run_ladder_on_host(std::vector<F>& data, const std::vector<BFieldElement>& twiddles) {
    const size_t n = data.size();
    for (const LadderStep& step : plan_fft_ladder(n)) {
        size_t num_boxes = step.num_boxes;
        for (uint32_t s = 0; s < step.stages; ++s, num_boxes *= 2) {
            const size_t box_size = n / num_boxes;
            const size_t half = box_size / 2;
            for (size_t lane = 0; lane < n / 2; ++lane) {
                const size_t box = lane / half;
                const size_t i0 = box * box_size + lane % half;
                const size_t i1 = i0 + half;
                F wy = data[i1] * twiddles[box];
                F x = data[i0];
                data[i0] = x + wy;
                data[i1] = x - wy;
            }
        }
    }
}

std::vector<BFieldElement> random_vector(size_t n, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<BFieldElement> v(n);
    for (auto& x : v) x = BFieldElement(rng());
    return v;
}

} // namespace

TEST(FftLadderTest, SmallestSizeIsOneMultipleDispatch) {
    auto ladder = plan_fft_ladder(2048);
    ASSERT_EQ(ladder.size(), 1u);
    EXPECT_EQ(ladder[0].variant, FftVariant::Multiple);
    EXPECT_EQ(ladder[0].num_boxes, 1u);
    EXPECT_EQ(ladder[0].stages, 11u);
}

TEST(FftLadderTest, SingleDispatchesUntilBoxesFitATile) {
    auto ladder = plan_fft_ladder(size_t(1) << 20);
    ASSERT_EQ(ladder.size(), 10u);
    for (size_t i = 0; i < 9; ++i) {
        EXPECT_EQ(ladder[i].variant, FftVariant::Single);
        EXPECT_EQ(ladder[i].num_boxes, size_t(1) << i);
        EXPECT_EQ(ladder[i].stages, 1u);
    }
    EXPECT_EQ(ladder.back().variant, FftVariant::Multiple);
    EXPECT_EQ(ladder.back().num_boxes, 512u);
    EXPECT_EQ(ladder.back().stages, 11u);
}

TEST(FftLadderTest, StagesAlwaysSumToLogN) {
    for (uint32_t log_n = kMinLog2TransformSize; log_n <= kMaxLog2TransformSize; ++log_n) {
        auto ladder = plan_fft_ladder(size_t(1) << log_n);
        EXPECT_EQ(total_stages(ladder), log_n);
        EXPECT_EQ(ladder.size(), log_n - 10);
    }
}

TEST(FftLadderTest, RejectsUnsupportedSizes) {
    EXPECT_THROW(plan_fft_ladder(1024), std::invalid_argument);
    EXPECT_THROW(plan_fft_ladder(size_t(1) << 31), std::invalid_argument);
    EXPECT_THROW(plan_fft_ladder(5000), std::invalid_argument);
}

TEST(FftLadderTest, Description) {
    EXPECT_EQ(describe_ladder(plan_fft_ladder(2048)), "multiple(1, x11)");
    EXPECT_EQ(describe_ladder(plan_fft_ladder(8192)), "single(1) -> single(2) -> multiple(4, x11)");
}

TEST(FftLadderTest, HostModelOfLadderIsABitReversedDft) {
    const size_t n = 2048;
    auto coeffs = random_vector(n, 1);
    auto values = coeffs;
    run_ladder_on_host(values, compute_twiddles(n, FftDirection::Forward));
    bit_reverse_permute(values);

    auto domain = EvaluationDomain::of_size(n);
    for (size_t i = 0; i < n; i += 97) {
        EXPECT_EQ(values[i], horner_evaluate(coeffs, domain.element(i))) << "i=" << i;
    }
}

TEST(FftLadderTest, HostModelOfInverseLadderRestoresCoefficients) {
    const size_t n = 4096;
    auto coeffs = random_vector(n, 2);
    auto data = coeffs;
    run_ladder_on_host(data, compute_twiddles(n, FftDirection::Forward));
    bit_reverse_permute(data);
    run_ladder_on_host(data, compute_twiddles(n, FftDirection::Inverse));
    bit_reverse_permute(data);
    const BFieldElement n_inv = BFieldElement(n).inverse();
    for (auto& x : data) x *= n_inv;
    EXPECT_EQ(data, coeffs);
}

TEST(FftPlanTest, InverseTransformCannotLeaveBitReversedOutput) {
    gpu::KernelLibrary library(0);
    TwiddleCache twiddles;
    auto domain = EvaluationDomain::of_size(2048);
    EXPECT_THROW(FftPlan<BFieldElement>(library, twiddles, domain, FftDirection::Inverse, nullptr,
                                        OutputOrder::BitReversed),
                 std::invalid_argument);
    EXPECT_EQ(twiddles.size(), 0u);
}
