#include <gtest/gtest.h>

#include "stark/proof_options.hpp"

using namespace gpu_poly;

TEST(ProofOptionsTest, DefaultsAreValid) {
    ProofOptions options;
    EXPECT_NO_THROW(options.validate());
    EXPECT_EQ(options.lde_domain_size(2048), 2048u * options.lde_blowup_factor);
}

TEST(ProofOptionsTest, RejectsOutOfRangeFields) {
    EXPECT_THROW(ProofOptions(0, 4, 16, 8, 64), std::invalid_argument);
    EXPECT_THROW(ProofOptions(129, 4, 16, 8, 64), std::invalid_argument);
    EXPECT_THROW(ProofOptions(32, 3, 16, 8, 64), std::invalid_argument);
    EXPECT_THROW(ProofOptions(32, 128, 16, 8, 64), std::invalid_argument);
    EXPECT_THROW(ProofOptions(32, 0, 16, 8, 64), std::invalid_argument);
    EXPECT_THROW(ProofOptions(32, 4, 33, 8, 64), std::invalid_argument);
    EXPECT_NO_THROW(ProofOptions(1, 1, 0, 2, 1));
    EXPECT_NO_THROW(ProofOptions(128, 64, 32, 16, 255));
}

TEST(ProofOptionsTest, SecurityLevelWithoutGrindingCredit) {
    // 2^3 blowup * 32 queries = 96 bits; grinding adds 16 -> 112.
    // Field bits 192 - log2(8 * 2^20) = 169, so queries decide: 111.
    EXPECT_EQ(conjectured_security_level(192, 128, 8, size_t(1) << 20, 32, 16), 111u);
    // 2 * 20 = 40 bits of query security, below the grinding floor
    EXPECT_EQ(conjectured_security_level(192, 128, 4, size_t(1) << 20, 20, 16), 39u);
}

TEST(ProofOptionsTest, SecurityLevelIsCappedByFieldAndHash) {
    // 64-bit field, domain 2^24: field security 40
    EXPECT_EQ(conjectured_security_level(64, 128, 16, size_t(1) << 20, 64, 0), 39u);
    // hash caps a very strong configuration
    EXPECT_EQ(conjectured_security_level(192, 100, 64, 2048, 128, 32), 100u);
}

TEST(ProofOptionsTest, MemberSecurityLevelUsesOwnParameters) {
    ProofOptions options(32, 8, 16, 8, 64);
    EXPECT_EQ(options.conjectured_security_level(192, 128, size_t(1) << 20),
              conjectured_security_level(192, 128, 8, size_t(1) << 20, 32, 16));
}

TEST(ProofOptionsTest, SecurityLevelRejectsDegenerateInputs) {
    EXPECT_THROW(conjectured_security_level(192, 128, 3, 1024, 32, 0), std::invalid_argument);
    EXPECT_THROW(conjectured_security_level(192, 128, 8, 0, 32, 0), std::invalid_argument);
}

TEST(ProofOptionsTest, JsonRoundTrip) {
    ProofOptions options(40, 16, 20, 4, 128);
    nlohmann::json j = options;
    EXPECT_EQ(j["num_queries"], 40);
    EXPECT_EQ(j["lde_blowup_factor"], 16);
    EXPECT_EQ(j.get<ProofOptions>(), options);
}

TEST(ProofOptionsTest, PartialJsonKeepsDefaults) {
    auto options = nlohmann::json{{"num_queries", 50}}.get<ProofOptions>();
    EXPECT_EQ(options.num_queries, 50u);
    EXPECT_EQ(options.lde_blowup_factor, ProofOptions().lde_blowup_factor);
}

TEST(ProofOptionsTest, InvalidJsonIsRejected) {
    nlohmann::json bad_blowup = {{"lde_blowup_factor", 6}};
    EXPECT_THROW(bad_blowup.get<ProofOptions>(), std::invalid_argument);
    EXPECT_THROW(ProofOptions::from_config({{"proof_options", {{"num_queries", "many"}}}}), std::invalid_argument);
}

TEST(ProofOptionsTest, FromConfigDocument) {
    EXPECT_EQ(ProofOptions::from_config(nlohmann::json::object()), ProofOptions());
    auto options = ProofOptions::from_config({{"device_id", 0}, {"proof_options", {{"grinding_factor", 8}}}});
    EXPECT_EQ(options.grinding_factor, 8u);
}
