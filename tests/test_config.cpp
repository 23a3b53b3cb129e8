#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include "common/config.hpp"
#include "common/debug_control.hpp"

using namespace gpu_poly;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }

    void TearDown() override {
        clear_env();
        if (!temp_path_.empty()) {
            std::remove(temp_path_.c_str());
        }
        debug::set_profile_enabled(false);
        debug::set_debug_enabled(false);
    }

    static void clear_env() {
        unsetenv("GPU_POLY_CONFIG");
        unsetenv("GPU_POLY_DEVICE");
        unsetenv("GPU_POLY_PROFILE");
        unsetenv("GPU_POLY_DEBUG");
    }

    std::string write_temp(const std::string& contents) {
        temp_path_ = ::testing::TempDir() + "gpu_poly_config_test.json";
        std::ofstream f(temp_path_);
        f << contents;
        return temp_path_;
    }

    std::string temp_path_;
};

TEST_F(EngineConfigTest, Defaults) {
    EngineConfig cfg = EngineConfig::load();
    EXPECT_EQ(cfg.device_id, 0);
    EXPECT_FALSE(cfg.profile);
    EXPECT_FALSE(cfg.debug);
    EXPECT_TRUE(cfg.cache_twiddles);
    EXPECT_EQ(cfg.proof_options, ProofOptions());
}

TEST_F(EngineConfigTest, MergeJsonKeepsAbsentFields) {
    EngineConfig cfg;
    cfg.merge_json({{"profile", true}, {"proof_options", {{"num_queries", 64}}}});
    EXPECT_TRUE(cfg.profile);
    EXPECT_FALSE(cfg.debug);
    EXPECT_TRUE(cfg.cache_twiddles);
    EXPECT_EQ(cfg.proof_options.num_queries, 64u);
}

TEST_F(EngineConfigTest, MergeJsonRejectsBadValues) {
    EngineConfig cfg;
    EXPECT_THROW(cfg.merge_json({{"device_id", "zero"}}), std::invalid_argument);
    EXPECT_THROW(cfg.merge_json({{"device_id", -1}}), std::invalid_argument);
    EXPECT_THROW(cfg.merge_json(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(cfg.merge_json({{"proof_options", {{"lde_blowup_factor", 5}}}}), std::invalid_argument);
}

TEST_F(EngineConfigTest, EnvironmentOverridesFile) {
    std::string path = write_temp(R"({"device_id": 1, "debug": true, "cache_twiddles": false})");
    setenv("GPU_POLY_CONFIG", path.c_str(), 1);
    setenv("GPU_POLY_DEVICE", "2", 1);
    setenv("GPU_POLY_PROFILE", "true", 1);

    EngineConfig cfg = EngineConfig::load();
    EXPECT_EQ(cfg.device_id, 2);
    EXPECT_TRUE(cfg.debug);
    EXPECT_TRUE(cfg.profile);
    EXPECT_FALSE(cfg.cache_twiddles);
}

TEST_F(EngineConfigTest, BadEnvironmentValuesThrow) {
    setenv("GPU_POLY_DEVICE", "gpu0", 1);
    EXPECT_THROW(EngineConfig::load(), std::invalid_argument);
    unsetenv("GPU_POLY_DEVICE");

    setenv("GPU_POLY_DEBUG", "maybe", 1);
    EXPECT_THROW(EngineConfig::load(), std::invalid_argument);
}

TEST_F(EngineConfigTest, MissingOrMalformedFile) {
    EXPECT_THROW(EngineConfig::from_file("/nonexistent/gpu_poly.json"), std::invalid_argument);
    std::string path = write_temp("{ not json");
    EXPECT_THROW(EngineConfig::from_file(path), std::invalid_argument);
}

TEST_F(EngineConfigTest, ToJsonRoundTrip) {
    EngineConfig cfg;
    cfg.device_id = 3;
    cfg.debug = true;
    cfg.proof_options.grinding_factor = 4;

    EngineConfig copy;
    copy.merge_json(cfg.to_json());
    EXPECT_EQ(copy.device_id, 3);
    EXPECT_TRUE(copy.debug);
    EXPECT_EQ(copy.proof_options, cfg.proof_options);
}

TEST_F(EngineConfigTest, ApplySetsLoggingFlags) {
    EngineConfig cfg;
    cfg.profile = true;
    cfg.debug = false;
    cfg.apply();
    EXPECT_TRUE(GPU_POLY_PROFILE_ENABLED());
    EXPECT_FALSE(GPU_POLY_DEBUG_ENABLED());
}
