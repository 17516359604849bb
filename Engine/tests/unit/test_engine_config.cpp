/**
 * @file test_engine_config.cpp
 * @brief Unit tests for EngineConfig environment overrides
 */

#include <gtest/gtest.h>
#include <config/engine_config.hpp>
#include <cstdlib>
#include <stdexcept>

using namespace Lexigraph;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override {
        clear_env();
        Logger::set_threshold(Logger::Level::Info);
    }

    static void clear_env() {
        for (const char* name : {"LEXIGRAPH_TOP_N", "LEXIGRAPH_WORKERS", "LEXIGRAPH_MODE", "LEXIGRAPH_MIN_STEM",
                                 "LEXIGRAPH_ALL_PRONUNCIATIONS", "LEXIGRAPH_LOG_LEVEL"}) {
            unsetenv(name);
        }
    }
};

TEST_F(EngineConfigTest, DefaultsWithoutEnvironment) {
    EngineConfig config = EngineConfig::load_from_env();
    LoaderConfig defaults;

    EXPECT_EQ(config.loader.top_n, defaults.top_n);
    EXPECT_EQ(config.loader.workers, 0u);
    EXPECT_EQ(config.loader.mode, ChartMode::Morphemes);
    EXPECT_EQ(config.loader.segmenter.min_stem_length, 3u);
    EXPECT_FALSE(config.loader.all_pronunciations);
    EXPECT_EQ(config.log_level, Logger::Level::Info);
}

TEST_F(EngineConfigTest, ReadsOverrides) {
    setenv("LEXIGRAPH_TOP_N", "250", 1);
    setenv("LEXIGRAPH_WORKERS", "8", 1);
    setenv("LEXIGRAPH_MODE", "Phonemes", 1);
    setenv("LEXIGRAPH_MIN_STEM", "2", 1);
    setenv("LEXIGRAPH_ALL_PRONUNCIATIONS", "yes", 1);
    setenv("LEXIGRAPH_LOG_LEVEL", "warning", 1);

    EngineConfig config = EngineConfig::load_from_env();
    EXPECT_EQ(config.loader.top_n, 250u);
    EXPECT_EQ(config.loader.workers, 8u);
    EXPECT_EQ(config.loader.mode, ChartMode::Phonemes);
    EXPECT_EQ(config.loader.segmenter.min_stem_length, 2u);
    EXPECT_TRUE(config.loader.all_pronunciations);
    EXPECT_EQ(config.log_level, Logger::Level::Warning);
}

TEST_F(EngineConfigTest, RejectsMalformedNumbers) {
    setenv("LEXIGRAPH_TOP_N", "many", 1);
    EXPECT_THROW(EngineConfig::load_from_env(), std::runtime_error);

    setenv("LEXIGRAPH_TOP_N", "-5", 1);
    EXPECT_THROW(EngineConfig::load_from_env(), std::runtime_error);

    setenv("LEXIGRAPH_TOP_N", "", 1);
    EXPECT_THROW(EngineConfig::load_from_env(), std::runtime_error);
}

TEST_F(EngineConfigTest, RejectsUnknownEnumerations) {
    setenv("LEXIGRAPH_MODE", "letters", 1);
    EXPECT_THROW(EngineConfig::load_from_env(), std::runtime_error);
    unsetenv("LEXIGRAPH_MODE");

    setenv("LEXIGRAPH_ALL_PRONUNCIATIONS", "maybe", 1);
    EXPECT_THROW(EngineConfig::load_from_env(), std::runtime_error);
    unsetenv("LEXIGRAPH_ALL_PRONUNCIATIONS");

    setenv("LEXIGRAPH_LOG_LEVEL", "chatty", 1);
    EXPECT_THROW(EngineConfig::load_from_env(), std::runtime_error);
}

TEST_F(EngineConfigTest, ApplySetsLoggerThreshold) {
    EngineConfig config;
    config.log_level = Logger::Level::Error;
    config.apply();
    EXPECT_EQ(Logger::threshold(), Logger::Level::Error);
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("BULK"), Logger::Level::Bulk);
    EXPECT_EQ(parse_log_level("warn"), Logger::Level::Warning);
    EXPECT_EQ(parse_log_level("quiet"), Logger::Level::Quiet);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}
