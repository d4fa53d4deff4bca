#include <cstdlib>

#include <gtest/gtest.h>

#include "digitloom/config.hpp"
#include "digitloom/error.hpp"
#include "digitloom/logging.hpp"
#include "test_support.hpp"

using namespace digitloom;

class ConfigTest : public test::DigitloomTest {
protected:
    void TearDown() override {
        for (const char* key : {"DIGITLOOM_GUARD_DIGITS", "DIGITLOOM_THREADS", "DIGITLOOM_LOG_LEVEL",
                                "DIGITLOOM_BBP_GUARD_BITS", "DIGITLOOM_SCRYPT_LOG2_N"}) {
            unsetenv(key);
        }
        test::DigitloomTest::TearDown();
    }
};

TEST_F(ConfigTest, Defaults) {
    EngineConfig config;
    EXPECT_EQ(config.guard_digits, 15u);
    EXPECT_EQ(config.retry_guard_digits, 40u);
    EXPECT_EQ(config.bbp_guard_bits, 10u);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("DIGITLOOM_GUARD_DIGITS", "25", 1);
    setenv("DIGITLOOM_THREADS", "3", 1);
    setenv("DIGITLOOM_LOG_LEVEL", "debug", 1);

    EngineConfig config = EngineConfig::from_environment();
    EXPECT_EQ(config.guard_digits, 25u);
    EXPECT_EQ(config.threads, 3u);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.retry_guard_digits, 40u);
}

TEST_F(ConfigTest, RejectsMalformedValues) {
    setenv("DIGITLOOM_GUARD_DIGITS", "many", 1);
    try {
        EngineConfig::from_environment();
        FAIL() << "accepted a non-numeric guard";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.context(), "DIGITLOOM_GUARD_DIGITS");
    }

    setenv("DIGITLOOM_GUARD_DIGITS", "-3", 1);
    EXPECT_THROW(EngineConfig::from_environment(), ConfigError);

    setenv("DIGITLOOM_GUARD_DIGITS", "12x", 1);
    EXPECT_THROW(EngineConfig::from_environment(), ConfigError);
}

TEST_F(ConfigTest, RejectsOutOfRangeValues) {
    setenv("DIGITLOOM_BBP_GUARD_BITS", "4", 1);
    EXPECT_THROW(EngineConfig::from_environment(), ConfigError);
    unsetenv("DIGITLOOM_BBP_GUARD_BITS");

    setenv("DIGITLOOM_SCRYPT_LOG2_N", "40", 1);
    EXPECT_THROW(EngineConfig::from_environment(), ConfigError);

    EngineConfig config;
    config.split_task_terms = config.split_leaf_terms;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST_F(ConfigTest, LogLevels) {
    EXPECT_NO_THROW(logging::set_level("warn"));
    EXPECT_EQ(logging::get()->level(), spdlog::level::warn);
    EXPECT_THROW(logging::set_level("loud"), ConfigError);
    logging::set_level("error");
}

TEST_F(ConfigTest, ErrorMessagesCarryTheirCode) {
    ChunkIntegrityFailure failure(4, "digest mismatch", "aa", "bb");
    EXPECT_EQ(failure.code(), ErrorCode::ChunkIntegrityFailure);
    EXPECT_EQ(std::string(failure.what()), "ChunkIntegrityFailure: chunk 4: digest mismatch [expected aa, actual bb]");

    InvalidExpression bad("unknown constant 'x'", 7);
    EXPECT_EQ(bad.offset(), 7u);
    EXPECT_EQ(bad.context(), "offset 7");
}
