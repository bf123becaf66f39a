/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "finality/finality_config.hpp"

#include <gtest/gtest.h>

#include <limits>

#include <qtils/test/outcome.hpp>

#include "testutil/prepare_loggers.hpp"

using rollnode::finality::AltDaConfig;
using rollnode::finality::calcFinalityLookback;
using rollnode::finality::ConfigError;
using rollnode::finality::FinalityConfig;
using rollnode::finality::kDefaultFinalityLookback;
using rollnode::finality::kFinalityDelay;
using rollnode::finality::loadFinalityConfig;
using rollnode::finality::loadFinalityConfigFile;

class FinalityConfigTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  outcome::result<FinalityConfig> load(const std::string &yaml) {
    return loadFinalityConfig(YAML::Load(yaml), logger);
  }

  qtils::SharedRef<rollnode::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  rollnode::log::Logger logger = logsys->getLogger("Config", "testing");
};

TEST_F(FinalityConfigTest, DefaultLookback) {
  EXPECT_EQ(kDefaultFinalityLookback, 129);
  EXPECT_EQ(calcFinalityLookback(FinalityConfig{}), 129);
}

TEST_F(FinalityConfigTest, AltDaWindowsOverrideSmallerDefault) {
  FinalityConfig config{
      .alt_da = AltDaConfig{.da_challenge_window = 100,
                            .da_resolve_window = 50},
  };
  EXPECT_EQ(calcFinalityLookback(config), 151);
}

TEST_F(FinalityConfigTest, SmallAltDaWindowsKeepDefault) {
  FinalityConfig config{
      .alt_da = AltDaConfig{.da_challenge_window = 20,
                            .da_resolve_window = 10},
  };
  EXPECT_EQ(calcFinalityLookback(config), kDefaultFinalityLookback);

  config.default_lookback = 10;
  EXPECT_EQ(calcFinalityLookback(config), 31);
}

TEST_F(FinalityConfigTest, MissingSectionKeepsDefaults) {
  ASSERT_OUTCOME_SUCCESS(config, load("general:\n  name: node\n"));
  EXPECT_EQ(config, FinalityConfig{});
  EXPECT_EQ(config.finality_delay, kFinalityDelay);
}

TEST_F(FinalityConfigTest, ReadsAllValues) {
  ASSERT_OUTCOME_SUCCESS(config, load(R"(
finality:
  lookback: 200
  delay: 32
  alt-da:
    challenge-window: 300
    resolve-window: 100
)"));
  EXPECT_EQ(config.default_lookback, 200);
  EXPECT_EQ(config.finality_delay, 32);
  ASSERT_TRUE(config.alt_da.has_value());
  EXPECT_EQ(config.alt_da->da_challenge_window, 300);
  EXPECT_EQ(config.alt_da->da_resolve_window, 100);
  EXPECT_EQ(calcFinalityLookback(config), 401);
}

TEST_F(FinalityConfigTest, SectionMustBeMap) {
  auto res = load("finality: 5\n");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            std::error_code{ConfigError::CONFIG_FILE_PARSE_FAILED});
}

TEST_F(FinalityConfigTest, ValuesMustBeNumbers) {
  auto res = load("finality:\n  lookback: many\n");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            std::error_code{ConfigError::CONFIG_FILE_PARSE_FAILED});

  res = load("finality:\n  delay: [1, 2]\n");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            std::error_code{ConfigError::CONFIG_FILE_PARSE_FAILED});
}

TEST_F(FinalityConfigTest, ZeroLookbackIsRejected) {
  auto res = load("finality:\n  lookback: 0\n");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            std::error_code{ConfigError::CONFIG_FILE_PARSE_FAILED});
}

TEST_F(FinalityConfigTest, AltDaNeedsBothWindows) {
  auto res = load("finality:\n  alt-da:\n    challenge-window: 10\n");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            std::error_code{ConfigError::CONFIG_FILE_PARSE_FAILED});
}

TEST_F(FinalityConfigTest, AltDaWindowsMustNotOverflow) {
  auto res = load(R"(
finality:
  alt-da:
    challenge-window: 18446744073709551615
    resolve-window: 1
)");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), std::error_code{ConfigError::INVALID_VALUE});
}

TEST_F(FinalityConfigTest, MaximalDelayIsKept) {
  ASSERT_OUTCOME_SUCCESS(config,
                         load("finality:\n  delay: 18446744073709551615\n"));
  EXPECT_EQ(config.finality_delay, std::numeric_limits<uint64_t>::max());
}

TEST_F(FinalityConfigTest, MissingFileIsReported) {
  auto res = loadFinalityConfigFile("/nonexistent/rollnode/config.yaml", logger);
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), std::error_code{ConfigError::CONFIG_FILE_READ_FAILED});
}
