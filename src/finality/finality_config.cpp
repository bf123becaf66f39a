/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "finality/finality_config.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

OUTCOME_CPP_DEFINE_CATEGORY(rollnode::finality, ConfigError, e) {
  using E = rollnode::finality::ConfigError;
  switch (e) {
    case E::CONFIG_FILE_READ_FAILED:
      return "Config file can't be read";
    case E::CONFIG_FILE_PARSE_FAILED:
      return "Config file parse failed";
    case E::INVALID_VALUE:
      return "Result config has invalid values";
  }
  return "Unknown finality::ConfigError";
}

namespace {
  std::optional<uint64_t> readUnsigned(const YAML::Node &node,
                                       std::string_view name,
                                       std::ostringstream &errors) {
    if (not node.IsScalar()) {
      errors << "E: Value '" << name << "' must be scalar\n";
      return std::nullopt;
    }
    uint64_t value = 0;
    if (not YAML::convert<uint64_t>::decode(node, value)) {
      errors << "E: Value '" << name << "' must be unsigned integer\n";
      return std::nullopt;
    }
    return value;
  }
}  // namespace

namespace rollnode::finality {

  uint64_t calcFinalityLookback(const FinalityConfig &config) {
    if (config.alt_da.has_value()) {
      auto lookback = config.alt_da->da_challenge_window
                    + config.alt_da->da_resolve_window + 1;
      return std::max(lookback, config.default_lookback);
    }
    return config.default_lookback;
  }

  outcome::result<FinalityConfig> loadFinalityConfig(
      const YAML::Node &root, const log::Logger &logger) {
    FinalityConfig config;
    std::ostringstream errors;
    bool has_error = false;

    auto section = root["finality"];
    if (section.IsDefined()) {
      if (section.IsMap()) {
        auto lookback = section["lookback"];
        if (lookback.IsDefined()) {
          auto value = readUnsigned(lookback, "finality.lookback", errors);
          if (value.has_value()) {
            if (value.value() == 0) {
              errors << "E: Value 'finality.lookback' must be positive\n";
              has_error = true;
            } else {
              config.default_lookback = value.value();
            }
          } else {
            has_error = true;
          }
        }
        auto delay = section["delay"];
        if (delay.IsDefined()) {
          auto value = readUnsigned(delay, "finality.delay", errors);
          if (value.has_value()) {
            config.finality_delay = value.value();
          } else {
            has_error = true;
          }
        }
        auto alt_da = section["alt-da"];
        if (alt_da.IsDefined()) {
          if (alt_da.IsMap()) {
            auto challenge = alt_da["challenge-window"];
            auto resolve = alt_da["resolve-window"];
            if (challenge.IsDefined() and resolve.IsDefined()) {
              auto challenge_value = readUnsigned(
                  challenge, "finality.alt-da.challenge-window", errors);
              auto resolve_value = readUnsigned(
                  resolve, "finality.alt-da.resolve-window", errors);
              if (challenge_value.has_value() and resolve_value.has_value()) {
                config.alt_da = AltDaConfig{
                    .da_challenge_window = challenge_value.value(),
                    .da_resolve_window = resolve_value.value(),
                };
              } else {
                has_error = true;
              }
            } else {
              errors << "E: Section 'finality.alt-da' must define both "
                        "'challenge-window' and 'resolve-window'\n";
              has_error = true;
            }
          } else {
            errors << "E: Section 'finality.alt-da' defined, but is not map\n";
            has_error = true;
          }
        }
      } else {
        errors << "E: Section 'finality' defined, but is not map\n";
        has_error = true;
      }
    }

    if (has_error) {
      SL_ERROR(logger, "Finality config has some problems:");
      std::istringstream iss(errors.str());
      std::string line;
      while (std::getline(iss, line)) {
        SL_ERROR(logger, "  {}", std::string_view(line).substr(3));
      }
      return ConfigError::CONFIG_FILE_PARSE_FAILED;
    }

    // Overflowing sum would make the window silently tiny
    constexpr auto kMaxWindow = std::numeric_limits<uint64_t>::max() - 1;
    if (config.alt_da.has_value()
        and (config.alt_da->da_resolve_window > kMaxWindow
             or config.alt_da->da_challenge_window
                    > kMaxWindow - config.alt_da->da_resolve_window)) {
      SL_ERROR(logger,
               "Alt-DA windows are too large: challenge={}, resolve={}",
               config.alt_da->da_challenge_window,
               config.alt_da->da_resolve_window);
      return ConfigError::INVALID_VALUE;
    }

    SL_DEBUG(logger,
             "Finality config: lookback={}, delay={}, alt-da={}",
             calcFinalityLookback(config),
             config.finality_delay,
             config.alt_da.has_value() ? "on" : "off");
    return config;
  }

  outcome::result<FinalityConfig> loadFinalityConfigFile(
      const std::filesystem::path &path, const log::Logger &logger) {
    YAML::Node root;
    try {
      root = YAML::LoadFile(path.string());
    } catch (const std::exception &exception) {
      SL_ERROR(logger,
               "Can't parse file {}: {}",
               path.string(),
               exception.what());
      return ConfigError::CONFIG_FILE_READ_FAILED;
    }
    return loadFinalityConfig(root, logger);
  }

}  // namespace rollnode::finality
