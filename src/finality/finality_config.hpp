/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <yaml-cpp/yaml.h>

#include "log/logger.hpp"

namespace rollnode::finality {

  /**
   * Number of L1<>L2 derivation relations to keep, one per L1 block.
   *
   * L1 finalizes blocks at most 4 epochs of 32 slots behind its head, so a
   * new finality signal always lands inside that range. One more slot leaves
   * room to append before pruning. Older signals or too little history only
   * delay L2 finality, they never make it diverge.
   */
  constexpr uint64_t kDefaultFinalityLookback = 4 * 32 + 1;

  /**
   * Number of L1 blocks to traverse before trying to finalize again.
   * Each attempt fetches L1 blocks by number, which are not cached.
   */
  constexpr uint64_t kFinalityDelay = 64;

  /// Data availability windows, present when alt-DA mode is active
  struct AltDaConfig {
    uint64_t da_challenge_window = 0;
    uint64_t da_resolve_window = 0;

    bool operator==(const AltDaConfig &) const = default;
  };

  struct FinalityConfig {
    uint64_t default_lookback = kDefaultFinalityLookback;
    std::optional<AltDaConfig> alt_da;
    uint64_t finality_delay = kFinalityDelay;

    bool operator==(const FinalityConfig &) const = default;
  };

  /**
   * Size of the provenance window.
   * With alt-DA a commitment challenged on the last block of the challenge
   * window may take the whole resolve window on top of it, so the window
   * must cover both plus one.
   */
  uint64_t calcFinalityLookback(const FinalityConfig &config);

  enum class ConfigError : uint8_t {
    CONFIG_FILE_READ_FAILED = 1,
    CONFIG_FILE_PARSE_FAILED,
    INVALID_VALUE,
  };

  /**
   * Reads section `finality` of a node config:
   * @code
   * finality:
   *   lookback: 129
   *   delay: 64
   *   alt-da:
   *     challenge-window: 100
   *     resolve-window: 50
   * @endcode
   * Absent section or keys keep the defaults.
   */
  outcome::result<FinalityConfig> loadFinalityConfig(const YAML::Node &root,
                                                     const log::Logger &logger);

  outcome::result<FinalityConfig> loadFinalityConfigFile(
      const std::filesystem::path &path, const log::Logger &logger);

}  // namespace rollnode::finality

OUTCOME_HPP_DECLARE_ERROR(rollnode::finality, ConfigError);
