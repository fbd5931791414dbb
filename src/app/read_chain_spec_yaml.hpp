/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/chain_spec.hpp"

namespace oppool::app {
  enum class ChainSpecYamlError {
    INVALID,
    UNKNOWN_PRESET,
    INVALID_VALUE,
  };
  Q_ENUM_ERROR_CODE(ChainSpecYamlError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID:
        return "Invalid chain spec yaml";
      case E::UNKNOWN_PRESET:
        return "Unknown PRESET_BASE in chain spec yaml";
      case E::INVALID_VALUE:
        return "Invalid value in chain spec yaml";
    }
    abort();
  }

  /**
   * Chain spec from PRESET_BASE ("mainnet" or "minimal") with optional
   * overrides: SLOTS_PER_EPOCH, MIN_ATTESTATION_INCLUSION_DELAY,
   * SHARD_COMMITTEE_PERIOD and MAX_* per-block operation limits.
   * Other keys are ignored.
   */
  outcome::result<ChainSpec> parseChainSpecYaml(std::string_view text);

  outcome::result<ChainSpec> readChainSpecYaml(
      const std::filesystem::path &path);
}  // namespace oppool::app
