/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/read_chain_spec_yaml.hpp"

#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace oppool::app {
  namespace {
    outcome::result<ChainSpec> chainSpecFromYaml(const YAML::Node &yaml) {
      if (not yaml.IsMap()) {
        return ChainSpecYamlError::INVALID;
      }

      auto yaml_preset = yaml["PRESET_BASE"];
      if (not yaml_preset.IsScalar()) {
        return ChainSpecYamlError::INVALID;
      }
      auto preset = yaml_preset.as<std::string>();
      ChainSpec spec;
      if (preset == "mainnet") {
        spec = ChainSpec::mainnet();
      } else if (preset == "minimal") {
        spec = ChainSpec::minimal();
      } else {
        return ChainSpecYamlError::UNKNOWN_PRESET;
      }

      std::pair<const char *, uint64_t *> overrides[]{
          {"SLOTS_PER_EPOCH", &spec.slots_per_epoch},
          {"MIN_ATTESTATION_INCLUSION_DELAY",
           &spec.min_attestation_inclusion_delay},
          {"SHARD_COMMITTEE_PERIOD", &spec.shard_committee_period},
          {"MAX_PROPOSER_SLASHINGS", &spec.max_proposer_slashings},
          {"MAX_ATTESTER_SLASHINGS", &spec.max_attester_slashings},
          {"MAX_ATTESTATIONS", &spec.max_attestations},
          {"MAX_VOLUNTARY_EXITS", &spec.max_voluntary_exits},
      };
      for (auto &[key, field] : overrides) {
        auto yaml_value = yaml[key];
        if (not yaml_value) {
          continue;
        }
        if (not yaml_value.IsScalar()) {
          return ChainSpecYamlError::INVALID_VALUE;
        }
        *field = yaml_value.as<uint64_t>();
      }

      if (spec.slots_per_epoch == 0) {
        return ChainSpecYamlError::INVALID_VALUE;
      }
      return spec;
    }
  }  // namespace

  outcome::result<ChainSpec> parseChainSpecYaml(std::string_view text) {
    try {
      return chainSpecFromYaml(YAML::Load(std::string{text}));
    } catch (const YAML::BadConversion &) {
      return ChainSpecYamlError::INVALID_VALUE;
    } catch (const YAML::Exception &) {
      return ChainSpecYamlError::INVALID;
    }
  }

  outcome::result<ChainSpec> readChainSpecYaml(
      const std::filesystem::path &path) {
    try {
      return chainSpecFromYaml(YAML::LoadFile(path.string()));
    } catch (const YAML::BadConversion &) {
      return ChainSpecYamlError::INVALID_VALUE;
    } catch (const YAML::Exception &) {
      return ChainSpecYamlError::INVALID;
    }
  }
}  // namespace oppool::app
