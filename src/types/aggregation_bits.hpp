/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <ranges>

#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "types/constants.hpp"
#include "types/validator_index.hpp"

namespace oppool {
  /**
   * Set of signers, one bit per validator index.
   */
  struct AggregationBits : ssz::ssz_variable_size_container {
    auto iter() const {
      return std::views::iota(ValidatorIndex{0}, ValidatorIndex{bits.size()})
           | std::views::filter([this](ValidatorIndex validator_index) {
               return bits.data()[validator_index];
             });
    }

    bool contains(ValidatorIndex validator_index) const {
      return validator_index < bits.size() and bits.data()[validator_index];
    }

    void add(ValidatorIndex validator_index) {
      if (bits.size() <= validator_index) {
        bits.data().resize(validator_index + 1);
      }
      bits.data()[validator_index] = true;
    }

    void remove(ValidatorIndex validator_index) {
      if (validator_index < bits.size()) {
        bits.data()[validator_index] = false;
      }
    }

    size_t count() const {
      return std::ranges::count(bits.data(), true);
    }

    bool empty() const {
      return std::ranges::find(bits.data(), true) == bits.data().end();
    }

    /// True if no validator is set in both
    bool isDisjoint(const AggregationBits &other) const {
      auto n = std::min(bits.size(), other.bits.size());
      for (size_t i = 0; i < n; ++i) {
        if (bits.data()[i] and other.bits.data()[i]) {
          return false;
        }
      }
      return true;
    }

    /// Union in place
    void merge(const AggregationBits &other) {
      if (bits.size() < other.bits.size()) {
        bits.data().resize(other.bits.size());
      }
      for (size_t i = 0; i < other.bits.size(); ++i) {
        if (other.bits.data()[i]) {
          bits.data()[i] = true;
        }
      }
    }

    /// Clears every validator set in `other`
    void subtract(const AggregationBits &other) {
      auto n = std::min(bits.size(), other.bits.size());
      for (size_t i = 0; i < n; ++i) {
        if (other.bits.data()[i]) {
          bits.data()[i] = false;
        }
      }
    }

    ssz::list<bool, VALIDATOR_REGISTRY_LIMIT> bits;

    SSZ_CONT(bits);
    bool operator==(const AggregationBits &) const = default;
  };
}  // namespace oppool
