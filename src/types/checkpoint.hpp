/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>
#include <sszpp/container.hpp>

#include "types/hash.hpp"
#include "types/slot.hpp"

namespace oppool {

  struct Checkpoint : ssz::ssz_container {
    Epoch epoch = 0;
    Root root;

    SSZ_CONT(epoch, root);
    bool operator==(const Checkpoint &) const = default;
  };

}  // namespace oppool

template <>
struct fmt::formatter<oppool::Checkpoint> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const oppool::Checkpoint &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{:0x} @ epoch {}", v.root, v.epoch);
  }
};
