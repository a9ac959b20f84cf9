/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>

#include "common/blob.hpp"

namespace vigil::primitives {
  using BlockNumber = uint32_t;
  using BlockHash = common::Hash256;

  /// Number and hash of a block
  struct BlockInfo {
    BlockInfo() = default;

    BlockInfo(const BlockNumber &n, const BlockHash &h) : number(n), hash(h) {}

    BlockNumber number{};
    BlockHash hash{};

    bool operator==(const BlockInfo &) const = default;

    bool operator<(const BlockInfo &o) const {
      return number < o.number or (number == o.number and hash < o.hash);
    }
  };

}  // namespace vigil::primitives

template <>
struct std::hash<vigil::primitives::BlockInfo> {
  size_t operator()(const vigil::primitives::BlockInfo &x) const {
    size_t hash = 0;
    boost::hash_combine(hash, x.number);
    boost::hash_combine(hash, std::hash<vigil::primitives::BlockHash>{}(x.hash));
    return hash;
  }
};

template <>
struct fmt::formatter<vigil::primitives::BlockInfo> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const vigil::primitives::BlockInfo &block_info,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(), "#{} ({})", block_info.number, block_info.hash);
  }
};
