/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <optional>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <sszpp/ssz++.hpp>

#include "types/primitives.hpp"

namespace dataworker {

  /**
   * @struct ChainBlockRange
   * Inclusive block range of one chain covered by a bundle
   */
  struct ChainBlockRange : ssz::ssz_container {
    ChainId chain_id = 0;
    BlockNumber start_block = 0;
    BlockNumber end_block = 0;

    SSZ_CONT(chain_id, start_block, end_block);

    bool contains(BlockNumber block) const {
      return start_block <= block and block <= end_block;
    }

    bool operator==(const ChainBlockRange &) const = default;
  };

  /**
   * @struct BundleScope
   * Bundle evaluation block numbers: one range per chain, sorted by chain id
   */
  struct BundleScope {
    std::vector<ChainBlockRange> ranges;

    BundleScope() = default;

    explicit BundleScope(std::vector<ChainBlockRange> ranges_)
        : ranges(std::move(ranges_)) {
      std::ranges::sort(ranges, {}, &ChainBlockRange::chain_id);
    }

    std::optional<ChainBlockRange> rangeOf(ChainId chain_id) const {
      auto it = std::ranges::find(ranges, chain_id, &ChainBlockRange::chain_id);
      if (it == ranges.end()) {
        return std::nullopt;
      }
      return *it;
    }

    bool operator==(const BundleScope &) const = default;
  };

}  // namespace dataworker

template <>
struct fmt::formatter<dataworker::ChainBlockRange> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const dataworker::ChainBlockRange &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(), "{}:[{}..{}]", v.chain_id, v.start_block, v.end_block);
  }
};

template <>
struct fmt::formatter<dataworker::BundleScope> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const dataworker::BundleScope &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}", fmt::join(v.ranges, " "));
  }
};
