/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/format.h>

namespace dataworker {

  /// The three settlement roots of a bundle
  enum class RootType : uint8_t {
    SlowRelay = 0,
    RelayerRefund = 1,
    PoolRebalance = 2,
  };

  constexpr std::array<RootType, 3> kAllRootTypes{
      RootType::SlowRelay,
      RootType::RelayerRefund,
      RootType::PoolRebalance,
  };

  constexpr std::string_view rootTypeName(RootType type) {
    switch (type) {
      case RootType::SlowRelay:
        return "slow-relay";
      case RootType::RelayerRefund:
        return "relayer-refund";
      case RootType::PoolRebalance:
        return "pool-rebalance";
    }
    return "unknown";
  }

  inline std::optional<RootType> rootTypeFromName(std::string_view name) {
    for (auto type : kAllRootTypes) {
      if (rootTypeName(type) == name) {
        return type;
      }
    }
    return std::nullopt;
  }

}  // namespace dataworker

template <>
struct fmt::formatter<dataworker::RootType> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(dataworker::RootType v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        dataworker::rootTypeName(v), ctx);
  }
};
