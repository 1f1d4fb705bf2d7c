/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>

#include <fmt/format.h>

namespace dataworker::bundle {

  /**
   * Building -> Proposed -> {Validated, Disputed}
   * Validated -> Executing -> Closed
   */
  enum class BundleState : uint8_t {
    Building = 0,
    Proposed,
    Validated,
    Disputed,
    Executing,
    Closed,
  };

  constexpr std::string_view bundleStateName(BundleState state) {
    switch (state) {
      case BundleState::Building:
        return "building";
      case BundleState::Proposed:
        return "proposed";
      case BundleState::Validated:
        return "validated";
      case BundleState::Disputed:
        return "disputed";
      case BundleState::Executing:
        return "executing";
      case BundleState::Closed:
        return "closed";
    }
    return "unknown";
  }

  constexpr bool isAllowedTransition(BundleState from, BundleState to) {
    switch (from) {
      case BundleState::Building:
        return to == BundleState::Proposed;
      case BundleState::Proposed:
        return to == BundleState::Validated or to == BundleState::Disputed;
      case BundleState::Validated:
        return to == BundleState::Executing;
      case BundleState::Executing:
        return to == BundleState::Closed;
      case BundleState::Disputed:
      case BundleState::Closed:
        return false;
    }
    return false;
  }

  /// Execution status of one leaf
  enum class LeafStatus : uint8_t {
    Pending = 0,
    Executed = 1,
  };

}  // namespace dataworker::bundle

template <>
struct fmt::formatter<dataworker::bundle::BundleState>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(dataworker::bundle::BundleState v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        dataworker::bundle::bundleStateName(v), ctx);
  }
};
