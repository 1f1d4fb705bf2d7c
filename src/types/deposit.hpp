/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "types/primitives.hpp"

namespace dataworker {

  /**
   * @struct Deposit
   * Funds locked on the origin chain for delivery on the destination chain.
   * Identified by (origin_chain_id, deposit_id).
   */
  struct Deposit {
    DepositId deposit_id = 0;
    ChainId origin_chain_id = 0;
    ChainId destination_chain_id = 0;
    Address depositor;
    Address recipient;
    Address origin_token;
    Address destination_token;
    Amount amount = 0;
    FeePct relayer_fee_pct = 0;
    /// Fixed at quote time
    FeePct realized_lp_fee_pct = 0;
    Timestamp quote_timestamp = 0;
    /// Block of the origin chain the deposit was observed in
    BlockNumber block_number = 0;

    bool operator==(const Deposit &) const = default;
  };

}  // namespace dataworker

template <>
struct fmt::formatter<dataworker::Deposit> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const dataworker::Deposit &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "deposit #{} {}→{}",
                          v.deposit_id,
                          v.origin_chain_id,
                          v.destination_chain_id);
  }
};
