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
   * @struct Fill
   * A relayer's (partial) fill of a deposit, observed on the destination
   * chain. Economic fields repeat the ones of the deposit being filled.
   */
  struct Fill {
    DepositId deposit_id = 0;
    ChainId origin_chain_id = 0;
    ChainId destination_chain_id = 0;
    Address depositor;
    Address recipient;
    Address destination_token;
    Amount amount = 0;
    /// Cumulative amount filled for the deposit including this fill
    Amount total_filled_amount = 0;
    Amount fill_amount = 0;
    /// Chain where the relayer wants to be refunded
    ChainId repayment_chain_id = 0;
    /// Refund recipient
    Address relayer;
    FeePct relayer_fee_pct = 0;
    FeePct realized_lp_fee_pct = 0;
    bool is_slow_relay = false;
    /// Block of the destination chain the fill was observed in
    BlockNumber block_number = 0;

    bool operator==(const Fill &) const = default;
  };

}  // namespace dataworker

template <>
struct fmt::formatter<dataworker::Fill> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const dataworker::Fill &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "fill of deposit #{} {}→{}{}",
                          v.deposit_id,
                          v.origin_chain_id,
                          v.destination_chain_id,
                          v.is_slow_relay ? " (slow)" : "");
  }
};
