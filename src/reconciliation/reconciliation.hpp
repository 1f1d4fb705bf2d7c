/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <vector>

#include "types/deposit.hpp"
#include "types/fill.hpp"

namespace dataworker::reconciliation {

  /// Deposit still owed to its recipient after all valid fills
  struct UnfilledDeposit {
    Deposit deposit;
    Amount unfilled_amount = 0;

    bool operator==(const UnfilledDeposit &) const = default;
  };

  /// Who gets refunded and where
  struct RefundKey {
    ChainId repayment_chain_id = 0;
    Address relayer;

    auto operator<=>(const RefundKey &other) const = default;
  };

  /**
   * Result of one reconciliation pass.
   * Lists are in canonical order: unfilled deposits by (origin chain,
   * deposit id), fills by (origin chain, deposit id, total filled amount).
   */
  struct Reconciliation {
    /// Keyed by destination chain
    std::map<ChainId, std::vector<UnfilledDeposit>> unfilled_deposits;
    std::map<RefundKey, std::vector<Fill>> fills_to_refund;

    bool operator==(const Reconciliation &) const = default;
  };

}  // namespace dataworker::reconciliation
