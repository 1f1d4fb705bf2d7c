/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/outcome.hpp>

#include "storage/spaced_storage.hpp"
#include "types/running_balance.hpp"

namespace dataworker::ledger {

  /**
   * Versioned running balances of (chain, l1 token) pairs carried from
   * bundle to bundle. Only the bundle lifecycle advances it.
   */
  class RunningBalanceLedger {
   public:
    virtual ~RunningBalanceLedger() = default;

    /// Current entry; balance 0 and version 0 if the pair was never written
    virtual outcome::result<RunningBalanceEntry> get(
        ChainId chain_id, const Address &l1_token) const = 0;

    /**
     * Checks the transitions of bundle `bundle_id` against the current
     * entries and stages the new entries into `batch`.
     * Transitions already applied by the same bundle are skipped.
     * @return VERSION_CONFLICT if an entry was advanced by another bundle
     */
    virtual outcome::result<void> stage(
        BundleId bundle_id,
        const std::vector<RunningBalanceTransition> &transitions,
        storage::SpacedBatch &batch) const = 0;
  };

}  // namespace dataworker::ledger
