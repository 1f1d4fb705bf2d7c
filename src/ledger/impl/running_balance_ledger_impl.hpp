/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "ledger/running_balance_ledger.hpp"
#include "log/logger.hpp"

namespace dataworker::ledger {

  /**
   * Ledger kept in the RunningBalances space,
   * key is big-endian chain id followed by the l1 token
   */
  class RunningBalanceLedgerImpl : public RunningBalanceLedger {
   public:
    RunningBalanceLedgerImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                             qtils::SharedRef<storage::SpacedStorage> storage);

    outcome::result<RunningBalanceEntry> get(
        ChainId chain_id, const Address &l1_token) const override;

    outcome::result<void> stage(
        BundleId bundle_id,
        const std::vector<RunningBalanceTransition> &transitions,
        storage::SpacedBatch &batch) const override;

    static qtils::ByteVec entryKey(ChainId chain_id, const Address &l1_token);

   private:
    log::Logger logger_;
    std::shared_ptr<storage::BufferStorage> space_;
  };

}  // namespace dataworker::ledger
