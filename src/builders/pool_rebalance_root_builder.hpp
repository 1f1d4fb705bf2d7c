/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "builders/built_root.hpp"
#include "clients/hub_pool_view.hpp"
#include "ledger/running_balance_ledger.hpp"
#include "log/logger.hpp"
#include "reconciliation/reconciliation.hpp"
#include "types/bundle_scope.hpp"
#include "types/pool_rebalance_leaf.hpp"

namespace dataworker::builders {

  struct PoolRebalanceConfig {
    /// Tokens per leaf before a chain is split into several groups
    size_t max_l1_tokens_per_leaf = MAX_L1_TOKENS_PER_LEAF;
    /// Minimal positive balance sent out, per l1 token; absent means 0
    std::map<Address, Amount> transfer_thresholds;
  };

  /**
   * Pool-rebalance root and the running-balance transitions its leaves
   * commit to. Transitions are kept even when the root is absent.
   */
  struct PoolRebalanceRoot {
    std::optional<BuiltRoot<PoolRebalanceLeaf>> root;
    std::vector<RunningBalanceTransition> transitions;
  };

  /**
   * Aggregates the bundle per (chain, l1 token) and carries the result
   * forward against the running-balance ledger.
   *
   * For every pair touched by the bundle:
   *   slow     = sum of unfilled amounts bound for the chain
   *   refunds  = sum of fill amounts repaid on the chain
   *   lp_fee   = sum of amount * realized_lp_fee_pct / 1e18 of both
   *   accrued  = prior balance + slow - refunds
   *   net_send = accrued if accrued > 0 and >= threshold, else 0
   *   next     = accrued - net_send
   */
  class PoolRebalanceRootBuilder {
   public:
    PoolRebalanceRootBuilder(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<clients::HubPoolView> hub,
        qtils::SharedRef<ledger::RunningBalanceLedger> ledger,
        PoolRebalanceConfig config);

    outcome::result<PoolRebalanceRoot> build(
        const reconciliation::Reconciliation &reconciliation,
        const BundleScope &scope) const;

    const PoolRebalanceConfig &config() const {
      return config_;
    }

   private:
    outcome::result<Address> l1TokenOf(ChainId chain_id,
                                       const Address &token) const;

    log::Logger logger_;
    qtils::SharedRef<clients::HubPoolView> hub_;
    qtils::SharedRef<ledger::RunningBalanceLedger> ledger_;
    PoolRebalanceConfig config_;
  };

}  // namespace dataworker::builders
