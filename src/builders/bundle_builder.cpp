/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "builders/bundle_builder.hpp"

#include "reconciliation/reconciliation_error.hpp"

namespace dataworker::builders {

  BundleBuilder::BundleBuilder(
      qtils::SharedRef<reconciliation::Reconciler> reconciler,
      qtils::SharedRef<SlowRelayRootBuilder> slow_relay,
      qtils::SharedRef<RelayerRefundRootBuilder> relayer_refund,
      qtils::SharedRef<PoolRebalanceRootBuilder> pool_rebalance)
      : reconciler_(std::move(reconciler)),
        slow_relay_(std::move(slow_relay)),
        relayer_refund_(std::move(relayer_refund)),
        pool_rebalance_(std::move(pool_rebalance)) {}

  outcome::result<std::optional<SlowRelayRoot>>
  BundleBuilder::buildSlowRelayRoot(const BundleScope &scope,
                                    std::stop_token stop) const {
    OUTCOME_TRY(reconciliation, reconciler_->reconcile(scope, stop));
    return slow_relay_->build(reconciliation, scope);
  }

  outcome::result<std::optional<RelayerRefundRoot>>
  BundleBuilder::buildRelayerRefundRoot(const BundleScope &scope,
                                        std::stop_token stop) const {
    OUTCOME_TRY(reconciliation, reconciler_->reconcile(scope, stop));
    return relayer_refund_->build(reconciliation, scope);
  }

  outcome::result<PoolRebalanceRoot> BundleBuilder::buildPoolRebalanceRoot(
      const BundleScope &scope, std::stop_token stop) const {
    OUTCOME_TRY(reconciliation, reconciler_->reconcile(scope, stop));
    return pool_rebalance_->build(reconciliation, scope);
  }

  outcome::result<BundleRoots> BundleBuilder::buildAll(
      const BundleScope &scope, std::stop_token stop) const {
    OUTCOME_TRY(reconciliation, reconciler_->reconcile(scope, stop));
    OUTCOME_TRY(slow_relay, slow_relay_->build(reconciliation, scope));
    OUTCOME_TRY(relayer_refund, relayer_refund_->build(reconciliation, scope));
    OUTCOME_TRY(pool_rebalance, pool_rebalance_->build(reconciliation, scope));
    if (stop.stop_requested()) {
      return reconciliation::ReconciliationError::ABORTED;
    }
    return BundleRoots{
        .slow_relay = std::move(slow_relay),
        .relayer_refund = std::move(relayer_refund),
        .pool_rebalance = std::move(pool_rebalance),
    };
  }

}  // namespace dataworker::builders
