/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <stop_token>

#include <qtils/shared_ref.hpp>

#include "builders/pool_rebalance_root_builder.hpp"
#include "builders/relayer_refund_root_builder.hpp"
#include "builders/slow_relay_root_builder.hpp"
#include "reconciliation/reconciler.hpp"
#include "types/root_type.hpp"

namespace dataworker::builders {

  /// All three roots of one bundle, computed from one reconciliation pass
  struct BundleRoots {
    std::optional<SlowRelayRoot> slow_relay;
    std::optional<RelayerRefundRoot> relayer_refund;
    PoolRebalanceRoot pool_rebalance;

    std::optional<Hash256> rootOf(RootType root_type) const {
      switch (root_type) {
        case RootType::SlowRelay:
          return slow_relay ? std::optional{slow_relay->root} : std::nullopt;
        case RootType::RelayerRefund:
          return relayer_refund ? std::optional{relayer_refund->root}
                                : std::nullopt;
        case RootType::PoolRebalance:
          return pool_rebalance.root ? std::optional{pool_rebalance.root->root}
                                     : std::nullopt;
      }
      return std::nullopt;
    }
  };

  /**
   * Entry points of root construction for a block-range scope.
   * Every call reconciles against the current chain state.
   */
  class BundleBuilder {
   public:
    BundleBuilder(qtils::SharedRef<reconciliation::Reconciler> reconciler,
                  qtils::SharedRef<SlowRelayRootBuilder> slow_relay,
                  qtils::SharedRef<RelayerRefundRootBuilder> relayer_refund,
                  qtils::SharedRef<PoolRebalanceRootBuilder> pool_rebalance);

    outcome::result<std::optional<SlowRelayRoot>> buildSlowRelayRoot(
        const BundleScope &scope, std::stop_token stop = {}) const;

    outcome::result<std::optional<RelayerRefundRoot>> buildRelayerRefundRoot(
        const BundleScope &scope, std::stop_token stop = {}) const;

    outcome::result<PoolRebalanceRoot> buildPoolRebalanceRoot(
        const BundleScope &scope, std::stop_token stop = {}) const;

    /// Reconciles once and builds all three roots
    outcome::result<BundleRoots> buildAll(const BundleScope &scope,
                                          std::stop_token stop = {}) const;

    const reconciliation::Reconciler &reconciler() const {
      return *reconciler_;
    }

   private:
    qtils::SharedRef<reconciliation::Reconciler> reconciler_;
    qtils::SharedRef<SlowRelayRootBuilder> slow_relay_;
    qtils::SharedRef<RelayerRefundRootBuilder> relayer_refund_;
    qtils::SharedRef<PoolRebalanceRootBuilder> pool_rebalance_;
  };

}  // namespace dataworker::builders
