/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <stop_token>
#include <vector>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "clients/chain_state_view.hpp"
#include "log/logger.hpp"
#include "reconciliation/reconciliation.hpp"
#include "types/bundle_scope.hpp"

namespace dataworker::reconciliation {

  /**
   * Cross-references deposits and fills of every ordered pair of active
   * chains. Stateless between calls: every call reads the views anew.
   */
  class Reconciler {
   public:
    using ChainViews = std::vector<qtils::SharedRef<clients::ChainStateView>>;

    Reconciler(qtils::SharedRef<log::LoggingSystem> logsys, ChainViews chains);

    /**
     * Runs a full pass over the events inside `scope`.
     * Deposits are taken from the origin ranges; fills from the destination
     * ranges are refunded when they match any deposit, including deposits of
     * earlier bundles.
     * @return the unfilled deposits and the fills to refund, or
     * STALE_CHAIN_STATE / CHAIN_NOT_IN_SCOPE / ABORTED
     */
    outcome::result<Reconciliation> reconcile(
        const BundleScope &scope, std::stop_token stop = {}) const;

    /// First chain (by id) whose view is not synchronized
    std::optional<ChainId> firstUnsynchronizedChain() const;

    /// Active chains sorted by id
    std::vector<ChainId> chainIds() const;

   private:
    void reconcilePair(const clients::ChainStateView &origin,
                       const clients::ChainStateView &destination,
                       const ChainBlockRange &origin_range,
                       const std::vector<Fill> &destination_fills,
                       Reconciliation &result) const;

    log::Logger logger_;
    ChainViews chains_;
  };

}  // namespace dataworker::reconciliation
