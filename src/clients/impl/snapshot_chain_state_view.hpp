/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <shared_mutex>

#include "clients/chain_state_view.hpp"

namespace dataworker::clients {

  /**
   * Chain state kept in memory, filled from a snapshot file or by the owner
   * as new events are ingested.
   */
  class SnapshotChainStateView : public ChainStateView {
   public:
    explicit SnapshotChainStateView(ChainId chain_id);

    /// Deposit made on this chain, its origin is overwritten with chainId()
    void addDeposit(Deposit deposit);

    /// Fill observed on this chain, its destination is overwritten with
    /// chainId()
    void addFill(Fill fill);

    void setSynchronized(bool synchronized);

    ChainId chainId() const override;

    bool isSynchronized() const override;

    std::vector<Deposit> depositsForDestination(
        ChainId destination) const override;

    Amount unfilledAmount(const Deposit &deposit) const override;

    std::vector<Fill> allFills() const override;

    bool fillMatchesDeposit(const Fill &fill,
                            const Deposit &deposit) const override;

   private:
    const ChainId chain_id_;
    mutable std::shared_mutex mutex_;
    bool synchronized_ = false;
    std::vector<Deposit> deposits_;
    std::vector<Fill> fills_;
  };

}  // namespace dataworker::clients
