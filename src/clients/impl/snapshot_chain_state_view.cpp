/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clients/impl/snapshot_chain_state_view.hpp"

#include <mutex>

namespace dataworker::clients {

  SnapshotChainStateView::SnapshotChainStateView(ChainId chain_id)
      : chain_id_(chain_id) {}

  void SnapshotChainStateView::addDeposit(Deposit deposit) {
    deposit.origin_chain_id = chain_id_;
    std::unique_lock lock{mutex_};
    deposits_.emplace_back(std::move(deposit));
  }

  void SnapshotChainStateView::addFill(Fill fill) {
    fill.destination_chain_id = chain_id_;
    std::unique_lock lock{mutex_};
    fills_.emplace_back(std::move(fill));
  }

  void SnapshotChainStateView::setSynchronized(bool synchronized) {
    std::unique_lock lock{mutex_};
    synchronized_ = synchronized;
  }

  ChainId SnapshotChainStateView::chainId() const {
    return chain_id_;
  }

  bool SnapshotChainStateView::isSynchronized() const {
    std::shared_lock lock{mutex_};
    return synchronized_;
  }

  std::vector<Deposit> SnapshotChainStateView::depositsForDestination(
      ChainId destination) const {
    std::shared_lock lock{mutex_};
    std::vector<Deposit> result;
    for (const auto &deposit : deposits_) {
      if (deposit.destination_chain_id == destination) {
        result.emplace_back(deposit);
      }
    }
    return result;
  }

  Amount SnapshotChainStateView::unfilledAmount(const Deposit &deposit) const {
    std::shared_lock lock{mutex_};
    // counted down so that oversized fills can't wrap around
    Amount remaining = deposit.amount;
    for (const auto &fill : fills_) {
      if (fill.is_slow_relay or not fillMatchesDeposit(fill, deposit)) {
        continue;
      }
      if (fill.fill_amount >= remaining) {
        return 0;
      }
      remaining -= fill.fill_amount;
    }
    return remaining;
  }

  std::vector<Fill> SnapshotChainStateView::allFills() const {
    std::shared_lock lock{mutex_};
    return fills_;
  }

  bool SnapshotChainStateView::fillMatchesDeposit(
      const Fill &fill, const Deposit &deposit) const {
    return fill.deposit_id == deposit.deposit_id
       and fill.origin_chain_id == deposit.origin_chain_id
       and fill.destination_chain_id == deposit.destination_chain_id
       and fill.depositor == deposit.depositor
       and fill.recipient == deposit.recipient
       and fill.destination_token == deposit.destination_token
       and fill.amount == deposit.amount
       and fill.relayer_fee_pct == deposit.relayer_fee_pct
       and fill.realized_lp_fee_pct == deposit.realized_lp_fee_pct;
  }

}  // namespace dataworker::clients
