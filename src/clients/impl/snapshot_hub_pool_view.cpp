/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clients/impl/snapshot_hub_pool_view.hpp"

#include <mutex>

namespace dataworker::clients {

  SnapshotHubPoolView::SnapshotHubPoolView(ChainId hub_chain_id)
      : hub_chain_id_(hub_chain_id) {}

  void SnapshotHubPoolView::addRoute(const Address &l1_token,
                                     ChainId chain_id,
                                     const Address &l2_token) {
    std::unique_lock lock{mutex_};
    l1_by_l2_[{chain_id, l2_token}] = l1_token;
    l2_by_l1_[{chain_id, l1_token}] = l2_token;
  }

  void SnapshotHubPoolView::markLeafClaimed(RootType root_type,
                                            const Hash256 &root,
                                            LeafId leaf_id) {
    std::unique_lock lock{mutex_};
    claimed_.emplace(root_type, root, leaf_id);
  }

  ChainId SnapshotHubPoolView::hubChainId() const {
    return hub_chain_id_;
  }

  std::optional<Address> SnapshotHubPoolView::l1TokenFor(
      ChainId chain_id, const Address &l2_token) const {
    std::shared_lock lock{mutex_};
    auto it = l1_by_l2_.find({chain_id, l2_token});
    if (it == l1_by_l2_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<Address> SnapshotHubPoolView::l2TokenFor(
      ChainId chain_id, const Address &l1_token) const {
    std::shared_lock lock{mutex_};
    auto it = l2_by_l1_.find({chain_id, l1_token});
    if (it == l2_by_l1_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool SnapshotHubPoolView::isLeafClaimed(RootType root_type,
                                          const Hash256 &root,
                                          LeafId leaf_id) const {
    std::shared_lock lock{mutex_};
    return claimed_.contains({root_type, root, leaf_id});
  }

}  // namespace dataworker::clients
