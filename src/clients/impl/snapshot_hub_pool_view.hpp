/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>
#include <shared_mutex>
#include <tuple>

#include "clients/hub_pool_view.hpp"

namespace dataworker::clients {

  /**
   * Hub pool state kept in memory: token routes and executed leaves
   */
  class SnapshotHubPoolView : public HubPoolView {
   public:
    explicit SnapshotHubPoolView(ChainId hub_chain_id);

    /// Registers `l2_token` on `chain_id` as the counterpart of `l1_token`
    void addRoute(const Address &l1_token,
                  ChainId chain_id,
                  const Address &l2_token);

    void markLeafClaimed(RootType root_type,
                         const Hash256 &root,
                         LeafId leaf_id);

    ChainId hubChainId() const override;

    std::optional<Address> l1TokenFor(ChainId chain_id,
                                      const Address &l2_token) const override;

    std::optional<Address> l2TokenFor(ChainId chain_id,
                                      const Address &l1_token) const override;

    bool isLeafClaimed(RootType root_type,
                       const Hash256 &root,
                       LeafId leaf_id) const override;

   private:
    using TokenKey = std::pair<ChainId, Address>;
    using ClaimKey = std::tuple<RootType, Hash256, LeafId>;

    const ChainId hub_chain_id_;
    mutable std::shared_mutex mutex_;
    std::map<TokenKey, Address> l1_by_l2_;
    std::map<TokenKey, Address> l2_by_l1_;
    std::set<ClaimKey> claimed_;
  };

}  // namespace dataworker::clients
