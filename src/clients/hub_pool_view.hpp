/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "types/primitives.hpp"
#include "types/root_type.hpp"

namespace dataworker::clients {

  /**
   * Read-only view of the hub chain: the token routes of the pool and
   * the settlement state of proposed roots.
   */
  class HubPoolView {
   public:
    virtual ~HubPoolView() = default;

    virtual ChainId hubChainId() const = 0;

    /// L1 token whose pool backs `l2_token` on `chain_id`
    virtual std::optional<Address> l1TokenFor(
        ChainId chain_id, const Address &l2_token) const = 0;

    /// Counterpart of `l1_token` on `chain_id`
    virtual std::optional<Address> l2TokenFor(
        ChainId chain_id, const Address &l1_token) const = 0;

    /// True if the leaf of the root was already executed on chain
    virtual bool isLeafClaimed(RootType root_type,
                               const Hash256 &root,
                               LeafId leaf_id) const = 0;
  };

}  // namespace dataworker::clients
