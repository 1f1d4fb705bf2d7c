/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "types/deposit.hpp"
#include "types/fill.hpp"

namespace dataworker::clients {

  /**
   * Read-only view of the events already ingested from one spoke chain.
   * The view is refreshed by its owner; readers rely only on
   * isSynchronized() to know whether its content is complete.
   * Implementations must allow concurrent reads.
   */
  class ChainStateView {
   public:
    virtual ~ChainStateView() = default;

    virtual ChainId chainId() const = 0;

    /// True when the view has caught up with the chain
    virtual bool isSynchronized() const = 0;

    /// Deposits made on this chain to be delivered on `destination`
    virtual std::vector<Deposit> depositsForDestination(
        ChainId destination) const = 0;

    /**
     * Part of `deposit` not yet covered by valid non-slow fills observed on
     * this chain. Queried on the deposit's destination chain.
     */
    virtual Amount unfilledAmount(const Deposit &deposit) const = 0;

    /// Every fill observed on this chain, slow relays included
    virtual std::vector<Fill> allFills() const = 0;

    /// Validity predicate: the fill is for exactly this deposit
    virtual bool fillMatchesDeposit(const Fill &fill,
                                    const Deposit &deposit) const = 0;
  };

}  // namespace dataworker::clients
