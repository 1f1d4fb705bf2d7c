/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "clients/chain_state_view.hpp"

namespace dataworker::clients {

  class ChainStateViewMock : public ChainStateView {
   public:
    MOCK_METHOD(ChainId, chainId, (), (const, override));

    MOCK_METHOD(bool, isSynchronized, (), (const, override));

    MOCK_METHOD(std::vector<Deposit>,
                depositsForDestination,
                (ChainId),
                (const, override));

    MOCK_METHOD(Amount, unfilledAmount, (const Deposit &), (const, override));

    MOCK_METHOD(std::vector<Fill>, allFills, (), (const, override));

    MOCK_METHOD(bool,
                fillMatchesDeposit,
                (const Fill &, const Deposit &),
                (const, override));
  };

}  // namespace dataworker::clients
