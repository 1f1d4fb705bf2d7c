/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "submission/transaction.hpp"

namespace dataworker::submission {

  /**
   * Sends contract calls to chains on behalf of the dataworker.
   * Must be safe to call from several threads.
   */
  class TransactionSubmitter {
   public:
    virtual ~TransactionSubmitter() = default;

    /// Dry run of the call; an error means submit() would revert
    virtual outcome::result<void> willSucceed(
        const Transaction &transaction) const = 0;

    virtual outcome::result<TransactionReceipt> submit(
        const Transaction &transaction) = 0;
  };

}  // namespace dataworker::submission
