/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <mutex>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "submission/transaction_submitter.hpp"

namespace dataworker::submission {

  /**
   * Appends every submitted transaction to an outbox file as a YAML
   * document, to be signed and broadcast by a separate sender.
   * The receipt hash is sha256 of the transaction and its sequence number.
   */
  class OutboxTransactionSubmitter : public TransactionSubmitter {
   public:
    OutboxTransactionSubmitter(qtils::SharedRef<log::LoggingSystem> logsys,
                               std::filesystem::path outbox);

    outcome::result<void> willSucceed(
        const Transaction &transaction) const override;

    outcome::result<TransactionReceipt> submit(
        const Transaction &transaction) override;

    /// Transactions submitted by this instance
    size_t submittedCount() const;

   private:
    log::Logger logger_;
    std::filesystem::path outbox_;
    mutable std::mutex mutex_;
    size_t sequence_ = 0;
  };

}  // namespace dataworker::submission
