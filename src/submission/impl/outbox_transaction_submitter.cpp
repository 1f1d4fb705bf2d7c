/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "submission/impl/outbox_transaction_submitter.hpp"

#include <fstream>

#include <yaml-cpp/yaml.h>

#include "crypto/sha/sha256.hpp"
#include "storage/key_encoding.hpp"
#include "submission/submission_error.hpp"

namespace dataworker::submission {

  OutboxTransactionSubmitter::OutboxTransactionSubmitter(
      qtils::SharedRef<log::LoggingSystem> logsys, std::filesystem::path outbox)
      : logger_(logsys->getLogger("TransactionSubmitter", "submission")),
        outbox_(std::move(outbox)) {}

  outcome::result<void> OutboxTransactionSubmitter::willSucceed(
      const Transaction &transaction) const {
    if (transaction.target.empty() or transaction.method.empty()) {
      SL_ERROR(logger_, "Simulation of {} failed: no target", transaction);
      return SubmissionError::SIMULATION_FAILED;
    }
    if (transaction.args.empty()) {
      SL_ERROR(logger_, "Simulation of {} failed: no arguments", transaction);
      return SubmissionError::SIMULATION_FAILED;
    }
    auto directory = outbox_.parent_path();
    std::error_code ec;
    if (not directory.empty()
        and not std::filesystem::is_directory(directory, ec)) {
      SL_ERROR(logger_,
               "Simulation of {} failed: outbox directory {} does not exist",
               transaction,
               directory.string());
      return SubmissionError::OUTBOX_UNAVAILABLE;
    }
    SL_TRACE(logger_, "Simulation of {} succeeded", transaction);
    return outcome::success();
  }

  outcome::result<TransactionReceipt> OutboxTransactionSubmitter::submit(
      const Transaction &transaction) {
    std::lock_guard lock{mutex_};

    qtils::ByteVec preimage;
    storage::appendBigEndian(preimage, transaction.chain_id);
    preimage.insert(
        preimage.end(), transaction.target.begin(), transaction.target.end());
    preimage.insert(
        preimage.end(), transaction.method.begin(), transaction.method.end());
    preimage.insert(
        preimage.end(), transaction.args.begin(), transaction.args.end());
    storage::appendBigEndian(preimage, static_cast<uint64_t>(sequence_));
    TransactionReceipt receipt{
        .tx_hash = crypto::sha256(qtils::ByteView{preimage}),
    };

    YAML::Emitter out;
    out << YAML::BeginDoc << YAML::BeginMap;
    out << YAML::Key << "sequence" << YAML::Value << sequence_;
    out << YAML::Key << "chain-id" << YAML::Value << transaction.chain_id;
    out << YAML::Key << "target" << YAML::Value << transaction.target;
    out << YAML::Key << "method" << YAML::Value << transaction.method;
    out << YAML::Key << "args" << YAML::Value
        << "0x" + qtils::ByteView{transaction.args}.toHex();
    out << YAML::Key << "tx-hash" << YAML::Value
        << "0x" + receipt.tx_hash.toHex();
    out << YAML::EndMap;

    std::ofstream file(outbox_, std::ios::app);
    if (not file.is_open()) {
      SL_ERROR(logger_,
               "Submission of {} failed: can't open outbox {}",
               transaction,
               outbox_.string());
      return SubmissionError::OUTBOX_UNAVAILABLE;
    }
    file << out.c_str() << '\n';
    file.flush();
    if (not file.good()) {
      SL_ERROR(logger_,
               "Submission of {} failed: write to outbox {} failed",
               transaction,
               outbox_.string());
      return SubmissionError::SUBMISSION_FAILED;
    }

    ++sequence_;
    SL_DEBUG(logger_,
             "Submitted {} with args 0x{}, tx {}",
             transaction,
             qtils::ByteView{transaction.args}.toHex(),
             receipt.tx_hash);
    return receipt;
  }

  size_t OutboxTransactionSubmitter::submittedCount() const {
    std::lock_guard lock{mutex_};
    return sequence_;
  }

}  // namespace dataworker::submission
