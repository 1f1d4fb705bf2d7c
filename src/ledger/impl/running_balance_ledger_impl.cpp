/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/impl/running_balance_ledger_impl.hpp"

#include "ledger/ledger_error.hpp"
#include "log/formatters/amount.hpp"
#include "serde/serialization.hpp"
#include "storage/key_encoding.hpp"

namespace dataworker::ledger {

  RunningBalanceLedgerImpl::RunningBalanceLedgerImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::SpacedStorage> storage)
      : logger_(logsys->getLogger("RunningBalanceLedger", "ledger")),
        space_(storage->getSpace(storage::Space::RunningBalances)) {}

  qtils::ByteVec RunningBalanceLedgerImpl::entryKey(ChainId chain_id,
                                                    const Address &l1_token) {
    qtils::ByteVec key;
    key.reserve(sizeof(ChainId) + l1_token.size());
    storage::appendBigEndian(key, chain_id);
    key.insert(key.end(), l1_token.begin(), l1_token.end());
    return key;
  }

  outcome::result<RunningBalanceEntry> RunningBalanceLedgerImpl::get(
      ChainId chain_id, const Address &l1_token) const {
    OUTCOME_TRY(raw, space_->tryGet(entryKey(chain_id, l1_token)));
    if (not raw.has_value()) {
      return RunningBalanceEntry{
          .chain_id = chain_id,
          .l1_token = l1_token,
          .balance = toWord(SignedAmount{0}),
          .version = 0,
      };
    }
    return decode<RunningBalanceEntry>(raw.value());
  }

  outcome::result<void> RunningBalanceLedgerImpl::stage(
      BundleId bundle_id,
      const std::vector<RunningBalanceTransition> &transitions,
      storage::SpacedBatch &batch) const {
    for (const auto &transition : transitions) {
      auto previous = signedAmountFromWord(transition.previous_balance);
      auto delta = signedAmountFromWord(transition.delta);
      auto net_send = signedAmountFromWord(transition.net_send);
      auto next = signedAmountFromWord(transition.next_balance);
      if (previous + delta - net_send != next) {
        SL_ERROR(logger_,
                 "Inconsistent transition of chain {} token {}: "
                 "{} + {} - {} != {}",
                 transition.chain_id,
                 transition.l1_token,
                 previous,
                 delta,
                 net_send,
                 next);
        return LedgerError::BALANCE_OUT_OF_RANGE;
      }

      OUTCOME_TRY(current, get(transition.chain_id, transition.l1_token));
      if (current.version == bundle_id
          and current.balance == transition.next_balance) {
        SL_DEBUG(logger_,
                 "Running balance of chain {} token {} already advanced by "
                 "bundle {}",
                 transition.chain_id,
                 transition.l1_token,
                 bundle_id);
        continue;
      }
      if (current.version != transition.previous_version
          or current.balance != transition.previous_balance) {
        SL_ERROR(logger_,
                 "Running balance of chain {} token {} is at version {}, "
                 "bundle {} expects version {}",
                 transition.chain_id,
                 transition.l1_token,
                 current.version,
                 bundle_id,
                 transition.previous_version);
        return LedgerError::VERSION_CONFLICT;
      }

      RunningBalanceEntry entry{
          .chain_id = transition.chain_id,
          .l1_token = transition.l1_token,
          .balance = transition.next_balance,
          .version = bundle_id,
      };
      OUTCOME_TRY(encoded, encode(entry));
      OUTCOME_TRY(batch.put(storage::Space::RunningBalances,
                            entryKey(transition.chain_id, transition.l1_token),
                            std::move(encoded)));
      SL_INFO(logger_,
              "Running balance of chain {} token {}: {} (v{}) -> {} (v{}), "
              "delta {}, net send {}",
              transition.chain_id,
              transition.l1_token,
              previous,
              transition.previous_version,
              next,
              bundle_id,
              delta,
              net_send);
    }
    return outcome::success();
  }

}  // namespace dataworker::ledger
