/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "reconciliation/reconciler.hpp"

#include <algorithm>
#include <iterator>
#include <tuple>

#include "log/formatters/amount.hpp"
#include "reconciliation/reconciliation_error.hpp"

namespace dataworker::reconciliation {

  namespace {
    void sortCanonically(Reconciliation &result) {
      for (auto &[_, deposits] : result.unfilled_deposits) {
        std::ranges::sort(deposits, {}, [](const UnfilledDeposit &u) {
          return std::tie(u.deposit.origin_chain_id, u.deposit.deposit_id);
        });
      }
      for (auto &[_, fills] : result.fills_to_refund) {
        std::ranges::sort(fills, {}, [](const Fill &f) {
          return std::tie(f.origin_chain_id,
                          f.deposit_id,
                          f.total_filled_amount,
                          f.fill_amount,
                          f.block_number);
        });
      }
    }
  }  // namespace

  Reconciler::Reconciler(qtils::SharedRef<log::LoggingSystem> logsys,
                         ChainViews chains)
      : logger_(logsys->getLogger("Reconciler", "reconciliation")),
        chains_(std::move(chains)) {
    std::ranges::sort(chains_, {}, [](const auto &chain) {
      return chain->chainId();
    });
  }

  std::optional<ChainId> Reconciler::firstUnsynchronizedChain() const {
    for (auto &chain : chains_) {
      if (not chain->isSynchronized()) {
        return chain->chainId();
      }
    }
    return std::nullopt;
  }

  std::vector<ChainId> Reconciler::chainIds() const {
    std::vector<ChainId> ids;
    ids.reserve(chains_.size());
    for (auto &chain : chains_) {
      ids.emplace_back(chain->chainId());
    }
    return ids;
  }

  outcome::result<Reconciliation> Reconciler::reconcile(
      const BundleScope &scope, std::stop_token stop) const {
    std::vector<ChainBlockRange> ranges;
    ranges.reserve(chains_.size());
    for (auto &chain : chains_) {
      auto range = scope.rangeOf(chain->chainId());
      if (not range) {
        SL_ERROR(logger_,
                 "Bundle scope {} has no block range for chain {}",
                 scope,
                 chain->chainId());
        return ReconciliationError::CHAIN_NOT_IN_SCOPE;
      }
      ranges.emplace_back(*range);
    }

    if (auto stale = firstUnsynchronizedChain()) {
      SL_WARN(logger_,
              "Chain {} is not synchronized, reconciliation refused",
              *stale);
      return ReconciliationError::STALE_CHAIN_STATE;
    }

    // Fills of each destination, already restricted to its block range
    std::vector<std::vector<Fill>> fills(chains_.size());
    for (size_t i = 0; i < chains_.size(); ++i) {
      for (auto &fill : chains_[i]->allFills()) {
        if (ranges[i].contains(fill.block_number)) {
          fills[i].emplace_back(std::move(fill));
        }
      }
    }

    Reconciliation result;
    for (size_t o = 0; o < chains_.size(); ++o) {
      for (size_t d = 0; d < chains_.size(); ++d) {
        if (o == d) {
          continue;
        }
        if (stop.stop_requested()) {
          SL_INFO(logger_, "Reconciliation of {} aborted", scope);
          return ReconciliationError::ABORTED;
        }
        reconcilePair(*chains_[o], *chains_[d], ranges[o], fills[d], result);
      }
    }

    if (stop.stop_requested()) {
      SL_INFO(logger_, "Reconciliation of {} aborted", scope);
      return ReconciliationError::ABORTED;
    }

    sortCanonically(result);

    size_t unfilled_count = 0;
    for (auto &[_, deposits] : result.unfilled_deposits) {
      unfilled_count += deposits.size();
    }
    size_t fill_count = 0;
    for (auto &[_, refund_fills] : result.fills_to_refund) {
      fill_count += refund_fills.size();
    }
    SL_DEBUG(logger_,
             "Reconciled {}: {} unfilled deposits, {} fills to refund "
             "for {} relayer/chain pairs",
             scope,
             unfilled_count,
             fill_count,
             result.fills_to_refund.size());
    return result;
  }

  void Reconciler::reconcilePair(const clients::ChainStateView &origin,
                                 const clients::ChainStateView &destination,
                                 const ChainBlockRange &origin_range,
                                 const std::vector<Fill> &destination_fills,
                                 Reconciliation &result) const {
    SL_DEBUG(logger_,
             "Reconciling deposits {} -> {}",
             origin.chainId(),
             destination.chainId());

    // Fills in range may settle deposits of earlier bundles, so they are
    // matched against every known deposit; only deposits in range can be
    // unfilled in this bundle
    const auto known_deposits =
        origin.depositsForDestination(destination.chainId());
    std::vector<Deposit> deposits;
    std::ranges::copy_if(
        known_deposits, std::back_inserter(deposits), [&](const Deposit &d) {
          return origin_range.contains(d.block_number);
        });

    size_t unfilled_count = 0;
    for (auto &deposit : deposits) {
      auto unfilled = destination.unfilledAmount(deposit);
      if (unfilled == 0) {
        continue;
      }
      SL_TRACE(logger_, "{} has {} unfilled", deposit, unfilled);
      result.unfilled_deposits[destination.chainId()].emplace_back(
          UnfilledDeposit{.deposit = deposit, .unfilled_amount = unfilled});
      ++unfilled_count;
    }

    size_t valid_fills = 0;
    for (auto &fill : destination_fills) {
      if (fill.is_slow_relay) {
        continue;
      }
      auto matches =
          std::ranges::any_of(known_deposits, [&](const Deposit &d) {
            return destination.fillMatchesDeposit(fill, d);
          });
      if (not matches) {
        continue;
      }
      result.fills_to_refund[RefundKey{
                                 .repayment_chain_id = fill.repayment_chain_id,
                                 .relayer = fill.relayer,
                             }]
          .emplace_back(fill);
      ++valid_fills;
    }

    if (unfilled_count == 0) {
      SL_DEBUG(logger_,
               "{} -> {}: all {} deposits are filled, {} valid fills",
               origin.chainId(),
               destination.chainId(),
               deposits.size(),
               valid_fills);
    } else {
      SL_DEBUG(logger_,
               "{} -> {}: {} of {} deposits unfilled, {} valid fills",
               origin.chainId(),
               destination.chainId(),
               unfilled_count,
               deposits.size(),
               valid_fills);
    }
  }

}  // namespace dataworker::reconciliation
