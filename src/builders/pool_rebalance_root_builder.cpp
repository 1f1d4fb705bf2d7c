/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "builders/pool_rebalance_root_builder.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "builders/amount_math.hpp"
#include "builders/root_builder_error.hpp"
#include "log/formatters/amount.hpp"

namespace dataworker::builders {

  namespace {
    struct Aggregate {
      WideInt slow = 0;
      WideInt refunds = 0;
      WideInt lp_fee = 0;
    };

    struct Row {
      Address l1_token;
      Amount lp_fee;
      SignedAmount net_send;
      SignedAmount next;
    };
  }  // namespace

  PoolRebalanceRootBuilder::PoolRebalanceRootBuilder(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<clients::HubPoolView> hub,
      qtils::SharedRef<ledger::RunningBalanceLedger> ledger,
      PoolRebalanceConfig config)
      : logger_(logsys->getLogger("PoolRebalanceRootBuilder", "root_builders")),
        hub_(std::move(hub)),
        ledger_(std::move(ledger)),
        config_(std::move(config)) {
    BOOST_ASSERT(config_.max_l1_tokens_per_leaf > 0);
    BOOST_ASSERT(config_.max_l1_tokens_per_leaf <= MAX_L1_TOKENS_PER_LEAF);
  }

  outcome::result<Address> PoolRebalanceRootBuilder::l1TokenOf(
      ChainId chain_id, const Address &token) const {
    auto l1_token = hub_->l1TokenFor(chain_id, token);
    if (not l1_token) {
      SL_ERROR(logger_,
               "No L1 token for token {} of chain {}",
               token,
               chain_id);
      return RootBuilderError::MISSING_TOKEN_ROUTE;
    }
    return *l1_token;
  }

  outcome::result<PoolRebalanceRoot> PoolRebalanceRootBuilder::build(
      const reconciliation::Reconciliation &reconciliation,
      const BundleScope &scope) const {
    std::map<ChainId, std::map<Address, Aggregate>> aggregates;

    for (const auto &[destination, unfilled] :
         reconciliation.unfilled_deposits) {
      for (const auto &entry : unfilled) {
        OUTCOME_TRY(l1_token,
                    l1TokenOf(destination, entry.deposit.destination_token));
        auto &aggregate = aggregates[destination][l1_token];
        aggregate.slow += WideInt{entry.unfilled_amount};
        aggregate.lp_fee += lpFeeOf(entry.unfilled_amount,
                                    entry.deposit.realized_lp_fee_pct);
      }
    }

    for (const auto &[key, fills] : reconciliation.fills_to_refund) {
      for (const auto &fill : fills) {
        OUTCOME_TRY(l1_token,
                    l1TokenOf(fill.destination_chain_id,
                              fill.destination_token));
        auto &aggregate = aggregates[key.repayment_chain_id][l1_token];
        aggregate.refunds += WideInt{fill.fill_amount};
        aggregate.lp_fee +=
            lpFeeOf(fill.fill_amount, fill.realized_lp_fee_pct);
      }
    }

    PoolRebalanceRoot result;
    if (aggregates.empty()) {
      SL_INFO(logger_, "No pool rebalances in bundle {}", scope);
      return result;
    }

    std::vector<PoolRebalanceLeaf> leaves;
    for (const auto &[chain_id, tokens] : aggregates) {
      std::vector<Row> rows;
      rows.reserve(tokens.size());
      for (const auto &[l1_token, aggregate] : tokens) {
        OUTCOME_TRY(prior, ledger_->get(chain_id, l1_token));
        auto prior_balance = signedAmountFromWord(prior.balance);

        WideInt delta = aggregate.slow - aggregate.refunds;
        WideInt accrued = WideInt{prior_balance} + delta;

        WideInt threshold = 0;
        if (auto it = config_.transfer_thresholds.find(l1_token);
            it != config_.transfer_thresholds.end()) {
          threshold = WideInt{it->second};
        }
        WideInt net_send = 0;
        if (accrued > 0 and accrued >= threshold) {
          net_send = accrued;
        }
        WideInt next = accrued - net_send;

        auto delta_value = toSignedAmount(delta);
        auto net_send_value = toSignedAmount(net_send);
        auto next_value = toSignedAmount(next);
        auto lp_fee_value = toAmount(aggregate.lp_fee);
        if (not delta_value or not net_send_value or not next_value
            or not lp_fee_value) {
          SL_ERROR(logger_,
                   "Rebalance of chain {} token {} overflows",
                   chain_id,
                   l1_token);
          return RootBuilderError::AMOUNT_OVERFLOW;
        }

        result.transitions.emplace_back(RunningBalanceTransition{
            .chain_id = chain_id,
            .l1_token = l1_token,
            .previous_version = prior.version,
            .previous_balance = prior.balance,
            .delta = toWord(*delta_value),
            .net_send = toWord(*net_send_value),
            .next_balance = toWord(*next_value),
        });
        SL_DEBUG(logger_,
                 "Chain {} token {}: prior {} (v{}), delta {}, net send {}, "
                 "next {}",
                 chain_id,
                 l1_token,
                 prior_balance,
                 prior.version,
                 *delta_value,
                 *net_send_value,
                 *next_value);

        rows.emplace_back(Row{
            .l1_token = l1_token,
            .lp_fee = *lp_fee_value,
            .net_send = *net_send_value,
            .next = *next_value,
        });
      }

      // Tokens are already ordered by the map
      const auto group_size = config_.max_l1_tokens_per_leaf;
      for (size_t first = 0; first < rows.size(); first += group_size) {
        PoolRebalanceLeaf leaf;
        leaf.leaf_id = static_cast<LeafId>(leaves.size());
        leaf.chain_id = chain_id;
        leaf.group_index = static_cast<uint32_t>(first / group_size);
        auto last = std::min(rows.size(), first + group_size);
        for (size_t i = first; i < last; ++i) {
          leaf.l1_tokens.push_back(rows[i].l1_token);
          leaf.bundle_lp_fees.push_back(toWord(rows[i].lp_fee));
          leaf.net_send_amounts.push_back(toWord(rows[i].net_send));
          leaf.running_balances.push_back(toWord(rows[i].next));
        }
        leaves.emplace_back(std::move(leaf));
      }
    }

    if (leaves.size() > MAX_LEAVES) {
      SL_ERROR(logger_, "Too many pool rebalance leaves: {}", leaves.size());
      return RootBuilderError::LEAF_TOO_LARGE;
    }

    OUTCOME_TRY(built, buildRoot(std::move(leaves)));
    SL_INFO(logger_,
            "Pool rebalance root {} built over {} leaves with {} running "
            "balance transitions for bundle {}",
            built.root,
            built.leaves.size(),
            result.transitions.size(),
            scope);
    result.root = std::move(built);
    return result;
  }

}  // namespace dataworker::builders
