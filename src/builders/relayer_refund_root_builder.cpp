/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "builders/relayer_refund_root_builder.hpp"

#include <algorithm>
#include <map>

#include "builders/amount_math.hpp"
#include "builders/root_builder_error.hpp"

namespace dataworker::builders {

  RelayerRefundRootBuilder::RelayerRefundRootBuilder(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<clients::HubPoolView> hub)
      : logger_(logsys->getLogger("RelayerRefundRootBuilder", "root_builders")),
        hub_(std::move(hub)) {}

  outcome::result<Address> RelayerRefundRootBuilder::refundTokenOf(
      const Fill &fill) const {
    auto l1_token =
        hub_->l1TokenFor(fill.destination_chain_id, fill.destination_token);
    if (not l1_token) {
      SL_ERROR(logger_,
               "No L1 token for token {} of chain {}",
               fill.destination_token,
               fill.destination_chain_id);
      return RootBuilderError::MISSING_TOKEN_ROUTE;
    }
    auto refund_token = hub_->l2TokenFor(fill.repayment_chain_id, *l1_token);
    if (not refund_token) {
      SL_ERROR(logger_,
               "No counterpart of L1 token {} on repayment chain {}",
               *l1_token,
               fill.repayment_chain_id);
      return RootBuilderError::MISSING_TOKEN_ROUTE;
    }
    return *refund_token;
  }

  outcome::result<std::optional<RelayerRefundRoot>>
  RelayerRefundRootBuilder::build(
      const reconciliation::Reconciliation &reconciliation,
      const BundleScope &scope) const {
    // repayment chain -> (relayer, refund token) -> fill amounts
    using RefundsOfChain = std::map<std::pair<Address, Address>,
                                    std::vector<Amount>>;
    std::map<ChainId, RefundsOfChain> grouped;

    for (const auto &[key, fills] : reconciliation.fills_to_refund) {
      for (const auto &fill : fills) {
        OUTCOME_TRY(refund_token, refundTokenOf(fill));
        grouped[key.repayment_chain_id][{key.relayer, refund_token}]
            .emplace_back(fill.fill_amount);
      }
    }

    if (grouped.empty()) {
      SL_INFO(logger_, "No relayer refunds in bundle {}", scope);
      return std::nullopt;
    }
    if (grouped.size() > MAX_LEAVES) {
      SL_ERROR(logger_, "Too many repayment chains: {}", grouped.size());
      return RootBuilderError::LEAF_TOO_LARGE;
    }

    std::vector<RelayerRefundLeaf> leaves;
    leaves.reserve(grouped.size());
    for (auto &[chain_id, refunds] : grouped) {
      if (refunds.size() > MAX_REFUNDS_PER_LEAF) {
        SL_ERROR(logger_,
                 "Too many refunds on chain {}: {}",
                 chain_id,
                 refunds.size());
        return RootBuilderError::LEAF_TOO_LARGE;
      }
      RelayerRefundLeaf leaf;
      leaf.leaf_id = static_cast<LeafId>(leaves.size());
      leaf.chain_id = chain_id;
      for (auto &[relayer_and_token, amounts] : refunds) {
        if (amounts.size() > MAX_FILLS_PER_REFUND) {
          SL_ERROR(logger_,
                   "Too many fills of relayer {} on chain {}: {}",
                   relayer_and_token.first,
                   chain_id,
                   amounts.size());
          return RootBuilderError::LEAF_TOO_LARGE;
        }
        std::ranges::sort(amounts);
        WideInt total = 0;
        RelayerRefund refund;
        refund.relayer = relayer_and_token.first;
        refund.refund_token = relayer_and_token.second;
        for (const auto &amount : amounts) {
          total += WideInt{amount};
          refund.fill_amounts.push_back(toWord(amount));
        }
        auto total_amount = toAmount(total);
        if (not total_amount) {
          SL_ERROR(logger_,
                   "Refund of relayer {} on chain {} overflows",
                   refund.relayer,
                   chain_id);
          return RootBuilderError::AMOUNT_OVERFLOW;
        }
        refund.amount = toWord(*total_amount);
        leaf.refunds.push_back(std::move(refund));
      }
      SL_DEBUG(logger_,
               "Refund leaf {} for chain {} with {} refunds",
               leaf.leaf_id,
               chain_id,
               leaf.refunds.size());
      leaves.emplace_back(std::move(leaf));
    }

    OUTCOME_TRY(built, buildRoot(std::move(leaves)));
    SL_INFO(logger_,
            "Relayer refund root {} built over {} leaves for bundle {}",
            built.root,
            built.leaves.size(),
            scope);
    return built;
  }

}  // namespace dataworker::builders
