/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "builders/bundle_builder.hpp"
#include "clients/impl/snapshot_chain_state_view.hpp"
#include "clients/impl/snapshot_hub_pool_view.hpp"
#include "ledger/impl/running_balance_ledger_impl.hpp"
#include "reconciliation/reconciler.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "testutil/literals.hpp"

namespace testutil {

  using dataworker::Address;
  using dataworker::Amount;
  using dataworker::BlockNumber;
  using dataworker::ChainId;
  using dataworker::DepositId;

  constexpr ChainId kMainnet = 1;
  constexpr ChainId kOptimism = 10;
  constexpr ChainId kPolygon = 137;

  inline const Address kUsdc = "usdc"_arr20;
  inline const Address kWeth = "weth"_arr20;

  inline const Address kDepositor = "depositor"_arr20;
  inline const Address kRecipient = "recipient"_arr20;
  inline const Address kRelayer1 = "relayer-1"_arr20;
  inline const Address kRelayer2 = "relayer-2"_arr20;

  /// 1% in 18-decimal fixed point
  constexpr dataworker::FeePct kOnePercent = 10'000'000'000'000'000ull;

  /**
   * Counterpart of an L1 token on a spoke: the token's name followed by the
   * chain id in the last byte
   */
  inline Address tokenOn(const Address &l1_token, ChainId chain_id) {
    auto token = l1_token;
    token[token.size() - 1] = static_cast<uint8_t>(chain_id);
    return token;
  }

  /**
   * Three spoke chains with the hub on mainnet, USDC and WETH routed
   * everywhere, and the whole dataworker pipeline on in-memory storage
   */
  struct BridgeWorld {
    explicit BridgeWorld(
        qtils::SharedRef<dataworker::log::LoggingSystem> logsys_,
        dataworker::builders::PoolRebalanceConfig pool_config = {})
        : logsys(std::move(logsys_)) {
      hub = std::make_shared<dataworker::clients::SnapshotHubPoolView>(
          kMainnet);
      for (auto chain_id : {kMainnet, kOptimism, kPolygon}) {
        chains[chain_id] =
            std::make_shared<dataworker::clients::SnapshotChainStateView>(
                chain_id);
        hub->addRoute(kUsdc, chain_id, tokenOn(kUsdc, chain_id));
        hub->addRoute(kWeth, chain_id, tokenOn(kWeth, chain_id));
      }

      storage = std::make_shared<dataworker::storage::InMemorySpacedStorage>();
      ledger = std::make_shared<dataworker::ledger::RunningBalanceLedgerImpl>(
          logsys, std::shared_ptr<dataworker::storage::SpacedStorage>(storage));

      dataworker::reconciliation::Reconciler::ChainViews views;
      for (auto &[_, chain] : chains) {
        views.emplace_back(
            std::shared_ptr<dataworker::clients::ChainStateView>(chain));
      }
      reconciler = std::make_shared<dataworker::reconciliation::Reconciler>(
          logsys, std::move(views));

      std::shared_ptr<dataworker::clients::HubPoolView> hub_view = hub;
      std::shared_ptr<dataworker::ledger::RunningBalanceLedger> ledger_view =
          ledger;
      slow_relay =
          std::make_shared<dataworker::builders::SlowRelayRootBuilder>(logsys);
      relayer_refund =
          std::make_shared<dataworker::builders::RelayerRefundRootBuilder>(
              logsys, hub_view);
      pool_rebalance =
          std::make_shared<dataworker::builders::PoolRebalanceRootBuilder>(
              logsys, hub_view, ledger_view, std::move(pool_config));
      builder = std::make_shared<dataworker::builders::BundleBuilder>(
          reconciler, slow_relay, relayer_refund, pool_rebalance);
    }

    /// Registers a deposit of `l1_token` on its origin chain
    dataworker::Deposit deposit(DepositId deposit_id,
                                ChainId origin,
                                ChainId destination,
                                Amount amount,
                                BlockNumber block = 10,
                                const Address &l1_token = kUsdc) {
      dataworker::Deposit deposit{
          .deposit_id = deposit_id,
          .origin_chain_id = origin,
          .destination_chain_id = destination,
          .depositor = kDepositor,
          .recipient = kRecipient,
          .origin_token = tokenOn(l1_token, origin),
          .destination_token = tokenOn(l1_token, destination),
          .amount = amount,
          .relayer_fee_pct = kOnePercent,
          .realized_lp_fee_pct = kOnePercent,
          .quote_timestamp = 1'700'000'000,
          .block_number = block,
      };
      chains.at(origin)->addDeposit(deposit);
      return deposit;
    }

    /// Registers a fill of `deposit` on its destination chain
    dataworker::Fill fill(const dataworker::Deposit &deposit,
                          Amount fill_amount,
                          const Address &relayer,
                          ChainId repayment_chain_id,
                          BlockNumber block = 20,
                          bool is_slow_relay = false) {
      auto &filled = filled_[{deposit.origin_chain_id, deposit.deposit_id}];
      filled += fill_amount;
      dataworker::Fill fill{
          .deposit_id = deposit.deposit_id,
          .origin_chain_id = deposit.origin_chain_id,
          .destination_chain_id = deposit.destination_chain_id,
          .depositor = deposit.depositor,
          .recipient = deposit.recipient,
          .destination_token = deposit.destination_token,
          .amount = deposit.amount,
          .total_filled_amount = filled,
          .fill_amount = fill_amount,
          .repayment_chain_id = repayment_chain_id,
          .relayer = relayer,
          .relayer_fee_pct = deposit.relayer_fee_pct,
          .realized_lp_fee_pct = deposit.realized_lp_fee_pct,
          .is_slow_relay = is_slow_relay,
          .block_number = block,
      };
      chains.at(deposit.destination_chain_id)->addFill(fill);
      return fill;
    }

    /// Same block range on every chain
    dataworker::BundleScope scope(BlockNumber start = 0,
                                  BlockNumber end = 100) const {
      std::vector<dataworker::ChainBlockRange> ranges;
      for (const auto &[chain_id, _] : chains) {
        dataworker::ChainBlockRange range;
        range.chain_id = chain_id;
        range.start_block = start;
        range.end_block = end;
        ranges.emplace_back(range);
      }
      return dataworker::BundleScope{std::move(ranges)};
    }

    /**
     * Three deposits over Optimism and Polygon:
     * - #1 10->137 of 1000, filled by relayer 1 repaid on Optimism
     * - #2 10->137 of 500, 200 filled by relayer 2 repaid on Polygon
     * - #1 137->10 of 700, not filled
     */
    void populate() {
      auto d1 = deposit(1, kOptimism, kPolygon, 1000);
      auto d2 = deposit(2, kOptimism, kPolygon, 500);
      deposit(1, kPolygon, kOptimism, 700);
      fill(d1, 1000, kRelayer1, kOptimism);
      fill(d2, 200, kRelayer2, kPolygon);
    }

    qtils::SharedRef<dataworker::log::LoggingSystem> logsys;
    std::shared_ptr<dataworker::clients::SnapshotHubPoolView> hub;
    std::map<ChainId, std::shared_ptr<dataworker::clients::SnapshotChainStateView>>
        chains;
    std::shared_ptr<dataworker::storage::InMemorySpacedStorage> storage;
    std::shared_ptr<dataworker::ledger::RunningBalanceLedgerImpl> ledger;
    std::shared_ptr<dataworker::reconciliation::Reconciler> reconciler;
    std::shared_ptr<dataworker::builders::SlowRelayRootBuilder> slow_relay;
    std::shared_ptr<dataworker::builders::RelayerRefundRootBuilder>
        relayer_refund;
    std::shared_ptr<dataworker::builders::PoolRebalanceRootBuilder>
        pool_rebalance;
    std::shared_ptr<dataworker::builders::BundleBuilder> builder;

   private:
    std::map<std::pair<ChainId, DepositId>, Amount> filled_;
  };

}  // namespace testutil
