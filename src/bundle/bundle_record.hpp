/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <sszpp/ssz++.hpp>

#include "bundle/bundle_state.hpp"
#include "types/bundle_scope.hpp"
#include "types/constants.hpp"
#include "types/pool_rebalance_leaf.hpp"
#include "types/relay_data.hpp"
#include "types/relayer_refund_leaf.hpp"
#include "types/root_type.hpp"
#include "types/running_balance.hpp"
#include "types/ssz_maybe.hpp"

namespace dataworker::bundle {

  /**
   * @struct BundleRecord
   * Everything persisted about a proposed bundle: its scope, the three roots
   * (absent ones as empty lists) with their leaves, and the running-balance
   * transitions to apply when execution starts.
   */
  struct BundleRecord : ssz::ssz_variable_size_container {
    BundleId bundle_id = 0;
    uint32_t protocol_version = PROTOCOL_VERSION;
    uint8_t state = static_cast<uint8_t>(BundleState::Building);
    ssz::list<ChainBlockRange, MAX_CHAINS> scope;
    SszMaybe<Hash256> slow_relay_root;
    ssz::list<RelayData, MAX_LEAVES> slow_relay_leaves;
    SszMaybe<Hash256> relayer_refund_root;
    ssz::list<RelayerRefundLeaf, MAX_LEAVES> relayer_refund_leaves;
    SszMaybe<Hash256> pool_rebalance_root;
    ssz::list<PoolRebalanceLeaf, MAX_LEAVES> pool_rebalance_leaves;
    ssz::list<RunningBalanceTransition, MAX_RUNNING_BALANCE_TRANSITIONS>
        transitions;

    SSZ_CONT(bundle_id,
             protocol_version,
             state,
             scope,
             slow_relay_root,
             slow_relay_leaves,
             relayer_refund_root,
             relayer_refund_leaves,
             pool_rebalance_root,
             pool_rebalance_leaves,
             transitions);

    bool operator==(const BundleRecord &) const = default;

    BundleState bundleState() const {
      return static_cast<BundleState>(state);
    }

    void setBundleState(BundleState new_state) {
      state = static_cast<uint8_t>(new_state);
    }

    BundleScope bundleScope() const {
      std::vector<ChainBlockRange> ranges;
      for (const auto &range : scope) {
        ranges.emplace_back(range);
      }
      return BundleScope{std::move(ranges)};
    }

    std::optional<Hash256> rootOf(RootType root_type) const {
      switch (root_type) {
        case RootType::SlowRelay:
          return slow_relay_root.toOptional();
        case RootType::RelayerRefund:
          return relayer_refund_root.toOptional();
        case RootType::PoolRebalance:
          return pool_rebalance_root.toOptional();
      }
      return std::nullopt;
    }

    size_t leafCount(RootType root_type) const {
      switch (root_type) {
        case RootType::SlowRelay:
          return slow_relay_leaves.size();
        case RootType::RelayerRefund:
          return relayer_refund_leaves.size();
        case RootType::PoolRebalance:
          return pool_rebalance_leaves.size();
      }
      return 0;
    }
  };

}  // namespace dataworker::bundle
