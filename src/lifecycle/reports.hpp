/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <optional>
#include <system_error>
#include <vector>

#include "bundle/bundle_state.hpp"
#include "submission/transaction.hpp"
#include "types/root_type.hpp"

namespace dataworker::lifecycle {

  /// Roots a proposer claims for a bundle, std::nullopt for an absent root
  struct ClaimedRoots {
    std::optional<Hash256> slow_relay;
    std::optional<Hash256> relayer_refund;
    std::optional<Hash256> pool_rebalance;

    std::optional<Hash256> rootOf(RootType root_type) const {
      switch (root_type) {
        case RootType::SlowRelay:
          return slow_relay;
        case RootType::RelayerRefund:
          return relayer_refund;
        case RootType::PoolRebalance:
          return pool_rebalance;
      }
      return std::nullopt;
    }

    bool operator==(const ClaimedRoots &) const = default;
  };

  struct RootComparison {
    RootType root_type = RootType::SlowRelay;
    bool matches = false;
    /// Claimed by the proposer
    std::optional<Hash256> expected;
    /// Recomputed locally
    std::optional<Hash256> actual;
  };

  /// Outcome of all three comparisons, in the order of kAllRootTypes
  struct ValidationReport {
    std::array<RootComparison, kAllRootTypes.size()> roots;

    bool allMatch() const {
      for (const auto &root : roots) {
        if (not root.matches) {
          return false;
        }
      }
      return true;
    }

    std::vector<RootType> mismatched() const {
      std::vector<RootType> result;
      for (const auto &root : roots) {
        if (not root.matches) {
          result.emplace_back(root.root_type);
        }
      }
      return result;
    }
  };

  struct ProposalReport {
    BundleId bundle_id = 0;
    ClaimedRoots roots;
    std::array<size_t, kAllRootTypes.size()> leaf_counts{};
    submission::TransactionReceipt receipt;
  };

  struct LeafFailure {
    LeafId leaf_id = 0;
    std::error_code error;
  };

  /**
   * Per-leaf outcome of executing one root. Failed leaves don't stop the
   * others; the call succeeds partially when `failed` is not empty.
   */
  struct ExecutionReport {
    BundleId bundle_id = 0;
    RootType root_type = RootType::SlowRelay;
    std::vector<LeafId> executed;
    /// Already executed before, locally or on chain
    std::vector<LeafId> skipped;
    std::vector<LeafFailure> failed;
    bundle::BundleState state = bundle::BundleState::Executing;

    bool success() const {
      return failed.empty();
    }
  };

}  // namespace dataworker::lifecycle
