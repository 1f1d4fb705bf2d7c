/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "clients/impl/snapshot_chain_state_view.hpp"
#include "clients/impl/snapshot_hub_pool_view.hpp"
#include "log/logger.hpp"
#include "types/bundle_scope.hpp"

namespace YAML {
  class Node;
}

namespace dataworker::clients {

  enum class SnapshotError : uint8_t {
    FILE_NOT_READABLE = 1,
    MALFORMED_SECTION,
    INVALID_VALUE,
  };

  /**
   * Chain state loaded from a snapshot file: the hub, every spoke chain and,
   * when the file names one, the block ranges of the bundle to build
   */
  struct ChainSnapshot {
    std::shared_ptr<SnapshotHubPoolView> hub;
    std::vector<std::shared_ptr<SnapshotChainStateView>> chains;
    std::optional<BundleScope> scope;
  };

  /**
   * Reads a YAML chain-state snapshot.
   *
   * Layout:
   * @code
   * hub:
   *   chain-id: 1
   *   routes:
   *     - l1-token: 0x...
   *       tokens: { 1: 0x..., 10: 0x... }
   *   claimed-leaves:
   *     - { root-type: slow-relay, root: 0x..., leaf-id: 0 }
   * bundle:
   *   - { chain-id: 1, start-block: 0, end-block: 100 }
   * chains:
   *   - chain-id: 1
   *     synchronized: true
   *     deposits: [...]
   *     fills: [...]
   * @endcode
   * Amounts are decimal strings, addresses and hashes 0x-prefixed hex.
   */
  class SnapshotLoader {
   public:
    explicit SnapshotLoader(qtils::SharedRef<log::LoggingSystem> logsys);

    outcome::result<ChainSnapshot> load(
        const std::filesystem::path &path) const;

    /// Same as load() but from an already parsed document
    outcome::result<ChainSnapshot> parse(const YAML::Node &root) const;

   private:
    outcome::result<void> parseHub(const YAML::Node &node,
                                   ChainSnapshot &snapshot) const;
    outcome::result<BundleScope> parseScope(const YAML::Node &node) const;
    outcome::result<std::shared_ptr<SnapshotChainStateView>> parseChain(
        const YAML::Node &node) const;
    outcome::result<Deposit> parseDeposit(const YAML::Node &node) const;
    outcome::result<Fill> parseFill(const YAML::Node &node) const;

    log::Logger logger_;
  };

}  // namespace dataworker::clients

OUTCOME_HPP_DECLARE_ERROR(dataworker::clients, SnapshotError);
