/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "builders/slow_relay_root_builder.hpp"

#include <algorithm>
#include <tuple>

#include "builders/root_builder_error.hpp"

namespace dataworker::builders {

  SlowRelayRootBuilder::SlowRelayRootBuilder(
      qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_(logsys->getLogger("SlowRelayRootBuilder", "root_builders")) {}

  outcome::result<std::optional<SlowRelayRoot>> SlowRelayRootBuilder::build(
      const reconciliation::Reconciliation &reconciliation,
      const BundleScope &scope) const {
    std::vector<RelayData> leaves;
    for (const auto &[_, unfilled] : reconciliation.unfilled_deposits) {
      for (const auto &entry : unfilled) {
        leaves.emplace_back(RelayData::from(entry.deposit));
      }
    }

    if (leaves.empty()) {
      SL_INFO(logger_, "No slow relays in bundle {}", scope);
      return std::nullopt;
    }
    if (leaves.size() > MAX_LEAVES) {
      SL_ERROR(logger_, "Too many slow relays: {}", leaves.size());
      return RootBuilderError::LEAF_TOO_LARGE;
    }

    std::ranges::sort(leaves, {}, [](const RelayData &leaf) {
      return std::tie(leaf.origin_chain_id, leaf.deposit_id);
    });

    OUTCOME_TRY(built, buildRoot(std::move(leaves)));
    SL_INFO(logger_,
            "Slow relay root {} built over {} leaves for bundle {}",
            built.root,
            built.leaves.size(),
            scope);
    return built;
  }

}  // namespace dataworker::builders
