/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/shared_ref.hpp>

#include "builders/built_root.hpp"
#include "log/logger.hpp"
#include "reconciliation/reconciliation.hpp"
#include "types/bundle_scope.hpp"
#include "types/relay_data.hpp"

namespace dataworker::builders {

  using SlowRelayRoot = BuiltRoot<RelayData>;

  /**
   * Builds the slow-relay root: one leaf per unfilled deposit, ordered by
   * (origin chain id, deposit id)
   */
  class SlowRelayRootBuilder {
   public:
    explicit SlowRelayRootBuilder(qtils::SharedRef<log::LoggingSystem> logsys);

    /// std::nullopt when there is nothing to relay
    outcome::result<std::optional<SlowRelayRoot>> build(
        const reconciliation::Reconciliation &reconciliation,
        const BundleScope &scope) const;

   private:
    log::Logger logger_;
  };

}  // namespace dataworker::builders
