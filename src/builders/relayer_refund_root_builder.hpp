/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/shared_ref.hpp>

#include "builders/built_root.hpp"
#include "clients/hub_pool_view.hpp"
#include "log/logger.hpp"
#include "reconciliation/reconciliation.hpp"
#include "types/bundle_scope.hpp"
#include "types/relayer_refund_leaf.hpp"

namespace dataworker::builders {

  using RelayerRefundRoot = BuiltRoot<RelayerRefundLeaf>;

  /**
   * Builds the relayer-refund root: one leaf per repayment chain, ordered by
   * chain id. Inside a leaf refunds are ordered by (relayer, token) and each
   * refund lists its fill amounts ascending.
   */
  class RelayerRefundRootBuilder {
   public:
    RelayerRefundRootBuilder(qtils::SharedRef<log::LoggingSystem> logsys,
                             qtils::SharedRef<clients::HubPoolView> hub);

    /// std::nullopt when no fill is refundable
    outcome::result<std::optional<RelayerRefundRoot>> build(
        const reconciliation::Reconciliation &reconciliation,
        const BundleScope &scope) const;

   private:
    /// Token paid out on the repayment chain for the token of the fill
    outcome::result<Address> refundTokenOf(const Fill &fill) const;

    log::Logger logger_;
    qtils::SharedRef<clients::HubPoolView> hub_;
  };

}  // namespace dataworker::builders
