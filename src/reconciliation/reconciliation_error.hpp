/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

namespace dataworker::reconciliation {

  enum class ReconciliationError : uint8_t {
    STALE_CHAIN_STATE = 1,
    CHAIN_NOT_IN_SCOPE,
    ABORTED,
  };

}  // namespace dataworker::reconciliation

OUTCOME_HPP_DECLARE_ERROR(dataworker::reconciliation, ReconciliationError);
