/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

namespace dataworker::ledger {

  enum class LedgerError : uint8_t {
    VERSION_CONFLICT = 1,
    BALANCE_OUT_OF_RANGE,
  };

}  // namespace dataworker::ledger

OUTCOME_HPP_DECLARE_ERROR(dataworker::ledger, LedgerError);
