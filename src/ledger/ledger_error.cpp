/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/ledger_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dataworker::ledger, LedgerError, e) {
  using E = dataworker::ledger::LedgerError;
  switch (e) {
    case E::VERSION_CONFLICT:
      return "Running balance was changed by another bundle";
    case E::BALANCE_OUT_OF_RANGE:
      return "Running balance transition is not arithmetically consistent";
  }
  return "Unknown error";
}
