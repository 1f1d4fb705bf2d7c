/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "reconciliation/reconciliation_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dataworker::reconciliation,
                            ReconciliationError,
                            e) {
  using E = dataworker::reconciliation::ReconciliationError;
  switch (e) {
    case E::STALE_CHAIN_STATE:
      return "Chain state view is not synchronized";
    case E::CHAIN_NOT_IN_SCOPE:
      return "Bundle scope has no block range for an active chain";
    case E::ABORTED:
      return "Reconciliation was aborted";
  }
  return "Unknown error";
}
