/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lifecycle/lifecycle_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dataworker::lifecycle, LifecycleError, e) {
  using E = dataworker::lifecycle::LifecycleError;
  switch (e) {
    case E::BUNDLE_NOT_FOUND:
      return "Bundle not found";
    case E::INVALID_STATE_TRANSITION:
      return "Operation is not allowed in the current bundle state";
    case E::ROOT_MISMATCH:
      return "Recomputed roots differ from the claimed ones";
    case E::PROOF_CONSTRUCTION_FAILURE:
      return "Persisted leaves are inconsistent with the claimed root";
    case E::SUBMISSION_FAILED:
      return "Transaction submission failed";
    case E::PREVIOUS_BUNDLE_PENDING:
      return "Previous bundle is neither executing nor disputed yet";
  }
  return "Unknown error";
}
