/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

namespace dataworker::lifecycle {

  enum class LifecycleError : uint8_t {
    BUNDLE_NOT_FOUND = 1,
    INVALID_STATE_TRANSITION,
    ROOT_MISMATCH,
    PROOF_CONSTRUCTION_FAILURE,
    SUBMISSION_FAILED,
    PREVIOUS_BUNDLE_PENDING,
  };

}  // namespace dataworker::lifecycle

OUTCOME_HPP_DECLARE_ERROR(dataworker::lifecycle, LifecycleError);
