/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

namespace dataworker::submission {

  enum class SubmissionError : uint8_t {
    SIMULATION_FAILED = 1,
    SUBMISSION_FAILED,
    OUTBOX_UNAVAILABLE,
  };

}  // namespace dataworker::submission

OUTCOME_HPP_DECLARE_ERROR(dataworker::submission, SubmissionError);
