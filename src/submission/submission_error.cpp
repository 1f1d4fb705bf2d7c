/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "submission/submission_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dataworker::submission, SubmissionError, e) {
  using E = dataworker::submission::SubmissionError;
  switch (e) {
    case E::SIMULATION_FAILED:
      return "Transaction would revert";
    case E::SUBMISSION_FAILED:
      return "Transaction was not accepted";
    case E::OUTBOX_UNAVAILABLE:
      return "Outbox file can not be written";
  }
  return "Unknown error";
}
