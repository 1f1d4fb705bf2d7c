/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "builders/root_builder_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dataworker::builders, RootBuilderError, e) {
  using E = dataworker::builders::RootBuilderError;
  switch (e) {
    case E::MISSING_TOKEN_ROUTE:
      return "Hub pool has no route for a token of the bundle";
    case E::AMOUNT_OVERFLOW:
      return "Aggregated amount does not fit 256 bits";
    case E::LEAF_TOO_LARGE:
      return "Leaf exceeds the maximum number of entries";
  }
  return "Unknown error";
}
