/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

namespace dataworker::builders {

  enum class RootBuilderError : uint8_t {
    MISSING_TOKEN_ROUTE = 1,
    AMOUNT_OVERFLOW,
    LEAF_TOO_LARGE,
  };

}  // namespace dataworker::builders

OUTCOME_HPP_DECLARE_ERROR(dataworker::builders, RootBuilderError);
