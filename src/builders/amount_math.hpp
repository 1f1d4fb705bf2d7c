/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <optional>

#include <boost/multiprecision/cpp_int.hpp>

#include "types/primitives.hpp"

namespace dataworker::builders {

  /// Arbitrary precision intermediate for aggregation
  using WideInt = boost::multiprecision::cpp_int;

  /// Range of a signed 256-bit two's complement word
  inline const WideInt kMaxSignedWord = (WideInt{1} << 255) - 1;
  inline const WideInt kMinSignedWord = -(WideInt{1} << 255);

  inline std::optional<Amount> toAmount(const WideInt &value) {
    if (value < 0 or value > WideInt{std::numeric_limits<Amount>::max()}) {
      return std::nullopt;
    }
    return static_cast<Amount>(value);
  }

  inline std::optional<SignedAmount> toSignedAmount(const WideInt &value) {
    if (value < kMinSignedWord or value > kMaxSignedWord) {
      return std::nullopt;
    }
    return static_cast<SignedAmount>(value);
  }

  /// LP fee of `amount` at `pct` (1e18 = 100%), rounded down
  inline WideInt lpFeeOf(const Amount &amount, FeePct pct) {
    return WideInt{amount} * pct / kFeePctScale;
  }

}  // namespace dataworker::builders
