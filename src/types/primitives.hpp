/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <boost/multiprecision/cpp_int.hpp>
#include <qtils/byte_arr.hpp>

namespace dataworker {

  using ChainId = uint64_t;
  using DepositId = uint32_t;
  using BlockNumber = uint64_t;
  using LeafId = uint32_t;
  using BundleId = uint64_t;
  using Timestamp = uint32_t;

  using Address = qtils::ByteArr<20>;
  using Hash256 = qtils::ByteArr<32>;

  /// Token amount in the token's smallest unit
  using Amount = boost::multiprecision::uint256_t;

  /// Running balances and net sends may be negative
  using SignedAmount = boost::multiprecision::int256_t;

  /// Fee percentage as 18-decimal fixed point, `kFeePctScale` is 100%
  using FeePct = uint64_t;
  constexpr FeePct kFeePctScale = 1'000'000'000'000'000'000ull;

}  // namespace dataworker
