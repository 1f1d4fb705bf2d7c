/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <fmt/format.h>
#include <qtils/byte_vec.hpp>

#include "types/primitives.hpp"

namespace dataworker::submission {

  /// Contract names the dataworker calls
  inline const std::string kHubPool = "HubPool";
  inline const std::string kSpokePool = "SpokePool";

  /// Contract call: SSZ-encoded arguments of `method` on `target`
  struct Transaction {
    ChainId chain_id = 0;
    std::string target;
    std::string method;
    qtils::ByteVec args;

    bool operator==(const Transaction &) const = default;
  };

  struct TransactionReceipt {
    Hash256 tx_hash;

    bool operator==(const TransactionReceipt &) const = default;
  };

}  // namespace dataworker::submission

template <>
struct fmt::formatter<dataworker::submission::Transaction> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const dataworker::submission::Transaction &v,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "{}.{} on chain {} ({} bytes of args)",
                          v.target,
                          v.method,
                          v.chain_id,
                          v.args.size());
  }
};
