/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cctype>
#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "types/bundle_scope.hpp"
#include "types/primitives.hpp"

namespace dataworker::util {

  /**
   * Case-insensitive comparison of two string views.
   */
  inline bool iequals(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(lhs[i]))
          != std::tolower(static_cast<unsigned char>(rhs[i]))) {
        return false;
      }
    }
    return true;
  }

  inline std::string_view trim(std::string_view input) {
    auto first = input.find_first_not_of(" \t\n\r");
    if (first == std::string_view::npos) {
      return {};
    }
    auto last = input.find_last_not_of(" \t\n\r");
    return input.substr(first, last - first + 1);
  }

  template <typename T>
    requires std::is_unsigned_v<T>
  std::optional<T> parseUnsigned(std::string_view input) {
    input = trim(input);
    T value{};
    auto [ptr, ec] = std::from_chars(
        input.data(), input.data() + input.size(), value);
    if (ec != std::errc() or ptr != input.end()) {
      return std::nullopt;
    }
    return value;
  }

  /**
   * Parses a byte size such as "4096", "512Mb" or "1 GiB".
   *
   * Recognized suffixes (case-insensitive):
   * - SI (base 1000): B, KB, MB, GB, TB
   * - IEC (base 1024): KiB, MiB, GiB, TiB
   * - Single-letter: K, M, G, T are interpreted as IEC (1024-based)
   *
   * @param input string representation of byte size
   * @return size in bytes if parsing succeeded, std::nullopt otherwise
   */
  inline std::optional<uint64_t> parseByteQuantity(std::string_view input) {
    input = trim(input);

    size_t i = 0;
    while (i < input.size()
           and std::isdigit(static_cast<unsigned char>(input[i]))) {
      ++i;
    }
    if (i == 0) {
      return std::nullopt;
    }
    auto number = parseUnsigned<uint64_t>(input.substr(0, i));
    if (not number.has_value()) {
      return std::nullopt;
    }
    auto suffix = trim(input.substr(i));
    if (suffix.empty()) {
      return number;
    }

    struct SuffixDef {
      std::string_view suffix;
      uint64_t multiplier;
    };
    static constexpr SuffixDef units[] = {
        {"b", 1},
        {"k", 1ull << 10},
        {"kib", 1ull << 10},
        {"kb", 1000ull},
        {"m", 1ull << 20},
        {"mib", 1ull << 20},
        {"mb", 1000ull * 1000ull},
        {"g", 1ull << 30},
        {"gib", 1ull << 30},
        {"gb", 1000ull * 1000ull * 1000ull},
        {"t", 1ull << 40},
        {"tib", 1ull << 40},
        {"tb", 1000ull * 1000ull * 1000ull * 1000ull},
    };

    for (const auto &[table_suffix, multiplier] : units) {
      if (iequals(table_suffix, suffix)) {
        if (*number > UINT64_MAX / multiplier) {
          return std::nullopt;
        }
        return *number * multiplier;
      }
    }
    return std::nullopt;
  }

  /**
   * Parses a token amount written as an unsigned decimal integer.
   * Values that don't fit 256 bits are rejected.
   */
  inline std::optional<Amount> parseAmount(std::string_view input) {
    input = trim(input);
    if (input.empty() or input.size() > 78) {
      return std::nullopt;
    }
    for (auto c : input) {
      if (not std::isdigit(static_cast<unsigned char>(c))) {
        return std::nullopt;
      }
    }
    boost::multiprecision::cpp_int wide{std::string(input)};
    if (wide > boost::multiprecision::cpp_int{
            std::numeric_limits<Amount>::max()}) {
      return std::nullopt;
    }
    return static_cast<Amount>(wide);
  }

  /// 20-byte address written as 0x-prefixed hex
  inline std::optional<Address> parseAddress(std::string_view input) {
    auto res = Address::fromHexWithPrefix(trim(input));
    if (res.has_error()) {
      return std::nullopt;
    }
    return res.value();
  }

  /// 32-byte hash written as 0x-prefixed hex
  inline std::optional<Hash256> parseHash(std::string_view input) {
    auto res = Hash256::fromHexWithPrefix(trim(input));
    if (res.has_error()) {
      return std::nullopt;
    }
    return res.value();
  }

  /**
   * Parses a block range of a chain: `<chain-id>:<start>-<end>`
   */
  inline std::optional<ChainBlockRange> parseBlockRange(
      std::string_view input) {
    input = trim(input);
    auto colon = input.find(':');
    auto dash = input.find('-', colon);
    if (colon == std::string_view::npos or dash == std::string_view::npos) {
      return std::nullopt;
    }
    auto chain_id = parseUnsigned<ChainId>(input.substr(0, colon));
    auto start = parseUnsigned<BlockNumber>(
        input.substr(colon + 1, dash - colon - 1));
    auto end = parseUnsigned<BlockNumber>(input.substr(dash + 1));
    if (not chain_id or not start or not end or *start > *end) {
      return std::nullopt;
    }
    ChainBlockRange range;
    range.chain_id = *chain_id;
    range.start_block = *start;
    range.end_block = *end;
    return range;
  }

}  // namespace dataworker::util
