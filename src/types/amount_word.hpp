/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <iterator>
#include <vector>

#include "types/primitives.hpp"

namespace dataworker {

  /**
   * 256-bit amount as it appears inside leaves: 32 bytes, big-endian.
   * Signed values use two's complement.
   */
  using AmountWord = qtils::ByteArr<32>;

  inline AmountWord toWord(const Amount &amount) {
    AmountWord word{};
    std::vector<uint8_t> bytes;
    boost::multiprecision::export_bits(
        amount, std::back_inserter(bytes), 8, true);
    // export_bits emits the minimal number of bytes
    std::copy(bytes.begin(), bytes.end(), word.end() - bytes.size());
    return word;
  }

  inline Amount amountFromWord(const AmountWord &word) {
    Amount amount;
    boost::multiprecision::import_bits(amount, word.begin(), word.end(), 8, true);
    return amount;
  }

  inline AmountWord toWord(const SignedAmount &amount) {
    if (amount >= 0) {
      return toWord(static_cast<Amount>(amount));
    }
    Amount magnitude = static_cast<Amount>(-amount);
    return toWord(static_cast<Amount>(~magnitude + 1));
  }

  inline SignedAmount signedAmountFromWord(const AmountWord &word) {
    auto raw = amountFromWord(word);
    if ((word[0] & 0x80) == 0) {
      return static_cast<SignedAmount>(raw);
    }
    Amount magnitude = ~raw + 1;
    return -static_cast<SignedAmount>(magnitude);
  }

}  // namespace dataworker
