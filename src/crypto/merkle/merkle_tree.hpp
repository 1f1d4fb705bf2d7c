/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "crypto/sha/sha256.hpp"
#include "serde/serialization.hpp"
#include "types/primitives.hpp"

namespace dataworker::crypto {

  enum class MerkleError : uint8_t {
    EMPTY_LEAF_SET = 1,
    LEAF_INDEX_OUT_OF_RANGE,
  };

  /// Sibling hashes from the leaf level up to the root
  using MerkleProof = std::vector<Hash256>;

  /**
   * Binary Merkle tree over leaf hashes given in their final order.
   * A parent is sha256 of its two children sorted bytewise, so proofs need no
   * direction bits. A node without a sibling is promoted to the next level
   * unchanged.
   */
  class MerkleTree {
   public:
    static outcome::result<MerkleTree> build(std::vector<Hash256> leaf_hashes);

    const Hash256 &root() const {
      return levels_.back().front();
    }

    size_t leafCount() const {
      return levels_.front().size();
    }

    const std::vector<Hash256> &leafHashes() const {
      return levels_.front();
    }

    outcome::result<MerkleProof> proofFor(size_t index) const;

    static bool verify(const Hash256 &leaf_hash,
                       const MerkleProof &proof,
                       const Hash256 &root);

    static Hash256 hashPair(const Hash256 &a, const Hash256 &b);

   private:
    explicit MerkleTree(std::vector<std::vector<Hash256>> levels);

    // levels_[0] are leaf hashes, levels_.back() holds only the root
    std::vector<std::vector<Hash256>> levels_;
  };

  /// Leaf hash: SSZ hash tree root of the leaf
  template <typename Leaf>
  outcome::result<Hash256> leafHash(const Leaf &leaf) {
    return sszHash(leaf);
  }

}  // namespace dataworker::crypto

OUTCOME_HPP_DECLARE_ERROR(dataworker::crypto, MerkleError);
