/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/merkle/merkle_tree.hpp"

#include <algorithm>

#include "crypto/sha/sha256.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dataworker::crypto, MerkleError, e) {
  using E = dataworker::crypto::MerkleError;
  switch (e) {
    case E::EMPTY_LEAF_SET:
      return "Merkle tree can't be built over empty leaf set";
    case E::LEAF_INDEX_OUT_OF_RANGE:
      return "Leaf index is out of range of the tree";
  }
  return "Unknown MerkleError";
}

namespace dataworker::crypto {

  MerkleTree::MerkleTree(std::vector<std::vector<Hash256>> levels)
      : levels_(std::move(levels)) {}

  Hash256 MerkleTree::hashPair(const Hash256 &a, const Hash256 &b) {
    if (std::ranges::lexicographical_compare(b, a)) {
      return sha256(b, a);
    }
    return sha256(a, b);
  }

  outcome::result<MerkleTree> MerkleTree::build(
      std::vector<Hash256> leaf_hashes) {
    if (leaf_hashes.empty()) {
      return MerkleError::EMPTY_LEAF_SET;
    }

    std::vector<std::vector<Hash256>> levels;
    levels.emplace_back(std::move(leaf_hashes));

    while (levels.back().size() > 1) {
      const auto &current = levels.back();
      std::vector<Hash256> next;
      next.reserve((current.size() + 1) / 2);
      for (size_t i = 0; i < current.size(); i += 2) {
        if (i + 1 < current.size()) {
          next.emplace_back(hashPair(current[i], current[i + 1]));
        } else {
          next.emplace_back(current[i]);
        }
      }
      levels.emplace_back(std::move(next));
    }

    return MerkleTree(std::move(levels));
  }

  outcome::result<MerkleProof> MerkleTree::proofFor(size_t index) const {
    if (index >= leafCount()) {
      return MerkleError::LEAF_INDEX_OUT_OF_RANGE;
    }

    MerkleProof proof;
    for (size_t level = 0; level + 1 < levels_.size(); ++level) {
      auto sibling = index ^ 1;
      if (sibling < levels_[level].size()) {
        proof.emplace_back(levels_[level][sibling]);
      }
      index /= 2;
    }
    return proof;
  }

  bool MerkleTree::verify(const Hash256 &leaf_hash,
                          const MerkleProof &proof,
                          const Hash256 &root) {
    auto computed = leaf_hash;
    for (const auto &sibling : proof) {
      computed = hashPair(computed, sibling);
    }
    return computed == root;
  }

}  // namespace dataworker::crypto
