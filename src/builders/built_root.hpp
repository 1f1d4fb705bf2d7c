/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "crypto/merkle/merkle_tree.hpp"

namespace dataworker::builders {

  /**
   * Merkle root together with the ordered leaves it commits to.
   * The leaves are kept for proof generation at execution time.
   */
  template <typename Leaf>
  struct BuiltRoot {
    Hash256 root;
    std::vector<Leaf> leaves;
    crypto::MerkleTree tree;
  };

  /// Hashes `leaves` in the given order and builds the tree over them
  template <typename Leaf>
  outcome::result<BuiltRoot<Leaf>> buildRoot(std::vector<Leaf> leaves) {
    std::vector<Hash256> hashes;
    hashes.reserve(leaves.size());
    for (const auto &leaf : leaves) {
      OUTCOME_TRY(hash, crypto::leafHash(leaf));
      hashes.emplace_back(hash);
    }
    OUTCOME_TRY(tree, crypto::MerkleTree::build(std::move(hashes)));
    auto root = tree.root();
    return BuiltRoot<Leaf>{
        .root = root,
        .leaves = std::move(leaves),
        .tree = std::move(tree),
    };
  }

}  // namespace dataworker::builders
