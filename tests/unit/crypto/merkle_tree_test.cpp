/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <fmt/format.h>
#include <qtils/test/outcome.hpp>

#include "crypto/merkle/merkle_tree.hpp"
#include "crypto/sha/sha256.hpp"
#include "testutil/literals.hpp"
#include "types/bundle_scope.hpp"

using dataworker::Hash256;
using dataworker::ChainBlockRange;
using dataworker::crypto::leafHash;
using dataworker::crypto::MerkleError;
using dataworker::crypto::MerkleTree;
using dataworker::crypto::sha256;

namespace {
  std::vector<Hash256> leaves(size_t count) {
    std::vector<Hash256> result;
    for (size_t i = 0; i < count; ++i) {
      auto text = fmt::format("leaf #{}", i);
      result.emplace_back(sha256(std::string_view{text}));
    }
    return result;
  }
}  // namespace

/**
 * @given one leaf hash
 * @when tree is built
 * @then root is the leaf hash itself and its proof is empty
 */
TEST(MerkleTreeTest, SingleLeafIsRoot) {
  auto hashes = leaves(1);
  ASSERT_OUTCOME_SUCCESS(tree, MerkleTree::build(hashes));
  EXPECT_EQ(tree.root(), hashes[0]);
  ASSERT_OUTCOME_SUCCESS(proof, tree.proofFor(0));
  EXPECT_TRUE(proof.empty());
  EXPECT_TRUE(MerkleTree::verify(hashes[0], proof, tree.root()));
}

/**
 * @given two leaves
 * @when tree is built in either order
 * @then root is the same, since pairs are hashed sorted
 */
TEST(MerkleTreeTest, PairsAreHashedSorted) {
  auto a = "aaa"_arr32;
  auto b = "bbb"_arr32;
  ASSERT_OUTCOME_SUCCESS(ab, MerkleTree::build({a, b}));
  ASSERT_OUTCOME_SUCCESS(ba, MerkleTree::build({b, a}));
  EXPECT_EQ(ab.root(), ba.root());
  EXPECT_EQ(ab.root(), sha256(a, b));
}

/**
 * @given three leaves
 * @when tree is built
 * @then the last leaf is promoted unchanged and paired at the next level
 */
TEST(MerkleTreeTest, OddNodeIsPromoted) {
  auto hashes = leaves(3);
  ASSERT_OUTCOME_SUCCESS(tree, MerkleTree::build(hashes));
  auto expected = MerkleTree::hashPair(
      MerkleTree::hashPair(hashes[0], hashes[1]), hashes[2]);
  EXPECT_EQ(tree.root(), expected);

  ASSERT_OUTCOME_SUCCESS(proof, tree.proofFor(2));
  ASSERT_EQ(proof.size(), 1u);
  EXPECT_EQ(proof[0], MerkleTree::hashPair(hashes[0], hashes[1]));
}

/**
 * @given trees of several sizes
 * @when proof of every leaf is constructed
 * @then it verifies against the root, and fails for another leaf
 */
TEST(MerkleTreeTest, EveryProofVerifies) {
  for (size_t count : {2, 5, 8, 13}) {
    auto hashes = leaves(count);
    ASSERT_OUTCOME_SUCCESS(tree, MerkleTree::build(hashes));
    for (size_t i = 0; i < count; ++i) {
      ASSERT_OUTCOME_SUCCESS(proof, tree.proofFor(i));
      EXPECT_TRUE(MerkleTree::verify(hashes[i], proof, tree.root()))
          << "leaf " << i << " of " << count;
      auto other = hashes[(i + 1) % count];
      EXPECT_FALSE(MerkleTree::verify(other, proof, tree.root()))
          << "leaf " << i << " of " << count;
    }
  }
}

/**
 * @given a valid proof
 * @when one of its siblings is altered
 * @then verification fails
 */
TEST(MerkleTreeTest, TamperedProofFails) {
  auto hashes = leaves(4);
  ASSERT_OUTCOME_SUCCESS(tree, MerkleTree::build(hashes));
  ASSERT_OUTCOME_SUCCESS(proof, tree.proofFor(1));
  auto tampered = proof;
  tampered.back()[0] ^= 0x01;
  EXPECT_FALSE(MerkleTree::verify(hashes[1], tampered, tree.root()));
}

TEST(MerkleTreeTest, Errors) {
  ASSERT_OUTCOME_ERROR(MerkleTree::build({}), MerkleError::EMPTY_LEAF_SET);

  ASSERT_OUTCOME_SUCCESS(tree, MerkleTree::build(leaves(3)));
  ASSERT_OUTCOME_ERROR(tree.proofFor(3), MerkleError::LEAF_INDEX_OUT_OF_RANGE);
}

/**
 * @given a container of three uint64 fields
 * @when its leaf hash is taken
 * @then it is the SSZ hash tree root over four little-endian chunks, not a
 * digest of the serialized bytes
 */
TEST(MerkleTreeTest, LeafHashIsHashTreeRoot) {
  ChainBlockRange range;
  range.chain_id = 10;
  range.start_block = 0x0102;
  range.end_block = 7;

  auto chunk = [](uint64_t value) {
    Hash256 result{};
    for (size_t i = 0; i < sizeof(value); ++i) {
      result[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return result;
  };
  auto expected = sha256(sha256(chunk(10), chunk(0x0102)),
                         sha256(chunk(7), Hash256{}));

  ASSERT_OUTCOME_SUCCESS(hash, leafHash(range));
  EXPECT_EQ(hash, expected);

  ASSERT_OUTCOME_SUCCESS(encoded, dataworker::encode(range));
  EXPECT_NE(hash, sha256(qtils::ByteView{encoded}));
}
