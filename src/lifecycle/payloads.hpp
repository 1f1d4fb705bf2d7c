/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "types/bundle_scope.hpp"
#include "types/constants.hpp"
#include "types/ssz_maybe.hpp"

namespace dataworker::lifecycle {

  /// Arguments of HubPool.proposeRootBundle
  struct RootBundleProposal : ssz::ssz_variable_size_container {
    BundleId bundle_id = 0;
    uint32_t protocol_version = PROTOCOL_VERSION;
    ssz::list<ChainBlockRange, MAX_CHAINS> bundle_evaluation_block_numbers;
    uint32_t pool_rebalance_leaf_count = 0;
    SszMaybe<Hash256> pool_rebalance_root;
    SszMaybe<Hash256> relayer_refund_root;
    SszMaybe<Hash256> slow_relay_root;

    SSZ_CONT(bundle_id,
             protocol_version,
             bundle_evaluation_block_numbers,
             pool_rebalance_leaf_count,
             pool_rebalance_root,
             relayer_refund_root,
             slow_relay_root);
  };

  /// Arguments of a leaf execution: the leaf and its proof against `root`
  template <typename Leaf>
  struct LeafExecution : ssz::ssz_variable_size_container {
    BundleId bundle_id = 0;
    Hash256 root;
    Leaf leaf;
    ssz::list<Hash256, MAX_PROOF_DEPTH> proof;

    SSZ_CONT(bundle_id, root, leaf, proof);
  };

}  // namespace dataworker::lifecycle
