/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lifecycle/bundle_lifecycle_controller.hpp"

#include <type_traits>

#include "lifecycle/lifecycle_error.hpp"
#include "lifecycle/payloads.hpp"
#include "serde/serialization.hpp"

namespace dataworker::lifecycle {

  using bundle::BundleRecord;
  using bundle::BundleState;
  using bundle::LeafStatus;

  namespace {
    template <typename List>
    auto toVector(const List &list) {
      std::vector<std::decay_t<decltype(*list.begin())>> result;
      result.reserve(list.size());
      for (const auto &item : list) {
        result.emplace_back(item);
      }
      return result;
    }

    ChainId targetChainOf(const RelayData &leaf, ChainId) {
      return leaf.destination_chain_id;
    }

    ChainId targetChainOf(const RelayerRefundLeaf &leaf, ChainId) {
      return leaf.chain_id;
    }

    ChainId targetChainOf(const PoolRebalanceLeaf &, ChainId hub_chain_id) {
      return hub_chain_id;
    }

    submission::Transaction executionCall(RootType root_type,
                                          ChainId chain_id,
                                          qtils::ByteVec args) {
      submission::Transaction tx{.chain_id = chain_id, .args = std::move(args)};
      switch (root_type) {
        case RootType::SlowRelay:
          tx.target = submission::kSpokePool;
          tx.method = "executeSlowRelayRoot";
          break;
        case RootType::RelayerRefund:
          tx.target = submission::kSpokePool;
          tx.method = "executeRelayerRefundRoot";
          break;
        case RootType::PoolRebalance:
          tx.target = submission::kHubPool;
          tx.method = "executeRootBundle";
          break;
      }
      return tx;
    }

    template <typename Root>
    std::optional<Hash256> rootHash(const std::optional<Root> &root) {
      if (root.has_value()) {
        return root->root;
      }
      return std::nullopt;
    }
  }  // namespace

  BundleLifecycleController::BundleLifecycleController(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<builders::BundleBuilder> builder,
      qtils::SharedRef<clients::HubPoolView> hub,
      qtils::SharedRef<bundle::BundleStorage> bundles,
      qtils::SharedRef<ledger::RunningBalanceLedger> ledger,
      qtils::SharedRef<submission::TransactionSubmitter> submitter)
      : logger_(logsys->getLogger("BundleLifecycle", "lifecycle")),
        builder_(std::move(builder)),
        hub_(std::move(hub)),
        bundles_(std::move(bundles)),
        ledger_(std::move(ledger)),
        submitter_(std::move(submitter)) {}

  std::shared_ptr<std::shared_mutex> BundleLifecycleController::bundleMutex(
      BundleId bundle_id) {
    std::lock_guard lock{locks_mutex_};
    auto &mutex = bundle_mutexes_[bundle_id];
    if (not mutex) {
      mutex = std::make_shared<std::shared_mutex>();
    }
    return mutex;
  }

  std::shared_ptr<std::mutex> BundleLifecycleController::rootMutex(
      BundleId bundle_id, RootType root_type) {
    std::lock_guard lock{locks_mutex_};
    auto &mutex = root_mutexes_[{bundle_id, root_type}];
    if (not mutex) {
      mutex = std::make_shared<std::mutex>();
    }
    return mutex;
  }

  ClaimedRoots BundleLifecycleController::claimedRootsOf(
      const BundleRecord &record) {
    return ClaimedRoots{
        .slow_relay = record.slow_relay_root.toOptional(),
        .relayer_refund = record.relayer_refund_root.toOptional(),
        .pool_rebalance = record.pool_rebalance_root.toOptional(),
    };
  }

  outcome::result<BundleRecord> BundleLifecycleController::bundle(
      BundleId bundle_id) const {
    OUTCOME_TRY(record, bundles_->getBundle(bundle_id));
    if (not record.has_value()) {
      SL_ERROR(logger_, "Bundle {} not found", bundle_id);
      return LifecycleError::BUNDLE_NOT_FOUND;
    }
    return std::move(record.value());
  }

  outcome::result<void> BundleLifecycleController::changeState(
      BundleRecord &record, BundleState new_state) {
    auto old_state = record.bundleState();
    if (not bundle::isAllowedTransition(old_state, new_state)) {
      SL_ERROR(logger_,
               "Bundle {} can't move from {} to {}",
               record.bundle_id,
               old_state,
               new_state);
      return LifecycleError::INVALID_STATE_TRANSITION;
    }
    record.setBundleState(new_state);
    auto batch = bundles_->createBatch();
    OUTCOME_TRY(bundles_->stageBundle(record, *batch));
    if (new_state == BundleState::Executing) {
      OUTCOME_TRY(ledger_->stage(
          record.bundle_id, toVector(record.transitions), *batch));
    }
    OUTCOME_TRY(batch->commit());
    SL_INFO(logger_,
            "Bundle {}: {} -> {}",
            record.bundle_id,
            old_state,
            new_state);
    return outcome::success();
  }

  outcome::result<ProposalReport> BundleLifecycleController::propose(
      const BundleScope &scope, std::stop_token stop) {
    std::lock_guard propose_lock{propose_mutex_};

    // The predecessor's running balance transitions must be applied first
    OUTCOME_TRY(last_id, bundles_->lastBundleId());
    if (last_id.has_value()) {
      OUTCOME_TRY(previous, bundle(last_id.value()));
      auto previous_state = previous.bundleState();
      if (previous_state == BundleState::Proposed
          or previous_state == BundleState::Validated) {
        SL_ERROR(logger_,
                 "Can't propose while bundle {} is {}",
                 previous.bundle_id,
                 previous_state);
        return LifecycleError::PREVIOUS_BUNDLE_PENDING;
      }
    }
    const BundleId bundle_id = last_id.has_value() ? last_id.value() + 1 : 1;

    OUTCOME_TRY(roots, builder_->buildAll(scope, stop));

    BundleRecord record;
    record.bundle_id = bundle_id;
    for (const auto &range : scope.ranges) {
      record.scope.push_back(range);
    }
    if (roots.slow_relay) {
      record.slow_relay_root = SszMaybe<Hash256>::from(roots.slow_relay->root);
      for (const auto &leaf : roots.slow_relay->leaves) {
        record.slow_relay_leaves.push_back(leaf);
      }
    }
    if (roots.relayer_refund) {
      record.relayer_refund_root =
          SszMaybe<Hash256>::from(roots.relayer_refund->root);
      for (const auto &leaf : roots.relayer_refund->leaves) {
        record.relayer_refund_leaves.push_back(leaf);
      }
    }
    if (roots.pool_rebalance.root) {
      record.pool_rebalance_root =
          SszMaybe<Hash256>::from(roots.pool_rebalance.root->root);
      for (const auto &leaf : roots.pool_rebalance.root->leaves) {
        record.pool_rebalance_leaves.push_back(leaf);
      }
    }
    for (const auto &transition : roots.pool_rebalance.transitions) {
      record.transitions.push_back(transition);
    }

    RootBundleProposal proposal;
    proposal.bundle_id = bundle_id;
    proposal.bundle_evaluation_block_numbers = record.scope;
    proposal.pool_rebalance_leaf_count =
        static_cast<uint32_t>(record.pool_rebalance_leaves.size());
    proposal.pool_rebalance_root = record.pool_rebalance_root;
    proposal.relayer_refund_root = record.relayer_refund_root;
    proposal.slow_relay_root = record.slow_relay_root;
    OUTCOME_TRY(args, encode(proposal));

    submission::Transaction tx{
        .chain_id = hub_->hubChainId(),
        .target = submission::kHubPool,
        .method = "proposeRootBundle",
        .args = std::move(args),
    };
    if (auto res = submitter_->willSucceed(tx); res.has_error()) {
      SL_ERROR(logger_,
               "Proposal of bundle {} would fail: {}",
               bundle_id,
               res.error());
      return LifecycleError::SUBMISSION_FAILED;
    }
    auto receipt_res = submitter_->submit(tx);
    if (receipt_res.has_error()) {
      SL_ERROR(logger_,
               "Proposal of bundle {} failed: {}",
               bundle_id,
               receipt_res.error());
      return LifecycleError::SUBMISSION_FAILED;
    }

    record.setBundleState(BundleState::Proposed);
    auto batch = bundles_->createBatch();
    OUTCOME_TRY(bundles_->stageBundle(record, *batch));
    if (auto res = batch->commit(); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Bundle {} was proposed on chain but not persisted: {}",
                  bundle_id,
                  res.error());
      return res.error();
    }
    SL_INFO(logger_,
            "Bundle {}: {} -> {}, scope {}",
            bundle_id,
            BundleState::Building,
            BundleState::Proposed,
            scope);

    ProposalReport report{
        .bundle_id = bundle_id,
        .roots = claimedRootsOf(record),
        .receipt = receipt_res.value(),
    };
    for (auto root_type : kAllRootTypes) {
      report.leaf_counts[static_cast<size_t>(root_type)] =
          record.leafCount(root_type);
    }
    return report;
  }

  outcome::result<ValidationReport> BundleLifecycleController::validate(
      const BundleScope &scope,
      const ClaimedRoots &claimed,
      std::stop_token stop) const {
    OUTCOME_TRY(roots, builder_->buildAll(scope, stop));

    ValidationReport report;
    for (size_t i = 0; i < kAllRootTypes.size(); ++i) {
      auto root_type = kAllRootTypes[i];
      auto &comparison = report.roots[i];
      comparison.root_type = root_type;
      comparison.expected = claimed.rootOf(root_type);
      comparison.actual = roots.rootOf(root_type);
      comparison.matches = comparison.expected == comparison.actual;
      if (comparison.matches) {
        SL_DEBUG(logger_, "{} root matches for scope {}", root_type, scope);
      } else {
        SL_WARN(logger_,
                "{} root mismatch for scope {}: claimed {}, computed {}",
                root_type,
                scope,
                comparison.expected ? comparison.expected->toHex() : "none",
                comparison.actual ? comparison.actual->toHex() : "none");
      }
    }
    return report;
  }

  outcome::result<ValidationReport> BundleLifecycleController::validateBundle(
      BundleId bundle_id, std::stop_token stop) {
    auto mutex = bundleMutex(bundle_id);
    std::unique_lock lock{*mutex};

    OUTCOME_TRY(record, bundle(bundle_id));
    if (record.bundleState() != BundleState::Proposed) {
      SL_ERROR(logger_,
               "Bundle {} is {}, only proposed bundles are validated",
               bundle_id,
               record.bundleState());
      return LifecycleError::INVALID_STATE_TRANSITION;
    }

    OUTCOME_TRY(report,
                validate(record.bundleScope(), claimedRootsOf(record), stop));
    OUTCOME_TRY(changeState(record,
                            report.allMatch() ? BundleState::Validated
                                              : BundleState::Disputed));
    return report;
  }

  outcome::result<void> BundleLifecycleController::startExecution(
      BundleId bundle_id) {
    auto mutex = bundleMutex(bundle_id);
    std::unique_lock lock{*mutex};

    OUTCOME_TRY(record, bundle(bundle_id));
    switch (record.bundleState()) {
      case BundleState::Validated:
        return changeState(record, BundleState::Executing);
      case BundleState::Executing:
        return outcome::success();
      default:
        SL_ERROR(logger_,
                 "Bundle {} is {} and can't be executed",
                 bundle_id,
                 record.bundleState());
        return LifecycleError::INVALID_STATE_TRANSITION;
    }
  }

  outcome::result<BundleState> BundleLifecycleController::closeIfComplete(
      BundleId bundle_id) {
    auto mutex = bundleMutex(bundle_id);
    std::unique_lock lock{*mutex};

    OUTCOME_TRY(record, bundle(bundle_id));
    if (record.bundleState() != BundleState::Executing) {
      return record.bundleState();
    }
    for (auto root_type : kAllRootTypes) {
      if (not record.rootOf(root_type)) {
        continue;
      }
      for (size_t i = 0; i < record.leafCount(root_type); ++i) {
        OUTCOME_TRY(status,
                    bundles_->getLeafStatus(
                        bundle_id, root_type, static_cast<LeafId>(i)));
        if (status != LeafStatus::Executed) {
          return record.bundleState();
        }
      }
    }
    OUTCOME_TRY(changeState(record, BundleState::Closed));
    return record.bundleState();
  }

  outcome::result<bool> BundleLifecycleController::isLeafExecuted(
      const BundleRecord &record,
      RootType root_type,
      const Hash256 &root,
      LeafId leaf_id) {
    OUTCOME_TRY(status,
                bundles_->getLeafStatus(record.bundle_id, root_type, leaf_id));
    if (status == LeafStatus::Executed) {
      return true;
    }
    if (hub_->isLeafClaimed(root_type, root, leaf_id)) {
      SL_DEBUG(logger_,
               "Leaf {} of {} root of bundle {} already executed on chain",
               leaf_id,
               root_type,
               record.bundle_id);
      OUTCOME_TRY(bundles_->putLeafStatus(
          record.bundle_id, root_type, leaf_id, LeafStatus::Executed));
      return true;
    }
    return false;
  }

  template <typename Leaf>
  void BundleLifecycleController::executeLeaves(const BundleRecord &record,
                                                RootType root_type,
                                                const std::vector<Leaf> &leaves,
                                                ExecutionReport &report) {
    auto claimed_root = record.rootOf(root_type);
    if (not claimed_root) {
      SL_INFO(logger_,
              "Bundle {} has no {} root, nothing to execute",
              record.bundle_id,
              root_type);
      return;
    }
    const auto &root = claimed_root.value();

    auto fail = [&](LeafId leaf_id, std::error_code error) {
      SL_ERROR(logger_,
               "Leaf {} of {} root of bundle {} failed: {}",
               leaf_id,
               root_type,
               record.bundle_id,
               error);
      report.failed.emplace_back(
          LeafFailure{.leaf_id = leaf_id, .error = error});
    };

    auto built = builders::buildRoot(leaves);
    const bool tree_consistent =
        built.has_value() and built.value().root == root;
    if (not tree_consistent) {
      SL_ERROR(logger_,
               "Persisted {} leaves of bundle {} don't produce root {}",
               root_type,
               record.bundle_id,
               root);
    }

    for (size_t i = 0; i < leaves.size(); ++i) {
      const auto leaf_id = static_cast<LeafId>(i);

      auto executed = isLeafExecuted(record, root_type, root, leaf_id);
      if (executed.has_error()) {
        fail(leaf_id, executed.error());
        continue;
      }
      if (executed.value()) {
        report.skipped.emplace_back(leaf_id);
        continue;
      }

      if (not tree_consistent) {
        fail(leaf_id, LifecycleError::PROOF_CONSTRUCTION_FAILURE);
        continue;
      }
      const auto &tree = built.value().tree;
      auto proof = tree.proofFor(i);
      if (proof.has_error()
          or not crypto::MerkleTree::verify(
              tree.leafHashes()[i], proof.value(), root)) {
        fail(leaf_id, LifecycleError::PROOF_CONSTRUCTION_FAILURE);
        continue;
      }

      LeafExecution<Leaf> payload;
      payload.bundle_id = record.bundle_id;
      payload.root = root;
      payload.leaf = leaves[i];
      for (const auto &sibling : proof.value()) {
        payload.proof.push_back(sibling);
      }
      auto args = encode(payload);
      if (args.has_error()) {
        fail(leaf_id, args.error());
        continue;
      }
      auto tx = executionCall(root_type,
                              targetChainOf(leaves[i], hub_->hubChainId()),
                              std::move(args.value()));

      if (auto res = submitter_->willSucceed(tx); res.has_error()) {
        fail(leaf_id, res.error());
        continue;
      }
      auto receipt = submitter_->submit(tx);
      if (receipt.has_error()) {
        fail(leaf_id, receipt.error());
        continue;
      }
      if (auto res = bundles_->putLeafStatus(
              record.bundle_id, root_type, leaf_id, LeafStatus::Executed);
          res.has_error()) {
        SL_CRITICAL(logger_,
                    "Leaf {} of {} root of bundle {} was submitted in tx {} "
                    "but its status is not saved",
                    leaf_id,
                    root_type,
                    record.bundle_id,
                    receipt.value().tx_hash);
        fail(leaf_id, res.error());
        continue;
      }
      SL_DEBUG(logger_,
               "Leaf {} of {} root of bundle {} executed in tx {}",
               leaf_id,
               root_type,
               record.bundle_id,
               receipt.value().tx_hash);
      report.executed.emplace_back(leaf_id);
    }
  }

  outcome::result<ExecutionReport> BundleLifecycleController::execute(
      BundleId bundle_id, RootType root_type) {
    OUTCOME_TRY(startExecution(bundle_id));

    ExecutionReport report{.bundle_id = bundle_id, .root_type = root_type};
    {
      auto mutex = bundleMutex(bundle_id);
      std::shared_lock bundle_lock{*mutex};
      auto root_mutex = rootMutex(bundle_id, root_type);
      std::lock_guard root_lock{*root_mutex};

      OUTCOME_TRY(record, bundle(bundle_id));
      switch (root_type) {
        case RootType::SlowRelay:
          executeLeaves(
              record, root_type, toVector(record.slow_relay_leaves), report);
          break;
        case RootType::RelayerRefund:
          executeLeaves(record,
                        root_type,
                        toVector(record.relayer_refund_leaves),
                        report);
          break;
        case RootType::PoolRebalance:
          executeLeaves(record,
                        root_type,
                        toVector(record.pool_rebalance_leaves),
                        report);
          break;
      }
    }

    OUTCOME_TRY(state, closeIfComplete(bundle_id));
    report.state = state;
    SL_INFO(logger_,
            "Execution of {} root of bundle {}: {} executed, {} skipped, "
            "{} failed",
            root_type,
            bundle_id,
            report.executed.size(),
            report.skipped.size(),
            report.failed.size());
    return report;
  }

}  // namespace dataworker::lifecycle
