/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <array>
#include <numeric>
#include <thread>

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "bundle/impl/bundle_storage_impl.hpp"
#include "lifecycle/bundle_lifecycle_controller.hpp"
#include "lifecycle/lifecycle_error.hpp"
#include "mock/submission/transaction_submitter_mock.hpp"
#include "reconciliation/reconciliation_error.hpp"
#include "testutil/bridge_world.hpp"
#include "testutil/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"

using dataworker::BundleId;
using dataworker::LeafId;
using dataworker::RootType;
using dataworker::SignedAmount;
using dataworker::signedAmountFromWord;
using dataworker::toWord;
using dataworker::bundle::BundleState;
using dataworker::bundle::BundleStorageImpl;
using dataworker::bundle::LeafStatus;
using dataworker::lifecycle::BundleLifecycleController;
using dataworker::lifecycle::ClaimedRoots;
using dataworker::lifecycle::LifecycleError;
using dataworker::submission::Transaction;
using dataworker::submission::TransactionReceipt;
using dataworker::submission::TransactionSubmitterMock;
using testing::_;
using testing::Field;
using testing::Return;
using testutil::DummyError;
using namespace testutil;

class BundleLifecycleControllerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ON_CALL(*submitter, willSucceed(_))
        .WillByDefault(Return(outcome::success()));
    ON_CALL(*submitter, submit(_))
        .WillByDefault(Return(TransactionReceipt{.tx_hash = "tx"_arr32}));
    allowSubmissions();
  }

  void allowSubmissions() {
    EXPECT_CALL(*submitter, willSucceed(_)).Times(testing::AnyNumber());
    EXPECT_CALL(*submitter, submit(_)).Times(testing::AnyNumber());
  }

  /// Proposes the populated world and validates the bundle
  BundleId proposeAndValidate() {
    auto proposal = controller->propose(world.scope());
    EXPECT_TRUE(proposal.has_value());
    auto bundle_id = proposal.value().bundle_id;
    auto report = controller->validateBundle(bundle_id);
    EXPECT_TRUE(report.has_value());
    EXPECT_TRUE(report.value().allMatch());
    return bundle_id;
  }

  /// Executes the roots of a validated bundle until it closes
  BundleState executeAll(BundleId bundle_id) {
    auto state = BundleState::Validated;
    for (auto root_type : dataworker::kAllRootTypes) {
      if (state == BundleState::Closed) {
        break;
      }
      auto report = controller->execute(bundle_id, root_type);
      if (not report.has_value()) {
        ADD_FAILURE() << report.error().message();
        return state;
      }
      EXPECT_TRUE(report.value().success());
      state = report.value().state;
    }
    return state;
  }

  LeafStatus statusOf(BundleId bundle_id, RootType root_type, LeafId leaf_id) {
    return bundles->getLeafStatus(bundle_id, root_type, leaf_id).value();
  }

  qtils::SharedRef<dataworker::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  BridgeWorld world{logsys};
  std::shared_ptr<BundleStorageImpl> bundles =
      std::make_shared<BundleStorageImpl>(logsys, world.storage);
  std::shared_ptr<TransactionSubmitterMock> submitter =
      std::make_shared<TransactionSubmitterMock>();
  std::shared_ptr<BundleLifecycleController> controller =
      std::make_shared<BundleLifecycleController>(
          logsys, world.builder, world.hub, bundles, world.ledger, submitter);
};

/**
 * @given deposits and fills on two chains
 * @when a bundle is proposed, validated and every root executed
 * @then the bundle closes and the running balances carry its transitions
 */
TEST_F(BundleLifecycleControllerTest, ProposeValidateExecute) {
  world.populate();

  EXPECT_CALL(*submitter,
              submit(Field(&Transaction::method, "proposeRootBundle")))
      .WillOnce(Return(TransactionReceipt{.tx_hash = "proposal"_arr32}));

  ASSERT_OUTCOME_SUCCESS(proposal, controller->propose(world.scope()));
  EXPECT_EQ(proposal.bundle_id, 1u);
  EXPECT_EQ(proposal.receipt.tx_hash, "proposal"_arr32);
  EXPECT_TRUE(proposal.roots.slow_relay.has_value());
  EXPECT_TRUE(proposal.roots.relayer_refund.has_value());
  EXPECT_TRUE(proposal.roots.pool_rebalance.has_value());
  EXPECT_EQ(proposal.leaf_counts, (std::array<size_t, 3>{2, 2, 2}));

  ASSERT_OUTCOME_SUCCESS(proposed, controller->bundle(1));
  EXPECT_EQ(proposed.bundleState(), BundleState::Proposed);
  EXPECT_EQ(BundleLifecycleController::claimedRootsOf(proposed),
            proposal.roots);

  ASSERT_OUTCOME_SUCCESS(validation, controller->validateBundle(1));
  EXPECT_TRUE(validation.allMatch());
  ASSERT_OUTCOME_SUCCESS(validated, controller->bundle(1));
  EXPECT_EQ(validated.bundleState(), BundleState::Validated);

  ASSERT_OUTCOME_SUCCESS(slow, controller->execute(1, RootType::SlowRelay));
  EXPECT_EQ(slow.executed, (std::vector<LeafId>{0, 1}));
  EXPECT_TRUE(slow.skipped.empty());
  EXPECT_TRUE(slow.success());
  EXPECT_EQ(slow.state, BundleState::Executing);

  // execution started: the ledger is advanced
  ASSERT_OUTCOME_SUCCESS(optimism, world.ledger->get(kOptimism, kUsdc));
  EXPECT_EQ(optimism.version, 1u);
  EXPECT_EQ(signedAmountFromWord(optimism.balance), SignedAmount{-300});

  ASSERT_OUTCOME_SUCCESS(refunds,
                         controller->execute(1, RootType::RelayerRefund));
  EXPECT_EQ(refunds.executed, (std::vector<LeafId>{0, 1}));
  EXPECT_EQ(refunds.state, BundleState::Executing);

  ASSERT_OUTCOME_SUCCESS(pool, controller->execute(1, RootType::PoolRebalance));
  EXPECT_EQ(pool.executed, (std::vector<LeafId>{0, 1}));
  EXPECT_EQ(pool.state, BundleState::Closed);

  ASSERT_OUTCOME_SUCCESS(closed, controller->bundle(1));
  EXPECT_EQ(closed.bundleState(), BundleState::Closed);
}

/**
 * @given leaves are sent to the chain the payout happens on
 * @when a bundle is executed
 * @then slow relays and refunds go to spoke pools, rebalances to the hub
 */
TEST_F(BundleLifecycleControllerTest, ExecutionTargets) {
  world.populate();
  auto bundle_id = proposeAndValidate();

  EXPECT_CALL(*submitter,
              submit(testing::AllOf(
                  Field(&Transaction::method, "executeSlowRelayRoot"),
                  Field(&Transaction::target, "SpokePool"),
                  Field(&Transaction::chain_id, kPolygon))))
      .WillOnce(Return(TransactionReceipt{}));
  EXPECT_CALL(*submitter,
              submit(testing::AllOf(
                  Field(&Transaction::method, "executeSlowRelayRoot"),
                  Field(&Transaction::chain_id, kOptimism))))
      .WillOnce(Return(TransactionReceipt{}));
  ASSERT_OUTCOME_SUCCESS(controller->execute(bundle_id, RootType::SlowRelay));

  EXPECT_CALL(*submitter,
              submit(testing::AllOf(
                  Field(&Transaction::method, "executeRootBundle"),
                  Field(&Transaction::target, "HubPool"),
                  Field(&Transaction::chain_id, kMainnet))))
      .Times(2)
      .WillRepeatedly(Return(TransactionReceipt{}));
  ASSERT_OUTCOME_SUCCESS(
      controller->execute(bundle_id, RootType::PoolRebalance));
}

/**
 * @given a proposed bundle whose chain state changed before validation
 * @when it is validated
 * @then the affected roots mismatch, the bundle is disputed and can't be
 * executed
 */
TEST_F(BundleLifecycleControllerTest, MismatchDisputesBundle) {
  world.populate();
  ASSERT_OUTCOME_SUCCESS(proposal, controller->propose(world.scope()));

  // a late fill of deposit #2 inside the bundle's block range
  auto deposits = world.chains.at(kOptimism)->depositsForDestination(kPolygon);
  world.fill(deposits.at(1), 100, kRelayer1, kOptimism, 30);

  ASSERT_OUTCOME_SUCCESS(report,
                         controller->validateBundle(proposal.bundle_id));
  EXPECT_FALSE(report.allMatch());
  EXPECT_EQ(report.mismatched(),
            (std::vector<RootType>{RootType::RelayerRefund,
                                   RootType::PoolRebalance}));
  EXPECT_EQ(report.roots[1].expected, proposal.roots.relayer_refund);
  EXPECT_NE(report.roots[1].actual, proposal.roots.relayer_refund);

  ASSERT_OUTCOME_SUCCESS(record, controller->bundle(proposal.bundle_id));
  EXPECT_EQ(record.bundleState(), BundleState::Disputed);

  ASSERT_OUTCOME_ERROR(
      controller->execute(proposal.bundle_id, RootType::SlowRelay),
      LifecycleError::INVALID_STATE_TRANSITION);
  ASSERT_OUTCOME_ERROR(controller->validateBundle(proposal.bundle_id),
                       LifecycleError::INVALID_STATE_TRANSITION);
}

/**
 * @given roots claimed by somebody else
 * @when they are validated against the local computation
 * @then each root is compared separately and nothing is persisted
 */
TEST_F(BundleLifecycleControllerTest, ValidateClaimedRoots) {
  world.populate();
  ASSERT_OUTCOME_SUCCESS(roots, world.builder->buildAll(world.scope()));

  ClaimedRoots claimed{
      .slow_relay = roots.rootOf(RootType::SlowRelay),
      .relayer_refund = "forged"_arr32,
      .pool_rebalance = std::nullopt,
  };
  ASSERT_OUTCOME_SUCCESS(report,
                         controller->validate(world.scope(), claimed));
  EXPECT_TRUE(report.roots[0].matches);
  EXPECT_FALSE(report.roots[1].matches);
  EXPECT_FALSE(report.roots[2].matches);
  EXPECT_FALSE(report.roots[2].expected.has_value());
  EXPECT_EQ(report.roots[2].actual, roots.rootOf(RootType::PoolRebalance));

  ASSERT_OUTCOME_SUCCESS(last, bundles->lastBundleId());
  EXPECT_FALSE(last.has_value());
}

/**
 * @given a root already executed
 * @when it is executed again
 * @then every leaf is skipped and nothing is submitted
 */
TEST_F(BundleLifecycleControllerTest, ExecuteIsIdempotent) {
  world.populate();
  auto bundle_id = proposeAndValidate();
  ASSERT_OUTCOME_SUCCESS(controller->execute(bundle_id, RootType::SlowRelay));

  EXPECT_CALL(*submitter, submit(_)).Times(0);
  ASSERT_OUTCOME_SUCCESS(again,
                         controller->execute(bundle_id, RootType::SlowRelay));
  EXPECT_TRUE(again.executed.empty());
  EXPECT_EQ(again.skipped, (std::vector<LeafId>{0, 1}));
  EXPECT_EQ(again.state, BundleState::Executing);
}

/**
 * @given a leaf executed on chain by another dataworker
 * @when the root is executed
 * @then the leaf is skipped and recorded as executed
 */
TEST_F(BundleLifecycleControllerTest, LeafClaimedOnChainIsSkipped) {
  world.populate();
  auto bundle_id = proposeAndValidate();
  ASSERT_OUTCOME_SUCCESS(record, controller->bundle(bundle_id));
  auto root = record.rootOf(RootType::RelayerRefund).value();
  world.hub->markLeafClaimed(RootType::RelayerRefund, root, 0);

  ASSERT_OUTCOME_SUCCESS(
      report, controller->execute(bundle_id, RootType::RelayerRefund));
  EXPECT_EQ(report.skipped, (std::vector<LeafId>{0}));
  EXPECT_EQ(report.executed, (std::vector<LeafId>{1}));
  EXPECT_EQ(statusOf(bundle_id, RootType::RelayerRefund, 0),
            LeafStatus::Executed);
}

/**
 * @given a spoke pool rejecting refunds
 * @when the refund root is executed
 * @then each leaf fails on its own, stays pending and the bundle stays
 * executing until a retry succeeds
 */
TEST_F(BundleLifecycleControllerTest, FailedLeavesStayPending) {
  world.populate();
  auto bundle_id = proposeAndValidate();
  ASSERT_OUTCOME_SUCCESS(controller->execute(bundle_id, RootType::SlowRelay));
  ASSERT_OUTCOME_SUCCESS(
      controller->execute(bundle_id, RootType::PoolRebalance));

  EXPECT_CALL(*submitter,
              willSucceed(Field(&Transaction::method,
                                "executeRelayerRefundRoot")))
      .Times(2)
      .WillRepeatedly(Return(DummyError::ERROR));

  ASSERT_OUTCOME_SUCCESS(
      failed, controller->execute(bundle_id, RootType::RelayerRefund));
  EXPECT_FALSE(failed.success());
  ASSERT_EQ(failed.failed.size(), 2u);
  EXPECT_EQ(failed.failed[0].leaf_id, 0u);
  EXPECT_EQ(failed.failed[0].error, make_error_code(DummyError::ERROR));
  EXPECT_TRUE(failed.executed.empty());
  EXPECT_EQ(failed.state, BundleState::Executing);
  EXPECT_EQ(statusOf(bundle_id, RootType::RelayerRefund, 0),
            LeafStatus::Pending);

  testing::Mock::VerifyAndClearExpectations(submitter.get());
  allowSubmissions();

  ASSERT_OUTCOME_SUCCESS(
      retry, controller->execute(bundle_id, RootType::RelayerRefund));
  EXPECT_EQ(retry.executed, (std::vector<LeafId>{0, 1}));
  EXPECT_EQ(retry.state, BundleState::Closed);
}

/**
 * @given persisted leaves that no longer produce the proposed root
 * @when the root is executed
 * @then every leaf fails with PROOF_CONSTRUCTION_FAILURE and nothing is
 * submitted
 */
TEST_F(BundleLifecycleControllerTest, TamperedLeavesFailProofs) {
  world.populate();
  auto bundle_id = proposeAndValidate();

  ASSERT_OUTCOME_SUCCESS(record, controller->bundle(bundle_id));
  record.slow_relay_leaves[0].amount = toWord(dataworker::Amount{1});
  auto batch = bundles->createBatch();
  ASSERT_OUTCOME_SUCCESS(bundles->stageBundle(record, *batch));
  ASSERT_OUTCOME_SUCCESS(batch->commit());

  EXPECT_CALL(*submitter,
              submit(Field(&Transaction::method, "executeSlowRelayRoot")))
      .Times(0);
  ASSERT_OUTCOME_SUCCESS(report,
                         controller->execute(bundle_id, RootType::SlowRelay));
  ASSERT_EQ(report.failed.size(), 2u);
  for (const auto &failure : report.failed) {
    EXPECT_EQ(failure.error,
              make_error_code(LifecycleError::PROOF_CONSTRUCTION_FAILURE));
  }
}

/**
 * @given a hub pool rejecting the proposal
 * @when a bundle is proposed
 * @then SUBMISSION_FAILED is returned and nothing is persisted
 */
TEST_F(BundleLifecycleControllerTest, RejectedProposalIsNotPersisted) {
  world.populate();
  EXPECT_CALL(*submitter,
              willSucceed(Field(&Transaction::method, "proposeRootBundle")))
      .WillOnce(Return(DummyError::ERROR));

  ASSERT_OUTCOME_ERROR(controller->propose(world.scope()),
                       LifecycleError::SUBMISSION_FAILED);
  ASSERT_OUTCOME_SUCCESS(last, bundles->lastBundleId());
  EXPECT_FALSE(last.has_value());
}

/**
 * @given a failed proposal submission
 * @when a bundle is proposed
 * @then SUBMISSION_FAILED is returned and nothing is persisted
 */
TEST_F(BundleLifecycleControllerTest, FailedProposalIsNotPersisted) {
  world.populate();
  EXPECT_CALL(*submitter,
              submit(Field(&Transaction::method, "proposeRootBundle")))
      .WillOnce(Return(DummyError::ERROR_2));

  ASSERT_OUTCOME_ERROR(controller->propose(world.scope()),
                       LifecycleError::SUBMISSION_FAILED);
  ASSERT_OUTCOME_ERROR(controller->bundle(1), LifecycleError::BUNDLE_NOT_FOUND);
}

/**
 * @given a stale chain
 * @when a bundle is proposed
 * @then reconciliation refuses and nothing is submitted
 */
TEST_F(BundleLifecycleControllerTest, StaleChainBlocksProposal) {
  world.populate();
  world.chains.at(kOptimism)->setSynchronized(false);
  EXPECT_CALL(*submitter, submit(_)).Times(0);
  ASSERT_OUTCOME_ERROR(
      controller->propose(world.scope()),
      dataworker::reconciliation::ReconciliationError::STALE_CHAIN_STATE);
}

/**
 * @given a bundle without any activity
 * @when it is proposed, validated and executed
 * @then all roots are absent and the bundle closes right away
 */
TEST_F(BundleLifecycleControllerTest, EmptyBundle) {
  ASSERT_OUTCOME_SUCCESS(proposal, controller->propose(world.scope()));
  EXPECT_EQ(proposal.roots, ClaimedRoots{});
  ASSERT_OUTCOME_SUCCESS(report,
                         controller->validateBundle(proposal.bundle_id));
  EXPECT_TRUE(report.allMatch());

  ASSERT_OUTCOME_SUCCESS(
      execution, controller->execute(proposal.bundle_id, RootType::SlowRelay));
  EXPECT_TRUE(execution.executed.empty());
  EXPECT_EQ(execution.state, BundleState::Closed);
}

/**
 * @given successive proposals, each executed before the next one
 * @when they are persisted
 * @then bundle ids increase by one
 */
TEST_F(BundleLifecycleControllerTest, BundleIdsIncrease) {
  ASSERT_OUTCOME_SUCCESS(first, controller->propose(world.scope(0, 100)));
  ASSERT_OUTCOME_SUCCESS(controller->validateBundle(first.bundle_id));
  EXPECT_EQ(executeAll(first.bundle_id), BundleState::Closed);

  ASSERT_OUTCOME_SUCCESS(second, controller->propose(world.scope(101, 200)));
  EXPECT_EQ(first.bundle_id, 1u);
  EXPECT_EQ(second.bundle_id, 2u);
  ASSERT_OUTCOME_SUCCESS(last, bundles->lastBundleId());
  EXPECT_EQ(last, BundleId{2});
}

/**
 * @given a bundle that is proposed or validated but not executing
 * @when the next bundle is proposed
 * @then PREVIOUS_BUNDLE_PENDING is returned and nothing is submitted
 */
TEST_F(BundleLifecycleControllerTest, PendingBundleBlocksNextProposal) {
  world.populate();
  ASSERT_OUTCOME_SUCCESS(first, controller->propose(world.scope(0, 100)));

  testing::Mock::VerifyAndClearExpectations(submitter.get());
  EXPECT_CALL(*submitter, willSucceed(_)).Times(0);
  EXPECT_CALL(*submitter, submit(_)).Times(0);
  ASSERT_OUTCOME_ERROR(controller->propose(world.scope(101, 200)),
                       LifecycleError::PREVIOUS_BUNDLE_PENDING);

  ASSERT_OUTCOME_SUCCESS(controller->validateBundle(first.bundle_id));
  ASSERT_OUTCOME_ERROR(controller->propose(world.scope(101, 200)),
                       LifecycleError::PREVIOUS_BUNDLE_PENDING);

  ASSERT_OUTCOME_SUCCESS(last, bundles->lastBundleId());
  EXPECT_EQ(last, BundleId{1});

  testing::Mock::VerifyAndClearExpectations(submitter.get());
  allowSubmissions();

  // one executed root is enough: the running balances are advanced
  ASSERT_OUTCOME_SUCCESS(
      controller->execute(first.bundle_id, RootType::SlowRelay));
  ASSERT_OUTCOME_SUCCESS(second, controller->propose(world.scope(101, 200)));
  EXPECT_EQ(second.bundle_id, 2u);
}

/**
 * @given a disputed bundle
 * @when the next bundle is proposed
 * @then it is accepted and built on the unchanged running balances
 */
TEST_F(BundleLifecycleControllerTest, DisputedBundleDoesNotBlock) {
  world.populate();
  ASSERT_OUTCOME_SUCCESS(first, controller->propose(world.scope()));
  auto deposits = world.chains.at(kOptimism)->depositsForDestination(kPolygon);
  world.fill(deposits.at(1), 100, kRelayer1, kOptimism, 30);
  ASSERT_OUTCOME_SUCCESS(report, controller->validateBundle(first.bundle_id));
  ASSERT_FALSE(report.allMatch());

  ASSERT_OUTCOME_SUCCESS(second, controller->propose(world.scope()));
  EXPECT_EQ(second.bundle_id, 2u);
  ASSERT_OUTCOME_SUCCESS(entry, world.ledger->get(kOptimism, kUsdc));
  EXPECT_EQ(entry.version, 0u);
}

/**
 * @given two consecutive bundles rebalancing the same chain and token
 * @when each is proposed, validated and executed in turn
 * @then both close and the running balance carries both transitions
 */
TEST_F(BundleLifecycleControllerTest, ConsecutiveBundlesShareRunningBalance) {
  world.populate();
  ASSERT_OUTCOME_SUCCESS(first, controller->propose(world.scope(0, 100)));
  ASSERT_OUTCOME_SUCCESS(controller->validateBundle(first.bundle_id));
  EXPECT_EQ(executeAll(first.bundle_id), BundleState::Closed);

  ASSERT_OUTCOME_SUCCESS(after_first, world.ledger->get(kOptimism, kUsdc));
  EXPECT_EQ(after_first.version, 1u);
  EXPECT_EQ(signedAmountFromWord(after_first.balance), SignedAmount{-300});

  // a refund repaid on the same chain in the next block range
  auto deposit = world.deposit(3, kOptimism, kPolygon, 400, 150);
  world.fill(deposit, 400, kRelayer1, kOptimism, 160);

  ASSERT_OUTCOME_SUCCESS(second, controller->propose(world.scope(101, 200)));
  EXPECT_EQ(second.bundle_id, 2u);
  ASSERT_OUTCOME_SUCCESS(record, controller->bundle(second.bundle_id));
  ASSERT_EQ(record.transitions.size(), 1u);
  EXPECT_EQ(record.transitions[0].previous_version, 1u);

  ASSERT_OUTCOME_SUCCESS(validation,
                         controller->validateBundle(second.bundle_id));
  EXPECT_TRUE(validation.allMatch());
  EXPECT_EQ(executeAll(second.bundle_id), BundleState::Closed);

  ASSERT_OUTCOME_SUCCESS(after_second, world.ledger->get(kOptimism, kUsdc));
  EXPECT_EQ(after_second.version, 2u);
  EXPECT_EQ(signedAmountFromWord(after_second.balance), SignedAmount{-700});
}

/**
 * @given two threads proposing at the same time
 * @when both proposals finish
 * @then exactly one bundle is proposed and the other call is refused
 */
TEST_F(BundleLifecycleControllerTest, ConcurrentProposalsYieldOneBundle) {
  world.populate();
  EXPECT_CALL(*submitter,
              submit(Field(&Transaction::method, "proposeRootBundle")))
      .WillOnce(Return(TransactionReceipt{.tx_hash = "proposal"_arr32}));

  std::array<outcome::result<dataworker::lifecycle::ProposalReport>, 2>
      results{LifecycleError::BUNDLE_NOT_FOUND,
              LifecycleError::BUNDLE_NOT_FOUND};
  {
    std::thread first(
        [&] { results[0] = controller->propose(world.scope()); });
    std::thread second(
        [&] { results[1] = controller->propose(world.scope()); });
    first.join();
    second.join();
  }

  auto succeeded = std::ranges::count_if(
      results, [](const auto &result) { return result.has_value(); });
  EXPECT_EQ(succeeded, 1);
  for (const auto &result : results) {
    if (result.has_error()) {
      EXPECT_EQ(result.error(),
                make_error_code(LifecycleError::PREVIOUS_BUNDLE_PENDING));
    }
  }
  ASSERT_OUTCOME_SUCCESS(last, bundles->lastBundleId());
  EXPECT_EQ(last, BundleId{1});
}

/**
 * @given a validated bundle
 * @when every root is executed from its own thread
 * @then each leaf is submitted once, the ledger advances once and the
 * bundle closes
 */
TEST_F(BundleLifecycleControllerTest, ConcurrentRootExecution) {
  world.populate();
  auto bundle_id = proposeAndValidate();

  testing::Mock::VerifyAndClearExpectations(submitter.get());
  EXPECT_CALL(*submitter, willSucceed(_)).Times(testing::AnyNumber());
  EXPECT_CALL(*submitter, submit(_)).Times(6);

  {
    std::vector<std::thread> threads;
    for (auto root_type : dataworker::kAllRootTypes) {
      threads.emplace_back([this, bundle_id, root_type] {
        auto report = controller->execute(bundle_id, root_type);
        ASSERT_TRUE(report.has_value());
        EXPECT_TRUE(report.value().success());
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
  }

  ASSERT_OUTCOME_SUCCESS(record, controller->bundle(bundle_id));
  EXPECT_EQ(record.bundleState(), BundleState::Closed);
  ASSERT_OUTCOME_SUCCESS(entry, world.ledger->get(kOptimism, kUsdc));
  EXPECT_EQ(entry.version, 1u);
}

/**
 * @given a validated bundle
 * @when the same root is executed from several threads at once
 * @then each leaf is submitted exactly once and the rest are skipped
 */
TEST_F(BundleLifecycleControllerTest, ConcurrentExecutionOfSameRoot) {
  world.populate();
  auto bundle_id = proposeAndValidate();

  testing::Mock::VerifyAndClearExpectations(submitter.get());
  EXPECT_CALL(*submitter, willSucceed(_)).Times(testing::AnyNumber());
  EXPECT_CALL(*submitter,
              submit(Field(&Transaction::method, "executeRelayerRefundRoot")))
      .Times(2);

  constexpr size_t kThreads = 4;
  std::array<size_t, kThreads> executed{};
  {
    std::vector<std::thread> threads;
    for (size_t i = 0; i < kThreads; ++i) {
      threads.emplace_back([this, bundle_id, i, &executed] {
        auto report = controller->execute(bundle_id, RootType::RelayerRefund);
        ASSERT_TRUE(report.has_value());
        executed[i] = report.value().executed.size();
        EXPECT_EQ(report.value().executed.size()
                      + report.value().skipped.size(),
                  2u);
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
  }

  EXPECT_EQ(std::accumulate(executed.begin(), executed.end(), size_t{0}), 2u);
  EXPECT_EQ(statusOf(bundle_id, RootType::RelayerRefund, 0),
            LeafStatus::Executed);
  EXPECT_EQ(statusOf(bundle_id, RootType::RelayerRefund, 1),
            LeafStatus::Executed);
}

/**
 * @given a proposed bundle
 * @when it is validated and executed from two threads at once
 * @then execution either waits for validation or is refused, and the
 * running balances advance only if execution started
 */
TEST_F(BundleLifecycleControllerTest, ValidationRacesExecution) {
  world.populate();
  ASSERT_OUTCOME_SUCCESS(proposal, controller->propose(world.scope()));
  const auto bundle_id = proposal.bundle_id;

  outcome::result<dataworker::lifecycle::ValidationReport> validation =
      LifecycleError::BUNDLE_NOT_FOUND;
  outcome::result<dataworker::lifecycle::ExecutionReport> execution =
      LifecycleError::BUNDLE_NOT_FOUND;
  {
    std::thread validator(
        [&] { validation = controller->validateBundle(bundle_id); });
    std::thread executor([&] {
      execution = controller->execute(bundle_id, RootType::SlowRelay);
    });
    validator.join();
    executor.join();
  }

  ASSERT_TRUE(validation.has_value());
  EXPECT_TRUE(validation.value().allMatch());

  ASSERT_OUTCOME_SUCCESS(record, controller->bundle(bundle_id));
  ASSERT_OUTCOME_SUCCESS(entry, world.ledger->get(kOptimism, kUsdc));
  if (execution.has_value()) {
    EXPECT_EQ(execution.value().executed, (std::vector<LeafId>{0, 1}));
    EXPECT_EQ(record.bundleState(), BundleState::Executing);
    EXPECT_EQ(entry.version, 1u);
  } else {
    EXPECT_EQ(execution.error(),
              make_error_code(LifecycleError::INVALID_STATE_TRANSITION));
    EXPECT_EQ(record.bundleState(), BundleState::Validated);
    EXPECT_EQ(entry.version, 0u);
    EXPECT_EQ(statusOf(bundle_id, RootType::SlowRelay, 0),
              LeafStatus::Pending);
  }
}

/**
 * @given no such bundle
 * @when it is validated or executed
 * @then BUNDLE_NOT_FOUND is returned
 */
TEST_F(BundleLifecycleControllerTest, UnknownBundle) {
  ASSERT_OUTCOME_ERROR(controller->validateBundle(42),
                       LifecycleError::BUNDLE_NOT_FOUND);
  ASSERT_OUTCOME_ERROR(controller->execute(42, RootType::PoolRebalance),
                       LifecycleError::BUNDLE_NOT_FOUND);
}

/**
 * @given a proposed but not validated bundle
 * @when it is executed
 * @then INVALID_STATE_TRANSITION is returned and no leaf is touched
 */
TEST_F(BundleLifecycleControllerTest, ExecuteRequiresValidation) {
  world.populate();
  ASSERT_OUTCOME_SUCCESS(proposal, controller->propose(world.scope()));
  ASSERT_OUTCOME_ERROR(
      controller->execute(proposal.bundle_id, RootType::SlowRelay),
      LifecycleError::INVALID_STATE_TRANSITION);
  EXPECT_EQ(statusOf(proposal.bundle_id, RootType::SlowRelay, 0),
            LeafStatus::Pending);
  ASSERT_OUTCOME_SUCCESS(entry, world.ledger->get(kOptimism, kUsdc));
  EXPECT_EQ(entry.version, 0u);
}
