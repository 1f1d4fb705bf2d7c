/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>

#include <qtils/shared_ref.hpp>

#include "builders/bundle_builder.hpp"
#include "bundle/bundle_storage.hpp"
#include "clients/hub_pool_view.hpp"
#include "ledger/running_balance_ledger.hpp"
#include "lifecycle/reports.hpp"
#include "log/logger.hpp"
#include "submission/transaction_submitter.hpp"

namespace dataworker::lifecycle {

  /**
   * Drives bundles through
   * Building -> Proposed -> {Validated, Disputed} -> Executing -> Closed.
   *
   * It is the only writer of bundle records, leaf statuses and the
   * running-balance ledger. Phases of one bundle are serialized; execution
   * of different root types of one bundle may run concurrently.
   */
  class BundleLifecycleController {
   public:
    BundleLifecycleController(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<builders::BundleBuilder> builder,
        qtils::SharedRef<clients::HubPoolView> hub,
        qtils::SharedRef<bundle::BundleStorage> bundles,
        qtils::SharedRef<ledger::RunningBalanceLedger> ledger,
        qtils::SharedRef<submission::TransactionSubmitter> submitter);

    /**
     * Builds the three roots for `scope`, submits them to the hub and
     * persists the bundle as Proposed. Refused while the latest bundle is
     * still Proposed or Validated. Nothing is persisted on failure.
     */
    outcome::result<ProposalReport> propose(const BundleScope &scope,
                                            std::stop_token stop = {});

    /**
     * Recomputes the roots for `scope` and compares each of them with the
     * claimed one
     */
    outcome::result<ValidationReport> validate(
        const BundleScope &scope,
        const ClaimedRoots &claimed,
        std::stop_token stop = {}) const;

    /// Validates a Proposed bundle and moves it to Validated or Disputed
    outcome::result<ValidationReport> validateBundle(BundleId bundle_id,
                                                     std::stop_token stop = {});

    /**
     * Executes every pending leaf of one root of a Validated or Executing
     * bundle. Leaves executed before are skipped.
     */
    outcome::result<ExecutionReport> execute(BundleId bundle_id,
                                              RootType root_type);

    outcome::result<bundle::BundleRecord> bundle(BundleId bundle_id) const;

    static ClaimedRoots claimedRootsOf(const bundle::BundleRecord &record);

   private:
    using RootKey = std::pair<BundleId, RootType>;

    std::shared_ptr<std::shared_mutex> bundleMutex(BundleId bundle_id);
    std::shared_ptr<std::mutex> rootMutex(BundleId bundle_id,
                                          RootType root_type);

    outcome::result<void> changeState(bundle::BundleRecord &record,
                                      bundle::BundleState new_state);

    /// Validated -> Executing with the ledger advanced in the same batch
    outcome::result<void> startExecution(BundleId bundle_id);

    /// Executing -> Closed once every leaf of every root is executed
    outcome::result<bundle::BundleState> closeIfComplete(BundleId bundle_id);

    template <typename Leaf>
    void executeLeaves(const bundle::BundleRecord &record,
                       RootType root_type,
                       const std::vector<Leaf> &leaves,
                       ExecutionReport &report);

    outcome::result<bool> isLeafExecuted(const bundle::BundleRecord &record,
                                         RootType root_type,
                                         const Hash256 &root,
                                         LeafId leaf_id);

    log::Logger logger_;
    qtils::SharedRef<builders::BundleBuilder> builder_;
    qtils::SharedRef<clients::HubPoolView> hub_;
    qtils::SharedRef<bundle::BundleStorage> bundles_;
    qtils::SharedRef<ledger::RunningBalanceLedger> ledger_;
    qtils::SharedRef<submission::TransactionSubmitter> submitter_;

    std::mutex propose_mutex_;
    std::mutex locks_mutex_;
    std::map<BundleId, std::shared_ptr<std::shared_mutex>> bundle_mutexes_;
    std::map<RootKey, std::shared_ptr<std::mutex>> root_mutexes_;
  };

}  // namespace dataworker::lifecycle
