/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "builders/bundle_builder.hpp"
#include "bundle/impl/bundle_storage_impl.hpp"
#include "clients/impl/snapshot_loader.hpp"
#include "ledger/impl/running_balance_ledger_impl.hpp"
#include "lifecycle/bundle_lifecycle_controller.hpp"
#include "lifecycle/lifecycle_error.hpp"
#include "log/logger.hpp"
#include "reconciliation/reconciliation_error.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "submission/impl/outbox_transaction_submitter.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using dataworker::BundleScope;
  using dataworker::RootType;
  using dataworker::app::Command;
  using dataworker::app::Configuration;
  using dataworker::log::LoggingSystem;

  std::string hex(const std::optional<dataworker::Hash256> &root) {
    if (not root.has_value()) {
      return "none";
    }
    return fmt::format("0x{}", root->toHex());
  }

  /**
   * Everything a command needs, wired by hand from the configuration
   */
  struct Node {
    std::shared_ptr<dataworker::storage::SpacedStorage> storage;
    std::shared_ptr<dataworker::clients::SnapshotHubPoolView> hub;
    std::shared_ptr<dataworker::reconciliation::Reconciler> reconciler;
    std::shared_ptr<dataworker::builders::BundleBuilder> builder;
    std::shared_ptr<dataworker::bundle::BundleStorage> bundles;
    std::shared_ptr<dataworker::lifecycle::BundleLifecycleController>
        controller;
    std::optional<BundleScope> snapshot_scope;
  };

  std::optional<Node> make_node(
      const std::shared_ptr<LoggingSystem> &logsys,
      const std::shared_ptr<Configuration> &appcfg) {
    namespace dw = dataworker;
    auto logger = logsys->getLogger("Main", dw::log::defaultGroupName);
    Node node;

    dw::clients::SnapshotLoader loader(logsys);
    auto snapshot_res = loader.load(appcfg->dataworker().snapshot);
    if (snapshot_res.has_error()) {
      SL_CRITICAL(logger,
                  "Can't load snapshot {}: {}",
                  appcfg->dataworker().snapshot.c_str(),
                  snapshot_res.error());
      return std::nullopt;
    }
    auto &snapshot = snapshot_res.value();
    node.hub = snapshot.hub;
    node.snapshot_scope = snapshot.scope;

    switch (appcfg->database().backend) {
      case Configuration::DatabaseBackend::ROCKSDB:
        try {
          node.storage = std::make_shared<dw::storage::RocksDb>(logsys, appcfg);
        } catch (const std::exception &e) {
          SL_CRITICAL(logger, "Can't open database: {}", e.what());
          return std::nullopt;
        }
        break;
      case Configuration::DatabaseBackend::MEMORY:
        node.storage = std::make_shared<dw::storage::InMemorySpacedStorage>();
        break;
    }

    dw::reconciliation::Reconciler::ChainViews chains;
    for (auto &chain : snapshot.chains) {
      chains.emplace_back(chain);
    }
    node.reconciler =
        std::make_shared<dw::reconciliation::Reconciler>(logsys, chains);

    std::shared_ptr<dw::clients::HubPoolView> hub = node.hub;
    std::shared_ptr<dw::ledger::RunningBalanceLedger> ledger =
        std::make_shared<dw::ledger::RunningBalanceLedgerImpl>(logsys,
                                                               node.storage);
    node.bundles =
        std::make_shared<dw::bundle::BundleStorageImpl>(logsys, node.storage);

    dw::builders::PoolRebalanceConfig pool_config{
        .max_l1_tokens_per_leaf = appcfg->dataworker().max_l1_tokens_per_leaf,
        .transfer_thresholds = appcfg->dataworker().transfer_thresholds,
    };
    node.builder = std::make_shared<dw::builders::BundleBuilder>(
        node.reconciler,
        std::make_shared<dw::builders::SlowRelayRootBuilder>(logsys),
        std::make_shared<dw::builders::RelayerRefundRootBuilder>(logsys, hub),
        std::make_shared<dw::builders::PoolRebalanceRootBuilder>(
            logsys, hub, ledger, std::move(pool_config)));

    std::shared_ptr<dw::submission::TransactionSubmitter> submitter =
        std::make_shared<dw::submission::OutboxTransactionSubmitter>(
            logsys, appcfg->dataworker().outbox);

    node.controller =
        std::make_shared<dw::lifecycle::BundleLifecycleController>(
            logsys, node.builder, hub, node.bundles, ledger, submitter);

    return node;
  }

  void report_failure(const Node &node, const std::error_code &error) {
    fmt::println(std::cerr, "Failed: {}", error.message());
    if (error == dataworker::reconciliation::ReconciliationError::
            STALE_CHAIN_STATE) {
      if (auto chain = node.reconciler->firstUnsynchronizedChain()) {
        fmt::println(std::cerr, "Chain {} is not synchronized", *chain);
      }
    }
  }

  std::optional<BundleScope> scope_of(const Node &node,
                                      const Configuration &appcfg) {
    if (appcfg.blockRanges().has_value()) {
      return appcfg.blockRanges();
    }
    return node.snapshot_scope;
  }

  std::optional<dataworker::BundleId> bundle_id_of(
      const Node &node, const Configuration &appcfg) {
    if (appcfg.bundleId().has_value()) {
      return appcfg.bundleId();
    }
    auto last_res = node.bundles->lastBundleId();
    if (last_res.has_error()) {
      fmt::println(std::cerr, "Failed: {}", last_res.error().message());
      return std::nullopt;
    }
    if (not last_res.value().has_value()) {
      fmt::println(std::cerr, "No bundle has been proposed yet");
    }
    return last_res.value();
  }

  int cmd_roots(const Node &node, const BundleScope &scope) {
    auto roots_res = node.builder->buildAll(scope);
    if (roots_res.has_error()) {
      report_failure(node, roots_res.error());
      return EXIT_FAILURE;
    }
    auto &roots = roots_res.value();
    fmt::println("scope: {}", scope);
    fmt::println("{}: {} ({} leaves)",
                 RootType::SlowRelay,
                 hex(roots.rootOf(RootType::SlowRelay)),
                 roots.slow_relay ? roots.slow_relay->leaves.size() : 0);
    fmt::println("{}: {} ({} leaves)",
                 RootType::RelayerRefund,
                 hex(roots.rootOf(RootType::RelayerRefund)),
                 roots.relayer_refund ? roots.relayer_refund->leaves.size()
                                      : 0);
    fmt::println("{}: {} ({} leaves, {} running balances)",
                 RootType::PoolRebalance,
                 hex(roots.rootOf(RootType::PoolRebalance)),
                 roots.pool_rebalance.root
                     ? roots.pool_rebalance.root->leaves.size()
                     : 0,
                 roots.pool_rebalance.transitions.size());
    return EXIT_SUCCESS;
  }

  int cmd_propose(const Node &node, const BundleScope &scope) {
    auto report_res = node.controller->propose(scope);
    if (report_res.has_error()) {
      report_failure(node, report_res.error());
      return EXIT_FAILURE;
    }
    auto &report = report_res.value();
    fmt::println("bundle {} proposed, tx 0x{}",
                 report.bundle_id,
                 report.receipt.tx_hash.toHex());
    for (size_t i = 0; i < dataworker::kAllRootTypes.size(); ++i) {
      auto root_type = dataworker::kAllRootTypes[i];
      fmt::println("{}: {} ({} leaves)",
                   root_type,
                   hex(report.roots.rootOf(root_type)),
                   report.leaf_counts[i]);
    }
    return EXIT_SUCCESS;
  }

  int cmd_validate(const Node &node, dataworker::BundleId bundle_id) {
    auto report_res = node.controller->validateBundle(bundle_id);
    if (report_res.has_error()) {
      report_failure(node, report_res.error());
      return EXIT_FAILURE;
    }
    auto &report = report_res.value();
    for (const auto &root : report.roots) {
      fmt::println("{}: {} (claimed {}, computed {})",
                   root.root_type,
                   root.matches ? "match" : "MISMATCH",
                   hex(root.expected),
                   hex(root.actual));
    }
    if (not report.allMatch()) {
      std::error_code error =
          dataworker::lifecycle::LifecycleError::ROOT_MISMATCH;
      fmt::println(std::cerr,
                   "Bundle {} disputed: {}",
                   bundle_id,
                   error.message());
      return EXIT_FAILURE;
    }
    fmt::println("bundle {} validated", bundle_id);
    return EXIT_SUCCESS;
  }

  int cmd_execute(const Node &node,
                  dataworker::BundleId bundle_id,
                  std::optional<RootType> only) {
    int exit_code = EXIT_SUCCESS;
    for (auto root_type : dataworker::kAllRootTypes) {
      if (only.has_value() and *only != root_type) {
        continue;
      }
      auto report_res = node.controller->execute(bundle_id, root_type);
      if (report_res.has_error()) {
        report_failure(node, report_res.error());
        return EXIT_FAILURE;
      }
      auto &report = report_res.value();
      fmt::println("{}: {} executed, {} skipped, {} failed; bundle is {}",
                   root_type,
                   report.executed.size(),
                   report.skipped.size(),
                   report.failed.size(),
                   report.state);
      for (const auto &failure : report.failed) {
        fmt::println(std::cerr,
                     "  leaf {}: {}",
                     failure.leaf_id,
                     failure.error.message());
      }
      if (not report.success()) {
        exit_code = EXIT_FAILURE;
      }
    }
    return exit_code;
  }

  int run_command(std::shared_ptr<LoggingSystem> logsys,
                  std::shared_ptr<Configuration> appcfg) {
    auto node = make_node(logsys, appcfg);
    if (not node.has_value()) {
      return EXIT_FAILURE;
    }

    switch (appcfg->command()) {
      case Command::ROOTS:
      case Command::PROPOSE: {
        auto scope = scope_of(*node, *appcfg);
        if (not scope.has_value()) {
          fmt::println(std::cerr,
                       "Block ranges are given neither by --block-range "
                       "nor by the snapshot");
          return EXIT_FAILURE;
        }
        return appcfg->command() == Command::ROOTS
                 ? cmd_roots(*node, *scope)
                 : cmd_propose(*node, *scope);
      }
      case Command::VALIDATE:
      case Command::EXECUTE: {
        auto bundle_id = bundle_id_of(*node, *appcfg);
        if (not bundle_id.has_value()) {
          return EXIT_FAILURE;
        }
        return appcfg->command() == Command::VALIDATE
                 ? cmd_validate(*node, *bundle_id)
                 : cmd_execute(*node, *bundle_id, appcfg->rootType());
      }
    }
    return EXIT_FAILURE;
  }

}  // namespace

int main(int argc, const char **argv, const char **env) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("dataworker");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<dataworker::app::Configurator>(argc, argv, env);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<LoggingSystem>(std::move(logging_system));
  });

  logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "configurator");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  auto logger =
      logging_system->getLogger("Main", dataworker::log::defaultGroupName);
  SL_INFO(logger,
          "Dataworker '{}' started. Version: {}",
          app_configuration->nodeName(),
          app_configuration->nodeVersion());

  auto exit_code = run_command(logging_system, app_configuration);

  SL_INFO(logger, "Done");
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
