/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/assert.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dataworker::app, Configurator::Error, e) {
  using E = dataworker::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown Configurator::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    BOOST_ASSERT(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  /**
   * Reads scalar `section.key` when it is defined.
   * A non-scalar value is recorded as a file error.
   */
  std::optional<std::string> scalar(const YAML::Node &section,
                                    std::string_view section_name,
                                    const char *key,
                                    std::ostringstream &errors,
                                    bool &has_error) {
    auto node = section[key];
    if (not node.IsDefined()) {
      return std::nullopt;
    }
    if (not node.IsScalar()) {
      errors << "E: Value '" << section_name << '.' << key
             << "' must be scalar\n";
      has_error = true;
      return std::nullopt;
    }
    auto value = node.as<std::string>();
    boost::trim(value);
    return value;
  }

  std::optional<dataworker::app::Command> commandFromName(
      std::string_view name) {
    using dataworker::app::Command;
    if (name == "roots") {
      return Command::ROOTS;
    }
    if (name == "propose") {
      return Command::PROPOSE;
    }
    if (name == "validate") {
      return Command::VALIDATE;
    }
    if (name == "execute") {
      return Command::EXECUTE;
    }
    return std::nullopt;
  }

  std::optional<dataworker::app::Configuration::DatabaseBackend>
  backendFromName(std::string_view name) {
    using Backend = dataworker::app::Configuration::DatabaseBackend;
    if (name == "rocksdb") {
      return Backend::ROCKSDB;
    }
    if (name == "memory") {
      return Backend::MEMORY;
    }
    return std::nullopt;
  }

  static constexpr std::string_view kUsage =
      "Usage: dataworker_node <command> [options]\n"
      "Commands:\n"
      "  roots     Build the three roots of a bundle and print them\n"
      "  propose   Build the roots, submit them to the hub and persist the "
      "bundle\n"
      "  validate  Recompute the roots of a proposed bundle and compare them\n"
      "  execute   Execute the leaves of a validated bundle\n";

}  // namespace

namespace dataworker::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "dataworker";
    config_->base_path_ = std::filesystem::current_path();

    config_->database_.directory = "db";
    config_->database_.cache_size = 512 << 20;  // 512MiB

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of node.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lreconciliation=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description storage_options("Storage options");
    storage_options.add_options()
        ("db_path", po::value<std::string>()->default_value(config_->database_.directory), "Path to DB directory. Can be relative on base path.")
        ("db_cache_size", po::value<uint32_t>()->default_value(config_->database_.cache_size), "Limit the memory the database cache can use <MiB>.")
        ("db_backend", po::value<std::string>(), "Storage backend: rocksdb (default) or memory.")
        ;

    po::options_description dataworker_options("Dataworker options");
    dataworker_options.add_options()
        ("snapshot", po::value<std::string>(), "Path to chain-state snapshot yaml-file.")
        ("outbox", po::value<std::string>(), "Path to file outbound transactions are appended to.")
        ("max-l1-tokens-per-leaf", po::value<size_t>(), "Maximum number of L1 tokens in one pool-rebalance leaf.")
        ("bundle", po::value<BundleId>(), "Bundle to validate or execute. Default: the latest one.")
        ("root", po::value<std::string>(), "Root to execute: slow-relay, relayer-refund or pool-rebalance. Default: all.")
        ("block-range", po::value<std::vector<std::string>>(),
          "Block range of one chain, <chain-id>:<start>-<end>.\n"
          "Repeat for every chain. Overrides the bundle section of the snapshot.")
        ;

    po::options_description hidden_options;
    hidden_options.add_options()
        ("command", po::value<std::string>(), "Command to run")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(storage_options)
        .add(dataworker_options)
        .add(hidden_options);

    cli_positional_.add("command", 1);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Dataworker version " << buildVersion() << '\n';
      std::cout << kUsage << '\n';
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Dataworker version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(cli_options_)
                                      .positional(cli_positional_)
                                      .run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: dataworker
        children:
          - name: configurator
          - name: reconciliation
          - name: root_builders
          - name: lifecycle
          - name: ledger
          - name: submission
          - name: storage
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initDatabaseConfig());
    OUTCOME_TRY(initDataworkerConfig());
    OUTCOME_TRY(initCommandConfig());

    return config_;
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          if (auto value = scalar(
                  section, "general", "name", file_errors_, file_has_error_)) {
            config_->name_ = *value;
          }
          if (auto value = scalar(section,
                                  "general",
                                  "base-path",
                                  file_errors_,
                                  file_has_error_)) {
            config_->base_path_ = *value;
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = value;
        });

    // Check values
    if (not config_->base_path_.is_absolute()) {
      SL_ERROR(logger_,
               "The 'base_path' must be defined as absolute: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initDatabaseConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["database"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          if (auto value = scalar(
                  section, "database", "path", file_errors_, file_has_error_)) {
            config_->database_.directory = *value;
          }
          if (auto value = scalar(section,
                                  "database",
                                  "cache_size",
                                  file_errors_,
                                  file_has_error_)) {
            auto size = util::parseByteQuantity(*value);
            if (size.has_value()) {
              config_->database_.cache_size = size.value();
            } else {
              file_errors_ << "E: Bad 'cache_size' value; "
                              "Expected: 4096, 512Mb, 1G, etc.\n";
              file_has_error_ = true;
            }
          }
          if (auto value = scalar(section,
                                  "database",
                                  "backend",
                                  file_errors_,
                                  file_has_error_)) {
            auto backend = backendFromName(*value);
            if (backend.has_value()) {
              config_->database_.backend = backend.value();
            } else {
              file_errors_ << "E: Bad 'database.backend' value; "
                              "Expected: rocksdb or memory\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'database' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    bool fail = false;
    find_argument<std::string>(
        cli_values_map_, "db_path", [&](const std::string &value) {
          config_->database_.directory = value;
        });
    find_argument<uint32_t>(
        cli_values_map_, "db_cache_size", [&](const uint32_t &value) {
          config_->database_.cache_size = value;
        });
    find_argument<std::string>(
        cli_values_map_, "db_backend", [&](const std::string &value) {
          auto backend = backendFromName(value);
          if (backend.has_value()) {
            config_->database_.backend = backend.value();
          } else {
            std::cerr << "Option --db_backend has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    auto make_absolute = [&](const std::filesystem::path &path) {
      return weakly_canonical(path.is_absolute() ? path
                                                 : (config_->base_path_ / path));
    };

    config_->database_.directory = make_absolute(config_->database_.directory);

    return outcome::success();
  }

  outcome::result<void> Configurator::initDataworkerConfig() {
    auto &dataworker = config_->dataworker_;

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["dataworker"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          if (auto value = scalar(section,
                                  "dataworker",
                                  "snapshot",
                                  file_errors_,
                                  file_has_error_)) {
            dataworker.snapshot = *value;
          }
          if (auto value = scalar(section,
                                  "dataworker",
                                  "outbox",
                                  file_errors_,
                                  file_has_error_)) {
            dataworker.outbox = *value;
          }
          if (auto value = scalar(section,
                                  "dataworker",
                                  "max-l1-tokens-per-leaf",
                                  file_errors_,
                                  file_has_error_)) {
            auto count = util::parseUnsigned<size_t>(*value);
            if (count.has_value()) {
              dataworker.max_l1_tokens_per_leaf = count.value();
            } else {
              file_errors_ << "E: Value 'dataworker.max-l1-tokens-per-leaf' "
                              "must be unsigned integer\n";
              file_has_error_ = true;
            }
          }
          auto thresholds = section["transfer-thresholds"];
          if (thresholds.IsDefined()) {
            if (thresholds.IsMap()) {
              for (const auto &item : thresholds) {
                auto token = item.first.IsScalar()
                               ? util::parseAddress(item.first.as<std::string>())
                               : std::nullopt;
                auto amount =
                    item.second.IsScalar()
                        ? util::parseAmount(item.second.as<std::string>())
                        : std::nullopt;
                if (token.has_value() and amount.has_value()) {
                  dataworker.transfer_thresholds[token.value()] =
                      amount.value();
                } else {
                  file_errors_
                      << "E: Entry of 'dataworker.transfer-thresholds' must be "
                         "<l1 token address>: <unsigned decimal amount>\n";
                  file_has_error_ = true;
                }
              }
            } else {
              file_errors_ << "E: Value 'dataworker.transfer-thresholds' "
                              "defined, but is not map\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'dataworker' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "snapshot", [&](const std::string &value) {
          dataworker.snapshot = value;
        });
    find_argument<std::string>(
        cli_values_map_, "outbox", [&](const std::string &value) {
          dataworker.outbox = value;
        });
    find_argument<size_t>(
        cli_values_map_, "max-l1-tokens-per-leaf", [&](const size_t &value) {
          dataworker.max_l1_tokens_per_leaf = value;
        });

    // Check values
    auto make_absolute = [&](const std::filesystem::path &path) {
      return weakly_canonical(path.is_absolute() ? path
                                                 : (config_->base_path_ / path));
    };

    if (dataworker.max_l1_tokens_per_leaf < 1
        or dataworker.max_l1_tokens_per_leaf > MAX_L1_TOKENS_PER_LEAF) {
      SL_ERROR(logger_,
               "The 'max-l1-tokens-per-leaf' must be in range [1..{}]: {}",
               MAX_L1_TOKENS_PER_LEAF,
               dataworker.max_l1_tokens_per_leaf);
      return Error::InvalidValue;
    }

    if (dataworker.snapshot.empty()) {
      SL_ERROR(logger_, "The 'snapshot' path must be provided");
      return Error::InvalidValue;
    }
    dataworker.snapshot = make_absolute(dataworker.snapshot);
    if (not is_regular_file(dataworker.snapshot)) {
      SL_ERROR(logger_,
               "The 'snapshot' file does not exist or is not a file: {}",
               dataworker.snapshot.c_str());
      return Error::InvalidValue;
    }

    dataworker.outbox = make_absolute(dataworker.outbox);

    return outcome::success();
  }

  outcome::result<void> Configurator::initCommandConfig() {
    auto it = cli_values_map_.find("command");
    if (it == cli_values_map_.end()) {
      SL_ERROR(logger_, "Command is not provided; Run with '--help' for usage");
      return Error::CliArgsParseFailed;
    }
    auto name = it->second.as<std::string>();
    auto command = commandFromName(name);
    if (not command.has_value()) {
      SL_ERROR(logger_, "Unknown command: {}", name);
      return Error::CliArgsParseFailed;
    }
    config_->command_ = command.value();

    bool fail = false;
    find_argument<BundleId>(
        cli_values_map_, "bundle", [&](const BundleId &value) {
          config_->bundle_id_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "root", [&](const std::string &value) {
          auto root_type = rootTypeFromName(value);
          if (root_type.has_value()) {
            config_->root_type_ = root_type;
          } else {
            SL_ERROR(logger_, "Option --root has invalid value: {}", value);
            fail = true;
          }
        });
    find_argument<std::vector<std::string>>(
        cli_values_map_,
        "block-range",
        [&](const std::vector<std::string> &values) {
          std::vector<ChainBlockRange> ranges;
          for (const auto &value : values) {
            auto range = util::parseBlockRange(value);
            if (not range.has_value()) {
              SL_ERROR(logger_,
                       "Option --block-range has invalid value: {}; "
                       "Expected <chain-id>:<start>-<end>",
                       value);
              fail = true;
              return;
            }
            if (std::ranges::any_of(ranges, [&](const ChainBlockRange &r) {
                  return r.chain_id == range->chain_id;
                })) {
              SL_ERROR(logger_,
                       "Option --block-range is repeated for chain {}",
                       range->chain_id);
              fail = true;
              return;
            }
            ranges.push_back(range.value());
          }
          config_->block_ranges_ = BundleScope{std::move(ranges)};
        });
    if (fail) {
      return Error::InvalidValue;
    }

    return outcome::success();
  }

}  // namespace dataworker::app
