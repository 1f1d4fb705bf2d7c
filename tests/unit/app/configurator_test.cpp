/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/storage/base_fs_test.hpp"

using dataworker::Address;
using dataworker::Amount;
using dataworker::ChainBlockRange;
using dataworker::RootType;
using dataworker::app::Command;
using dataworker::app::Configuration;
using dataworker::app::Configurator;

class ConfiguratorTest : public test::BaseFS_Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  ConfiguratorTest() : BaseFS_Test("/tmp/dataworker-test-configurator") {}

  void SetUp() override {
    BaseFS_Test::SetUp();
    std::ofstream{base_path / "snapshot.yaml"} << "chains: {}\n";
  }

  void writeConfig(const std::string &content) {
    std::ofstream{base_path / "config.yaml"} << content;
  }

  /// Runs both parsing steps and builds the configuration
  outcome::result<std::shared_ptr<Configuration>> configure(
      std::vector<std::string> args) {
    args.insert(args.begin(), "dataworker_node");
    std::vector<const char *> argv;
    for (const auto &arg : args) {
      argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);
    const char *env[] = {nullptr};

    Configurator configurator(
        static_cast<int>(args.size()), argv.data(), env);
    OUTCOME_TRY(stop, configurator.step1());
    EXPECT_FALSE(stop);
    OUTCOME_TRY(configurator.step2());
    return configurator.calculateConfig(
        logsys->getLogger("Configurator", "configurator"));
  }

  std::string basePathArg() const {
    return "--base-path=" + base_path.string();
  }

  qtils::SharedRef<dataworker::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
};

/**
 * @given only a command and a snapshot
 * @when the configuration is built
 * @then defaults are used and relative paths resolve against the base path
 */
TEST_F(ConfiguratorTest, Defaults) {
  ASSERT_OUTCOME_SUCCESS(
      config, configure({"roots", basePathArg(), "--snapshot=snapshot.yaml"}));
  EXPECT_EQ(config->command(), Command::ROOTS);
  EXPECT_EQ(config->dataworker().snapshot,
            std::filesystem::weakly_canonical(base_path / "snapshot.yaml"));
  EXPECT_EQ(config->dataworker().outbox,
            std::filesystem::weakly_canonical(base_path / "outbox.yaml"));
  EXPECT_EQ(config->database().directory,
            std::filesystem::weakly_canonical(base_path / "db"));
  EXPECT_EQ(config->database().backend,
            Configuration::DatabaseBackend::ROCKSDB);
  EXPECT_EQ(config->dataworker().max_l1_tokens_per_leaf,
            dataworker::MAX_L1_TOKENS_PER_LEAF);
  EXPECT_FALSE(config->bundleId().has_value());
  EXPECT_FALSE(config->rootType().has_value());
  EXPECT_FALSE(config->blockRanges().has_value());
}

/**
 * @given a config file with every dataworker setting
 * @when the configuration is built
 * @then file values are applied and command line values override them
 */
TEST_F(ConfiguratorTest, FileAndCommandLine) {
  writeConfig(R"(
general:
  name: worker-1
database:
  backend: memory
  cache_size: 64Mb
dataworker:
  snapshot: snapshot.yaml
  outbox: sent.yaml
  max-l1-tokens-per-leaf: 4
  transfer-thresholds:
    "0x00000000000000000000000000000000000000aa": 1000
)");
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"execute",
                                    basePathArg(),
                                    "--config",
                                    (base_path / "config.yaml").string(),
                                    "--max-l1-tokens-per-leaf=2",
                                    "--bundle=3",
                                    "--root=relayer-refund"}));
  EXPECT_EQ(config->command(), Command::EXECUTE);
  EXPECT_EQ(config->nodeName(), "worker-1");
  EXPECT_EQ(config->database().backend,
            Configuration::DatabaseBackend::MEMORY);
  EXPECT_EQ(config->database().cache_size, 64u << 20);
  EXPECT_EQ(config->dataworker().outbox,
            std::filesystem::weakly_canonical(base_path / "sent.yaml"));
  EXPECT_EQ(config->dataworker().max_l1_tokens_per_leaf, 2u);
  EXPECT_EQ(config->bundleId(), 3u);
  EXPECT_EQ(config->rootType(), RootType::RelayerRefund);

  Address token{};
  token[19] = 0xaa;
  ASSERT_EQ(config->dataworker().transfer_thresholds.size(), 1u);
  EXPECT_EQ(config->dataworker().transfer_thresholds.at(token), Amount{1000});
}

/**
 * @given block ranges on the command line in arbitrary chain order
 * @when the configuration is built
 * @then they form a scope sorted by chain id
 */
TEST_F(ConfiguratorTest, BlockRanges) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"propose",
                                    basePathArg(),
                                    "--snapshot=snapshot.yaml",
                                    "--block-range=137:5-9",
                                    "--block-range=1:100-200"}));
  ASSERT_TRUE(config->blockRanges().has_value());
  std::vector<ChainBlockRange> expected{
      {.chain_id = 1, .start_block = 100, .end_block = 200},
      {.chain_id = 137, .start_block = 5, .end_block = 9},
  };
  EXPECT_EQ(config->blockRanges()->ranges, expected);
}

/**
 * @given a block range given twice for one chain or malformed
 * @when the configuration is built
 * @then it is rejected
 */
TEST_F(ConfiguratorTest, BadBlockRanges) {
  ASSERT_OUTCOME_ERROR(configure({"propose",
                                  basePathArg(),
                                  "--snapshot=snapshot.yaml",
                                  "--block-range=1:1-2",
                                  "--block-range=1:3-4"}),
                       Configurator::Error::InvalidValue);
  ASSERT_OUTCOME_ERROR(configure({"propose",
                                  basePathArg(),
                                  "--snapshot=snapshot.yaml",
                                  "--block-range=1:9-2"}),
                       Configurator::Error::InvalidValue);
}

/**
 * @given invalid command line input
 * @when the configuration is built
 * @then the matching error is returned
 */
TEST_F(ConfiguratorTest, InvalidCommandLine) {
  ASSERT_OUTCOME_ERROR(
      configure({"bridge", basePathArg(), "--snapshot=snapshot.yaml"}),
      Configurator::Error::CliArgsParseFailed);
  ASSERT_OUTCOME_ERROR(configure({basePathArg(), "--snapshot=snapshot.yaml"}),
                       Configurator::Error::CliArgsParseFailed);
  ASSERT_OUTCOME_ERROR(
      configure({"roots", basePathArg(), "--snapshot=snapshot.yaml", "--x"}),
      Configurator::Error::CliArgsParseFailed);
  ASSERT_OUTCOME_ERROR(configure({"execute",
                                  basePathArg(),
                                  "--snapshot=snapshot.yaml",
                                  "--root=everything"}),
                       Configurator::Error::InvalidValue);
}

/**
 * @given settings out of their valid domain
 * @when the configuration is built
 * @then it is rejected as invalid
 */
TEST_F(ConfiguratorTest, InvalidValues) {
  ASSERT_OUTCOME_ERROR(configure({"roots", basePathArg()}),
                       Configurator::Error::InvalidValue);
  ASSERT_OUTCOME_ERROR(
      configure({"roots", basePathArg(), "--snapshot=absent.yaml"}),
      Configurator::Error::InvalidValue);
  ASSERT_OUTCOME_ERROR(configure({"roots",
                                  basePathArg(),
                                  "--snapshot=snapshot.yaml",
                                  "--max-l1-tokens-per-leaf=0"}),
                       Configurator::Error::InvalidValue);
  ASSERT_OUTCOME_ERROR(
      configure({"roots", "--base-path=relative", "--snapshot=snapshot.yaml"}),
      Configurator::Error::InvalidValue);
}

/**
 * @given config files with malformed sections
 * @when the configuration is built
 * @then the file is rejected
 */
TEST_F(ConfiguratorTest, MalformedConfigFile) {
  auto config_arg = "--config=" + (base_path / "config.yaml").string();

  writeConfig("dataworker: [1, 2]\n");
  ASSERT_OUTCOME_ERROR(configure({"roots",
                                  basePathArg(),
                                  config_arg,
                                  "--snapshot=snapshot.yaml"}),
                       Configurator::Error::ConfigFileParseFailed);

  writeConfig("dataworker:\n  transfer-thresholds:\n    usdc: 1\n");
  ASSERT_OUTCOME_ERROR(configure({"roots",
                                  basePathArg(),
                                  config_arg,
                                  "--snapshot=snapshot.yaml"}),
                       Configurator::Error::ConfigFileParseFailed);

  writeConfig("database:\n  backend: postgres\n");
  ASSERT_OUTCOME_ERROR(configure({"roots",
                                  basePathArg(),
                                  config_arg,
                                  "--snapshot=snapshot.yaml"}),
                       Configurator::Error::ConfigFileParseFailed);

  writeConfig("general: [unclosed\n");
  ASSERT_OUTCOME_ERROR(
      configure({"roots", basePathArg(), config_arg}),
      Configurator::Error::ConfigFileParseFailed);
}
