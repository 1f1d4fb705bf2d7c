/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clients/impl/snapshot_loader.hpp"

#include <algorithm>

#include <yaml-cpp/yaml.h>

#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dataworker::clients, SnapshotError, e) {
  using E = dataworker::clients::SnapshotError;
  switch (e) {
    case E::FILE_NOT_READABLE:
      return "Snapshot file can not be read";
    case E::MALFORMED_SECTION:
      return "Snapshot section has unexpected structure";
    case E::INVALID_VALUE:
      return "Snapshot contains a value that can not be parsed";
  }
  return "Unknown error";
}

namespace dataworker::clients {

  namespace {
    // Scalar fields share one set of readers so that every failure is
    // reported with the name of the field
    class FieldReader {
     public:
      FieldReader(const YAML::Node &node,
                  std::string_view section,
                  const log::Logger &logger)
          : node_(node), section_(section), logger_(logger) {}

      outcome::result<std::string> string(const char *key) const {
        auto value = node_[key];
        if (not value or not value.IsScalar()) {
          SL_ERROR(logger_, "{}: field '{}' is missing", section_, key);
          return SnapshotError::INVALID_VALUE;
        }
        return value.as<std::string>();
      }

      template <typename T>
      outcome::result<T> number(const char *key) const {
        OUTCOME_TRY(str, string(key));
        auto value = util::parseUnsigned<T>(str);
        if (not value) {
          return fail(key, str);
        }
        return *value;
      }

      outcome::result<Amount> amount(const char *key) const {
        OUTCOME_TRY(str, string(key));
        auto value = util::parseAmount(str);
        if (not value) {
          return fail(key, str);
        }
        return *value;
      }

      outcome::result<Address> address(const char *key) const {
        OUTCOME_TRY(str, string(key));
        auto value = util::parseAddress(str);
        if (not value) {
          return fail(key, str);
        }
        return *value;
      }

      outcome::result<Hash256> hash(const char *key) const {
        OUTCOME_TRY(str, string(key));
        auto value = util::parseHash(str);
        if (not value) {
          return fail(key, str);
        }
        return *value;
      }

      outcome::result<bool> flag(const char *key, bool fallback) const {
        auto value = node_[key];
        if (not value) {
          return fallback;
        }
        OUTCOME_TRY(str, string(key));
        if (util::iequals(str, "true") or util::iequals(str, "yes")) {
          return true;
        }
        if (util::iequals(str, "false") or util::iequals(str, "no")) {
          return false;
        }
        return fail(key, str);
      }

     private:
      SnapshotError fail(const char *key, std::string_view str) const {
        SL_ERROR(logger_, "{}: field '{}' has invalid value '{}'",
                 section_, key, str);
        return SnapshotError::INVALID_VALUE;
      }

      const YAML::Node &node_;
      std::string_view section_;
      const log::Logger &logger_;
    };
  }  // namespace

  SnapshotLoader::SnapshotLoader(qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_(logsys->getLogger("SnapshotLoader", "dataworker")) {}

  outcome::result<ChainSnapshot> SnapshotLoader::load(
      const std::filesystem::path &path) const {
    YAML::Node root;
    try {
      root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception &e) {
      SL_ERROR(logger_, "Can't read snapshot {}: {}", path.string(), e.what());
      return SnapshotError::FILE_NOT_READABLE;
    }
    OUTCOME_TRY(snapshot, parse(root));
    SL_INFO(logger_,
            "Snapshot {} loaded: hub chain {}, {} spoke chains",
            path.string(),
            snapshot.hub->hubChainId(),
            snapshot.chains.size());
    return snapshot;
  }

  outcome::result<ChainSnapshot> SnapshotLoader::parse(
      const YAML::Node &root) const {
    if (not root.IsMap()) {
      SL_ERROR(logger_, "Snapshot root must be a map");
      return SnapshotError::MALFORMED_SECTION;
    }
    ChainSnapshot snapshot;

    auto hub = root["hub"];
    if (not hub or not hub.IsMap()) {
      SL_ERROR(logger_, "Snapshot has no 'hub' section");
      return SnapshotError::MALFORMED_SECTION;
    }
    OUTCOME_TRY(parseHub(hub, snapshot));

    if (auto bundle = root["bundle"]) {
      OUTCOME_TRY(scope, parseScope(bundle));
      snapshot.scope = std::move(scope);
    }

    auto chains = root["chains"];
    if (not chains or not chains.IsSequence()) {
      SL_ERROR(logger_, "Snapshot has no 'chains' sequence");
      return SnapshotError::MALFORMED_SECTION;
    }
    for (auto &&chain_node : chains) {
      OUTCOME_TRY(chain, parseChain(chain_node));
      auto duplicate = std::ranges::any_of(snapshot.chains, [&](auto &c) {
        return c->chainId() == chain->chainId();
      });
      if (duplicate) {
        SL_ERROR(logger_, "Chain {} is listed twice", chain->chainId());
        return SnapshotError::MALFORMED_SECTION;
      }
      snapshot.chains.emplace_back(std::move(chain));
    }
    return snapshot;
  }

  outcome::result<void> SnapshotLoader::parseHub(
      const YAML::Node &node, ChainSnapshot &snapshot) const {
    FieldReader hub{node, "hub", logger_};
    OUTCOME_TRY(hub_chain_id, hub.number<ChainId>("chain-id"));
    snapshot.hub = std::make_shared<SnapshotHubPoolView>(hub_chain_id);

    if (auto routes = node["routes"]) {
      if (not routes.IsSequence()) {
        SL_ERROR(logger_, "hub.routes must be a sequence");
        return SnapshotError::MALFORMED_SECTION;
      }
      for (auto &&route_node : routes) {
        FieldReader route{route_node, "hub.routes", logger_};
        OUTCOME_TRY(l1_token, route.address("l1-token"));
        auto tokens = route_node["tokens"];
        if (not tokens or not tokens.IsMap()) {
          SL_ERROR(logger_, "hub.routes: 'tokens' must be a map");
          return SnapshotError::MALFORMED_SECTION;
        }
        for (auto &&pair : tokens) {
          auto chain_id =
              util::parseUnsigned<ChainId>(pair.first.as<std::string>());
          auto l2_token = util::parseAddress(pair.second.as<std::string>());
          if (not chain_id or not l2_token) {
            SL_ERROR(logger_,
                     "hub.routes: invalid token entry '{}: {}'",
                     pair.first.as<std::string>(),
                     pair.second.as<std::string>());
            return SnapshotError::INVALID_VALUE;
          }
          snapshot.hub->addRoute(l1_token, *chain_id, *l2_token);
        }
      }
    }

    if (auto claimed = node["claimed-leaves"]) {
      if (not claimed.IsSequence()) {
        SL_ERROR(logger_, "hub.claimed-leaves must be a sequence");
        return SnapshotError::MALFORMED_SECTION;
      }
      for (auto &&leaf_node : claimed) {
        FieldReader leaf{leaf_node, "hub.claimed-leaves", logger_};
        OUTCOME_TRY(type_name, leaf.string("root-type"));
        auto root_type = rootTypeFromName(type_name);
        if (not root_type) {
          SL_ERROR(logger_, "Unknown root type '{}'", type_name);
          return SnapshotError::INVALID_VALUE;
        }
        OUTCOME_TRY(root, leaf.hash("root"));
        OUTCOME_TRY(leaf_id, leaf.number<LeafId>("leaf-id"));
        snapshot.hub->markLeafClaimed(*root_type, root, leaf_id);
      }
    }
    return outcome::success();
  }

  outcome::result<BundleScope> SnapshotLoader::parseScope(
      const YAML::Node &node) const {
    if (not node.IsSequence()) {
      SL_ERROR(logger_, "'bundle' must be a sequence of block ranges");
      return SnapshotError::MALFORMED_SECTION;
    }
    std::vector<ChainBlockRange> ranges;
    for (auto &&range_node : node) {
      FieldReader reader{range_node, "bundle", logger_};
      ChainBlockRange range;
      OUTCOME_TRY(chain_id, reader.number<ChainId>("chain-id"));
      OUTCOME_TRY(start_block, reader.number<BlockNumber>("start-block"));
      OUTCOME_TRY(end_block, reader.number<BlockNumber>("end-block"));
      if (start_block > end_block) {
        SL_ERROR(logger_,
                 "bundle: range of chain {} ends before it starts",
                 chain_id);
        return SnapshotError::INVALID_VALUE;
      }
      range.chain_id = chain_id;
      range.start_block = start_block;
      range.end_block = end_block;
      ranges.emplace_back(range);
    }
    return BundleScope{std::move(ranges)};
  }

  outcome::result<std::shared_ptr<SnapshotChainStateView>>
  SnapshotLoader::parseChain(const YAML::Node &node) const {
    FieldReader reader{node, "chains", logger_};
    OUTCOME_TRY(chain_id, reader.number<ChainId>("chain-id"));
    OUTCOME_TRY(synchronized, reader.flag("synchronized", true));

    auto chain = std::make_shared<SnapshotChainStateView>(chain_id);
    chain->setSynchronized(synchronized);

    if (auto deposits = node["deposits"]) {
      if (not deposits.IsSequence()) {
        SL_ERROR(logger_, "chain {}: 'deposits' must be a sequence", chain_id);
        return SnapshotError::MALFORMED_SECTION;
      }
      for (auto &&deposit_node : deposits) {
        OUTCOME_TRY(deposit, parseDeposit(deposit_node));
        chain->addDeposit(std::move(deposit));
      }
    }
    if (auto fills = node["fills"]) {
      if (not fills.IsSequence()) {
        SL_ERROR(logger_, "chain {}: 'fills' must be a sequence", chain_id);
        return SnapshotError::MALFORMED_SECTION;
      }
      for (auto &&fill_node : fills) {
        OUTCOME_TRY(fill, parseFill(fill_node));
        chain->addFill(std::move(fill));
      }
    }
    return chain;
  }

  outcome::result<Deposit> SnapshotLoader::parseDeposit(
      const YAML::Node &node) const {
    FieldReader reader{node, "deposit", logger_};
    Deposit deposit;
    OUTCOME_TRY(deposit_id, reader.number<DepositId>("deposit-id"));
    OUTCOME_TRY(destination, reader.number<ChainId>("destination-chain-id"));
    OUTCOME_TRY(depositor, reader.address("depositor"));
    OUTCOME_TRY(recipient, reader.address("recipient"));
    OUTCOME_TRY(origin_token, reader.address("origin-token"));
    OUTCOME_TRY(destination_token, reader.address("destination-token"));
    OUTCOME_TRY(amount, reader.amount("amount"));
    OUTCOME_TRY(relayer_fee_pct, reader.number<FeePct>("relayer-fee-pct"));
    OUTCOME_TRY(lp_fee_pct, reader.number<FeePct>("realized-lp-fee-pct"));
    OUTCOME_TRY(quote_timestamp, reader.number<Timestamp>("quote-timestamp"));
    OUTCOME_TRY(block_number, reader.number<BlockNumber>("block-number"));
    deposit.deposit_id = deposit_id;
    deposit.destination_chain_id = destination;
    deposit.depositor = depositor;
    deposit.recipient = recipient;
    deposit.origin_token = origin_token;
    deposit.destination_token = destination_token;
    deposit.amount = amount;
    deposit.relayer_fee_pct = relayer_fee_pct;
    deposit.realized_lp_fee_pct = lp_fee_pct;
    deposit.quote_timestamp = quote_timestamp;
    deposit.block_number = block_number;
    return deposit;
  }

  outcome::result<Fill> SnapshotLoader::parseFill(const YAML::Node &node) const {
    FieldReader reader{node, "fill", logger_};
    Fill fill;
    OUTCOME_TRY(deposit_id, reader.number<DepositId>("deposit-id"));
    OUTCOME_TRY(origin, reader.number<ChainId>("origin-chain-id"));
    OUTCOME_TRY(depositor, reader.address("depositor"));
    OUTCOME_TRY(recipient, reader.address("recipient"));
    OUTCOME_TRY(destination_token, reader.address("destination-token"));
    OUTCOME_TRY(amount, reader.amount("amount"));
    OUTCOME_TRY(total_filled, reader.amount("total-filled-amount"));
    OUTCOME_TRY(fill_amount, reader.amount("fill-amount"));
    OUTCOME_TRY(repayment_chain, reader.number<ChainId>("repayment-chain-id"));
    OUTCOME_TRY(relayer, reader.address("relayer"));
    OUTCOME_TRY(relayer_fee_pct, reader.number<FeePct>("relayer-fee-pct"));
    OUTCOME_TRY(lp_fee_pct, reader.number<FeePct>("realized-lp-fee-pct"));
    OUTCOME_TRY(is_slow_relay, reader.flag("slow-relay", false));
    OUTCOME_TRY(block_number, reader.number<BlockNumber>("block-number"));
    fill.deposit_id = deposit_id;
    fill.origin_chain_id = origin;
    fill.depositor = depositor;
    fill.recipient = recipient;
    fill.destination_token = destination_token;
    fill.amount = amount;
    fill.total_filled_amount = total_filled;
    fill.fill_amount = fill_amount;
    fill.repayment_chain_id = repayment_chain;
    fill.relayer = relayer;
    fill.relayer_fee_pct = relayer_fee_pct;
    fill.realized_lp_fee_pct = lp_fee_pct;
    fill.is_slow_relay = is_slow_relay;
    fill.block_number = block_number;
    return fill;
  }

}  // namespace dataworker::clients
