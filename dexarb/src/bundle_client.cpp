#include "dexarb/bundle_client.hpp"
#include "dexarb/abi.hpp"
#include "dexarb/errors.hpp"
#include <spdlog/spdlog.h>
#include <thread>

using json = nlohmann::json;

namespace dexarb {

BundleClient::BundleClient(const Config &config, const std::string &relay_url,
                           std::shared_ptr<HttpTransport> transport,
                           std::shared_ptr<RequestSigner> relay_signer,
                           std::shared_ptr<TransactionSigner> tx_signer,
                           std::shared_ptr<ChainClient> chain)
    : config_(config),
      rpc_(std::move(transport), relay_url, std::move(relay_signer)),
      tx_signer_(std::move(tx_signer)), chain_(std::move(chain)) {
  if (!tx_signer_)
    throw SigningKeyUnavailableError("no trading key signer configured");
}

int BundleClient::attempts() const {
  return std::max(1, config_.relay_max_retries);
}

void BundleClient::backoff(int attempt) const {
  if (config_.relay_retry_delay_ms <= 0)
    return;
  auto delay = std::chrono::milliseconds(config_.relay_retry_delay_ms) *
               (1 << std::min(attempt, 6));
  std::this_thread::sleep_for(delay);
}

static json rawTxs(const Bundle &bundle) {
  json txs = json::array();
  for (const auto &tx : bundle.txs)
    txs.push_back(tx.raw);
  return txs;
}

static double quantity(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return 0.0;
  const auto &v = j[key];
  if (v.is_number())
    return v.get<double>();
  if (v.is_string())
    return parseQuantity(v.get<std::string>());
  return 0.0;
}

// ── Build ────────────────────────────────────────────────────────────
void BundleClient::applyGasStrategy(std::vector<Transaction> &txs,
                                    double base_fee_gwei,
                                    const Config &config) {
  double base_price = base_fee_gwei * config.gas_price_multiplier;
  double priority =
      std::min(config.priority_premium_gwei, config.max_priority_fee_gwei);
  for (size_t i = 0; i < txs.size(); i++) {
    txs[i].max_priority_fee_per_gas_gwei = (i == 0) ? priority : 0.0;
    txs[i].max_fee_per_gas_gwei =
        base_price + txs[i].max_priority_fee_per_gas_gwei;
  }
}

Bundle BundleClient::build(std::vector<Transaction> txs,
                           uint64_t target_block) {
  if (txs.empty())
    throw DexarbError("cannot build an empty bundle");

  applyGasStrategy(txs, chain_->baseFeeGwei(), config_);

  const std::string from = tx_signer_->address();
  uint64_t nonce = chain_->nonceOf(from);
  for (auto &tx : txs) {
    tx.from = from;
    tx.nonce = nonce++;
    tx_signer_->sign(tx);
  }

  Bundle bundle;
  bundle.txs = std::move(txs);
  bundle.target_block = target_block;
  bundle.gas_token_rate = config_.gas_token_rate;
  return bundle;
}

// ── Simulate ─────────────────────────────────────────────────────────
SimulationResult BundleClient::parseSimulation(const json &result,
                                               const Bundle &bundle) {
  SimulationResult sim;
  if (!result.is_object() || !result.contains("results") ||
      !result["results"].is_array()) {
    sim.error = "malformed eth_callBundle result";
    return sim;
  }

  sim.success = true;
  double gross_raw = 0.0;
  for (const auto &tx : result["results"]) {
    for (const char *key : {"error", "revert"}) {
      if (tx.contains(key) && !tx[key].is_null()) {
        sim.success = false;
        std::string why =
            tx[key].is_string() ? tx[key].get<std::string>() : tx[key].dump();
        sim.error = tx.value("txHash", std::string("tx")) + ": " + why;
      }
    }
    if (!sim.success)
      break;
    // Executor calls return their profit as one uint256
    if (tx.contains("value") && tx["value"].is_string()) {
      std::string v = tx["value"].get<std::string>();
      if (v.size() > 2)
        gross_raw += hexToDouble(v.substr(0, 66));
    }
  }

  sim.gas_used = static_cast<uint64_t>(quantity(result, "totalGasUsed"));
  sim.gas_fees = quantity(result, "gasFees") / 1e18;
  sim.balance_deltas["coinbase"] = quantity(result, "coinbaseDiff") / 1e18;
  sim.gross_profit = fromBaseUnits(gross_raw, bundle.profit_decimals);
  sim.balance_deltas[bundle.profit_token] = sim.gross_profit;
  sim.net_profit = sim.gross_profit - sim.gas_fees * bundle.gas_token_rate;
  return sim;
}

SimulationResult BundleClient::simulate(const Bundle &bundle) {
  json req = {{"txs", rawTxs(bundle)},
              {"blockNumber", toHex(bundle.target_block)},
              {"stateBlockNumber", "latest"}};

  std::string last_error;
  for (int attempt = 0; attempt < attempts(); attempt++) {
    try {
      auto result = rpc_.call("eth_callBundle", json::array({req}));
      auto sim = parseSimulation(result, bundle);
      spdlog::debug("[Relay] Simulation on {}: ok={} gas={} net={:.6f}",
                    relayUrl(), sim.success, sim.gas_used, sim.net_profit);
      return sim;
    } catch (const RpcError &e) {
      SimulationResult sim;
      sim.error = e.what();
      return sim;
    } catch (const TransportError &e) {
      last_error = e.what();
      spdlog::error("[Relay] eth_callBundle attempt {} on {} failed: {}",
                    attempt + 1, relayUrl(), last_error);
      if (!e.transient())
        break;
    }
    if (attempt + 1 < attempts())
      backoff(attempt);
  }
  throw RelayUnavailableError(relayUrl() + ": " + last_error);
}

// ── Submit ───────────────────────────────────────────────────────────
std::optional<SubmissionHandle> BundleClient::submit(const Bundle &bundle) {
  bool reachable = false;
  std::string last_error;

  for (int attempt = 0; attempt < attempts(); attempt++) {
    uint64_t target = bundle.target_block + attempt;
    json req = {{"txs", rawTxs(bundle)}, {"blockNumber", toHex(target)}};
    try {
      auto result = rpc_.call("eth_sendBundle", json::array({req}));
      reachable = true;
      if (result.is_object() && result.contains("bundleHash")) {
        SubmissionHandle handle;
        handle.bundle_hash = result["bundleHash"].get<std::string>();
        handle.target_block = target;
        handle.lead_tx_hash = bundle.txs.front().hash;
        handle.relay = relayUrl();
        spdlog::info("[Relay] Bundle {} submitted to {} for block {}",
                     handle.bundle_hash, relayUrl(), target);
        return handle;
      }
      last_error = "response carried no bundleHash";
    } catch (const RpcError &e) {
      reachable = true;
      last_error = e.what();
      spdlog::warn("[Relay] eth_sendBundle rejected (attempt {}): {}",
                   attempt + 1, last_error);
    } catch (const TransportError &e) {
      last_error = e.what();
      spdlog::error("[Relay] eth_sendBundle attempt {} on {} failed: {}",
                    attempt + 1, relayUrl(), last_error);
      if (!e.transient())
        break;
    }
    if (attempt + 1 < attempts())
      backoff(attempt);
  }

  if (!reachable)
    throw RelayUnavailableError(relayUrl() + ": " + last_error);
  return std::nullopt;
}

// ── Status ───────────────────────────────────────────────────────────
BundleStatus BundleClient::status(const SubmissionHandle &handle) {
  BundleStatus st;
  if (auto receipt = chain_->receipt(handle.lead_tx_hash)) {
    st.block = receipt->block;
    if (receipt->reverted) {
      st.state = BundleStatus::State::REJECTED;
      st.reason = "reverted";
      spdlog::warn("[Relay] Bundle {} mined in block {} but reverted",
                   handle.bundle_hash, st.block);
    } else {
      st.state = BundleStatus::State::INCLUDED;
    }
    return st;
  }

  json req = {{"bundleHash", handle.bundle_hash},
              {"blockNumber", toHex(handle.target_block)}};
  try {
    rpc_.call("flashbots_getBundleStatsV2", json::array({req}));
  } catch (const RpcError &e) {
    st.state = BundleStatus::State::REJECTED;
    st.reason = e.what();
  } catch (const TransportError &e) {
    spdlog::debug("[Relay] Stats for {} unavailable: {}", handle.bundle_hash,
                  e.what());
  }
  return st;
}

} // namespace dexarb
