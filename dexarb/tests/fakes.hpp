#pragma once
// In-process stand-ins for the node, the relay and the signer so the
// execution pipeline runs without network access.
#include "dexarb/abi.hpp"
#include "dexarb/chain_client.hpp"
#include "dexarb/common.hpp"
#include "dexarb/errors.hpp"
#include "dexarb/event_log.hpp"
#include "dexarb/http_transport.hpp"
#include "dexarb/liquidity_graph.hpp"
#include "dexarb/request_signer.hpp"
#include "dexarb/transaction_signer.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace dexarb {
namespace testing {

using json = nlohmann::json;

inline std::string addr(char c) { return "0x" + std::string(40, c); }

// Scripted JSON-RPC endpoint. Handlers return "result"; throwing RpcError
// turns into an "error" object.
class FakeTransport : public HttpTransport {
public:
  using Handler = std::function<json(const json &params)>;

  std::map<std::string, Handler> handlers;
  std::optional<HttpResponse> canned; // returned verbatim when set
  std::atomic<bool> down{false};

  HttpResponse post(const std::string &url, const std::string &body,
                    const std::vector<std::string> &headers) override {
    json req = json::parse(body);
    std::string method = req["method"].get<std::string>();
    Handler handler;
    {
      std::lock_guard<std::mutex> lock(mu_);
      requests_.push_back(req);
      headers_.push_back(headers);
      urls_.push_back(url);
      auto it = handlers.find(method);
      if (it != handlers.end())
        handler = it->second;
    }

    if (down)
      throw TransportError("connection refused", true);
    if (canned)
      return *canned;

    json resp = {{"jsonrpc", "2.0"}, {"id", req["id"]}};
    if (!handler) {
      resp["error"] = {{"code", -32601}, {"message", "method not found"}};
    } else {
      try {
        resp["result"] = handler(req["params"]);
      } catch (const RpcError &e) {
        resp["error"] = {{"code", e.code()}, {"message", e.what()}};
      }
    }
    return {200, resp.dump()};
  }

  size_t count(const std::string &method) const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const auto &r : requests_) {
      if (r["method"] == method)
        n++;
    }
    return n;
  }

  std::vector<json> calls(const std::string &method) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<json> out;
    for (const auto &r : requests_) {
      if (r["method"] == method)
        out.push_back(r["params"]);
    }
    return out;
  }

  std::vector<std::string> lastHeaders() const {
    std::lock_guard<std::mutex> lock(mu_);
    return headers_.empty() ? std::vector<std::string>{} : headers_.back();
  }

private:
  mutable std::mutex mu_;
  std::vector<json> requests_;
  std::vector<std::vector<std::string>> headers_;
  std::vector<std::string> urls_;
};

// Chain head advances by `step` on every blockNumber() call
class FakeChain : public ChainClient {
public:
  std::atomic<uint64_t> block{100};
  std::atomic<uint64_t> step{0};
  double base_fee = 10.0;
  uint64_t nonce = 7;
  double default_balance = 1e6;
  std::atomic<bool> hold{false}; // blocks tokenBalance() while set
  std::atomic<int> receipt_failures{0}; // receipt() throws while positive

  uint64_t blockNumber() override { return block.fetch_add(step); }
  double baseFeeGwei() override { return base_fee; }
  uint64_t nonceOf(const std::string &) override { return nonce; }

  double tokenBalance(const Token &token, const std::string &) override {
    while (hold)
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    std::lock_guard<std::mutex> lock(mu_);
    auto it = balances.find(token.address);
    return it == balances.end() ? default_balance : it->second;
  }

  std::optional<Receipt> receipt(const std::string &hash) override {
    if (receipt_failures > 0) {
      receipt_failures--;
      throw ChainError("eth_getTransactionReceipt: connection reset");
    }
    std::lock_guard<std::mutex> lock(mu_);
    auto it = receipts.find(hash);
    if (it == receipts.end())
      return std::nullopt;
    return it->second;
  }

  void setBalance(const std::string &token, double amount) {
    std::lock_guard<std::mutex> lock(mu_);
    balances[token] = amount;
  }

  void setReceipt(const std::string &hash, uint64_t at,
                  bool reverted = false) {
    std::lock_guard<std::mutex> lock(mu_);
    receipts[hash] = Receipt{at, reverted};
  }

private:
  std::mutex mu_;
  std::map<std::string, double> balances;
  std::map<std::string, Receipt> receipts;
};

// Deterministic raw/hash per nonce: "0xhash<nonce>"
class FakeTxSigner : public TransactionSigner {
public:
  std::atomic<bool> unavailable{false};
  std::atomic<int> signed_count{0};

  std::string address() const override { return addr('7'); }

  void sign(Transaction &tx) override {
    if (unavailable)
      throw SigningKeyUnavailableError("hardware wallet disconnected");
    tx.raw = "0xraw" + std::to_string(tx.nonce);
    tx.hash = "0xhash" + std::to_string(tx.nonce);
    signed_count++;
  }
};

class StaticRequestSigner : public RequestSigner {
public:
  std::string sign(const std::string &body) override {
    return "test:" + std::to_string(body.size());
  }
};

class RecordingSink : public EventSink {
public:
  void opportunityDiscovered(const MultiPathOpportunity &opp) override {
    std::lock_guard<std::mutex> lock(mu_);
    discovered.push_back(opp.id);
  }
  void opportunityExecuted(const ExecutionReport &report) override {
    std::lock_guard<std::mutex> lock(mu_);
    executed.push_back(report);
  }
  void graphStats(size_t nodes, size_t edges) override {
    std::lock_guard<std::mutex> lock(mu_);
    last_nodes = nodes;
    last_edges = edges;
  }

  std::vector<ExecutionReport> reports() {
    std::lock_guard<std::mutex> lock(mu_);
    return executed;
  }

  std::vector<std::string> discovered;
  size_t last_nodes = 0;
  size_t last_edges = 0;

private:
  std::mutex mu_;
  std::vector<ExecutionReport> executed;
};

// ── Scenario builders ────────────────────────────────────────────────
inline Token token(char c, const std::string &symbol) {
  return Token{addr(c), symbol, 18};
}

inline PoolUpdate pool(char id, const Token &t0, const Token &t1, double r0,
                       double r1, uint64_t block = 0) {
  PoolUpdate u;
  u.pool_id = addr(id);
  u.venue = "uniswap_v2";
  u.token0 = t0;
  u.token1 = t1;
  u.reserve0 = r0;
  u.reserve1 = r1;
  u.fee = 0.003;
  u.block_number = block;
  u.received_at = Clock::now();
  return u;
}

const Token kA = token('1', "WETH");
const Token kB = token('2', "USDC");
const Token kC = token('3', "DAI");
const std::string kPoolAB = addr('4');
const std::string kPoolBC = addr('5');
const std::string kPoolCA = addr('6');

// A->B->C->A yields ~1.0108 after three 0.3% fees
inline void loadProfitableTriangle(LiquidityGraph &graph) {
  graph.applyUpdate(pool('4', kA, kB, 1e6, 1e6));
  graph.applyUpdate(pool('5', kB, kC, 1e6, 1.02e6));
  graph.applyUpdate(pool('6', kC, kA, 1e6, 1e6));
}

// Same shape, C->A priced so neither direction is profitable
inline void loadFlatTriangle(LiquidityGraph &graph) {
  graph.applyUpdate(pool('4', kA, kB, 1e6, 1e6));
  graph.applyUpdate(pool('5', kB, kC, 1e6, 1.02e6));
  graph.applyUpdate(pool('6', kC, kA, 1e6, 0.98e6));
}

inline Config testConfig() {
  Config cfg;
  cfg.wallet_address = addr('7');
  cfg.executor_address = addr('8');
  cfg.monte_carlo_trials = 200;
  cfg.hill_climb_iterations = 100;
  cfg.poll_interval_ms = 1;
  cfg.relay_max_retries = 2;
  cfg.relay_retry_delay_ms = 0;
  cfg.blocks_into_future = 2;
  cfg.max_wait_blocks = 2;
  return cfg;
}

// Relay that simulates `gross` profit-token units per tx, charges `gas_eth`
// and accepts every bundle
inline void scriptHappyRelay(FakeTransport &relay, double gross = 9.0,
                             double gas_eth = 0.01) {
  relay.handlers["eth_callBundle"] = [gross, gas_eth](const json &params) {
    json results = json::array();
    for (size_t i = 0; i < params[0]["txs"].size(); i++) {
      results.push_back(
          {{"txHash", "0xhash" + std::to_string(i)},
           {"gasUsed", 210000},
           {"value", "0x" + decimalToWord(toBaseUnits(gross, 18))}});
    }
    return json{{"results", results},
                {"totalGasUsed", "0x33450"},
                {"gasFees", toHex(static_cast<uint64_t>(gas_eth * 1e18))},
                {"coinbaseDiff", "0x0"}};
  };
  relay.handlers["eth_sendBundle"] = [](const json &) {
    return json{{"bundleHash", "0xbundle1"}};
  };
  relay.handlers["flashbots_getBundleStatsV2"] = [](const json &) {
    return json{{"isSimulated", true}};
  };
}

} // namespace testing
} // namespace dexarb
