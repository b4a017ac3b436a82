#pragma once
#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dexarb {

using Clock = std::chrono::steady_clock;

// ── Configuration ────────────────────────────────────────────────────
struct Config {
  // Discovery
  int max_hops = 4;
  int max_results = 20;
  int edge_ttl_ms = 60000;         // pools older than this are stale
  double max_pool_impact = 0.05;   // input / reserve_in cap per hop
  double min_yield_edge = 0.0;     // required yield above 1.0
  double yield_tie_tolerance = 1e-6;
  std::vector<std::string> start_tokens; // empty = every token
  int scan_interval_ms = 500;
  int prune_interval_s = 30;

  // Allocation
  int monte_carlo_trials = 1000;
  int hill_climb_iterations = 200;
  double min_allocation = 0.0;
  double gas_cost_per_path = 0.0; // in start-token units
  double capital_limit = 0.0;     // 0 = sum of optimal path inputs
  int max_paths_per_group = 5;
  std::string grouping = "start_token"; // or "token_overlap"
  double min_group_similarity = 0.5;
  uint32_t seed = 42;

  // Execution
  double min_profit_threshold = 0.0;
  int max_concurrent_executions = 4;
  int blocks_into_future = 2;
  int max_wait_blocks = 5;
  int poll_interval_ms = 1000;
  double slippage_tolerance = 0.005;
  std::string wallet_address;
  std::string executor_address;
  std::string route_selector = "0x8a3c7b12"; // ArbExecutor.executeRoute
  std::string flash_selector = "0x3d1f6c0e"; // ArbExecutor.flashArbitrage
  uint64_t hop_gas_limit = 150000;
  uint64_t base_gas_limit = 60000;
  std::string flash_loan_pool; // Aave pool address, empty = disabled
  double flash_loan_fee = 0.0009;
  uint64_t flash_loan_gas_overhead = 120000;

  // Relay
  std::string relay_url = "https://relay.flashbots.net";
  std::vector<std::string> alternate_relays;
  std::string relay_key_id;
  std::string relay_key_path;
  int relay_timeout_ms = 3000;
  int relay_max_retries = 3;
  int relay_retry_delay_ms = 1000;

  // Gas
  double gas_price_multiplier = 1.1;
  double priority_premium_gwei = 2.0;
  double max_priority_fee_gwei = 5.0;
  double gas_token_rate = 1.0; // profit-token units per gas-token unit

  // Chain
  std::string rpc_url = "http://localhost:8545";
  std::string signer_url;
  uint64_t chain_id = 1;
  std::string feed_url;
  std::vector<std::string> pools; // feed subscription, empty = everything
  std::string log_dir = "logs";
};

// ── Tokens and pools ─────────────────────────────────────────────────
struct Token {
  std::string address;
  std::string symbol;
  int decimals = 18;
};

inline std::string normalizeAddress(std::string addr) {
  std::transform(addr.begin(), addr.end(), addr.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return addr;
}

// Pushed by venue adapters, at-least-once.
struct PoolUpdate {
  std::string pool_id;
  std::string venue;
  Token token0;
  Token token1;
  double reserve0 = 0.0;
  double reserve1 = 0.0;
  double fee = 0.003;
  uint64_t block_number = 0;
  Clock::time_point received_at = Clock::now();
};

// One direction of a pool. weight = -ln(rate after fee).
struct Edge {
  std::string pool_id;
  std::string venue;
  Token token_in;
  Token token_out;
  double reserve_in = 0.0;
  double reserve_out = 0.0;
  double fee = 0.0;
  double weight = 0.0;
  uint64_t block_number = 0;
  Clock::time_point updated_at;

  double rate() const { return reserve_out / reserve_in * (1.0 - fee); }

  // Constant-product output for a given input
  double amountOut(double amount_in) const {
    if (amount_in <= 0.0)
      return 0.0;
    double in_after_fee = amount_in * (1.0 - fee);
    return in_after_fee * reserve_out / (reserve_in + in_after_fee);
  }
};

// ── Arbitrage ────────────────────────────────────────────────────────
struct ArbitragePath {
  std::vector<std::string> tokens; // addresses, first == last
  std::vector<std::string> venues;
  std::vector<Edge> hops;          // edge state at discovery time
  double yield = 1.0;
  double required_input = 0.0;
  double expected_profit = 0.0;
  double confidence = 0.0;

  size_t hopCount() const { return hops.size(); }
  const Token &startToken() const { return hops.front().token_in; }

  std::vector<std::string> poolIds() const {
    std::vector<std::string> ids;
    ids.reserve(hops.size());
    for (const auto &h : hops)
      ids.push_back(h.pool_id);
    return ids;
  }

  // Rotations of one cycle share this key
  std::string poolSetKey() const {
    std::vector<std::string> ids = poolIds();
    std::sort(ids.begin(), ids.end());
    std::string key;
    for (const auto &id : ids)
      key += id + "|";
    return key;
  }
};

struct MultiPathOpportunity {
  std::string id;
  std::vector<ArbitragePath> paths;
  Eigen::VectorXd allocation; // per-path capital, filled by the optimizer
  double expected_profit = 0.0;
  double confidence = 0.0;
  Clock::time_point created_at = Clock::now();
};

// ── Execution ────────────────────────────────────────────────────────
struct Transaction {
  std::string from;
  std::string to;
  std::string data;        // 0x-prefixed calldata
  std::string value = "0"; // wei, decimal
  uint64_t gas_limit = 0;
  uint64_t nonce = 0;
  double max_fee_per_gas_gwei = 0.0;
  double max_priority_fee_per_gas_gwei = 0.0;
  std::string raw;  // signed, filled by BundleClient::build
  std::string hash;
};

struct Bundle {
  std::vector<Transaction> txs;
  uint64_t target_block = 0;
  std::string profit_token;
  int profit_decimals = 18;
  double gas_token_rate = 1.0;
};

struct SimulationResult {
  bool success = false;
  std::string error;
  uint64_t gas_used = 0;
  double gas_fees = 0.0;     // gas token
  double gross_profit = 0.0; // profit token
  double net_profit = 0.0;
  std::map<std::string, double> balance_deltas;
};

struct SubmissionHandle {
  std::string bundle_hash;
  uint64_t target_block = 0;
  std::string lead_tx_hash;
  std::string relay;
};

struct BundleStatus {
  enum class State { PENDING, INCLUDED, REJECTED };
  State state = State::PENDING;
  uint64_t block = 0;
  std::string reason;
};

enum class OpportunityState {
  DISCOVERED,
  ALLOCATED,
  BUNDLE_BUILT,
  SIMULATED,
  SUBMITTED,
  INCLUDED,
  FAILED,
  EXPIRED
};

enum class FailureReason {
  NONE,
  UNPROFITABLE,
  SIMULATION_FAILED,
  BELOW_THRESHOLD,
  INVALIDATED,
  SUBMISSION_REJECTED,
  RELAY_UNAVAILABLE,
  REJECTED,
  ERROR
};

inline const char *toString(OpportunityState s) {
  switch (s) {
  case OpportunityState::DISCOVERED:
    return "DISCOVERED";
  case OpportunityState::ALLOCATED:
    return "ALLOCATED";
  case OpportunityState::BUNDLE_BUILT:
    return "BUNDLE_BUILT";
  case OpportunityState::SIMULATED:
    return "SIMULATED";
  case OpportunityState::SUBMITTED:
    return "SUBMITTED";
  case OpportunityState::INCLUDED:
    return "INCLUDED";
  case OpportunityState::FAILED:
    return "FAILED";
  case OpportunityState::EXPIRED:
    return "EXPIRED";
  }
  return "UNKNOWN";
}

inline const char *toString(FailureReason r) {
  switch (r) {
  case FailureReason::NONE:
    return "";
  case FailureReason::UNPROFITABLE:
    return "unprofitable";
  case FailureReason::SIMULATION_FAILED:
    return "simulation_failed";
  case FailureReason::BELOW_THRESHOLD:
    return "below_threshold";
  case FailureReason::INVALIDATED:
    return "invalidated";
  case FailureReason::SUBMISSION_REJECTED:
    return "submission_rejected";
  case FailureReason::RELAY_UNAVAILABLE:
    return "relay_unavailable";
  case FailureReason::REJECTED:
    return "rejected";
  case FailureReason::ERROR:
    return "error";
  }
  return "unknown";
}

struct ExecutionReport {
  std::string opportunity_id;
  OpportunityState state = OpportunityState::DISCOVERED;
  FailureReason reason = FailureReason::NONE;
  std::string detail;
  std::vector<OpportunityState> trace; // every state entered, in order
  double expected_profit = 0.0;
  double simulated_profit = 0.0;
  double capital = 0.0;
  bool flash_loan = false;
  std::string bundle_hash;
  uint64_t included_block = 0;
  double elapsed_ms = 0.0;

  bool reached(OpportunityState s) const {
    return std::find(trace.begin(), trace.end(), s) != trace.end();
  }
};

// ── Timing helper ────────────────────────────────────────────────────
inline double elapsed_ms(Clock::time_point start) {
  auto now = Clock::now();
  return std::chrono::duration<double, std::milli>(now - start).count();
}

} // namespace dexarb
