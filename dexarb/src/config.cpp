#include "dexarb/config.hpp"
#include "dexarb/errors.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace dexarb {

template <typename T>
static void read(const json &section, const char *key, T &out) {
  if (!section.is_object() || !section.contains(key))
    return;
  try {
    out = section.at(key).get<T>();
  } catch (const json::exception &e) {
    throw ConfigError(std::string("config key '") + key + "': " + e.what());
  }
}

static const json &section(const json &j, const char *name) {
  static const json empty = json::object();
  return j.contains(name) && j[name].is_object() ? j[name] : empty;
}

void applyJson(Config &cfg, const json &j) {
  if (!j.is_object())
    throw ConfigError("config root must be an object");

  const json &d = section(j, "discovery");
  read(d, "max_hops", cfg.max_hops);
  read(d, "max_results", cfg.max_results);
  read(d, "edge_ttl_ms", cfg.edge_ttl_ms);
  read(d, "max_pool_impact", cfg.max_pool_impact);
  read(d, "min_yield_edge", cfg.min_yield_edge);
  read(d, "yield_tie_tolerance", cfg.yield_tie_tolerance);
  read(d, "start_tokens", cfg.start_tokens);
  read(d, "scan_interval_ms", cfg.scan_interval_ms);
  read(d, "prune_interval_s", cfg.prune_interval_s);

  const json &a = section(j, "allocation");
  read(a, "monte_carlo_trials", cfg.monte_carlo_trials);
  read(a, "hill_climb_iterations", cfg.hill_climb_iterations);
  read(a, "min_allocation", cfg.min_allocation);
  read(a, "gas_cost_per_path", cfg.gas_cost_per_path);
  read(a, "capital_limit", cfg.capital_limit);
  read(a, "max_paths_per_group", cfg.max_paths_per_group);
  read(a, "grouping", cfg.grouping);
  read(a, "min_group_similarity", cfg.min_group_similarity);
  read(a, "seed", cfg.seed);

  const json &e = section(j, "execution");
  read(e, "min_profit_threshold", cfg.min_profit_threshold);
  read(e, "max_concurrent_executions", cfg.max_concurrent_executions);
  read(e, "blocks_into_future", cfg.blocks_into_future);
  read(e, "max_wait_blocks", cfg.max_wait_blocks);
  read(e, "poll_interval_ms", cfg.poll_interval_ms);
  read(e, "slippage_tolerance", cfg.slippage_tolerance);
  read(e, "wallet_address", cfg.wallet_address);
  read(e, "executor_address", cfg.executor_address);
  read(e, "route_selector", cfg.route_selector);
  read(e, "flash_selector", cfg.flash_selector);
  read(e, "hop_gas_limit", cfg.hop_gas_limit);
  read(e, "base_gas_limit", cfg.base_gas_limit);
  read(e, "flash_loan_pool", cfg.flash_loan_pool);
  read(e, "flash_loan_fee", cfg.flash_loan_fee);
  read(e, "flash_loan_gas_overhead", cfg.flash_loan_gas_overhead);

  const json &r = section(j, "relay");
  read(r, "url", cfg.relay_url);
  read(r, "alternates", cfg.alternate_relays);
  read(r, "key_id", cfg.relay_key_id);
  read(r, "key_path", cfg.relay_key_path);
  read(r, "timeout_ms", cfg.relay_timeout_ms);
  read(r, "max_retries", cfg.relay_max_retries);
  read(r, "retry_delay_ms", cfg.relay_retry_delay_ms);

  const json &g = section(j, "gas");
  read(g, "price_multiplier", cfg.gas_price_multiplier);
  read(g, "priority_premium_gwei", cfg.priority_premium_gwei);
  read(g, "max_priority_fee_gwei", cfg.max_priority_fee_gwei);
  read(g, "gas_token_rate", cfg.gas_token_rate);

  const json &c = section(j, "chain");
  read(c, "rpc_url", cfg.rpc_url);
  read(c, "signer_url", cfg.signer_url);
  read(c, "chain_id", cfg.chain_id);
  read(c, "feed_url", cfg.feed_url);
  read(c, "pools", cfg.pools);

  read(j, "log_dir", cfg.log_dir);

  // Flat operator keys
  read(j, "maxHops", cfg.max_hops);
  read(j, "minProfitThreshold", cfg.min_profit_threshold);
  read(j, "maxConcurrentExecutions", cfg.max_concurrent_executions);
  read(j, "blocksIntoFuture", cfg.blocks_into_future);
  read(j, "maxWaitBlocks", cfg.max_wait_blocks);
  read(j, "gasPriceMultiplier", cfg.gas_price_multiplier);
  read(j, "monteCarloTrials", cfg.monte_carlo_trials);
}

void applyConfigFile(Config &cfg, const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw ConfigError("cannot open config file: " + path);
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded())
    throw ConfigError("config file is not valid JSON: " + path);
  applyJson(cfg, j);
  spdlog::info("Loaded config from {}", path);
}

void applyEnv(Config &cfg) {
  if (auto *v = std::getenv("DEXARB_RELAY_KEY"))
    cfg.relay_key_path = v;
  if (auto *v = std::getenv("DEXARB_RELAY_KEY_ID"))
    cfg.relay_key_id = v;
  if (auto *v = std::getenv("DEXARB_RPC_URL"))
    cfg.rpc_url = v;
  if (auto *v = std::getenv("DEXARB_SIGNER_URL"))
    cfg.signer_url = v;
  if (auto *v = std::getenv("DEXARB_WALLET"))
    cfg.wallet_address = v;
  if (auto *v = std::getenv("DEXARB_EXECUTOR"))
    cfg.executor_address = v;
  if (auto *v = std::getenv("DEXARB_FEED_URL"))
    cfg.feed_url = v;
}

static int toInt(const std::string &flag, const char *v) {
  try {
    return std::stoi(v);
  } catch (const std::exception &) {
    throw ConfigError(flag + " expects an integer, got '" + v + "'");
  }
}

static double toDouble(const std::string &flag, const char *v) {
  try {
    return std::stod(v);
  } catch (const std::exception &) {
    throw ConfigError(flag + " expects a number, got '" + v + "'");
  }
}

Config parseArgs(int argc, char *argv[], bool &show_help) {
  Config cfg;
  show_help = false;

  for (int i = 1; i + 1 < argc; i++) {
    if (std::string(argv[i]) == "--config")
      applyConfigFile(cfg, argv[i + 1]);
  }
  applyEnv(cfg);

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "--help" || arg == "-h")
      show_help = true;
    else if (arg == "--config" && has_value)
      ++i;
    else if (arg == "--max-hops" && has_value)
      cfg.max_hops = toInt(arg, argv[++i]);
    else if (arg == "--min-profit" && has_value)
      cfg.min_profit_threshold = toDouble(arg, argv[++i]);
    else if (arg == "--max-concurrent" && has_value)
      cfg.max_concurrent_executions = toInt(arg, argv[++i]);
    else if (arg == "--blocks-into-future" && has_value)
      cfg.blocks_into_future = toInt(arg, argv[++i]);
    else if (arg == "--max-wait-blocks" && has_value)
      cfg.max_wait_blocks = toInt(arg, argv[++i]);
    else if (arg == "--gas-multiplier" && has_value)
      cfg.gas_price_multiplier = toDouble(arg, argv[++i]);
    else if (arg == "--trials" && has_value)
      cfg.monte_carlo_trials = toInt(arg, argv[++i]);
    else if (arg == "--feed-url" && has_value)
      cfg.feed_url = argv[++i];
    else if (arg == "--relay" && has_value)
      cfg.relay_url = argv[++i];
    else if (arg == "--alt-relay" && has_value)
      cfg.alternate_relays.push_back(argv[++i]);
    else if (arg == "--start-token" && has_value)
      cfg.start_tokens.push_back(argv[++i]);
    else if (arg == "--log-dir" && has_value)
      cfg.log_dir = argv[++i];
    else
      spdlog::warn("Ignoring unknown argument: {}", arg);
  }
  return cfg;
}

void validateConfig(const Config &cfg) {
  auto require = [](bool ok, const std::string &what) {
    if (!ok)
      throw ConfigError("invalid config: " + what);
  };
  require(cfg.max_hops >= 2, "max_hops must be >= 2");
  require(cfg.max_results >= 1, "max_results must be >= 1");
  require(cfg.edge_ttl_ms > 0, "edge_ttl_ms must be > 0");
  require(cfg.max_pool_impact > 0.0 && cfg.max_pool_impact <= 1.0,
          "max_pool_impact must be in (0, 1]");
  require(cfg.min_yield_edge >= 0.0, "min_yield_edge must be >= 0");
  require(cfg.monte_carlo_trials >= 0, "monte_carlo_trials must be >= 0");
  require(cfg.max_paths_per_group >= 1, "max_paths_per_group must be >= 1");
  require(cfg.grouping == "start_token" || cfg.grouping == "token_overlap",
          "grouping must be start_token or token_overlap");
  require(cfg.min_group_similarity >= 0.0 && cfg.min_group_similarity <= 1.0,
          "min_group_similarity must be in [0, 1]");
  require(cfg.max_concurrent_executions >= 1,
          "max_concurrent_executions must be >= 1");
  require(cfg.blocks_into_future >= 1, "blocks_into_future must be >= 1");
  require(cfg.max_wait_blocks >= 0, "max_wait_blocks must be >= 0");
  require(cfg.gas_price_multiplier > 0.0, "gas_price_multiplier must be > 0");
  require(cfg.max_priority_fee_gwei >= 0.0 && cfg.priority_premium_gwei >= 0.0,
          "priority fees must be >= 0");
  require(cfg.slippage_tolerance >= 0.0 && cfg.slippage_tolerance < 1.0,
          "slippage_tolerance must be in [0, 1)");
  require(cfg.flash_loan_fee >= 0.0 && cfg.flash_loan_fee < 1.0,
          "flash_loan_fee must be in [0, 1)");
  require(!cfg.relay_url.empty(), "relay url is required");
  require(cfg.relay_timeout_ms > 0, "relay timeout must be > 0");
}

const char *usage() {
  return R"(
╔═══════════════════════════════════════════════════════════╗
║          DEXARB - DEX Cycle Arbitrage Engine              ║
║     Bellman-Ford · Monte Carlo sizing · Private relay     ║
╚═══════════════════════════════════════════════════════════╝

Usage: dexarb [OPTIONS]

Options:
  --config <FILE>           JSON config file
  --max-hops <N>            Longest cycle to search (default: 4)
  --min-profit <AMOUNT>     Minimum simulated net profit (default: 0)
  --max-concurrent <N>      Pipelines in flight (default: 4)
  --blocks-into-future <N>  Target block offset (default: 2)
  --max-wait-blocks <N>     Inclusion window (default: 5)
  --gas-multiplier <X>      Base fee multiplier (default: 1.1)
  --trials <N>              Monte Carlo trials (default: 1000)
  --feed-url <URL>          Pool update WebSocket
  --relay <URL>             Primary relay
  --alt-relay <URL>         Failover relay (repeatable)
  --start-token <ADDR>      Cycle start token (repeatable)
  --log-dir <DIR>           Event/CSV output (default: logs)
  --help, -h                Show this help

Environment:
  DEXARB_RELAY_KEY          PEM path of the relay identity key
  DEXARB_RELAY_KEY_ID       Identity announced with relay signatures
  DEXARB_RPC_URL            Ethereum JSON-RPC node
  DEXARB_SIGNER_URL         Remote signer holding the trading key
  DEXARB_WALLET             Trading wallet address
  DEXARB_EXECUTOR           Executor contract address
  DEXARB_FEED_URL           Pool update WebSocket
)";
}

} // namespace dexarb
