#include "dexarb/bundle_client.hpp"
#include "dexarb/chain_client.hpp"
#include "dexarb/common.hpp"
#include "dexarb/config.hpp"
#include "dexarb/engine.hpp"
#include "dexarb/errors.hpp"
#include "dexarb/event_log.hpp"
#include "dexarb/flash_loan.hpp"
#include "dexarb/http_transport.hpp"
#include "dexarb/liquidity_graph.hpp"
#include "dexarb/orchestrator.hpp"
#include "dexarb/pool_feed.hpp"
#include "dexarb/request_signer.hpp"
#include "dexarb/swap_encoder.hpp"
#include "dexarb/transaction_signer.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <future>
#include <iostream>
#include <string>
#include <thread>

using namespace dexarb;

static volatile std::sig_atomic_t running = 1;

static void signalHandler(int) { running = 0; }

// ── Main pipeline ────────────────────────────────────────────────────
int main(int argc, char *argv[]) {
  // Setup logging
  auto console = spdlog::stdout_color_mt("dexarb");
  spdlog::set_default_logger(console);
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  // Parse config
  Config cfg;
  try {
    bool show_help = false;
    cfg = parseArgs(argc, argv, show_help);
    if (show_help) {
      std::cout << usage();
      return 0;
    }
    validateConfig(cfg);
  } catch (const ConfigError &e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  // Signal handler for graceful shutdown
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  // Banner
  spdlog::info("╔═══════════════════════════════════════════════════════╗");
  spdlog::info("║          DEXARB - DEX Cycle Arbitrage Engine          ║");
  spdlog::info("╚═══════════════════════════════════════════════════════╝");
  spdlog::info("Relay: {} (+{} failover)", cfg.relay_url,
               cfg.alternate_relays.size());
  spdlog::info("Max hops: {}", cfg.max_hops);
  spdlog::info("Min profit: {:.6f}", cfg.min_profit_threshold);
  spdlog::info("Max concurrent: {}", cfg.max_concurrent_executions);
  spdlog::info("Target: head+{}, wait {} blocks", cfg.blocks_into_future,
               cfg.max_wait_blocks);
  spdlog::info("Flash loans: {}",
               cfg.flash_loan_pool.empty() ? "❌ disabled" : "✅");

  if (cfg.wallet_address.empty() || cfg.executor_address.empty()) {
    spdlog::error("DEXARB_WALLET and DEXARB_EXECUTOR must be set.");
    return 1;
  }
  if (cfg.signer_url.empty()) {
    spdlog::error("DEXARB_SIGNER_URL not set. Required to sign bundles.");
    return 1;
  }
  if (cfg.feed_url.empty()) {
    spdlog::error("No pool feed configured (--feed-url).");
    return 1;
  }

  bool ok = true;
  try {
    // ── Initialize components ────────────────────────────────────────
    auto rpc_transport = std::make_shared<CurlTransport>(cfg.relay_timeout_ms);
    auto relay_transport =
        std::make_shared<CurlTransport>(cfg.relay_timeout_ms);

    auto chain = std::make_shared<RpcChainClient>(rpc_transport, cfg.rpc_url);
    auto tx_signer = std::make_shared<RemoteTransactionSigner>(
        rpc_transport, cfg.signer_url, cfg.wallet_address, cfg.chain_id);
    std::shared_ptr<RequestSigner> relay_signer =
        std::make_shared<EvpRequestSigner>(cfg.relay_key_id,
                                           cfg.relay_key_path);

    std::vector<std::shared_ptr<BundleClient>> relays;
    relays.push_back(std::make_shared<BundleClient>(
        cfg, cfg.relay_url, relay_transport, relay_signer, tx_signer, chain));
    for (const auto &url : cfg.alternate_relays) {
      relays.push_back(std::make_shared<BundleClient>(
          cfg, url, relay_transport, relay_signer, tx_signer, chain));
    }

    std::shared_ptr<FlashLoanProvider> flash_loans;
    if (!cfg.flash_loan_pool.empty())
      flash_loans = std::make_shared<AaveFlashLoanProvider>(cfg);

    auto sink = std::make_shared<EventLog>(cfg.log_dir);
    LiquidityGraph graph(cfg);
    Orchestrator orchestrator(cfg, graph, chain, relays,
                              std::make_shared<ExecutorSwapEncoder>(cfg),
                              flash_loans, sink);
    ArbitrageEngine engine(cfg, graph, orchestrator, sink, nullptr);
    graph.setOnChange([&engine] { engine.notifyChange(); });

    // ── Pool feed ────────────────────────────────────────────────────
    WebSocketPoolFeed feed(cfg.feed_url);
    feed.subscribe(cfg.pools,
                   [&graph](const PoolUpdate &u) { graph.applyUpdate(u); });
    feed.start();

    // ── Main loop ────────────────────────────────────────────────────
    auto loop = std::async(std::launch::async, [&engine] { return engine.run(); });
    while (running &&
           loop.wait_for(std::chrono::milliseconds(200)) !=
               std::future_status::ready) {
    }

    engine.stop();
    feed.stop();
    ok = loop.get();
    spdlog::info("Shutting down gracefully after {} cycles.", engine.cycles());
  } catch (const FatalEngineError &e) {
    spdlog::critical("Fatal: {}", e.what());
    ok = false;
  } catch (const std::exception &e) {
    spdlog::error("Startup failed: {}", e.what());
    ok = false;
  }

  return ok ? 0 : 1;
}
