#pragma once
#include "dexarb/bundle_client.hpp"
#include "dexarb/capital_allocator.hpp"
#include "dexarb/chain_client.hpp"
#include "dexarb/common.hpp"
#include "dexarb/event_log.hpp"
#include "dexarb/flash_loan.hpp"
#include "dexarb/liquidity_graph.hpp"
#include "dexarb/swap_encoder.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <set>

namespace dexarb {

// Drives one opportunity through
//   DISCOVERED -> ALLOCATED -> BUNDLE_BUILT -> SIMULATED -> SUBMITTED
//     -> INCLUDED | FAILED | EXPIRED
// One function per stage; a stage that fails records the reason and stops
// the pipeline. Only FatalEngineError escapes.
class Orchestrator {
public:
  // relays: primary first, then failover order. flash_loans may be null.
  Orchestrator(const Config &config, LiquidityGraph &graph,
               std::shared_ptr<ChainClient> chain,
               std::vector<std::shared_ptr<BundleClient>> relays,
               std::shared_ptr<SwapEncoder> encoder,
               std::shared_ptr<FlashLoanProvider> flash_loans,
               std::shared_ptr<EventSink> sink);
  ~Orchestrator();

  // Runs the whole pipeline on the calling thread
  ExecutionReport execute(MultiPathOpportunity opp);

  // Runs the pipeline on its own task. Returns false (opportunity dropped)
  // when max_concurrent_executions pipelines are already in flight or one
  // of its pools is held by another pipeline.
  bool dispatch(MultiPathOpportunity opp);

  // Collects finished tasks; rethrows a FatalEngineError raised by one
  size_t reap();
  void waitIdle();

  int inFlight() const { return in_flight_.load(); }

private:
  struct Pipeline {
    MultiPathOpportunity opp;
    ExecutionReport report;
    Allocation allocation;
    Token token;
    double wallet_balance = 0.0;
    Bundle bundle;
    SimulationResult sim;
    SubmissionHandle handle;
    size_t relay = 0;
  };

  Config config_;
  LiquidityGraph &graph_;
  std::shared_ptr<ChainClient> chain_;
  std::vector<std::shared_ptr<BundleClient>> relays_;
  std::shared_ptr<SwapEncoder> encoder_;
  std::shared_ptr<FlashLoanProvider> flash_loans_;
  std::shared_ptr<EventSink> sink_;
  CapitalAllocator allocator_;

  std::atomic<int> in_flight_{0};
  std::atomic<size_t> preferred_relay_{0};
  std::mutex tasks_mu_;
  std::vector<std::future<ExecutionReport>> tasks_;
  std::mutex pools_mu_;
  std::set<std::string> busy_pools_;

  // ── Stages ─────────────────────────────────────────────────────────
  bool allocate(Pipeline &p);
  bool buildBundle(Pipeline &p);
  bool simulate(Pipeline &p);
  bool submit(Pipeline &p);
  void monitor(Pipeline &p);

  bool stillProfitable(const Pipeline &p, std::string &why) const;
  bool withFailover(Pipeline &p, const std::function<void(BundleClient &)> &fn);
  void transition(Pipeline &p, OpportunityState next);
  void fail(Pipeline &p, FailureReason reason, const std::string &detail);
  void finish(Pipeline &p, Clock::time_point start);
  void release(const std::vector<std::string> &pools);
};

} // namespace dexarb
