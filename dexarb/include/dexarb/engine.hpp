#pragma once
#include "dexarb/common.hpp"
#include "dexarb/event_log.hpp"
#include "dexarb/grouping_policy.hpp"
#include "dexarb/liquidity_graph.hpp"
#include "dexarb/orchestrator.hpp"
#include "dexarb/path_finder.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace dexarb {

// Discovery loop: snapshot -> cycles per start token -> groups -> dispatch.
// Wakes on graph changes or every scan interval, whichever comes first.
class ArbitrageEngine {
public:
  ArbitrageEngine(const Config &config, LiquidityGraph &graph,
                  Orchestrator &orchestrator, std::shared_ptr<EventSink> sink,
                  std::unique_ptr<GroupingPolicy> grouping);

  // One discovery pass over the current snapshot
  std::vector<MultiPathOpportunity> discover();

  // discover() and hand every opportunity to the orchestrator. Returns how
  // many were accepted.
  size_t runOnce();

  // Blocks until stop(). Returns false when a fatal error ended the loop.
  bool run();
  void stop();

  void notifyChange();

  int cycles() const { return cycles_.load(); }

private:
  Config config_;
  LiquidityGraph &graph_;
  Orchestrator &orchestrator_;
  std::shared_ptr<EventSink> sink_;
  std::unique_ptr<GroupingPolicy> grouping_;
  PathFinder finder_;

  std::atomic<bool> running_{false};
  std::atomic<int> cycles_{0};
  std::atomic<uint64_t> next_id_{1};
  std::mutex wake_mu_;
  std::condition_variable wake_cv_;
  bool dirty_ = false;
};

} // namespace dexarb
