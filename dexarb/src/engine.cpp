#include "dexarb/engine.hpp"
#include "dexarb/errors.hpp"
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace dexarb {

ArbitrageEngine::ArbitrageEngine(const Config &config, LiquidityGraph &graph,
                                 Orchestrator &orchestrator,
                                 std::shared_ptr<EventSink> sink,
                                 std::unique_ptr<GroupingPolicy> grouping)
    : config_(config), graph_(graph), orchestrator_(orchestrator),
      sink_(std::move(sink)), grouping_(std::move(grouping)),
      finder_(config) {
  if (!grouping_)
    grouping_ = GroupingPolicy::create(config_);
}

void ArbitrageEngine::notifyChange() {
  {
    std::lock_guard<std::mutex> lock(wake_mu_);
    dirty_ = true;
  }
  wake_cv_.notify_one();
}

std::vector<MultiPathOpportunity> ArbitrageEngine::discover() {
  auto snap = graph_.snapshot();
  if (sink_)
    sink_->graphStats(snap->nodeCount(), snap->edgeCount());

  std::vector<std::string> starts = config_.start_tokens;
  if (starts.empty()) {
    for (const auto &kv : snap->tokens)
      starts.push_back(kv.first);
  }

  std::vector<ArbitragePath> paths;
  std::unordered_set<std::string> seen;
  size_t rotations = 0;
  for (const auto &token : starts) {
    auto found = finder_.findCycles(*snap, token, config_.max_hops,
                                    config_.max_results);
    for (auto &path : found) {
      if (!seen.insert(path.poolSetKey()).second) {
        rotations++;
        continue;
      }
      paths.push_back(std::move(path));
    }
  }
  if (rotations > 0)
    spdlog::debug("[Engine] Skipped {} rotations of cycles already found",
                  rotations);

  std::vector<MultiPathOpportunity> opps;
  for (auto &group : grouping_->group(paths)) {
    MultiPathOpportunity opp;
    opp.id = "opp-" + std::to_string(next_id_++);
    opp.created_at = Clock::now();
    double confidence = 1.0;
    for (const auto &p : group) {
      opp.expected_profit += p.expected_profit;
      confidence = std::min(confidence, p.confidence);
    }
    opp.confidence = group.empty() ? 0.0 : confidence;
    opp.paths = std::move(group);
    opps.push_back(std::move(opp));
  }
  return opps;
}

size_t ArbitrageEngine::runOnce() {
  auto start = Clock::now();
  orchestrator_.reap();

  size_t accepted = 0;
  auto opps = discover();
  for (auto &opp : opps) {
    if (sink_)
      sink_->opportunityDiscovered(opp);
    if (orchestrator_.dispatch(std::move(opp)))
      accepted++;
  }

  int cycle = ++cycles_;
  if (!opps.empty()) {
    spdlog::info("── Cycle {} ── opportunities={}, dispatched={}, "
                 "in_flight={}, elapsed={:.1f}ms ──",
                 cycle, opps.size(), accepted, orchestrator_.inFlight(),
                 elapsed_ms(start));
  }
  return accepted;
}

bool ArbitrageEngine::run() {
  running_ = true;
  auto last_prune = Clock::now();
  const auto scan = std::chrono::milliseconds(config_.scan_interval_ms);
  const auto prune_every = std::chrono::seconds(config_.prune_interval_s);
  spdlog::info("[Engine] Discovery loop started");

  while (running_) {
    {
      std::unique_lock<std::mutex> lock(wake_mu_);
      wake_cv_.wait_for(lock, scan, [this] { return dirty_ || !running_; });
      dirty_ = false;
    }
    if (!running_)
      break;

    try {
      if (Clock::now() - last_prune > prune_every) {
        graph_.pruneStale(std::chrono::milliseconds(config_.edge_ttl_ms));
        last_prune = Clock::now();
      }
      runOnce();
    } catch (const FatalEngineError &e) {
      spdlog::critical("[Engine] Fatal: {}", e.what());
      running_ = false;
      return false;
    } catch (const std::exception &e) {
      spdlog::error("[Engine] Cycle {} error: {}", cycles_.load(), e.what());
    }
  }

  spdlog::info("[Engine] Waiting for {} in-flight executions",
               orchestrator_.inFlight());
  try {
    orchestrator_.waitIdle();
  } catch (const FatalEngineError &e) {
    spdlog::critical("[Engine] Fatal during shutdown: {}", e.what());
    return false;
  }
  return true;
}

void ArbitrageEngine::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mu_);
    running_ = false;
  }
  wake_cv_.notify_all();
}

} // namespace dexarb
