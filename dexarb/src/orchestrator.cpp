#include "dexarb/orchestrator.hpp"
#include "dexarb/errors.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace dexarb {

Orchestrator::Orchestrator(const Config &config, LiquidityGraph &graph,
                           std::shared_ptr<ChainClient> chain,
                           std::vector<std::shared_ptr<BundleClient>> relays,
                           std::shared_ptr<SwapEncoder> encoder,
                           std::shared_ptr<FlashLoanProvider> flash_loans,
                           std::shared_ptr<EventSink> sink)
    : config_(config), graph_(graph), chain_(std::move(chain)),
      relays_(std::move(relays)), encoder_(std::move(encoder)),
      flash_loans_(std::move(flash_loans)), sink_(std::move(sink)),
      allocator_(config) {
  if (relays_.empty())
    throw ConfigError("at least one relay is required");
}

Orchestrator::~Orchestrator() {
  std::lock_guard<std::mutex> lock(tasks_mu_);
  for (auto &f : tasks_) {
    if (f.valid())
      f.wait();
  }
}

// ── Bookkeeping ──────────────────────────────────────────────────────
void Orchestrator::transition(Pipeline &p, OpportunityState next) {
  p.report.state = next;
  p.report.trace.push_back(next);
  spdlog::debug("[Exec] {} -> {}", p.opp.id, toString(next));
}

void Orchestrator::fail(Pipeline &p, FailureReason reason,
                        const std::string &detail) {
  p.report.reason = reason;
  p.report.detail = detail;
  transition(p, OpportunityState::FAILED);
}

void Orchestrator::finish(Pipeline &p, Clock::time_point start) {
  p.report.elapsed_ms = elapsed_ms(start);
  if (sink_)
    sink_->opportunityExecuted(p.report);
}

// Runs fn against relays starting from the last one that answered
bool Orchestrator::withFailover(
    Pipeline &p, const std::function<void(BundleClient &)> &fn) {
  const size_t n = relays_.size();
  const size_t first = preferred_relay_.load() % n;
  std::string last_error;
  for (size_t k = 0; k < n; k++) {
    size_t idx = (first + k) % n;
    try {
      fn(*relays_[idx]);
      p.relay = idx;
      preferred_relay_ = idx;
      return true;
    } catch (const RelayUnavailableError &e) {
      last_error = e.what();
      spdlog::warn("[Exec] Relay {} unavailable, failing over: {}",
                   relays_[idx]->relayUrl(), last_error);
    }
  }
  fail(p, FailureReason::RELAY_UNAVAILABLE, last_error);
  return false;
}

// ── Pipeline ─────────────────────────────────────────────────────────
ExecutionReport Orchestrator::execute(MultiPathOpportunity opp) {
  auto start = Clock::now();
  Pipeline p;
  p.opp = std::move(opp);
  p.report.opportunity_id = p.opp.id;
  p.report.expected_profit = p.opp.expected_profit;
  transition(p, OpportunityState::DISCOVERED);

  try {
    if (allocate(p) && buildBundle(p) && simulate(p) && submit(p))
      monitor(p);
  } catch (const FatalEngineError &e) {
    spdlog::critical("[Exec] {} aborted: {}", p.opp.id, e.what());
    fail(p, FailureReason::ERROR, e.what());
    finish(p, start);
    throw;
  } catch (const std::exception &e) {
    spdlog::error("[Exec] {} failed: {}", p.opp.id, e.what());
    fail(p, FailureReason::ERROR, e.what());
  }

  finish(p, start);
  return p.report;
}

bool Orchestrator::allocate(Pipeline &p) {
  if (p.opp.paths.empty()) {
    fail(p, FailureReason::UNPROFITABLE, "no paths");
    return false;
  }
  p.token = p.opp.paths.front().startToken();
  p.wallet_balance = chain_->tokenBalance(p.token, config_.wallet_address);

  double capital = config_.capital_limit;
  if (capital <= 0.0) {
    capital = 0.0;
    for (const auto &path : p.opp.paths)
      capital += path.required_input;
  }
  if (!flash_loans_)
    capital = std::min(capital, p.wallet_balance);

  p.allocation = allocator_.optimize(p.opp.paths, capital);
  if (p.allocation.empty()) {
    fail(p, FailureReason::UNPROFITABLE, "no profitable allocation");
    return false;
  }

  p.opp.allocation = p.allocation.amounts;
  p.opp.expected_profit = p.allocation.expected_profit;
  p.report.expected_profit = p.allocation.expected_profit;
  p.report.capital = p.allocation.total();
  spdlog::info("[Exec] {} allocated {:.4f} {} across {} paths, "
               "expected={:.6f}",
               p.opp.id, p.report.capital, p.token.symbol,
               p.opp.paths.size(), p.report.expected_profit);
  transition(p, OpportunityState::ALLOCATED);
  return true;
}

bool Orchestrator::buildBundle(Pipeline &p) {
  std::vector<Transaction> calls;
  for (size_t i = 0; i < p.opp.paths.size(); i++) {
    double amount = p.allocation.amounts[static_cast<Eigen::Index>(i)];
    if (amount > 0.0)
      calls.push_back(encoder_->encode(p.opp.paths[i], amount));
  }

  const double required = p.allocation.total();
  std::vector<Transaction> txs;
  if (required > p.wallet_balance) {
    if (!flash_loans_) {
      fail(p, FailureReason::UNPROFITABLE,
           "capital exceeds wallet balance and flash loans are disabled");
      return false;
    }
    double fee = flash_loans_->quoteFee(p.token, required);
    if (p.allocation.expected_profit - fee <= 0.0) {
      fail(p, FailureReason::UNPROFITABLE,
           "flash loan fee " + std::to_string(fee) + " exceeds profit");
      return false;
    }
    txs.push_back(flash_loans_->wrap(calls, p.token, required));
    p.report.flash_loan = true;
    p.report.expected_profit -= fee;
    spdlog::info("[Exec] {} borrowing {:.4f} {} via {} (fee {:.6f})",
                 p.opp.id, required, p.token.symbol, flash_loans_->name(),
                 fee);
  } else {
    txs = std::move(calls);
  }

  uint64_t target = chain_->blockNumber() + config_.blocks_into_future;
  size_t relay = preferred_relay_.load() % relays_.size();
  p.bundle = relays_[relay]->build(std::move(txs), target);
  p.bundle.profit_token = p.token.address;
  p.bundle.profit_decimals = p.token.decimals;
  transition(p, OpportunityState::BUNDLE_BUILT);
  return true;
}

bool Orchestrator::simulate(Pipeline &p) {
  if (!withFailover(p, [&](BundleClient &r) { p.sim = r.simulate(p.bundle); }))
    return false;

  p.report.simulated_profit = p.sim.net_profit;
  if (!p.sim.success) {
    fail(p, FailureReason::SIMULATION_FAILED, p.sim.error);
    return false;
  }
  if (p.sim.net_profit <= 0.0) {
    fail(p, FailureReason::UNPROFITABLE,
         "simulated net " + std::to_string(p.sim.net_profit));
    return false;
  }
  if (p.sim.net_profit < config_.min_profit_threshold) {
    fail(p, FailureReason::BELOW_THRESHOLD,
         "net " + std::to_string(p.sim.net_profit) + " < " +
             std::to_string(config_.min_profit_threshold));
    return false;
  }
  transition(p, OpportunityState::SIMULATED);
  return true;
}

// Re-prices the allocated paths on the live graph
bool Orchestrator::stillProfitable(const Pipeline &p, std::string &why) const {
  auto snap = graph_.snapshot();
  const auto now = Clock::now();
  const auto ttl = std::chrono::milliseconds(config_.edge_ttl_ms);

  std::vector<ArbitragePath> current;
  std::vector<double> amounts;
  for (size_t i = 0; i < p.opp.paths.size(); i++) {
    double amount = p.allocation.amounts[static_cast<Eigen::Index>(i)];
    if (amount <= 0.0)
      continue;
    ArbitragePath path = p.opp.paths[i];
    if (!graph_.isFresh(path.poolIds(), ttl)) {
      why = "pool removed or stale on path " + std::to_string(i);
      return false;
    }
    for (auto &hop : path.hops) {
      auto live = snap->edge(hop.pool_id, hop.token_in.address);
      if (!live) {
        why = "pool " + hop.pool_id + " removed";
        return false;
      }
      if (now - live->updated_at > ttl) {
        why = "pool " + hop.pool_id + " stale";
        return false;
      }
      hop = *live;
    }
    current.push_back(std::move(path));
    amounts.push_back(amount);
  }

  Eigen::VectorXd x =
      Eigen::Map<Eigen::VectorXd>(amounts.data(), amounts.size());
  if (allocator_.evaluate(current, x) <= 0.0) {
    why = "pool reserves moved, allocation no longer profitable";
    return false;
  }
  return true;
}

bool Orchestrator::submit(Pipeline &p) {
  std::string why;
  if (!stillProfitable(p, why)) {
    fail(p, FailureReason::INVALIDATED, why);
    return false;
  }

  std::optional<SubmissionHandle> handle;
  if (!withFailover(p, [&](BundleClient &r) { handle = r.submit(p.bundle); }))
    return false;
  if (!handle) {
    fail(p, FailureReason::SUBMISSION_REJECTED, "relay rejected the bundle");
    return false;
  }

  p.handle = *handle;
  p.report.bundle_hash = handle->bundle_hash;
  transition(p, OpportunityState::SUBMITTED);
  return true;
}

void Orchestrator::monitor(Pipeline &p) {
  const uint64_t deadline = p.handle.target_block + config_.max_wait_blocks;
  BundleClient &relay = *relays_[p.relay];
  int errors = 0;

  while (true) {
    try {
      BundleStatus st = relay.status(p.handle);
      if (st.state == BundleStatus::State::INCLUDED) {
        p.report.included_block = st.block;
        transition(p, OpportunityState::INCLUDED);
        return;
      }
      if (st.state == BundleStatus::State::REJECTED) {
        fail(p, FailureReason::REJECTED, st.reason);
        return;
      }

      uint64_t head = chain_->blockNumber();
      errors = 0;
      if (head > deadline) {
        spdlog::warn("[Exec] {} not included by block {} (head {}), "
                     "releasing capital",
                     p.opp.id, deadline, head);
        transition(p, OpportunityState::EXPIRED);
        return;
      }
    } catch (const ChainError &e) {
      // The bundle may still land, so a lost chain view expires it
      if (++errors > config_.relay_max_retries) {
        spdlog::warn("[Exec] {} lost track of the chain, releasing capital: "
                     "{}",
                     p.opp.id, e.what());
        p.report.detail = e.what();
        transition(p, OpportunityState::EXPIRED);
        return;
      }
      spdlog::warn("[Exec] {} status poll failed ({}/{}): {}", p.opp.id,
                   errors, config_.relay_max_retries, e.what());
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(config_.poll_interval_ms));
  }
}

// ── Concurrency ──────────────────────────────────────────────────────
bool Orchestrator::dispatch(MultiPathOpportunity opp) {
  std::vector<std::string> pools;
  for (const auto &path : opp.paths) {
    auto ids = path.poolIds();
    pools.insert(pools.end(), ids.begin(), ids.end());
  }

  {
    // One pipeline per pool: overlapping bundles race for the same nonce
    std::lock_guard<std::mutex> lock(pools_mu_);
    for (const auto &id : pools) {
      if (busy_pools_.count(id)) {
        spdlog::debug("[Exec] Pool {} already in flight, dropping {}", id,
                      opp.id);
        return false;
      }
    }
    int current = in_flight_.load();
    do {
      if (current >= config_.max_concurrent_executions) {
        spdlog::debug("[Exec] {} pipelines in flight, dropping {}", current,
                      opp.id);
        return false;
      }
    } while (!in_flight_.compare_exchange_weak(current, current + 1));
    busy_pools_.insert(pools.begin(), pools.end());
  }

  auto task = std::async(
      std::launch::async,
      [this, opp = std::move(opp), pools = std::move(pools)]() mutable {
        struct Release {
          Orchestrator &self;
          const std::vector<std::string> &pools;
          ~Release() { self.release(pools); }
        } guard{*this, pools};
        return execute(std::move(opp));
      });

  std::lock_guard<std::mutex> lock(tasks_mu_);
  tasks_.push_back(std::move(task));
  return true;
}

void Orchestrator::release(const std::vector<std::string> &pools) {
  {
    std::lock_guard<std::mutex> lock(pools_mu_);
    for (const auto &id : pools)
      busy_pools_.erase(id);
  }
  in_flight_--;
}

size_t Orchestrator::reap() {
  std::vector<std::future<ExecutionReport>> done;
  {
    std::lock_guard<std::mutex> lock(tasks_mu_);
    for (auto it = tasks_.begin(); it != tasks_.end();) {
      if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        done.push_back(std::move(*it));
        it = tasks_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &f : done)
    f.get();
  return done.size();
}

void Orchestrator::waitIdle() {
  std::vector<std::future<ExecutionReport>> all;
  {
    std::lock_guard<std::mutex> lock(tasks_mu_);
    all.swap(tasks_);
  }
  for (auto &f : all)
    f.get();
}

} // namespace dexarb
