#include "dexarb/liquidity_graph.hpp"
#include <cmath>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace dexarb {

static Edge makeEdge(const PoolUpdate &p, bool forward) {
  Edge e;
  e.pool_id = p.pool_id;
  e.venue = p.venue;
  e.token_in = forward ? p.token0 : p.token1;
  e.token_out = forward ? p.token1 : p.token0;
  e.reserve_in = forward ? p.reserve0 : p.reserve1;
  e.reserve_out = forward ? p.reserve1 : p.reserve0;
  e.fee = p.fee;
  e.weight = LiquidityGraph::edgeWeight(e.reserve_in, e.reserve_out, e.fee);
  e.block_number = p.block_number;
  e.updated_at = p.received_at;
  return e;
}

// ── GraphSnapshot ────────────────────────────────────────────────────
size_t GraphSnapshot::edgeCount() const {
  size_t n = 0;
  for (const auto &kv : adjacency)
    n += kv.second.size();
  return n;
}

const std::vector<Edge> &GraphSnapshot::outgoing(const std::string &token) const {
  static const std::vector<Edge> none;
  auto it = adjacency.find(token);
  return it == adjacency.end() ? none : it->second;
}

std::optional<Edge> GraphSnapshot::edge(const std::string &pool_id,
                                        const std::string &token_in) const {
  for (const auto &e : outgoing(token_in)) {
    if (e.pool_id == pool_id)
      return e;
  }
  return std::nullopt;
}

// ── LiquidityGraph ───────────────────────────────────────────────────
LiquidityGraph::LiquidityGraph(const Config &config) : config_(config) {}

double LiquidityGraph::edgeWeight(double reserve_in, double reserve_out,
                                  double fee) {
  return -std::log((reserve_out / reserve_in) * (1.0 - fee));
}

bool LiquidityGraph::validate(const PoolUpdate &u, std::string &why) {
  if (u.pool_id.empty()) {
    why = "missing pool id";
    return false;
  }
  if (u.token0.address.empty() || u.token1.address.empty()) {
    why = "missing token address";
    return false;
  }
  if (normalizeAddress(u.token0.address) == normalizeAddress(u.token1.address)) {
    why = "identical tokens";
    return false;
  }
  if (!std::isfinite(u.reserve0) || !std::isfinite(u.reserve1) ||
      u.reserve0 <= 0.0 || u.reserve1 <= 0.0) {
    why = "zero or invalid liquidity";
    return false;
  }
  if (!std::isfinite(u.fee) || u.fee < 0.0 || u.fee >= 1.0) {
    why = "fee outside [0, 1)";
    return false;
  }
  return true;
}

bool LiquidityGraph::applyUpdate(const PoolUpdate &update) {
  std::string why;
  if (!validate(update, why)) {
    spdlog::warn("[Graph] Rejected update for pool '{}' ({}): {}",
                 update.pool_id, update.venue, why);
    return false;
  }

  PoolUpdate p = update;
  p.token0.address = normalizeAddress(p.token0.address);
  p.token1.address = normalizeAddress(p.token1.address);

  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = pools_.find(p.pool_id);
    if (it != pools_.end() && p.block_number != 0 &&
        p.block_number <= it->second.block_number) {
      spdlog::debug("[Graph] Ignoring update for {} at block {} (have {})",
                    p.pool_id, p.block_number, it->second.block_number);
      return true;
    }
    pools_[p.pool_id] = p;
    cached_.reset();
  }

  notifyChange();
  return true;
}

bool LiquidityGraph::removePool(const std::string &pool_id) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (pools_.erase(pool_id) == 0)
      return false;
    cached_.reset();
  }
  spdlog::info("[Graph] Removed pool {}", pool_id);
  notifyChange();
  return true;
}

size_t LiquidityGraph::pruneStale(std::chrono::milliseconds ttl) {
  size_t removed = 0;
  auto now = Clock::now();
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = pools_.begin(); it != pools_.end();) {
      if (now - it->second.received_at > ttl) {
        it = pools_.erase(it);
        removed++;
      } else {
        ++it;
      }
    }
    if (removed > 0)
      cached_.reset();
  }
  if (removed > 0) {
    spdlog::info("[Graph] Pruned {} stale pools", removed);
    notifyChange();
  }
  return removed;
}

std::shared_ptr<const GraphSnapshot> LiquidityGraph::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!cached_)
    cached_ = buildSnapshot();
  return cached_;
}

// Caller holds mu_
std::shared_ptr<const GraphSnapshot> LiquidityGraph::buildSnapshot() const {
  auto snap = std::make_shared<GraphSnapshot>();
  snap->taken_at = Clock::now();
  for (const auto &kv : pools_) {
    const auto &p = kv.second;
    snap->tokens[p.token0.address] = p.token0;
    snap->tokens[p.token1.address] = p.token1;
    snap->adjacency[p.token0.address].push_back(makeEdge(p, true));
    snap->adjacency[p.token1.address].push_back(makeEdge(p, false));
  }
  return snap;
}

bool LiquidityGraph::isFresh(const std::vector<std::string> &pool_ids,
                             std::chrono::milliseconds ttl) const {
  auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto &id : pool_ids) {
    auto it = pools_.find(id);
    if (it == pools_.end() || now - it->second.received_at > ttl)
      return false;
  }
  return true;
}

void LiquidityGraph::setOnChange(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mu_);
  on_change_ = std::move(callback);
}

void LiquidityGraph::notifyChange() {
  std::function<void()> cb;
  {
    std::lock_guard<std::mutex> lock(mu_);
    cb = on_change_;
  }
  if (cb)
    cb();
}

size_t LiquidityGraph::nodeCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::unordered_set<std::string> nodes;
  for (const auto &kv : pools_) {
    nodes.insert(kv.second.token0.address);
    nodes.insert(kv.second.token1.address);
  }
  return nodes.size();
}

size_t LiquidityGraph::edgeCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pools_.size() * 2;
}

size_t LiquidityGraph::poolCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pools_.size();
}

} // namespace dexarb
