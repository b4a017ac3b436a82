#pragma once
#include "dexarb/common.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace dexarb {

// Immutable point-in-time copy of the graph. Safe to share across threads.
struct GraphSnapshot {
  std::unordered_map<std::string, Token> tokens;
  std::unordered_map<std::string, std::vector<Edge>> adjacency; // by token_in
  Clock::time_point taken_at;

  size_t nodeCount() const { return tokens.size(); }
  size_t edgeCount() const;

  const std::vector<Edge> &outgoing(const std::string &token) const;
  std::optional<Edge> edge(const std::string &pool_id,
                           const std::string &token_in) const;
};

class LiquidityGraph {
public:
  explicit LiquidityGraph(const Config &config);

  // Insert or update a pool's two directed edges. Returns false for
  // malformed updates, which never enter the graph.
  bool applyUpdate(const PoolUpdate &update);

  // Venue de-listed the pool
  bool removePool(const std::string &pool_id);

  // Drop pools not updated within ttl, returns how many were removed
  size_t pruneStale(std::chrono::milliseconds ttl);

  std::shared_ptr<const GraphSnapshot> snapshot() const;

  // True when every pool exists and was updated within ttl
  bool isFresh(const std::vector<std::string> &pool_ids,
               std::chrono::milliseconds ttl) const;

  // Fired after every accepted mutation, outside the lock
  void setOnChange(std::function<void()> callback);

  size_t nodeCount() const;
  size_t edgeCount() const;
  size_t poolCount() const;

  static double edgeWeight(double reserve_in, double reserve_out, double fee);
  static bool validate(const PoolUpdate &update, std::string &why);

private:
  Config config_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, PoolUpdate> pools_;
  mutable std::shared_ptr<const GraphSnapshot> cached_; // reset on mutation
  std::function<void()> on_change_;

  std::shared_ptr<const GraphSnapshot> buildSnapshot() const;
  void notifyChange();
};

} // namespace dexarb
