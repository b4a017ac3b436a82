#include "dexarb/path_finder.hpp"
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace dexarb {

PathFinder::PathFinder(const Config &config) : config_(config) {}

// ── Cycle math ───────────────────────────────────────────────────────
double PathFinder::pathYield(const std::vector<Edge> &hops) {
  double y = 1.0;
  for (const auto &h : hops)
    y *= h.rate();
  return y;
}

double PathFinder::simulateOutput(const ArbitragePath &path, double amount_in) {
  double amount = amount_in;
  for (const auto &h : path.hops)
    amount = h.amountOut(amount);
  return amount;
}

// Each hop is x -> a*x / (b + c*x) with a = g*Rout, b = Rin, c = g.
// Composition stays in that family, so the whole cycle is one virtual pool
// and profit a*x/(b+c*x) - x peaks at x = (sqrt(a*b) - b) / c.
double PathFinder::optimalInput(const std::vector<Edge> &hops) {
  if (hops.empty())
    return 0.0;
  double a = 1.0, b = 1.0, c = 0.0;
  for (const auto &h : hops) {
    double g = 1.0 - h.fee;
    double ha = g * h.reserve_out, hb = h.reserve_in, hc = g;
    double na = a * ha;
    double nb = b * hb;
    double nc = hb * c + hc * a;
    a = na / nb;
    c = nc / nb;
    b = 1.0;
  }
  if (a <= b || c <= 0.0)
    return 0.0;
  return (std::sqrt(a * b) - b) / c;
}

bool PathFinder::withinImpact(const std::vector<Edge> &hops,
                              double amount_in) const {
  double amount = amount_in;
  for (const auto &h : hops) {
    if (amount > config_.max_pool_impact * h.reserve_in)
      return false;
    amount = h.amountOut(amount);
  }
  return true;
}

double PathFinder::confidence(const std::vector<Edge> &hops,
                              Clock::time_point now) const {
  double oldest_ms = 0.0;
  for (const auto &h : hops) {
    double age = std::chrono::duration<double, std::milli>(now - h.updated_at)
                     .count();
    oldest_ms = std::max(oldest_ms, age);
  }
  double freshness =
      config_.edge_ttl_ms > 0 ? 1.0 - oldest_ms / config_.edge_ttl_ms : 1.0;
  freshness = std::clamp(freshness, 0.0, 1.0);
  return freshness * std::pow(0.9, static_cast<double>(hops.size()) - 2.0);
}

// ── Discovery ────────────────────────────────────────────────────────
std::vector<ArbitragePath>
PathFinder::findCycles(const GraphSnapshot &snapshot,
                       const std::string &start_token, int max_hops,
                       int max_results) const {
  std::vector<ArbitragePath> results;
  const std::string start = normalizeAddress(start_token);
  if (max_hops < 2 || max_results <= 0 || !snapshot.tokens.count(start))
    return results;

  std::unordered_map<std::string, size_t> index;
  std::vector<std::string> names;
  for (const auto &kv : snapshot.tokens) {
    index[kv.first] = names.size();
    names.push_back(kv.first);
  }
  const size_t n = names.size();
  const size_t s = index.at(start);
  const double inf = std::numeric_limits<double>::infinity();
  const auto ttl = std::chrono::milliseconds(config_.edge_ttl_ms);
  // Age is measured at scan time; a cached snapshot can outlive its pools
  const auto now = Clock::now();

  auto stale = [&](const Edge &e) { return now - e.updated_at > ttl; };

  // dist[k][v]: lightest k-hop simple walk start -> v; pred holds its last
  // edge. Edges point into the immutable snapshot.
  std::vector<std::vector<double>> dist(max_hops, std::vector<double>(n, inf));
  std::vector<std::vector<const Edge *>> pred(
      max_hops, std::vector<const Edge *>(n, nullptr));
  dist[0][s] = 0.0;

  auto walk = [&](int k, size_t v) {
    std::vector<const Edge *> edges(k, nullptr);
    for (int layer = k; layer > 0; --layer) {
      const Edge *e = pred[layer][v];
      edges[layer - 1] = e;
      v = index.at(e->token_in.address);
    }
    return edges;
  };

  auto revisits = [](const std::vector<const Edge *> &prefix, const Edge &e,
                     bool closing) {
    for (const Edge *p : prefix) {
      if (p->pool_id == e.pool_id)
        return true;
      if (!closing && p->token_in.address == e.token_out.address)
        return true;
    }
    return false;
  };

  for (int k = 1; k < max_hops; ++k) {
    for (size_t u = 0; u < n; ++u) {
      if (dist[k - 1][u] == inf)
        continue;
      auto prefix = walk(k - 1, u);
      for (const auto &e : snapshot.outgoing(names[u])) {
        if (stale(e) || e.token_out.address == start ||
            revisits(prefix, e, false))
          continue;
        size_t v = index.at(e.token_out.address);
        double d = dist[k - 1][u] + e.weight;
        if (d < dist[k][v]) {
          dist[k][v] = d;
          pred[k][v] = &e;
        }
      }
    }
  }

  // ── Close cycles back into the start token ─────────────────────────
  const double min_yield = 1.0 + config_.min_yield_edge;
  const double threshold = -std::log(min_yield);
  std::unordered_set<std::string> seen;
  size_t discarded_impact = 0;

  for (int k = 1; k < max_hops; ++k) {
    for (size_t u = 0; u < n; ++u) {
      if (u == s || dist[k][u] == inf)
        continue;
      auto prefix = walk(k, u);
      for (const auto &e : snapshot.outgoing(names[u])) {
        if (e.token_out.address != start || stale(e) ||
            revisits(prefix, e, true))
          continue;
        if (!(dist[k][u] + e.weight < threshold))
          continue;

        std::vector<Edge> hops;
        for (const Edge *p : prefix)
          hops.push_back(*p);
        hops.push_back(e);

        double y = pathYield(hops);
        if (y <= min_yield)
          continue;

        std::string key;
        for (const auto &h : hops)
          key += h.pool_id + "|";
        if (!seen.insert(key).second)
          continue;

        double x = optimalInput(hops);
        if (x <= 0.0)
          continue;
        if (!withinImpact(hops, x)) {
          discarded_impact++;
          continue;
        }

        ArbitragePath path;
        path.tokens.push_back(start);
        for (const auto &h : hops) {
          path.tokens.push_back(h.token_out.address);
          path.venues.push_back(h.venue);
        }
        path.hops = std::move(hops);
        path.yield = y;
        path.required_input = x;
        path.expected_profit = simulateOutput(path, x) - x;
        path.confidence = confidence(path.hops, now);
        if (path.expected_profit <= 0.0)
          continue;
        results.push_back(std::move(path));
      }
    }
  }

  // Yield descending, near-equal yields prefer fewer hops
  const double tol = std::max(config_.yield_tie_tolerance, 1e-12);
  std::sort(results.begin(), results.end(),
            [tol](const ArbitragePath &a, const ArbitragePath &b) {
              auto qa = std::llround(a.yield / tol);
              auto qb = std::llround(b.yield / tol);
              if (qa != qb)
                return qa > qb;
              if (a.hopCount() != b.hopCount())
                return a.hopCount() < b.hopCount();
              return a.expected_profit > b.expected_profit;
            });
  if (results.size() > static_cast<size_t>(max_results))
    results.resize(max_results);

  if (discarded_impact > 0)
    spdlog::debug("[Paths] {} cycles from {} exceed pool impact limit",
                  discarded_impact, start.substr(0, 10));
  if (!results.empty())
    spdlog::debug("[Paths] {} cycles from {}, best yield={:.5f}",
                  results.size(), start.substr(0, 10), results.front().yield);
  return results;
}

} // namespace dexarb
