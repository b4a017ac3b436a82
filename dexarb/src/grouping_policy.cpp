#include "dexarb/grouping_policy.hpp"
#include "dexarb/errors.hpp"
#include <algorithm>
#include <set>
#include <unordered_map>

namespace dexarb {

static std::vector<ArbitragePath>
byYield(const std::vector<ArbitragePath> &paths) {
  std::vector<ArbitragePath> sorted = paths;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const ArbitragePath &a, const ArbitragePath &b) {
                     return a.yield > b.yield;
                   });
  return sorted;
}

std::unique_ptr<GroupingPolicy> GroupingPolicy::create(const Config &config) {
  size_t max_paths = static_cast<size_t>(std::max(1, config.max_paths_per_group));
  if (config.grouping == "start_token")
    return std::make_unique<StartTokenGrouping>(max_paths);
  if (config.grouping == "token_overlap")
    return std::make_unique<TokenOverlapGrouping>(config.min_group_similarity,
                                                  max_paths);
  throw ConfigError("unknown grouping policy: " + config.grouping);
}

// ── Start token ──────────────────────────────────────────────────────
StartTokenGrouping::StartTokenGrouping(size_t max_paths)
    : max_paths_(max_paths) {}

std::vector<std::vector<ArbitragePath>>
StartTokenGrouping::group(const std::vector<ArbitragePath> &paths) const {
  std::vector<std::vector<ArbitragePath>> groups;
  std::unordered_map<std::string, size_t> slot;

  for (auto &p : byYield(paths)) {
    if (p.hops.empty())
      continue;
    const std::string &start = p.startToken().address;
    auto it = slot.find(start);
    if (it == slot.end()) {
      slot[start] = groups.size();
      groups.push_back({std::move(p)});
    } else if (groups[it->second].size() < max_paths_) {
      groups[it->second].push_back(std::move(p));
    }
  }
  return groups;
}

// ── Token overlap ────────────────────────────────────────────────────
TokenOverlapGrouping::TokenOverlapGrouping(double min_similarity,
                                           size_t max_paths)
    : min_similarity_(min_similarity), max_paths_(max_paths) {}

double
TokenOverlapGrouping::jaccardSimilarity(const std::vector<std::string> &a,
                                        const std::vector<std::string> &b) {
  std::set<std::string> setA(a.begin(), a.end());
  std::set<std::string> setB(b.begin(), b.end());

  size_t intersection = 0;
  for (const auto &t : setA) {
    if (setB.count(t))
      intersection++;
  }

  size_t uni = setA.size() + setB.size() - intersection;
  return uni == 0 ? 0.0 : static_cast<double>(intersection) / uni;
}

std::vector<std::vector<ArbitragePath>>
TokenOverlapGrouping::group(const std::vector<ArbitragePath> &paths) const {
  std::vector<std::vector<ArbitragePath>> groups;

  for (auto &p : byYield(paths)) {
    if (p.hops.empty())
      continue;
    bool placed = false;
    for (auto &g : groups) {
      const auto &seed = g.front();
      if (g.size() >= max_paths_ ||
          seed.startToken().address != p.startToken().address)
        continue;
      if (jaccardSimilarity(seed.tokens, p.tokens) >= min_similarity_) {
        g.push_back(p);
        placed = true;
        break;
      }
    }
    if (!placed)
      groups.push_back({p});
  }
  return groups;
}

} // namespace dexarb
