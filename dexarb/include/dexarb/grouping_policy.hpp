#pragma once
#include "dexarb/common.hpp"
#include <memory>
#include <vector>

namespace dexarb {

// Decides which discovered paths are sized together as one opportunity.
// Every group shares a start token.
class GroupingPolicy {
public:
  virtual ~GroupingPolicy() = default;

  virtual std::vector<std::vector<ArbitragePath>>
  group(const std::vector<ArbitragePath> &paths) const = 0;

  // "start_token" or "token_overlap"
  static std::unique_ptr<GroupingPolicy> create(const Config &config);
};

// Best `max_paths` paths per start token
class StartTokenGrouping : public GroupingPolicy {
public:
  explicit StartTokenGrouping(size_t max_paths);

  std::vector<std::vector<ArbitragePath>>
  group(const std::vector<ArbitragePath> &paths) const override;

private:
  size_t max_paths_;
};

// Greedy clusters of paths whose token sets are similar enough
class TokenOverlapGrouping : public GroupingPolicy {
public:
  TokenOverlapGrouping(double min_similarity, size_t max_paths);

  std::vector<std::vector<ArbitragePath>>
  group(const std::vector<ArbitragePath> &paths) const override;

  static double jaccardSimilarity(const std::vector<std::string> &a,
                                  const std::vector<std::string> &b);

private:
  double min_similarity_;
  size_t max_paths_;
};

} // namespace dexarb
