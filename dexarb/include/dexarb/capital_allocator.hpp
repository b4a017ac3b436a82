#pragma once
#include "dexarb/common.hpp"
#include <Eigen/Dense>
#include <vector>

namespace dexarb {

struct Allocation {
  Eigen::VectorXd amounts;      // per path, empty when nothing is worth doing
  double expected_profit = 0.0; // start-token units, after per-path gas
  double baseline_profit = 0.0; // equal split of the capital

  bool empty() const { return amounts.size() == 0; }
  double total() const { return empty() ? 0.0 : amounts.sum(); }
};

// Sizes capital across paths that share a start token. Pure: the result
// depends only on the paths, the capital and the configured seed.
class CapitalAllocator {
public:
  explicit CapitalAllocator(const Config &config);

  Allocation optimize(const std::vector<ArbitragePath> &paths,
                      double total_capital) const;

  // Aggregate profit of an allocation (amounts below min_allocation count
  // as zero)
  double evaluate(const std::vector<ArbitragePath> &paths,
                  const Eigen::VectorXd &amounts) const;

  double pathProfit(const ArbitragePath &path, double capital) const;

private:
  Config config_;

  Eigen::VectorXd clampSmall(const Eigen::VectorXd &amounts) const;
  void hillClimb(const std::vector<ArbitragePath> &paths, double capital,
                 Eigen::VectorXd &best, double &best_profit) const;
  void dropLosers(const std::vector<ArbitragePath> &paths,
                  Eigen::VectorXd &amounts) const;
};

} // namespace dexarb
