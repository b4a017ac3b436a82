#include "dexarb/capital_allocator.hpp"
#include "dexarb/path_finder.hpp"
#include <random>
#include <spdlog/spdlog.h>

namespace dexarb {

CapitalAllocator::CapitalAllocator(const Config &config) : config_(config) {}

double CapitalAllocator::pathProfit(const ArbitragePath &path,
                                    double capital) const {
  if (capital <= 0.0)
    return 0.0;
  return PathFinder::simulateOutput(path, capital) - capital -
         config_.gas_cost_per_path;
}

Eigen::VectorXd
CapitalAllocator::clampSmall(const Eigen::VectorXd &amounts) const {
  Eigen::VectorXd out = amounts;
  for (Eigen::Index i = 0; i < out.size(); i++) {
    if (out[i] < config_.min_allocation || out[i] < 0.0)
      out[i] = 0.0;
  }
  return out;
}

double CapitalAllocator::evaluate(const std::vector<ArbitragePath> &paths,
                                  const Eigen::VectorXd &amounts) const {
  Eigen::VectorXd x = clampSmall(amounts);
  double total = 0.0;
  for (size_t i = 0; i < paths.size() && i < static_cast<size_t>(x.size());
       i++)
    total += pathProfit(paths[i], x[i]);
  return total;
}

// ── Hill climbing ────────────────────────────────────────────────────
// Slot n is the unallocated reserve. Moves `step`, or a slot's whole
// balance, between any two slots while profit improves, halving the step
// once a sweep finds nothing. Whole-balance moves let a path that only
// pays its gas drop out entirely.
void CapitalAllocator::hillClimb(const std::vector<ArbitragePath> &paths,
                                 double capital, Eigen::VectorXd &best,
                                 double &best_profit) const {
  const Eigen::Index n = best.size();
  double step = capital / (2.0 * static_cast<double>(n));
  const double min_step = capital * 1e-6;

  for (int iter = 0; iter < config_.hill_climb_iterations && step > min_step;
       iter++) {
    bool improved = false;
    for (Eigen::Index from = 0; from <= n; from++) {
      for (Eigen::Index to = 0; to <= n; to++) {
        if (from == to)
          continue;
        double available = (from == n) ? capital - best.sum() : best[from];
        for (double amount : {step, available}) {
          if (amount <= 0.0 || amount > available)
            continue;

          Eigen::VectorXd trial = best;
          if (from < n)
            trial[from] -= amount;
          if (to < n)
            trial[to] += amount;

          double p = evaluate(paths, trial);
          if (p > best_profit + 1e-12) {
            best = trial;
            best_profit = p;
            improved = true;
            available = (from == n) ? capital - best.sum() : best[from];
          }
        }
      }
    }
    if (!improved)
      step *= 0.5;
  }
}

// Zeroes every slot whose own profit is not positive
void CapitalAllocator::dropLosers(const std::vector<ArbitragePath> &paths,
                                  Eigen::VectorXd &amounts) const {
  for (Eigen::Index i = 0; i < amounts.size(); i++) {
    if (amounts[i] > 0.0 &&
        pathProfit(paths[static_cast<size_t>(i)], amounts[i]) <= 0.0) {
      spdlog::debug("[Alloc] Dropping path {}: {:.4f} does not cover gas", i,
                    amounts[i]);
      amounts[i] = 0.0;
    }
  }
}

// ── Optimize ─────────────────────────────────────────────────────────
Allocation CapitalAllocator::optimize(const std::vector<ArbitragePath> &paths,
                                      double total_capital) const {
  Allocation result;
  const Eigen::Index n = static_cast<Eigen::Index>(paths.size());
  if (n == 0 || total_capital <= 0.0)
    return result;

  Eigen::VectorXd baseline =
      Eigen::VectorXd::Constant(n, total_capital / static_cast<double>(n));
  result.baseline_profit = evaluate(paths, baseline);

  Eigen::VectorXd best = baseline;
  double best_profit = result.baseline_profit;

  // Each path at its own optimum, scaled down to fit the capital
  Eigen::VectorXd optimal(n);
  for (Eigen::Index i = 0; i < n; i++)
    optimal[i] = paths[i].required_input;
  if (optimal.sum() > total_capital)
    optimal *= total_capital / optimal.sum();
  double optimal_profit = evaluate(paths, optimal);
  if (optimal_profit > best_profit) {
    best = optimal;
    best_profit = optimal_profit;
  }

  // Monte Carlo over random weights and capital usage
  std::mt19937 rng(config_.seed);
  std::uniform_real_distribution<double> unif(0.0, 1.0);
  Eigen::VectorXd trial(n);
  for (int t = 0; t < config_.monte_carlo_trials; t++) {
    for (Eigen::Index i = 0; i < n; i++)
      trial[i] = unif(rng);
    double wsum = trial.sum();
    if (wsum <= 0.0)
      continue;
    trial *= unif(rng) * total_capital / wsum;

    double p = evaluate(paths, trial);
    if (p > best_profit) {
      best = trial;
      best_profit = p;
    }
  }

  hillClimb(paths, total_capital, best, best_profit);

  best = clampSmall(best);
  if (best.sum() > total_capital)
    best *= total_capital / best.sum();
  dropLosers(paths, best);
  best_profit = evaluate(paths, best);

  spdlog::debug("[Alloc] {} paths, capital={:.4f}: best={:.6f} "
                "baseline={:.6f}",
                n, total_capital, best_profit, result.baseline_profit);

  if (best_profit <= 0.0)
    return result;

  result.amounts = best;
  result.expected_profit = best_profit;
  return result;
}

} // namespace dexarb
