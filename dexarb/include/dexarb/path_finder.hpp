#pragma once
#include "dexarb/common.hpp"
#include "dexarb/liquidity_graph.hpp"
#include <vector>

namespace dexarb {

class PathFinder {
public:
  explicit PathFinder(const Config &config);

  // Profitable cycles through start_token, best first. Each call
  // recomputes from the given snapshot.
  std::vector<ArbitragePath> findCycles(const GraphSnapshot &snapshot,
                                        const std::string &start_token,
                                        int max_hops, int max_results) const;

  // Output of the start token after routing amount_in through every hop
  static double simulateOutput(const ArbitragePath &path, double amount_in);

  // Profit-maximizing input of the composed constant-product cycle, 0 when
  // the cycle has no positive-profit input
  static double optimalInput(const std::vector<Edge> &hops);

  static double pathYield(const std::vector<Edge> &hops);

private:
  Config config_;

  bool withinImpact(const std::vector<Edge> &hops, double amount_in) const;
  double confidence(const std::vector<Edge> &hops, Clock::time_point now) const;
};

} // namespace dexarb
