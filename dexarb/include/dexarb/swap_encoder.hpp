#pragma once
#include "dexarb/common.hpp"

namespace dexarb {

// Turns a sized path into a call against the on-chain executor
class SwapEncoder {
public:
  virtual ~SwapEncoder() = default;

  virtual Transaction encode(const ArbitragePath &path,
                             double amount_in) const = 0;
};

// executeRoute(address[] pools, address[] tokens, uint256 amountIn,
//              uint256 amountOutMin) returns (uint256 profit)
//
// One entry per hop; the executor swaps through them in order and reverts
// when the final output is below amountOutMin.
class ExecutorSwapEncoder : public SwapEncoder {
public:
  explicit ExecutorSwapEncoder(const Config &config);

  Transaction encode(const ArbitragePath &path,
                     double amount_in) const override;

  double minAmountOut(const ArbitragePath &path, double amount_in) const;

private:
  Config config_;
};

} // namespace dexarb
