#pragma once
#include "dexarb/common.hpp"
#include <vector>

namespace dexarb {

class FlashLoanProvider {
public:
  virtual ~FlashLoanProvider() = default;

  virtual std::string name() const = 0;

  // Fee in token units for borrowing `amount`
  virtual double quoteFee(const Token &token, double amount) const = 0;

  // One transaction that borrows, runs `calls` and repays atomically
  virtual Transaction wrap(const std::vector<Transaction> &calls,
                           const Token &token, double amount) const = 0;
};

// Aave pool flash loan driven through the executor:
// flashArbitrage(address pool, address asset, uint256 amount, bytes[] calls)
class AaveFlashLoanProvider : public FlashLoanProvider {
public:
  explicit AaveFlashLoanProvider(const Config &config);

  std::string name() const override { return "aave"; }
  double quoteFee(const Token &token, double amount) const override;
  Transaction wrap(const std::vector<Transaction> &calls, const Token &token,
                   double amount) const override;

private:
  std::string pool_;
  std::string executor_;
  std::string selector_;
  double fee_rate_;
  uint64_t gas_overhead_;
};

} // namespace dexarb
