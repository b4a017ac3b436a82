#include "dexarb/flash_loan.hpp"
#include "dexarb/abi.hpp"
#include "dexarb/errors.hpp"
#include <spdlog/spdlog.h>

namespace dexarb {

AaveFlashLoanProvider::AaveFlashLoanProvider(const Config &config)
    : pool_(config.flash_loan_pool), executor_(config.executor_address),
      selector_(config.flash_selector), fee_rate_(config.flash_loan_fee),
      gas_overhead_(config.flash_loan_gas_overhead) {
  if (pool_.empty() || executor_.empty())
    throw ConfigError("flash loans need flash_loan_pool and executor_address");
}

double AaveFlashLoanProvider::quoteFee(const Token &, double amount) const {
  return amount * fee_rate_;
}

Transaction AaveFlashLoanProvider::wrap(const std::vector<Transaction> &calls,
                                        const Token &token,
                                        double amount) const {
  if (calls.empty())
    throw DexarbError("nothing to wrap in a flash loan");

  std::vector<std::string> payloads;
  uint64_t gas = gas_overhead_;
  for (const auto &c : calls) {
    payloads.push_back(c.data);
    gas += c.gas_limit;
  }

  Transaction tx;
  tx.to = executor_;
  tx.data = AbiEncoder(selector_)
                .address(pool_)
                .address(token.address)
                .uint256(toBaseUnits(amount, token.decimals))
                .bytesArray(payloads)
                .encode();
  tx.gas_limit = gas;

  spdlog::debug("[Exec] Flash loan {} {:.6f} via {} ({} calls, fee {:.6f})",
                token.symbol, amount, name(), calls.size(),
                quoteFee(token, amount));
  return tx;
}

} // namespace dexarb
