#include "dexarb/swap_encoder.hpp"
#include "dexarb/abi.hpp"
#include "dexarb/errors.hpp"
#include "dexarb/path_finder.hpp"

namespace dexarb {

ExecutorSwapEncoder::ExecutorSwapEncoder(const Config &config)
    : config_(config) {}

double ExecutorSwapEncoder::minAmountOut(const ArbitragePath &path,
                                         double amount_in) const {
  return PathFinder::simulateOutput(path, amount_in) *
         (1.0 - config_.slippage_tolerance);
}

Transaction ExecutorSwapEncoder::encode(const ArbitragePath &path,
                                        double amount_in) const {
  if (path.hops.empty())
    throw DexarbError("cannot encode an empty path");
  if (config_.executor_address.empty())
    throw ConfigError("executor address not configured");

  const Token &start = path.startToken();
  std::vector<std::string> pools = path.poolIds();

  Transaction tx;
  tx.to = config_.executor_address;
  tx.data = AbiEncoder(config_.route_selector)
                .addressArray(pools)
                .addressArray(path.tokens)
                .uint256(toBaseUnits(amount_in, start.decimals))
                .uint256(toBaseUnits(minAmountOut(path, amount_in),
                                     start.decimals))
                .encode();
  tx.gas_limit = config_.base_gas_limit + config_.hop_gas_limit * pools.size();
  return tx;
}

} // namespace dexarb
