#pragma once
#include "dexarb/chain_client.hpp"
#include "dexarb/common.hpp"
#include "dexarb/json_rpc.hpp"
#include "dexarb/request_signer.hpp"
#include "dexarb/transaction_signer.hpp"
#include <memory>
#include <optional>

namespace dexarb {

// Private-relay client: eth_callBundle, eth_sendBundle and
// flashbots_getBundleStatsV2, every request signed with the relay key.
class BundleClient {
public:
  BundleClient(const Config &config, const std::string &relay_url,
               std::shared_ptr<HttpTransport> transport,
               std::shared_ptr<RequestSigner> relay_signer,
               std::shared_ptr<TransactionSigner> tx_signer,
               std::shared_ptr<ChainClient> chain);

  // Applies the gas strategy, assigns nonces and signs every transaction
  Bundle build(std::vector<Transaction> txs, uint64_t target_block);

  // Relay rejection or a reverting tx is an unsuccessful result; a relay
  // that cannot be reached throws RelayUnavailableError
  SimulationResult simulate(const Bundle &bundle);

  // nullopt when the relay rejected the bundle on every attempt. Each retry
  // targets the next block.
  std::optional<SubmissionHandle> submit(const Bundle &bundle);

  BundleStatus status(const SubmissionHandle &handle);

  const std::string &relayUrl() const { return rpc_.url(); }

  // Lead tx pays base * multiplier + capped premium, the rest no tip
  static void applyGasStrategy(std::vector<Transaction> &txs,
                               double base_fee_gwei, const Config &config);

  static SimulationResult parseSimulation(const nlohmann::json &result,
                                          const Bundle &bundle);

private:
  Config config_;
  JsonRpcClient rpc_;
  std::shared_ptr<TransactionSigner> tx_signer_;
  std::shared_ptr<ChainClient> chain_;

  int attempts() const;
  void backoff(int attempt) const;
};

} // namespace dexarb
