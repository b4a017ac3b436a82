#include "dexarb/transaction_signer.hpp"
#include "dexarb/abi.hpp"
#include "dexarb/errors.hpp"

using json = nlohmann::json;

namespace dexarb {

RemoteTransactionSigner::RemoteTransactionSigner(
    std::shared_ptr<HttpTransport> transport, const std::string &url,
    std::string address, uint64_t chain_id)
    : rpc_(std::move(transport), url), address_(std::move(address)),
      chain_id_(chain_id) {}

json RemoteTransactionSigner::toRpcObject(const Transaction &tx,
                                          uint64_t chain_id) {
  return {{"type", "0x2"},
          {"chainId", toHex(chain_id)},
          {"from", tx.from},
          {"to", tx.to},
          {"data", tx.data},
          {"value", decimalToHex(tx.value)},
          {"gas", toHex(tx.gas_limit)},
          {"nonce", toHex(tx.nonce)},
          {"maxFeePerGas", gweiToWeiHex(tx.max_fee_per_gas_gwei)},
          {"maxPriorityFeePerGas",
           gweiToWeiHex(tx.max_priority_fee_per_gas_gwei)}};
}

void RemoteTransactionSigner::sign(Transaction &tx) {
  if (tx.from.empty())
    tx.from = address_;

  json result;
  try {
    result = rpc_.call("eth_signTransaction",
                       json::array({toRpcObject(tx, chain_id_)}));
  } catch (const RpcError &e) {
    throw SigningKeyUnavailableError(std::string("signer refused: ") +
                                     e.what());
  } catch (const TransportError &e) {
    throw SigningKeyUnavailableError(std::string("signer unreachable: ") +
                                     e.what());
  }

  // geth/clef answer {raw, tx{hash}}
  if (!result.is_object() || !result.contains("raw") ||
      !result.contains("tx") || !result["tx"].contains("hash"))
    throw DexarbError("eth_signTransaction returned no raw tx and hash");
  tx.raw = result["raw"].get<std::string>();
  tx.hash = result["tx"]["hash"].get<std::string>();
}

} // namespace dexarb
