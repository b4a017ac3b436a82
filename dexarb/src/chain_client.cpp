#include "dexarb/chain_client.hpp"
#include "dexarb/abi.hpp"
#include "dexarb/errors.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace dexarb {

RpcChainClient::RpcChainClient(std::shared_ptr<HttpTransport> transport,
                               const std::string &url)
    : rpc_(std::move(transport), url) {}

json RpcChainClient::call(const std::string &method, const json &params) {
  try {
    return rpc_.call(method, params);
  } catch (const RpcError &e) {
    throw ChainError(method + ": " + e.what());
  } catch (const TransportError &e) {
    throw ChainError(method + ": " + e.what());
  }
}

static std::string expectString(const json &j, const std::string &what) {
  if (!j.is_string())
    throw ChainError("unexpected " + what + " in node response");
  return j.get<std::string>();
}

uint64_t RpcChainClient::blockNumber() {
  return hexToU64(expectString(call("eth_blockNumber", json::array()),
                               "block number"));
}

double RpcChainClient::baseFeeGwei() {
  auto block = call("eth_getBlockByNumber", json::array({"latest", false}));
  if (!block.is_object() || !block.contains("baseFeePerGas"))
    throw ChainError("latest block has no baseFeePerGas");
  return hexToDouble(expectString(block["baseFeePerGas"], "base fee")) / 1e9;
}

uint64_t RpcChainClient::nonceOf(const std::string &address) {
  return hexToU64(expectString(
      call("eth_getTransactionCount", json::array({address, "pending"})),
      "nonce"));
}

std::string RpcChainClient::balanceOfCall(const std::string &owner) {
  return "0x70a08231" + AbiEncoder::addressWord(owner);
}

double RpcChainClient::tokenBalance(const Token &token,
                                    const std::string &owner) {
  json tx = {{"to", token.address}, {"data", balanceOfCall(owner)}};
  auto raw = expectString(call("eth_call", json::array({tx, "latest"})),
                          "balanceOf result");
  if (raw == "0x")
    return 0.0;
  return fromBaseUnits(hexToDouble(raw), token.decimals);
}

std::optional<Receipt> RpcChainClient::receipt(const std::string &tx_hash) {
  auto r = call("eth_getTransactionReceipt", json::array({tx_hash}));
  if (r.is_null() || !r.contains("blockNumber") || r["blockNumber"].is_null())
    return std::nullopt;
  Receipt out;
  out.block = hexToU64(expectString(r["blockNumber"], "receipt block"));
  out.reverted = r.value("status", "0x1") == "0x0";
  if (out.reverted)
    spdlog::warn("[Chain] Transaction {} mined but reverted", tx_hash);
  return out;
}

} // namespace dexarb
