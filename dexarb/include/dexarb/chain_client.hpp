#pragma once
#include "dexarb/common.hpp"
#include "dexarb/json_rpc.hpp"
#include <memory>
#include <optional>

namespace dexarb {

struct Receipt {
  uint64_t block = 0;
  bool reverted = false; // status 0x0
};

// Read-only view of the chain used by execution
class ChainClient {
public:
  virtual ~ChainClient() = default;

  virtual uint64_t blockNumber() = 0;
  virtual double baseFeeGwei() = 0;
  virtual uint64_t nonceOf(const std::string &address) = 0;

  // Balance in whole-token units
  virtual double tokenBalance(const Token &token, const std::string &owner) = 0;

  // nullopt while unmined
  virtual std::optional<Receipt> receipt(const std::string &tx_hash) = 0;
};

// Ethereum JSON-RPC node. Failures surface as ChainError.
class RpcChainClient : public ChainClient {
public:
  RpcChainClient(std::shared_ptr<HttpTransport> transport,
                 const std::string &url);

  uint64_t blockNumber() override;
  double baseFeeGwei() override;
  uint64_t nonceOf(const std::string &address) override;
  double tokenBalance(const Token &token, const std::string &owner) override;
  std::optional<Receipt> receipt(const std::string &tx_hash) override;

  // ERC-20 balanceOf(owner) calldata
  static std::string balanceOfCall(const std::string &owner);

private:
  JsonRpcClient rpc_;

  nlohmann::json call(const std::string &method, const nlohmann::json &params);
};

} // namespace dexarb
