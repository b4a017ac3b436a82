#pragma once
#include "dexarb/common.hpp"
#include "dexarb/json_rpc.hpp"
#include <memory>

namespace dexarb {

// Trading-key signer. An unusable key is fatal.
class TransactionSigner {
public:
  virtual ~TransactionSigner() = default;

  virtual std::string address() const = 0;

  // Fills tx.raw and tx.hash; throws SigningKeyUnavailableError
  virtual void sign(Transaction &tx) = 0;
};

// Delegates to an external signer (clef, web3signer) via
// eth_signTransaction, so the key never lives in this process.
class RemoteTransactionSigner : public TransactionSigner {
public:
  RemoteTransactionSigner(std::shared_ptr<HttpTransport> transport,
                          const std::string &url, std::string address,
                          uint64_t chain_id);

  std::string address() const override { return address_; }
  void sign(Transaction &tx) override;

  static nlohmann::json toRpcObject(const Transaction &tx, uint64_t chain_id);

private:
  JsonRpcClient rpc_;
  std::string address_;
  uint64_t chain_id_;
};

} // namespace dexarb
