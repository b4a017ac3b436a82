#pragma once
#include "dexarb/http_transport.hpp"
#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace dexarb {

class RequestSigner;

// JSON-RPC 2.0 over an HttpTransport. call() returns "result", throws
// RpcError for an "error" object and TransportError for HTTP failures.
class JsonRpcClient {
public:
  JsonRpcClient(std::shared_ptr<HttpTransport> transport, std::string url,
                std::shared_ptr<RequestSigner> signer = nullptr);

  nlohmann::json call(const std::string &method, const nlohmann::json &params);

  const std::string &url() const { return url_; }

private:
  std::shared_ptr<HttpTransport> transport_;
  std::string url_;
  std::shared_ptr<RequestSigner> signer_;
  std::atomic<uint64_t> next_id_{1};
};

} // namespace dexarb
