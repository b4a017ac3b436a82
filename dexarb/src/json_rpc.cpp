#include "dexarb/json_rpc.hpp"
#include "dexarb/errors.hpp"
#include "dexarb/request_signer.hpp"

using json = nlohmann::json;

namespace dexarb {

JsonRpcClient::JsonRpcClient(std::shared_ptr<HttpTransport> transport,
                             std::string url,
                             std::shared_ptr<RequestSigner> signer)
    : transport_(std::move(transport)), url_(std::move(url)),
      signer_(std::move(signer)) {}

json JsonRpcClient::call(const std::string &method, const json &params) {
  json req = {{"jsonrpc", "2.0"},
              {"id", next_id_++},
              {"method", method},
              {"params", params}};
  std::string body = req.dump();

  std::vector<std::string> headers;
  if (signer_)
    headers.push_back(signer_->headerName() + ": " + signer_->sign(body));

  HttpResponse resp = transport_->post(url_, body, headers);
  if (resp.status >= 500) {
    throw TransportError(method + " -> HTTP " + std::to_string(resp.status),
                         true, resp.status);
  }

  json j = json::parse(resp.body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw TransportError(method + " -> malformed response (HTTP " +
                             std::to_string(resp.status) + ")",
                         false, resp.status);
  }

  if (j.contains("error") && !j["error"].is_null()) {
    const auto &err = j["error"];
    int code = err.is_object() ? err.value("code", 0) : 0;
    std::string message =
        err.is_object() ? err.value("message", "") : err.dump();
    throw RpcError(code, message);
  }
  if (resp.status >= 400) {
    throw TransportError(method + " -> HTTP " + std::to_string(resp.status),
                         false, resp.status);
  }

  return j.contains("result") ? j["result"] : json(nullptr);
}

} // namespace dexarb
