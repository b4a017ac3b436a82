#pragma once
#include <string>
#include <vector>

namespace dexarb {

struct HttpResponse {
  long status = 0;
  std::string body;
};

class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  // Throws TransportError when no response was received
  virtual HttpResponse post(const std::string &url, const std::string &body,
                            const std::vector<std::string> &headers) = 0;
};

class CurlTransport : public HttpTransport {
public:
  explicit CurlTransport(long timeout_ms = 3000);

  HttpResponse post(const std::string &url, const std::string &body,
                    const std::vector<std::string> &headers) override;

private:
  long timeout_ms_;
};

} // namespace dexarb
