#include "dexarb/http_transport.hpp"
#include "dexarb/errors.hpp"
#include <cstdlib>
#include <curl/curl.h>
#include <mutex>

namespace dexarb {

// ── cURL write callback ──────────────────────────────────────────────
static size_t writeCallback(char *data, size_t size, size_t nmemb,
                            void *userp) {
  auto *buf = static_cast<std::string *>(userp);
  buf->append(data, size * nmemb);
  return size * nmemb;
}

// Thread-safe curl lifecycle management
static std::once_flag curl_init_flag;
static void initCurlOnce() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  std::atexit(curl_global_cleanup);
}

CurlTransport::CurlTransport(long timeout_ms) : timeout_ms_(timeout_ms) {
  std::call_once(curl_init_flag, initCurlOnce);
}

HttpResponse CurlTransport::post(const std::string &url,
                                 const std::string &body,
                                 const std::vector<std::string> &headers) {
  CURL *curl = curl_easy_init();
  if (!curl)
    throw TransportError("Failed to init curl", true);

  HttpResponse resp;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  struct curl_slist *hdrs = nullptr;
  hdrs = curl_slist_append(hdrs, "Content-Type: application/json");
  hdrs = curl_slist_append(hdrs, "Accept: application/json");
  for (const auto &h : headers)
    hdrs = curl_slist_append(hdrs, h.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);

  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
  curl_slist_free_all(hdrs);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    throw TransportError(std::string("HTTP POST failed: ") +
                             curl_easy_strerror(res),
                         true);
  }
  return resp;
}

} // namespace dexarb
