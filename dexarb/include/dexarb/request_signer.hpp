#pragma once
#include <memory>
#include <openssl/evp.h>
#include <string>
#include <vector>

namespace dexarb {

// Authenticates relay requests. The relay identity key is separate from
// the trading key.
class RequestSigner {
public:
  virtual ~RequestSigner() = default;

  virtual std::string headerName() const { return "X-Flashbots-Signature"; }

  // Header value for a request body
  virtual std::string sign(const std::string &body) = 0;
};

// Signs "keyId:base64(sig(sha256(body)))" with a PEM private key (EC or RSA)
class EvpRequestSigner : public RequestSigner {
public:
  // Throws SigningKeyUnavailableError when the key cannot be loaded
  EvpRequestSigner(std::string key_id, const std::string &private_key_path);
  ~EvpRequestSigner() override;

  EvpRequestSigner(const EvpRequestSigner &) = delete;
  EvpRequestSigner &operator=(const EvpRequestSigner &) = delete;

  static std::unique_ptr<EvpRequestSigner> fromPem(std::string key_id,
                                                   const std::string &pem);

  std::string sign(const std::string &body) override;
  bool verify(const std::string &body, const std::string &header_value) const;

  const std::string &keyId() const { return key_id_; }

  static std::string base64Encode(const unsigned char *buffer, size_t length);
  static std::vector<unsigned char> base64Decode(const std::string &input);

private:
  EvpRequestSigner(std::string key_id, EVP_PKEY *pkey);

  std::string key_id_;
  EVP_PKEY *pkey_ = nullptr;
};

} // namespace dexarb
