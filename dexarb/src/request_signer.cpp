#include "dexarb/request_signer.hpp"
#include "dexarb/errors.hpp"
#include <cstdio>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <spdlog/spdlog.h>

namespace dexarb {

EvpRequestSigner::EvpRequestSigner(std::string key_id, EVP_PKEY *pkey)
    : key_id_(std::move(key_id)), pkey_(pkey) {}

EvpRequestSigner::EvpRequestSigner(std::string key_id,
                                   const std::string &private_key_path)
    : key_id_(std::move(key_id)) {
  FILE *fp = fopen(private_key_path.c_str(), "r");
  if (!fp) {
    throw SigningKeyUnavailableError("cannot open relay signing key: " +
                                     private_key_path);
  }
  pkey_ = PEM_read_PrivateKey(fp, nullptr, nullptr, nullptr);
  fclose(fp);
  if (!pkey_) {
    throw SigningKeyUnavailableError("cannot parse relay signing key: " +
                                     private_key_path);
  }
  spdlog::info("[Relay] Loaded signing key '{}'", key_id_);
}

std::unique_ptr<EvpRequestSigner>
EvpRequestSigner::fromPem(std::string key_id, const std::string &pem) {
  BIO *bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
  if (!bio)
    throw SigningKeyUnavailableError("BIO allocation failed");
  EVP_PKEY *pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
  BIO_free(bio);
  if (!pkey)
    throw SigningKeyUnavailableError("cannot parse relay signing key");
  return std::unique_ptr<EvpRequestSigner>(
      new EvpRequestSigner(std::move(key_id), pkey));
}

EvpRequestSigner::~EvpRequestSigner() {
  if (pkey_)
    EVP_PKEY_free(pkey_);
}

// RSA keys sign with PSS, salt length = digest length
static bool configurePadding(EVP_PKEY *pkey, EVP_PKEY_CTX *pkey_ctx) {
  if (EVP_PKEY_base_id(pkey) != EVP_PKEY_RSA)
    return true;
  return EVP_PKEY_CTX_set_rsa_padding(pkey_ctx, RSA_PKCS1_PSS_PADDING) > 0 &&
         EVP_PKEY_CTX_set_rsa_pss_saltlen(pkey_ctx, -1) > 0;
}

std::string EvpRequestSigner::sign(const std::string &body) {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx)
    throw SigningKeyUnavailableError("EVP_MD_CTX_new failed");

  EVP_PKEY_CTX *pkey_ctx = nullptr;
  size_t siglen = 0;
  bool ok = EVP_DigestSignInit(ctx, &pkey_ctx, EVP_sha256(), nullptr, pkey_) >
                0 &&
            configurePadding(pkey_, pkey_ctx) &&
            EVP_DigestSignUpdate(ctx, body.data(), body.size()) > 0 &&
            EVP_DigestSignFinal(ctx, nullptr, &siglen) > 0;

  std::vector<unsigned char> sig(siglen);
  if (ok)
    ok = EVP_DigestSignFinal(ctx, sig.data(), &siglen) > 0;
  EVP_MD_CTX_free(ctx);

  if (!ok)
    throw SigningKeyUnavailableError("relay request signing failed");
  return key_id_ + ":" + base64Encode(sig.data(), siglen);
}

bool EvpRequestSigner::verify(const std::string &body,
                              const std::string &header_value) const {
  auto colon = header_value.find(':');
  if (colon == std::string::npos || header_value.substr(0, colon) != key_id_)
    return false;
  auto sig = base64Decode(header_value.substr(colon + 1));
  if (sig.empty())
    return false;

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx)
    return false;
  EVP_PKEY_CTX *pkey_ctx = nullptr;
  bool ok =
      EVP_DigestVerifyInit(ctx, &pkey_ctx, EVP_sha256(), nullptr, pkey_) > 0 &&
      configurePadding(pkey_, pkey_ctx) &&
      EVP_DigestVerifyUpdate(ctx, body.data(), body.size()) > 0 &&
      EVP_DigestVerifyFinal(ctx, sig.data(), sig.size()) == 1;
  EVP_MD_CTX_free(ctx);
  return ok;
}

// ── Base64 ───────────────────────────────────────────────────────────
std::string EvpRequestSigner::base64Encode(const unsigned char *buffer,
                                           size_t length) {
  BIO *bio, *b64;
  BUF_MEM *bufferPtr;

  b64 = BIO_new(BIO_f_base64());
  bio = BIO_new(BIO_s_mem());
  bio = BIO_push(b64, bio);

  BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
  BIO_write(bio, buffer, static_cast<int>(length));
  BIO_flush(bio);
  BIO_get_mem_ptr(bio, &bufferPtr);

  std::string res(bufferPtr->data, bufferPtr->length);
  BIO_free_all(bio);
  return res;
}

std::vector<unsigned char>
EvpRequestSigner::base64Decode(const std::string &input) {
  std::vector<unsigned char> out(input.size());
  BIO *b64 = BIO_new(BIO_f_base64());
  BIO *mem = BIO_new_mem_buf(input.data(), static_cast<int>(input.size()));
  BIO *bio = BIO_push(b64, mem);
  BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

  int n = BIO_read(bio, out.data(), static_cast<int>(out.size()));
  BIO_free_all(bio);
  out.resize(n > 0 ? static_cast<size_t>(n) : 0);
  return out;
}

} // namespace dexarb
