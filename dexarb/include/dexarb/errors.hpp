#pragma once
#include <stdexcept>
#include <string>

namespace dexarb {

class DexarbError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public DexarbError {
public:
  using DexarbError::DexarbError;
};

// HTTP-level failure. transient() is true for timeouts, connection errors
// and 5xx responses.
class TransportError : public DexarbError {
public:
  TransportError(const std::string &what, bool transient, long status = 0)
      : DexarbError(what), transient_(transient), status_(status) {}

  bool transient() const { return transient_; }
  long status() const { return status_; }

private:
  bool transient_;
  long status_;
};

// JSON-RPC error object returned by the remote end
class RpcError : public DexarbError {
public:
  RpcError(int code, const std::string &message)
      : DexarbError("RPC error " + std::to_string(code) + ": " + message),
        code_(code) {}

  int code() const { return code_; }

private:
  int code_;
};

class RelayUnavailableError : public DexarbError {
public:
  using DexarbError::DexarbError;
};

class ChainError : public DexarbError {
public:
  using DexarbError::DexarbError;
};

// Stops the engine
class FatalEngineError : public DexarbError {
public:
  using DexarbError::DexarbError;
};

class SigningKeyUnavailableError : public FatalEngineError {
public:
  using FatalEngineError::FatalEngineError;
};

} // namespace dexarb
