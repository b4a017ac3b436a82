#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace dexarb {

// ── Hex / unit helpers ───────────────────────────────────────────────
std::string toHex(uint64_t value); // "0x1a"
uint64_t hexToU64(const std::string &hex);
double hexToDouble(const std::string &hex); // any width, lossy above 2^53

// "0x..." hex or a plain decimal string
double parseQuantity(const std::string &quantity);

// 1.5 with 18 decimals -> "1500000000000000000"
std::string toBaseUnits(double amount, int decimals);
double fromBaseUnits(double raw, int decimals);

std::string gweiToWeiHex(double gwei);

// Decimal string -> 32-byte big-endian word (64 hex chars, no prefix)
std::string decimalToWord(const std::string &decimal);
std::string decimalToHex(const std::string &decimal); // "0x" quantity

// ── ABI call encoding ────────────────────────────────────────────────
// Head/tail encoding of a contract call, enough for the executor ABI:
// address, uint256, bytes, address[] and bytes[].
class AbiEncoder {
public:
  explicit AbiEncoder(const std::string &selector);

  AbiEncoder &address(const std::string &addr);
  AbiEncoder &uint256(const std::string &decimal);
  AbiEncoder &uint256(uint64_t value);
  AbiEncoder &bytes(const std::string &hex);
  AbiEncoder &addressArray(const std::vector<std::string> &addrs);
  AbiEncoder &bytesArray(const std::vector<std::string> &hexes);

  // 0x + selector + head + tail
  std::string encode() const;

  static std::string addressWord(const std::string &addr);
  static std::string bytesTail(const std::string &hex);

private:
  struct Slot {
    bool dynamic;
    std::string data; // static word or dynamic tail, hex without prefix
  };
  std::string selector_;
  std::vector<Slot> slots_;
};

} // namespace dexarb
