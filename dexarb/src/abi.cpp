#include "dexarb/abi.hpp"
#include "dexarb/errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace dexarb {

static std::string strip0x(const std::string &hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
    return hex.substr(2);
  return hex;
}

static int hexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

static std::string padLeft(const std::string &hex, size_t width = 64) {
  if (hex.size() > width)
    throw DexarbError("ABI word overflow: " + hex);
  return std::string(width - hex.size(), '0') + hex;
}

static std::string u64Word(uint64_t v) {
  std::ostringstream ss;
  ss << std::hex << v;
  return padLeft(ss.str());
}

// ── Hex / unit helpers ───────────────────────────────────────────────
std::string toHex(uint64_t value) {
  std::ostringstream ss;
  ss << "0x" << std::hex << value;
  return ss.str();
}

uint64_t hexToU64(const std::string &hex) {
  std::string h = strip0x(hex);
  if (h.empty() || h.size() > 16)
    throw DexarbError("invalid hex quantity: '" + hex + "'");
  uint64_t v = 0;
  for (char c : h) {
    int d = hexDigit(c);
    if (d < 0)
      throw DexarbError("invalid hex quantity: '" + hex + "'");
    v = (v << 4) | static_cast<uint64_t>(d);
  }
  return v;
}

double hexToDouble(const std::string &hex) {
  std::string h = strip0x(hex);
  long double v = 0.0L;
  for (char c : h) {
    int d = hexDigit(c);
    if (d < 0)
      throw DexarbError("invalid hex quantity: '" + hex + "'");
    v = v * 16.0L + d;
  }
  return static_cast<double>(v);
}

double parseQuantity(const std::string &quantity) {
  if (quantity.rfind("0x", 0) == 0 || quantity.rfind("0X", 0) == 0)
    return hexToDouble(quantity);
  if (quantity.empty())
    return 0.0;
  try {
    return std::stod(quantity);
  } catch (const std::exception &) {
    throw DexarbError("invalid quantity: '" + quantity + "'");
  }
}

std::string toBaseUnits(double amount, int decimals) {
  if (!std::isfinite(amount) || amount < 0.0 || decimals < 0)
    throw DexarbError("cannot convert amount to base units");
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(decimals) << amount;
  std::string digits;
  for (char c : ss.str()) {
    if (c != '.')
      digits += c;
  }
  size_t first = digits.find_first_not_of('0');
  return first == std::string::npos ? "0" : digits.substr(first);
}

double fromBaseUnits(double raw, int decimals) {
  return raw / std::pow(10.0, decimals);
}

std::string gweiToWeiHex(double gwei) {
  if (!std::isfinite(gwei) || gwei < 0.0)
    throw DexarbError("invalid gas price");
  return toHex(static_cast<uint64_t>(std::llround(gwei * 1e9)));
}

std::string decimalToWord(const std::string &decimal) {
  std::array<unsigned int, 32> bytes{};
  if (decimal.empty())
    throw DexarbError("empty uint256");
  for (char c : decimal) {
    if (c < '0' || c > '9')
      throw DexarbError("invalid uint256: '" + decimal + "'");
    unsigned int carry = static_cast<unsigned int>(c - '0');
    for (int i = 31; i >= 0; --i) {
      unsigned int v = bytes[i] * 10 + carry;
      bytes[i] = v & 0xff;
      carry = v >> 8;
    }
    if (carry != 0)
      throw DexarbError("uint256 overflow: " + decimal);
  }
  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int b : bytes)
    ss << std::setw(2) << b;
  return ss.str();
}

std::string decimalToHex(const std::string &decimal) {
  std::string word = decimalToWord(decimal);
  size_t first = word.find_first_not_of('0');
  return "0x" + (first == std::string::npos ? "0" : word.substr(first));
}

// ── AbiEncoder ───────────────────────────────────────────────────────
AbiEncoder::AbiEncoder(const std::string &selector)
    : selector_(strip0x(selector)) {
  if (selector_.size() != 8)
    throw DexarbError("selector must be 4 bytes: " + selector);
}

std::string AbiEncoder::addressWord(const std::string &addr) {
  std::string a = strip0x(addr);
  if (a.size() != 40)
    throw DexarbError("invalid address: '" + addr + "'");
  for (char c : a) {
    if (hexDigit(c) < 0)
      throw DexarbError("invalid address: '" + addr + "'");
  }
  std::transform(a.begin(), a.end(), a.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return padLeft(a);
}

std::string AbiEncoder::bytesTail(const std::string &hex) {
  std::string h = strip0x(hex);
  if (h.size() % 2 != 0)
    throw DexarbError("odd-length bytes");
  size_t len = h.size() / 2;
  size_t padded = ((h.size() + 63) / 64) * 64;
  return u64Word(len) + h + std::string(padded - h.size(), '0');
}

AbiEncoder &AbiEncoder::address(const std::string &addr) {
  slots_.push_back({false, addressWord(addr)});
  return *this;
}

AbiEncoder &AbiEncoder::uint256(const std::string &decimal) {
  slots_.push_back({false, decimalToWord(decimal)});
  return *this;
}

AbiEncoder &AbiEncoder::uint256(uint64_t value) {
  slots_.push_back({false, u64Word(value)});
  return *this;
}

AbiEncoder &AbiEncoder::bytes(const std::string &hex) {
  slots_.push_back({true, bytesTail(hex)});
  return *this;
}

AbiEncoder &AbiEncoder::addressArray(const std::vector<std::string> &addrs) {
  std::string tail = u64Word(addrs.size());
  for (const auto &a : addrs)
    tail += addressWord(a);
  slots_.push_back({true, tail});
  return *this;
}

// Elements are dynamic: count, then offsets relative to the first offset
// word, then each element's tail
AbiEncoder &AbiEncoder::bytesArray(const std::vector<std::string> &hexes) {
  std::string offsets, tails;
  size_t offset = 32 * hexes.size();
  for (const auto &h : hexes) {
    std::string t = bytesTail(h);
    offsets += u64Word(offset);
    offset += t.size() / 2;
    tails += t;
  }
  slots_.push_back({true, u64Word(hexes.size()) + offsets + tails});
  return *this;
}

std::string AbiEncoder::encode() const {
  std::string head, tail;
  size_t offset = 32 * slots_.size();
  for (const auto &s : slots_) {
    if (s.dynamic) {
      head += u64Word(offset);
      tail += s.data;
      offset += s.data.size() / 2;
    } else {
      head += s.data;
    }
  }
  return "0x" + selector_ + head + tail;
}

} // namespace dexarb
