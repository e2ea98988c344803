#pragma once

// ============================================================================
// 基础类型: 256-bit word / 20-byte address / 32-byte id
// ============================================================================

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace ledger {

// 定宽无符号 256 位, 溢出按 mod 2^256 回绕 (余额运算用 checked_* 检查)
using U256 = boost::multiprecision::uint256_t;

using Bytes = std::vector<uint8_t>;

static constexpr size_t WORD_BYTES = 32;
static constexpr size_t ADDRESS_BYTES = 20;

namespace detail {

inline int hex_digit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

inline std::string_view strip_0x(std::string_view s) {
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
    s.remove_prefix(2);
  return s;
}

} // namespace detail

inline std::string to_hex(const uint8_t *data, size_t n) {
  static const char *digits = "0123456789abcdef";
  std::string out = "0x";
  out.reserve(2 + n * 2);
  for (size_t i = 0; i < n; ++i) {
    out += digits[data[i] >> 4];
    out += digits[data[i] & 0x0f];
  }
  return out;
}

inline std::string to_hex(const Bytes &b) { return to_hex(b.data(), b.size()); }

// "0x..." -> bytes, 奇数长度或非法字符抛 invalid_argument
inline Bytes bytes_from_hex(std::string_view hex) {
  hex = detail::strip_0x(hex);
  if (hex.size() % 2 != 0)
    throw std::invalid_argument("odd-length hex string");
  Bytes out(hex.size() / 2);
  for (size_t i = 0; i < out.size(); ++i) {
    int hi = detail::hex_digit(hex[2 * i]);
    int lo = detail::hex_digit(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      throw std::invalid_argument("invalid hex digit");
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return out;
}

// ============================================================================
// FixedBytes<N> - Address(20) / Bytes32(32)
// ============================================================================
template <size_t N>
struct FixedBytes {
  std::array<uint8_t, N> bytes{};

  static FixedBytes from_hex(std::string_view hex) {
    auto raw = bytes_from_hex(hex);
    if (raw.size() != N)
      throw std::invalid_argument("expected " + std::to_string(N) + " bytes, got " +
                                  std::to_string(raw.size()));
    FixedBytes out;
    std::copy(raw.begin(), raw.end(), out.bytes.begin());
    return out;
  }

  std::string hex() const { return to_hex(bytes.data(), N); }
  bool is_zero() const {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
  }

  auto operator<=>(const FixedBytes &) const = default;
};

using Address = FixedBytes<ADDRESS_BYTES>;
using Bytes32 = FixedBytes<WORD_BYTES>;

// ============================================================================
// U256 <-> 32 字节大端
// ============================================================================
inline void write_word(const U256 &v, uint8_t *out) {
  std::fill(out, out + WORD_BYTES, 0);
  if (v.is_zero())
    return;
  std::vector<uint8_t> be;
  boost::multiprecision::export_bits(v, std::back_inserter(be), 8, true);
  std::copy(be.begin(), be.end(), out + (WORD_BYTES - be.size()));
}

inline Bytes32 word_to_bytes(const U256 &v) {
  Bytes32 out;
  write_word(v, out.bytes.data());
  return out;
}

inline U256 read_word(const uint8_t *in) {
  U256 v;
  boost::multiprecision::import_bits(v, in, in + WORD_BYTES, 8, true);
  return v;
}

inline U256 bytes_to_word(const Bytes32 &b) { return read_word(b.bytes.data()); }

inline std::string word_hex(const U256 &v) { return word_to_bytes(v).hex(); }

// 接受 "0x" 十六进制 (≤64 位) 或十进制
inline U256 parse_word(std::string_view s) {
  if (s.empty())
    throw std::invalid_argument("empty number");
  auto body = detail::strip_0x(s);
  bool is_hex = body.size() != s.size();
  if (is_hex) {
    if (body.empty() || body.size() > 64)
      throw std::invalid_argument("hex word must have 1..64 digits");
    std::string padded(64 - body.size(), '0');
    padded.append(body);
    return bytes_to_word(Bytes32::from_hex(padded));
  }
  static const U256 max = std::numeric_limits<U256>::max();
  U256 v = 0;
  for (char c : body) {
    if (c < '0' || c > '9')
      throw std::invalid_argument("invalid decimal digit");
    unsigned d = static_cast<unsigned>(c - '0');
    if (v > (max - d) / 10)
      throw std::invalid_argument("decimal number exceeds 256 bits");
    v = v * 10 + d;
  }
  return v;
}

inline std::string word_dec(const U256 &v) { return v.str(); }

} // namespace ledger
