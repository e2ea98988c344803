#pragma once

// ============================================================================
// Hash - SHA3-256 over packed big-endian encoding (OpenSSL EVP)
// ============================================================================

#include "types.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace ledger {

// 紧凑拼接: address 20 字节, bytes32/word 32 字节, 无填充
class Packer {
public:
  Packer &address(const Address &a) {
    buf_.insert(buf_.end(), a.bytes.begin(), a.bytes.end());
    return *this;
  }
  Packer &bytes32(const Bytes32 &b) {
    buf_.insert(buf_.end(), b.bytes.begin(), b.bytes.end());
    return *this;
  }
  Packer &word(const U256 &v) {
    size_t off = buf_.size();
    buf_.resize(off + WORD_BYTES);
    write_word(v, buf_.data() + off);
    return *this;
  }

  const Bytes &data() const { return buf_; }

private:
  Bytes buf_;
};

inline Bytes32 sha3_256(const uint8_t *data, size_t n) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx)
    throw std::runtime_error("EVP_MD_CTX_new failed");

  Bytes32 out;
  unsigned int len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, n) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.bytes.data(), &len) != 1 || len != WORD_BYTES)
    throw std::runtime_error("sha3-256 digest failed");
  return out;
}

inline Bytes32 sha3_256(const Bytes &b) { return sha3_256(b.data(), b.size()); }
inline Bytes32 sha3_256(const Packer &p) { return sha3_256(p.data()); }

} // namespace ledger
