#pragma once

#include "common/types.h"
#include <cstdint>
#include <vector>

namespace altprog {
namespace common {

/**
 * Crypto utilities backed by OpenSSL
 * Provides SHA256 hashing and the ed25519 curve membership test used for
 * program-derived addresses
 */
class CryptoUtils {
public:
  /**
   * Compute SHA256 hash of data
   * @throws std::runtime_error if OpenSSL cannot allocate a digest context
   */
  static Hash sha256(const std::vector<uint8_t> &data);

  /**
   * Compute SHA256 hash over the concatenation of multiple chunks
   * @throws std::runtime_error if OpenSSL cannot allocate a digest context
   */
  static Hash sha256_multi(const std::vector<std::vector<uint8_t>> &data_chunks);

  /**
   * Check whether 32 bytes decompress to a point on the ed25519 curve.
   *
   * Mirrors compressed Edwards-Y decompression: the sign bit is ignored and
   * the bytes are a curve point iff (y^2 - 1) / (d*y^2 + 1) is a square mod p.
   * @return false for inputs that are not 32 bytes long
   */
  static bool is_on_ed25519_curve(const std::vector<uint8_t> &bytes);
};

} // namespace common
} // namespace altprog
