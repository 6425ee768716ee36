#include "common/base58.h"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace altprog {
namespace common {

namespace {

// Base58 alphabet used by Bitcoin and Solana
constexpr char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

const std::array<int, 256> &base58_map() {
  static const std::array<int, 256> map = [] {
    std::array<int, 256> m{};
    m.fill(-1);
    for (int i = 0; i < 58; ++i) {
      m[static_cast<unsigned char>(BASE58_ALPHABET[i])] = i;
    }
    return m;
  }();
  return map;
}

} // namespace

std::string encode_base58(const std::vector<uint8_t> &data) {
  if (data.empty())
    return "";

  // Little-endian base58 digits of the big-endian input number
  std::vector<uint8_t> digits;
  digits.reserve(data.size() * 138 / 100 + 1);

  for (uint8_t byte : data) {
    uint32_t carry = byte;
    for (size_t j = 0; j < digits.size(); ++j) {
      carry += static_cast<uint32_t>(digits[j]) << 8;
      digits[j] = carry % 58;
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(carry % 58);
      carry /= 58;
    }
  }

  std::string result;
  for (uint8_t byte : data) {
    if (byte != 0)
      break;
    result += BASE58_ALPHABET[0];
  }

  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    result += BASE58_ALPHABET[*it];
  }

  return result;
}

Result<std::vector<uint8_t>> decode_base58(const std::string &encoded) {
  const auto &map = base58_map();

  // Little-endian bytes of the decoded number
  std::vector<uint8_t> bytes;
  bytes.reserve(encoded.size() * 733 / 1000 + 1);

  for (char c : encoded) {
    int digit = map[static_cast<unsigned char>(c)];
    if (digit < 0) {
      return Result<std::vector<uint8_t>>(
          std::string("Invalid base58 character '") + c + "'");
    }

    uint32_t carry = static_cast<uint32_t>(digit);
    for (size_t j = 0; j < bytes.size(); ++j) {
      carry += static_cast<uint32_t>(bytes[j]) * 58;
      bytes[j] = carry & 0xFF;
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(carry & 0xFF);
      carry >>= 8;
    }
  }

  size_t leading_zeros = 0;
  for (char c : encoded) {
    if (c != BASE58_ALPHABET[0])
      break;
    leading_zeros++;
  }

  std::vector<uint8_t> result(leading_zeros, 0);
  result.insert(result.end(), bytes.rbegin(), bytes.rend());
  return Result<std::vector<uint8_t>>(std::move(result));
}

Result<PublicKey> decode_pubkey(const std::string &encoded) {
  auto decoded = decode_base58(encoded);
  if (decoded.is_err()) {
    return Result<PublicKey>(decoded.error());
  }
  if (decoded.value().size() != PUBKEY_BYTES) {
    return Result<PublicKey>("Address must decode to 32 bytes, got " +
                             std::to_string(decoded.value().size()));
  }
  return Result<PublicKey>(std::move(decoded).value());
}

PublicKey pubkey_from_base58(const std::string &encoded) {
  auto decoded = decode_pubkey(encoded);
  if (decoded.is_err()) {
    throw std::invalid_argument("Invalid address constant " + encoded + ": " +
                                decoded.error());
  }
  return std::move(decoded).value();
}

} // namespace common
} // namespace altprog
