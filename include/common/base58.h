#pragma once

#include "common/types.h"
#include <string>
#include <vector>

namespace altprog {
namespace common {

/**
 * Base58 (Bitcoin alphabet) encoding as used for Solana addresses.
 */
std::string encode_base58(const std::vector<uint8_t> &data);

/**
 * Decode base58 text. Fails on characters outside the alphabet.
 */
Result<std::vector<uint8_t>> decode_base58(const std::string &encoded);

/**
 * Decode a base58 address and require exactly 32 bytes.
 */
Result<PublicKey> decode_pubkey(const std::string &encoded);

/**
 * Decode a compile-time known address constant.
 * @throws std::invalid_argument if the text is not a valid 32-byte address
 */
PublicKey pubkey_from_base58(const std::string &encoded);

} // namespace common
} // namespace altprog
