#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace altprog {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities used throughout the lookup table program
 *
 * Defines the byte-vector key and hash types, the slot and lamport scalars and
 * the Result<T> wrapper used by every layer that can fail with a message.
 */

/// @brief Size in bytes of a public key / account address
constexpr size_t PUBKEY_BYTES = 32;

/// @brief Size in bytes of a SHA-256 hash
constexpr size_t HASH_BYTES = 32;

/// @brief Cryptographic hash representation (SHA-256, 32 bytes)
using Hash = std::vector<uint8_t>;

/// @brief Ed25519 public key / account address (32 bytes)
using PublicKey = std::vector<uint8_t>;

/// @brief Slot number representing blockchain height/time
using Slot = uint64_t;

/// @brief Epoch number
using Epoch = uint64_t;

/// @brief Native token amount in smallest unit (1 SOL = 1,000,000,000 lamports)
using Lamports = uint64_t;

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Holds either a success value or an error message. Used by the
 * configuration, encoding and tooling layers; program handlers use
 * svm::ProgramResult, which carries a typed error instead of a string.
 *
 * @tparam T The type of the success value (must be default constructible)
 *
 * Example usage:
 * @code
 * auto result = decode_pubkey(text);
 * if (result.is_ok()) {
 *     use(result.value());
 * } else {
 *     std::cerr << "Decode failed: " << result.error() << std::endl;
 * }
 * @endcode
 */
template <typename T>
class Result {
private:
  bool success_;
  T value_;
  std::string error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error C-string describing the error
   */
  explicit Result(const char *error) : success_(false), value_(), error_(error) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error String describing the error
   */
  explicit Result(const std::string &error)
      : success_(false), value_(), error_(error) {}

  Result(const Result &other) = default;
  Result(Result &&other) noexcept = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) noexcept = default;

  bool is_ok() const noexcept { return success_; }
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }
  T &&value() && { return std::move(value_); }

  /// @brief Get the error message (empty on success)
  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

/// @brief Render bytes as lowercase hex
std::string to_hex(const std::vector<uint8_t> &data);

/// @brief Parse lowercase or uppercase hex, optionally prefixed with 0x
Result<std::vector<uint8_t>> from_hex(const std::string &text);

} // namespace common
} // namespace altprog

/**
 * @brief Standard library hash specialization for byte vectors
 *
 * Enables use of Hash and PublicKey as keys in std::unordered_map and
 * std::unordered_set containers.
 */
namespace std {
template <>
struct hash<std::vector<uint8_t>> {
  std::size_t operator()(const std::vector<uint8_t> &v) const noexcept {
    std::size_t seed = v.size();
    for (const auto &byte : v) {
      // Boost-style hash combine
      seed ^= byte + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
} // namespace std
