#include "common/types.h"
#include <iomanip>
#include <sstream>

namespace altprog {
namespace common {

/**
 * @file types.cpp
 * @brief Template instantiations and hex helpers for common types
 */

// Explicit template instantiations for frequently used Result types
template class Result<bool>;
template class Result<uint64_t>;
template class Result<std::vector<uint8_t>>;

std::string to_hex(const std::vector<uint8_t> &data) {
  std::ostringstream oss;
  for (uint8_t byte : data) {
    oss << std::hex << std::setfill('0') << std::setw(2)
        << static_cast<int>(byte);
  }
  return oss.str();
}

namespace {

int hex_digit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

Result<std::vector<uint8_t>> from_hex(const std::string &text) {
  size_t start = 0;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    start = 2;
  }

  if ((text.size() - start) % 2 != 0) {
    return Result<std::vector<uint8_t>>("Hex string has odd length");
  }

  std::vector<uint8_t> bytes;
  bytes.reserve((text.size() - start) / 2);
  for (size_t i = start; i < text.size(); i += 2) {
    int hi = hex_digit(text[i]);
    int lo = hex_digit(text[i + 1]);
    if (hi < 0 || lo < 0) {
      return Result<std::vector<uint8_t>>("Invalid hex character at offset " +
                                          std::to_string(i));
    }
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return Result<std::vector<uint8_t>>(std::move(bytes));
}

} // namespace common
} // namespace altprog
