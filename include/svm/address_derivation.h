#pragma once

#include "common/types.h"
#include "svm/program_error.h"
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace altprog {
namespace svm {

using namespace altprog::common;

/// Seeds used to sign for one program-derived address
using SignerSeeds = std::vector<std::vector<uint8_t>>;

constexpr size_t MAX_SEEDS = 16;
constexpr size_t MAX_SEED_LEN = 32;

/// Domain separator appended after the program id
extern const char PDA_MARKER[];

/**
 * Derive a program address from seeds and a program id.
 *
 * address = sha256(seed_0 || ... || seed_n || program_id || "ProgramDerivedAddress")
 *
 * Fails with InvalidSeeds when there are too many seeds, a seed is longer
 * than MAX_SEED_LEN, or the resulting hash lies on the ed25519 curve.
 */
ProgramResult create_program_address(const SignerSeeds& seeds,
                                      const PublicKey& program_id,
                                      PublicKey& address);

/**
 * Search bump seeds from 255 downward for the first off-curve address.
 * The bump is appended to seeds as a single trailing byte.
 * @return nullopt if no bump yields a valid address
 */
std::optional<std::pair<PublicKey, uint8_t>> find_program_address(
    const SignerSeeds& seeds, const PublicKey& program_id);

} // namespace svm
} // namespace altprog
