#pragma once

#include "svm/engine.h"
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace altprog {
namespace svm {
namespace address_lookup_table {

using namespace altprog::common;

/// Address of the address lookup table program
const PublicKey& address_lookup_table_program_id();

enum class InstructionTag : uint32_t {
    CreateLookupTable = 0,
    FreezeLookupTable = 1,
    ExtendLookupTable = 2,
    DeactivateLookupTable = 3,
    CloseLookupTable = 4,
};

/**
 * Create a table at the address derived from (authority, recent_slot, bump).
 *
 * Accounts: [writable] table, [] authority, [writable, signer] payer,
 * [] SlotHashes sysvar, [] system program
 */
struct CreateLookupTable {
    Slot recent_slot = 0;
    uint8_t bump_seed = 0;
};

/**
 * Permanently clear the authority of a non-empty table.
 *
 * Accounts: [writable] table, [signer] authority
 */
struct FreezeLookupTable {};

/**
 * Append addresses to an active, mutable table.
 *
 * Accounts: [writable] table, [signer] authority,
 * [writable, signer] payer and [] system program when rent must be topped up
 */
struct ExtendLookupTable {
    std::vector<PublicKey> new_addresses;
};

/**
 * Start the cooldown after which a table may be closed.
 *
 * Accounts: [writable] table, [signer] authority
 */
struct DeactivateLookupTable {};

/**
 * Reclaim the balance of a fully deactivated table.
 *
 * Accounts: [writable] table, [signer] authority, [writable] recipient,
 * [] SlotHashes sysvar
 */
struct CloseLookupTable {};

using LookupTableInstruction = std::variant<
    CreateLookupTable,
    FreezeLookupTable,
    ExtendLookupTable,
    DeactivateLookupTable,
    CloseLookupTable>;

const char* instruction_name(const LookupTableInstruction& instruction);

/**
 * Decode the u32 tag and payload.
 * Unknown tags, short payloads and extend payloads whose length does not
 * match the address count fail with InvalidInstructionData.
 */
ProgramResult decode_instruction(const std::vector<uint8_t>& data,
                                 LookupTableInstruction& instruction);

std::vector<uint8_t> encode_instruction(const LookupTableInstruction& instruction);

/// Table address and bump for an authority and recent slot
std::optional<std::pair<PublicKey, uint8_t>> derive_lookup_table_address(
    const PublicKey& authority, Slot recent_slot);

/// Seeds signing for the table address
SignerSeeds lookup_table_seeds(const PublicKey& authority, Slot recent_slot, uint8_t bump_seed);

/**
 * Build a CreateLookupTable instruction.
 * @return the instruction and the derived table address
 * @throws std::runtime_error if no bump seed yields a valid address
 */
std::pair<Instruction, PublicKey> create_lookup_table(const PublicKey& authority,
                                                      const PublicKey& payer,
                                                      Slot recent_slot);

Instruction freeze_lookup_table(const PublicKey& lookup_table, const PublicKey& authority);

Instruction extend_lookup_table(const PublicKey& lookup_table,
                                const PublicKey& authority,
                                const std::optional<PublicKey>& payer,
                                const std::vector<PublicKey>& new_addresses);

Instruction deactivate_lookup_table(const PublicKey& lookup_table, const PublicKey& authority);

Instruction close_lookup_table(const PublicKey& lookup_table,
                               const PublicKey& authority,
                               const PublicKey& recipient);

} // namespace address_lookup_table
} // namespace svm
} // namespace altprog
