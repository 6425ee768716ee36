#include "svm/address_lookup_table/instruction.h"
#include "common/base58.h"
#include "svm/address_derivation.h"
#include "svm/system_program.h"
#include "svm/sysvars.h"
#include <stdexcept>

namespace altprog {
namespace svm {
namespace address_lookup_table {

namespace {

constexpr size_t TAG_SIZE = 4;

template<typename T>
bool read_le(const std::vector<uint8_t>& data, size_t offset, T& value) {
    if (offset > data.size() || data.size() - offset < sizeof(T)) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(data[offset + i]) << (i * 8);
    }
    return true;
}

template<typename T>
void write_le(std::vector<uint8_t>& data, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

std::vector<uint8_t> slot_seed(Slot slot) {
    std::vector<uint8_t> seed;
    write_le<uint64_t>(seed, slot);
    return seed;
}

} // namespace

const PublicKey& address_lookup_table_program_id() {
    static const PublicKey id = pubkey_from_base58("AddressLookupTab1e1111111111111111111111111");
    return id;
}

const char* instruction_name(const LookupTableInstruction& instruction) {
    switch (instruction.index()) {
        case 0: return "CreateLookupTable";
        case 1: return "FreezeLookupTable";
        case 2: return "ExtendLookupTable";
        case 3: return "DeactivateLookupTable";
        case 4: return "CloseLookupTable";
    }
    return "Unknown";
}

ProgramResult decode_instruction(const std::vector<uint8_t>& data,
                                 LookupTableInstruction& instruction) {
    uint32_t tag = 0;
    if (!read_le<uint32_t>(data, 0, tag)) {
        return ProgramError::InvalidInstructionData;
    }

    switch (static_cast<InstructionTag>(tag)) {
        case InstructionTag::CreateLookupTable: {
            CreateLookupTable create;
            if (!read_le<uint64_t>(data, TAG_SIZE, create.recent_slot) ||
                !read_le<uint8_t>(data, TAG_SIZE + 8, create.bump_seed)) {
                return ProgramError::InvalidInstructionData;
            }
            instruction = create;
            return ProgramResult::ok();
        }
        case InstructionTag::FreezeLookupTable:
            instruction = FreezeLookupTable{};
            return ProgramResult::ok();
        case InstructionTag::ExtendLookupTable: {
            uint64_t count = 0;
            if (!read_le<uint64_t>(data, TAG_SIZE, count)) {
                return ProgramError::InvalidInstructionData;
            }
            size_t payload = data.size() - TAG_SIZE - 8;
            if (payload % PUBKEY_BYTES != 0 || count != payload / PUBKEY_BYTES) {
                return ProgramError::InvalidInstructionData;
            }

            ExtendLookupTable extend;
            extend.new_addresses.reserve(static_cast<size_t>(count));
            for (size_t offset = TAG_SIZE + 8; offset < data.size(); offset += PUBKEY_BYTES) {
                extend.new_addresses.emplace_back(data.begin() + offset,
                                                  data.begin() + offset + PUBKEY_BYTES);
            }
            instruction = std::move(extend);
            return ProgramResult::ok();
        }
        case InstructionTag::DeactivateLookupTable:
            instruction = DeactivateLookupTable{};
            return ProgramResult::ok();
        case InstructionTag::CloseLookupTable:
            instruction = CloseLookupTable{};
            return ProgramResult::ok();
    }
    return ProgramError::InvalidInstructionData;
}

std::vector<uint8_t> encode_instruction(const LookupTableInstruction& instruction) {
    std::vector<uint8_t> data;
    write_le<uint32_t>(data, static_cast<uint32_t>(instruction.index()));

    if (const auto* create = std::get_if<CreateLookupTable>(&instruction)) {
        write_le<uint64_t>(data, create->recent_slot);
        data.push_back(create->bump_seed);
    } else if (const auto* extend = std::get_if<ExtendLookupTable>(&instruction)) {
        write_le<uint64_t>(data, extend->new_addresses.size());
        for (const auto& address : extend->new_addresses) {
            data.insert(data.end(), address.begin(), address.end());
        }
    }
    return data;
}

std::optional<std::pair<PublicKey, uint8_t>> derive_lookup_table_address(
    const PublicKey& authority, Slot recent_slot) {
    return find_program_address({authority, slot_seed(recent_slot)},
                                address_lookup_table_program_id());
}

SignerSeeds lookup_table_seeds(const PublicKey& authority, Slot recent_slot, uint8_t bump_seed) {
    return {authority, slot_seed(recent_slot), {bump_seed}};
}

std::pair<Instruction, PublicKey> create_lookup_table(const PublicKey& authority,
                                                      const PublicKey& payer,
                                                      Slot recent_slot) {
    auto derived = derive_lookup_table_address(authority, recent_slot);
    if (!derived) {
        throw std::runtime_error("Unable to find a viable lookup table address");
    }

    Instruction instruction;
    instruction.program_id = address_lookup_table_program_id();
    instruction.accounts = {
        AccountMeta::writable(derived->first, false),
        AccountMeta::readonly(authority, false),
        AccountMeta::writable(payer, true),
        AccountMeta::readonly(slot_hashes_sysvar_id(), false),
        AccountMeta::readonly(system_program_id(), false),
    };
    instruction.data = encode_instruction(CreateLookupTable{recent_slot, derived->second});
    return {instruction, derived->first};
}

Instruction freeze_lookup_table(const PublicKey& lookup_table, const PublicKey& authority) {
    Instruction instruction;
    instruction.program_id = address_lookup_table_program_id();
    instruction.accounts = {
        AccountMeta::writable(lookup_table, false),
        AccountMeta::readonly(authority, true),
    };
    instruction.data = encode_instruction(FreezeLookupTable{});
    return instruction;
}

Instruction extend_lookup_table(const PublicKey& lookup_table,
                                const PublicKey& authority,
                                const std::optional<PublicKey>& payer,
                                const std::vector<PublicKey>& new_addresses) {
    Instruction instruction;
    instruction.program_id = address_lookup_table_program_id();
    instruction.accounts = {
        AccountMeta::writable(lookup_table, false),
        AccountMeta::readonly(authority, true),
    };
    if (payer) {
        instruction.accounts.push_back(AccountMeta::writable(*payer, true));
        instruction.accounts.push_back(AccountMeta::readonly(system_program_id(), false));
    }
    instruction.data = encode_instruction(ExtendLookupTable{new_addresses});
    return instruction;
}

Instruction deactivate_lookup_table(const PublicKey& lookup_table, const PublicKey& authority) {
    Instruction instruction;
    instruction.program_id = address_lookup_table_program_id();
    instruction.accounts = {
        AccountMeta::writable(lookup_table, false),
        AccountMeta::readonly(authority, true),
    };
    instruction.data = encode_instruction(DeactivateLookupTable{});
    return instruction;
}

Instruction close_lookup_table(const PublicKey& lookup_table,
                               const PublicKey& authority,
                               const PublicKey& recipient) {
    Instruction instruction;
    instruction.program_id = address_lookup_table_program_id();
    instruction.accounts = {
        AccountMeta::writable(lookup_table, false),
        AccountMeta::readonly(authority, true),
        AccountMeta::writable(recipient, false),
        AccountMeta::readonly(slot_hashes_sysvar_id(), false),
    };
    instruction.data = encode_instruction(CloseLookupTable{});
    return instruction;
}

} // namespace address_lookup_table
} // namespace svm
} // namespace altprog
