#include "svm/address_lookup_table/processor.h"
#include "common/base58.h"
#include "common/logging.h"
#include "svm/address_derivation.h"
#include "svm/address_lookup_table/instruction.h"
#include "svm/system_program.h"
#include "svm/sysvars.h"
#include <algorithm>
#include <limits>

namespace altprog {
namespace svm {
namespace address_lookup_table {

namespace {

const char* const LOG_MODULE = "address_lookup_table";

ProgramResult reject(ExecutionContext& context, ProgramError error, const std::string& reason) {
    context.log(reason);
    if (Logger::instance().is_debug_enabled()) {
        LOG_STRUCTURED(LogLevel::DEBUG, LOG_MODULE, reason, program_error_to_string(error),
                       {{"slot", std::to_string(context.slot)}});
    }
    return error;
}

Lamports rent_shortfall(const ExecutionContext& context, size_t data_len, Lamports balance) {
    Lamports required = std::max<Lamports>(context.rent.minimum_balance(data_len), 1);
    return required > balance ? required - balance : 0;
}

} // namespace

ProgramResult require_authority_signer(const AccountInfo& authority_account,
                                       const LookupTableMeta& meta,
                                       ExecutionContext& context) {
    if (!meta.authority) {
        return reject(context, ProgramError::Immutable, "Lookup table is frozen");
    }
    if (*meta.authority != authority_account.key()) {
        return reject(context, ProgramError::IncorrectAuthority,
                      "Incorrect lookup table authority");
    }
    if (!authority_account.is_signer()) {
        return reject(context, ProgramError::MissingRequiredSignature,
                      "Authority account must be a signer");
    }
    return ProgramResult::ok();
}

ProgramResult require_program_owned(const AccountInfo& table_account,
                                    const PublicKey& program_id,
                                    ExecutionContext& context) {
    if (table_account.owner() != program_id) {
        return reject(context, ProgramError::InvalidAccountOwner,
                      "Lookup table owner should be the Address Lookup Table program");
    }
    return ProgramResult::ok();
}

ProgramResult require_writable(const AccountInfo& account, ExecutionContext& context) {
    if (!account.is_writable()) {
        return reject(context, ProgramError::Immutable,
                      "Account " + encode_base58(account.key()) + " must be writable");
    }
    return ProgramResult::ok();
}

Processor::Processor(const PublicKey& program_id, const LookupTableConfig& config)
    : program_id_(program_id), config_(config) {}

ProgramResult Processor::load_table(const AccountInfo& table_account,
                                    LookupTableMeta& meta,
                                    size_t& address_count,
                                    ExecutionContext& context) const {
    ProgramState state = ProgramState::Uninitialized;
    ProgramResult decoded = decode(table_account.data(), state, meta, address_count);
    if (decoded.is_err()) {
        return reject(context, decoded.error(), "Invalid lookup table account data");
    }
    if (state != ProgramState::LookupTable) {
        return reject(context, ProgramError::UninitializedAccount,
                      "Lookup table is not initialized");
    }
    return ProgramResult::ok();
}

ProgramResult Processor::invoke(const Instruction& instruction,
                                const std::vector<AccountInfo>& accounts,
                                const std::vector<SignerSeeds>& signer_seeds,
                                ExecutionContext& context) const {
    if (!context.engine) {
        return reject(context, ProgramError::UnsupportedProgramId,
                      "Cross-program invocation is unavailable");
    }
    return context.engine->invoke_signed(instruction, accounts, program_id_,
                                         signer_seeds, context).to_program_result();
}

ProgramResult Processor::process_create_lookup_table(std::vector<AccountInfo>& accounts,
                                                     Slot recent_slot,
                                                     uint8_t bump_seed,
                                                     ExecutionContext& context) const {
    if (accounts.size() < 4) {
        return ProgramError::NotEnoughAccountKeys;
    }
    AccountInfo& table = accounts[0];
    const AccountInfo& authority = accounts[1];
    const AccountInfo& payer = accounts[2];
    const AccountInfo& slot_hashes_account = accounts[3];

    if (!payer.is_signer()) {
        return reject(context, ProgramError::MissingRequiredSignature,
                      "Payer account must be a signer");
    }
    if (slot_hashes_account.key() != slot_hashes_sysvar_id()) {
        return reject(context, ProgramError::InvalidArgument,
                      "Invalid SlotHashes sysvar account");
    }

    SlotHashes slot_hashes;
    ProgramResult loaded = SlotHashes::deserialize(slot_hashes_account.data(), slot_hashes);
    if (loaded.is_err()) {
        return loaded;
    }
    if (!slot_hashes.contains(recent_slot)) {
        return reject(context, ProgramError::InvalidSlot,
                      std::to_string(recent_slot) + " is not a recent slot");
    }

    SignerSeeds seeds = lookup_table_seeds(authority.key(), recent_slot, bump_seed);
    PublicKey derived_table_key;
    ProgramResult derived = create_program_address(seeds, program_id_, derived_table_key);
    if (derived.is_err()) {
        return reject(context, derived.error(), "Invalid lookup table derivation seeds");
    }
    if (table.key() != derived_table_key) {
        return reject(context, ProgramError::InvalidAuthority,
                      "Table address must match derived address: " +
                      encode_base58(derived_table_key));
    }

    if (table.owner() == program_id_) {
        return reject(context, ProgramError::AccountAlreadyInitialized,
                      "Table account is already initialized");
    }
    ProgramResult writable = require_writable(table, context);
    if (writable.is_err()) {
        return writable;
    }

    Lamports required_lamports = rent_shortfall(context, LOOKUP_TABLE_META_SIZE, table.lamports());
    if (required_lamports > 0) {
        ProgramResult transferred = invoke(
            system_instruction::transfer(payer.key(), table.key(), required_lamports),
            accounts, {}, context);
        if (transferred.is_err()) {
            return transferred;
        }
    }

    ProgramResult allocated = invoke(
        system_instruction::allocate(table.key(), LOOKUP_TABLE_META_SIZE),
        accounts, {seeds}, context);
    if (allocated.is_err()) {
        return allocated;
    }

    ProgramResult assigned = invoke(
        system_instruction::assign(table.key(), program_id_), accounts, {seeds}, context);
    if (assigned.is_err()) {
        return assigned;
    }

    LOG_DEBUG(LOG_MODULE, "Created lookup table ", encode_base58(table.key()),
              " for authority ", encode_base58(authority.key()));
    return serialize_new_lookup_table(table.data_mut(), authority.key());
}

ProgramResult Processor::process_freeze_lookup_table(std::vector<AccountInfo>& accounts,
                                                     ExecutionContext& context) const {
    if (accounts.size() < 2) {
        return ProgramError::NotEnoughAccountKeys;
    }
    AccountInfo& table = accounts[0];
    const AccountInfo& authority = accounts[1];

    ProgramResult check = require_program_owned(table, program_id_, context);
    if (check.is_err()) {
        return check;
    }

    LookupTableMeta meta;
    size_t address_count = 0;
    check = load_table(table, meta, address_count, context);
    if (check.is_err()) {
        return check;
    }

    check = require_authority_signer(authority, meta, context);
    if (check.is_err()) {
        return check;
    }
    if (meta.is_deactivated()) {
        return reject(context, ProgramError::AlreadyDeactivated,
                      "Deactivated tables cannot be frozen");
    }
    if (address_count == 0) {
        return reject(context, ProgramError::EmptyLookupTable,
                      "Empty lookup tables cannot be frozen");
    }
    check = require_writable(table, context);
    if (check.is_err()) {
        return check;
    }

    meta.authority.reset();
    return encode(meta, table.data_mut());
}

ProgramResult Processor::process_extend_lookup_table(std::vector<AccountInfo>& accounts,
                                                     const std::vector<PublicKey>& new_addresses,
                                                     ExecutionContext& context) const {
    if (accounts.size() < 2) {
        return ProgramError::NotEnoughAccountKeys;
    }
    AccountInfo& table = accounts[0];
    const AccountInfo& authority = accounts[1];

    ProgramResult check = require_program_owned(table, program_id_, context);
    if (check.is_err()) {
        return check;
    }

    LookupTableMeta meta;
    size_t old_address_count = 0;
    check = load_table(table, meta, old_address_count, context);
    if (check.is_err()) {
        return check;
    }

    check = require_authority_signer(authority, meta, context);
    if (check.is_err()) {
        return check;
    }
    if (meta.is_deactivated()) {
        return reject(context, ProgramError::AlreadyDeactivated,
                      "Deactivated tables cannot be extended");
    }
    if (old_address_count >= config_.max_addresses) {
        return reject(context, ProgramError::ExceedsMaxEntries,
                      "Lookup table is full and cannot contain more addresses");
    }
    if (new_addresses.empty()) {
        return reject(context, ProgramError::InvalidInstructionData,
                      "Must extend with at least one address");
    }
    if (new_addresses.size() > config_.max_addresses_per_extend) {
        return reject(context, ProgramError::ExceedsMaxEntries,
                      "Extend of " + std::to_string(new_addresses.size()) +
                      " addresses exceeds the per-extend limit of " +
                      std::to_string(config_.max_addresses_per_extend));
    }

    size_t new_address_count = old_address_count + new_addresses.size();
    if (new_address_count > config_.max_addresses) {
        return reject(context, ProgramError::ExceedsMaxEntries,
                      "Extended lookup table length " + std::to_string(new_address_count) +
                      " would exceed max capacity of " + std::to_string(config_.max_addresses));
    }

    bool same_slot = meta.last_extended_slot == context.slot;
    if (same_slot && old_address_count > 0 && !config_.allow_same_slot_extend) {
        return reject(context, ProgramError::SameSlotExtend,
                      "Lookup table was already extended in slot " +
                      std::to_string(context.slot));
    }

    check = require_writable(table, context);
    if (check.is_err()) {
        return check;
    }

    size_t new_data_len = LOOKUP_TABLE_META_SIZE + new_address_count * PUBKEY_BYTES;
    Lamports required_lamports = rent_shortfall(context, new_data_len, table.lamports());
    if (required_lamports > 0) {
        if (accounts.size() < 3) {
            return reject(context, ProgramError::NotEnoughAccountKeys,
                          "Payer account required to fund the extended table");
        }
        const AccountInfo& payer = accounts[2];
        if (!payer.is_signer()) {
            return reject(context, ProgramError::MissingRequiredSignature,
                          "Payer account must be a signer");
        }
        if (payer.lamports() < required_lamports) {
            return reject(context, ProgramError::InsufficientFunds,
                          "Payer balance " + std::to_string(payer.lamports()) +
                          " cannot cover " + std::to_string(required_lamports) + " lamports");
        }

        ProgramResult transferred = invoke(
            system_instruction::transfer(payer.key(), table.key(), required_lamports),
            accounts, {}, context);
        if (transferred.is_err()) {
            return transferred;
        }
    }

    ProgramResult resized = table.resize(new_data_len);
    if (resized.is_err()) {
        return resized;
    }
    ProgramResult appended = append_addresses(table.data_mut(), old_address_count, new_addresses);
    if (appended.is_err()) {
        return appended;
    }

    if (!same_slot) {
        meta.last_extended_slot = context.slot;
        meta.last_extended_slot_start_index = static_cast<uint8_t>(old_address_count);
    }

    LOG_DEBUG(LOG_MODULE, "Extended lookup table ", encode_base58(table.key()), " to ",
              new_address_count, " addresses");
    return encode(meta, table.data_mut());
}

ProgramResult Processor::process_deactivate_lookup_table(std::vector<AccountInfo>& accounts,
                                                         ExecutionContext& context) const {
    if (accounts.size() < 2) {
        return ProgramError::NotEnoughAccountKeys;
    }
    AccountInfo& table = accounts[0];
    const AccountInfo& authority = accounts[1];

    ProgramResult check = require_program_owned(table, program_id_, context);
    if (check.is_err()) {
        return check;
    }

    LookupTableMeta meta;
    size_t address_count = 0;
    check = load_table(table, meta, address_count, context);
    if (check.is_err()) {
        return check;
    }

    check = require_authority_signer(authority, meta, context);
    if (check.is_err()) {
        return check;
    }
    if (meta.is_deactivated()) {
        return reject(context, ProgramError::AlreadyDeactivated,
                      "Lookup table is already deactivated");
    }
    check = require_writable(table, context);
    if (check.is_err()) {
        return check;
    }

    meta.deactivation_slot = context.slot;
    return encode(meta, table.data_mut());
}

ProgramResult Processor::process_close_lookup_table(std::vector<AccountInfo>& accounts,
                                                    ExecutionContext& context) const {
    if (accounts.size() < 4) {
        return ProgramError::NotEnoughAccountKeys;
    }
    AccountInfo& table = accounts[0];
    const AccountInfo& authority = accounts[1];
    AccountInfo& recipient = accounts[2];
    const AccountInfo& slot_hashes_account = accounts[3];

    ProgramResult check = require_program_owned(table, program_id_, context);
    if (check.is_err()) {
        return check;
    }

    LookupTableMeta meta;
    size_t address_count = 0;
    check = load_table(table, meta, address_count, context);
    if (check.is_err()) {
        return check;
    }

    check = require_authority_signer(authority, meta, context);
    if (check.is_err()) {
        return check;
    }
    if (recipient.key() == table.key()) {
        return reject(context, ProgramError::InvalidArgument,
                      "Lookup table cannot be the recipient of reclaimed lamports");
    }

    if (!meta.is_deactivated()) {
        return reject(context, ProgramError::DeactivationRequired,
                      "Lookup table is not deactivated");
    }
    if (meta.deactivation_slot == context.slot) {
        return reject(context, ProgramError::NotReady,
                      "Table cannot be closed until it's fully deactivated in " +
                      std::to_string(SlotHashes::MAX_ENTRIES + 1) + " blocks");
    }

    if (slot_hashes_account.key() != slot_hashes_sysvar_id()) {
        return reject(context, ProgramError::InvalidArgument,
                      "Invalid SlotHashes sysvar account");
    }
    SlotHashes slot_hashes;
    check = SlotHashes::deserialize(slot_hashes_account.data(), slot_hashes);
    if (check.is_err()) {
        return check;
    }
    if (auto position = slot_hashes.position(meta.deactivation_slot)) {
        return reject(context, ProgramError::NotReady,
                      "Table cannot be closed until it's fully deactivated in " +
                      std::to_string(SlotHashes::MAX_ENTRIES - *position) + " blocks");
    }

    check = require_writable(table, context);
    if (check.is_err()) {
        return check;
    }
    check = require_writable(recipient, context);
    if (check.is_err()) {
        return check;
    }

    if (recipient.lamports() > std::numeric_limits<Lamports>::max() - table.lamports()) {
        return ProgramError::ArithmeticOverflow;
    }
    Lamports new_recipient_lamports = recipient.lamports() + table.lamports();

    std::fill(table.data_mut().begin(), table.data_mut().end(), 0);
    check = table.resize(0);
    if (check.is_err()) {
        return check;
    }
    recipient.set_lamports(new_recipient_lamports);
    table.set_lamports(0);

    LOG_DEBUG(LOG_MODULE, "Closed lookup table ", encode_base58(table.key()));
    return ProgramResult::ok();
}

} // namespace address_lookup_table
} // namespace svm
} // namespace altprog
