#pragma once

#include "svm/address_lookup_table/state.h"
#include "svm/engine.h"
#include <vector>

namespace altprog {
namespace svm {
namespace address_lookup_table {

/**
 * Tunable limits and policies of the lookup table program
 */
struct LookupTableConfig {
    /// Upper bound on addresses per table, at most LOOKUP_TABLE_MAX_ADDRESSES
    size_t max_addresses = LOOKUP_TABLE_MAX_ADDRESSES;
    /// Upper bound on addresses appended by one extend
    size_t max_addresses_per_extend = LOOKUP_TABLE_MAX_ADDRESSES;
    /// Permit a second extend in the slot of the previous one
    bool allow_same_slot_extend = false;
    uint64_t compute_units = 750;
};

// Authorization checks shared by every mutating instruction

/**
 * Fails with Immutable when the table is frozen, IncorrectAuthority when
 * the account is not the stored authority, MissingRequiredSignature when
 * it did not sign.
 */
ProgramResult require_authority_signer(const AccountInfo& authority_account,
                                       const LookupTableMeta& meta,
                                       ExecutionContext& context);

/// Fails with InvalidAccountOwner unless the table is owned by program_id
ProgramResult require_program_owned(const AccountInfo& table_account,
                                    const PublicKey& program_id,
                                    ExecutionContext& context);

/// Fails with Immutable unless the account was passed writable
ProgramResult require_writable(const AccountInfo& account,
                               ExecutionContext& context);

/**
 * Lookup table instruction handlers.
 *
 * Every handler validates all preconditions before its first mutation.
 * Accounts are positional, as documented on the instruction structs.
 */
class Processor {
public:
    Processor(const PublicKey& program_id, const LookupTableConfig& config);

    ProgramResult process_create_lookup_table(std::vector<AccountInfo>& accounts,
                                              Slot recent_slot,
                                              uint8_t bump_seed,
                                              ExecutionContext& context) const;

    ProgramResult process_freeze_lookup_table(std::vector<AccountInfo>& accounts,
                                              ExecutionContext& context) const;

    ProgramResult process_extend_lookup_table(std::vector<AccountInfo>& accounts,
                                              const std::vector<PublicKey>& new_addresses,
                                              ExecutionContext& context) const;

    ProgramResult process_deactivate_lookup_table(std::vector<AccountInfo>& accounts,
                                                  ExecutionContext& context) const;

    ProgramResult process_close_lookup_table(std::vector<AccountInfo>& accounts,
                                             ExecutionContext& context) const;

    const PublicKey& program_id() const { return program_id_; }
    const LookupTableConfig& config() const { return config_; }

private:
    /// Decode the table header, rejecting uninitialized accounts
    ProgramResult load_table(const AccountInfo& table_account,
                             LookupTableMeta& meta,
                             size_t& address_count,
                             ExecutionContext& context) const;

    /// Cross-program invocation on behalf of this program
    ProgramResult invoke(const Instruction& instruction,
                         const std::vector<AccountInfo>& accounts,
                         const std::vector<SignerSeeds>& signer_seeds,
                         ExecutionContext& context) const;

    PublicKey program_id_;
    LookupTableConfig config_;
};

} // namespace address_lookup_table
} // namespace svm
} // namespace altprog
