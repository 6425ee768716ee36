#pragma once

#include "common/types.h"
#include "svm/address_derivation.h"
#include "svm/program_error.h"
#include "svm/rent_calculator.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace altprog {
namespace svm {

using namespace altprog::common;

/// Maximum number of bytes an account's data may grow by within one instruction
constexpr size_t MAX_PERMITTED_DATA_INCREASE = 10 * 1024;

/// Maximum data length of any account
constexpr size_t MAX_PERMITTED_DATA_LENGTH = 10 * 1024 * 1024;

/// Maximum cross-program invocation depth (top level counts as 1)
constexpr size_t MAX_INVOKE_DEPTH = 5;

/**
 * Stored account: balance, data and owning program
 */
struct ProgramAccount {
    Lamports lamports = 0;
    std::vector<uint8_t> data;
    PublicKey owner;
    bool executable = false;
    Epoch rent_epoch = 0;
};

/**
 * Account reference of an instruction with its privileges
 */
struct AccountMeta {
    PublicKey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    static AccountMeta writable(const PublicKey& pubkey, bool is_signer) {
        return AccountMeta{pubkey, is_signer, true};
    }
    static AccountMeta readonly(const PublicKey& pubkey, bool is_signer) {
        return AccountMeta{pubkey, is_signer, false};
    }
};

/**
 * Instruction to be executed by the SVM
 */
struct Instruction {
    PublicKey program_id;
    std::vector<AccountMeta> accounts;
    std::vector<uint8_t> data;
};

/**
 * Borrowed view of one instruction account for the duration of a program call.
 *
 * Points into ExecutionContext::accounts; the map is node based so the view
 * survives insertions of other keys.
 */
class AccountInfo {
public:
    AccountInfo(const PublicKey& key, bool is_signer, bool is_writable,
                ProgramAccount& account);

    const PublicKey& key() const { return *key_; }
    bool is_signer() const { return is_signer_; }
    bool is_writable() const { return is_writable_; }

    Lamports lamports() const { return account_->lamports; }
    const PublicKey& owner() const { return account_->owner; }
    bool executable() const { return account_->executable; }
    size_t data_len() const { return account_->data.size(); }
    const std::vector<uint8_t>& data() const { return account_->data; }

    /// Mutable data buffer; callers must have checked writability
    std::vector<uint8_t>& data_mut() { return account_->data; }

    void set_lamports(Lamports lamports) { account_->lamports = lamports; }
    void assign(const PublicKey& owner) { account_->owner = owner; }

    /**
     * Resize the data buffer, zero-filling any growth.
     * Fails with InvalidRealloc when growth exceeds MAX_PERMITTED_DATA_INCREASE
     * relative to the length at the start of the call.
     */
    ProgramResult resize(size_t new_len);

private:
    const PublicKey* key_;
    bool is_signer_;
    bool is_writable_;
    ProgramAccount* account_;
    size_t original_data_len_;
};

class ExecutionEngine;

/**
 * Transaction execution context
 */
struct ExecutionContext {
    std::unordered_map<PublicKey, ProgramAccount> accounts;

    // Sysvar state
    Slot slot = 0;
    Epoch current_epoch = 0;
    RentCalculator rent;

    // Compute metering
    uint64_t max_compute_units = 200000;
    uint64_t consumed_compute_units = 0;

    // Runtime state
    std::vector<std::string> log_messages;
    std::unordered_set<PublicKey> modified_accounts;
    size_t invoke_depth = 0;

    /// Host used for cross-program invocation; not owned
    const ExecutionEngine* engine = nullptr;

    /**
     * Build positional account views for an instruction.
     * Keys not yet loaded are materialized as empty system-owned accounts.
     */
    std::vector<AccountInfo> resolve_accounts(const Instruction& instruction);

    /// Append a "Program log:" line to the transaction log
    void log(const std::string& message);
};

/**
 * SVM execution result
 */
enum class ExecutionResult {
    SUCCESS,
    COMPUTE_BUDGET_EXCEEDED,
    PROGRAM_ERROR,
    ACCOUNT_NOT_FOUND,
    INSUFFICIENT_FUNDS,
    INVALID_INSTRUCTION,
    CALL_DEPTH_EXCEEDED
};

struct ExecutionOutcome {
    ExecutionResult result = ExecutionResult::SUCCESS;
    uint64_t compute_units_consumed = 0;
    std::optional<ProgramError> program_error;
    std::string error_details;
    std::vector<std::string> logs;
    size_t failed_instruction_index = 0;

    bool is_success() const { return result == ExecutionResult::SUCCESS; }

    /// Host failures map back onto their ExecutionResult
    static ExecutionOutcome from_program_result(const ProgramResult& program_result,
                                                uint64_t compute_units);

    /// Collapse into a ProgramResult for a calling program
    ProgramResult to_program_result() const;
};

/**
 * Built-in program interface
 */
class BuiltinProgram {
public:
    virtual ~BuiltinProgram() = default;
    virtual PublicKey get_program_id() const = 0;

    /// Fixed compute cost charged before each invocation
    virtual uint64_t compute_units() const = 0;

    virtual ExecutionOutcome execute(
        const Instruction& instruction,
        ExecutionContext& context
    ) const = 0;
};

/**
 * SVM execution engine
 *
 * Runs transactions against builtin programs. A transaction either commits
 * all of its instructions or leaves the account set exactly as it was.
 */
class ExecutionEngine {
public:
    ExecutionEngine();
    ~ExecutionEngine();

    // Program management
    void register_builtin_program(std::unique_ptr<BuiltinProgram> program);
    bool is_program_loaded(const PublicKey& program_id) const;
    const BuiltinProgram* find_program(const PublicKey& program_id) const;

    /**
     * Execute instructions in order against context.accounts.
     * The engine's compute budget replaces context.max_compute_units and the
     * meter restarts at zero. On success, written accounts whose balance
     * dropped to zero are removed from context.accounts.
     */
    ExecutionOutcome execute_transaction(
        const std::vector<Instruction>& instructions,
        ExecutionContext& context
    );

    /**
     * Cross-program invocation from a running builtin.
     *
     * Every account of the inner instruction must appear among caller_accounts.
     * Signer privilege comes from the caller's signers or from an address
     * derived from signer_seeds under caller_program_id; writable privilege
     * only from the caller.
     */
    ExecutionOutcome invoke_signed(
        const Instruction& instruction,
        const std::vector<AccountInfo>& caller_accounts,
        const PublicKey& caller_program_id,
        const std::vector<SignerSeeds>& signer_seeds,
        ExecutionContext& context
    ) const;

    // Configuration
    void set_compute_budget(uint64_t max_compute_units);
    uint64_t get_compute_budget() const;

    // Statistics
    uint64_t get_total_instructions_executed() const;
    uint64_t get_total_compute_units_consumed() const;

private:
    ExecutionOutcome process_instruction(
        const Instruction& instruction,
        ExecutionContext& context
    ) const;

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace svm
} // namespace altprog
