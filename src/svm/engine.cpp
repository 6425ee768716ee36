#include "svm/engine.h"
#include "common/base58.h"
#include "common/logging.h"
#include "svm/system_program.h"
#include <algorithm>
#include <limits>
#include <optional>

namespace altprog {
namespace svm {

namespace {

struct AccountSnapshot {
    Lamports lamports;
    std::vector<uint8_t> data;
    PublicKey owner;
};

bool checked_add(Lamports a, Lamports b, Lamports& out) {
    if (a > std::numeric_limits<Lamports>::max() - b) {
        return false;
    }
    out = a + b;
    return true;
}

// Materialize every key an instruction references so snapshots and views
// agree on the same account nodes
void load_instruction_accounts(const Instruction& instruction, ExecutionContext& context) {
    for (const auto& meta : instruction.accounts) {
        if (context.accounts.find(meta.pubkey) == context.accounts.end()) {
            ProgramAccount account;
            account.owner = system_program_id();
            context.accounts.emplace(meta.pubkey, std::move(account));
        }
    }
}

} // namespace

// AccountInfo implementation
AccountInfo::AccountInfo(const PublicKey& key, bool is_signer, bool is_writable,
                         ProgramAccount& account)
    : key_(&key), is_signer_(is_signer), is_writable_(is_writable),
      account_(&account), original_data_len_(account.data.size()) {}

ProgramResult AccountInfo::resize(size_t new_len) {
    if (!is_writable_) {
        return ProgramError::ReadonlyDataModified;
    }
    if (new_len > MAX_PERMITTED_DATA_LENGTH) {
        return ProgramError::InvalidRealloc;
    }
    if (new_len > original_data_len_ &&
        new_len - original_data_len_ > MAX_PERMITTED_DATA_INCREASE) {
        return ProgramError::InvalidRealloc;
    }
    account_->data.resize(new_len, 0);
    return ProgramResult::ok();
}

// ExecutionContext implementation
std::vector<AccountInfo> ExecutionContext::resolve_accounts(const Instruction& instruction) {
    load_instruction_accounts(instruction, *this);

    std::vector<AccountInfo> infos;
    infos.reserve(instruction.accounts.size());
    for (const auto& meta : instruction.accounts) {
        auto it = accounts.find(meta.pubkey);
        infos.emplace_back(it->first, meta.is_signer, meta.is_writable, it->second);
    }
    return infos;
}

void ExecutionContext::log(const std::string& message) {
    log_messages.push_back("Program log: " + message);
    LOG_DEBUG("svm", message);
}

// ExecutionOutcome implementation
ExecutionOutcome ExecutionOutcome::from_program_result(const ProgramResult& program_result,
                                                       uint64_t compute_units) {
    ExecutionOutcome outcome;
    outcome.compute_units_consumed = compute_units;
    if (program_result.is_ok()) {
        outcome.result = ExecutionResult::SUCCESS;
    } else {
        switch (program_result.error()) {
            case ProgramError::UnsupportedProgramId:
                outcome.result = ExecutionResult::ACCOUNT_NOT_FOUND;
                break;
            case ProgramError::ComputationalBudgetExceeded:
                outcome.result = ExecutionResult::COMPUTE_BUDGET_EXCEEDED;
                break;
            case ProgramError::CallDepth:
                outcome.result = ExecutionResult::CALL_DEPTH_EXCEEDED;
                break;
            default:
                outcome.result = ExecutionResult::PROGRAM_ERROR;
                break;
        }
        outcome.program_error = program_result.error();
        outcome.error_details = program_error_to_string(program_result.error());
    }
    return outcome;
}

ProgramResult ExecutionOutcome::to_program_result() const {
    if (program_error) {
        return *program_error;
    }
    switch (result) {
        case ExecutionResult::SUCCESS:
            return ProgramResult::ok();
        case ExecutionResult::COMPUTE_BUDGET_EXCEEDED:
            return ProgramError::ComputationalBudgetExceeded;
        case ExecutionResult::ACCOUNT_NOT_FOUND:
            return ProgramError::UnsupportedProgramId;
        case ExecutionResult::CALL_DEPTH_EXCEEDED:
            return ProgramError::CallDepth;
        case ExecutionResult::INSUFFICIENT_FUNDS:
            return ProgramError::InsufficientFunds;
        case ExecutionResult::PROGRAM_ERROR:
        case ExecutionResult::INVALID_INSTRUCTION:
            break;
    }
    return ProgramError::InvalidInstructionData;
}

// ExecutionEngine implementation
class ExecutionEngine::Impl {
public:
    std::unordered_map<PublicKey, std::unique_ptr<BuiltinProgram>> builtin_programs_;
    uint64_t max_compute_units_ = 200000;

    // Statistics
    uint64_t total_instructions_executed_ = 0;
    uint64_t total_compute_units_consumed_ = 0;
};

ExecutionEngine::ExecutionEngine() : impl_(std::make_unique<Impl>()) {}
ExecutionEngine::~ExecutionEngine() = default;

void ExecutionEngine::register_builtin_program(std::unique_ptr<BuiltinProgram> program) {
    PublicKey program_id = program->get_program_id();
    LOG_DEBUG("svm", "Registered builtin program ", encode_base58(program_id));
    impl_->builtin_programs_[program_id] = std::move(program);
}

bool ExecutionEngine::is_program_loaded(const PublicKey& program_id) const {
    return impl_->builtin_programs_.find(program_id) != impl_->builtin_programs_.end();
}

const BuiltinProgram* ExecutionEngine::find_program(const PublicKey& program_id) const {
    auto it = impl_->builtin_programs_.find(program_id);
    if (it == impl_->builtin_programs_.end()) {
        return nullptr;
    }
    return it->second.get();
}

ExecutionOutcome ExecutionEngine::execute_transaction(
    const std::vector<Instruction>& instructions,
    ExecutionContext& context) {

    // Restored on every return
    const ExecutionEngine* previous_engine = context.engine;
    context.engine = this;
    context.max_compute_units = impl_->max_compute_units_;
    context.consumed_compute_units = 0;
    context.invoke_depth = 0;

    // All-or-nothing: restore this copy if any instruction fails
    auto accounts_snapshot = context.accounts;
    auto modified_snapshot = context.modified_accounts;
    size_t log_start = context.log_messages.size();

    ExecutionOutcome outcome;
    for (size_t i = 0; i < instructions.size(); ++i) {
        ExecutionOutcome instruction_outcome = process_instruction(instructions[i], context);
        impl_->total_instructions_executed_++;

        if (!instruction_outcome.is_success()) {
            context.accounts = std::move(accounts_snapshot);
            context.modified_accounts = std::move(modified_snapshot);

            outcome = std::move(instruction_outcome);
            outcome.failed_instruction_index = i;
            outcome.compute_units_consumed = context.consumed_compute_units;
            outcome.logs.assign(context.log_messages.begin() + log_start,
                                context.log_messages.end());
            impl_->total_compute_units_consumed_ += context.consumed_compute_units;

            LOG_DEBUG("svm", "Transaction failed at instruction ", i, ": ",
                      outcome.error_details);
            context.engine = previous_engine;
            return outcome;
        }
    }

    // Written accounts left without lamports cease to exist
    for (const auto& key : context.modified_accounts) {
        auto it = context.accounts.find(key);
        if (it != context.accounts.end() && it->second.lamports == 0) {
            context.accounts.erase(it);
        }
    }

    outcome.result = ExecutionResult::SUCCESS;
    outcome.compute_units_consumed = context.consumed_compute_units;
    outcome.logs.assign(context.log_messages.begin() + log_start,
                        context.log_messages.end());
    impl_->total_compute_units_consumed_ += context.consumed_compute_units;
    context.engine = previous_engine;
    return outcome;
}

ExecutionOutcome ExecutionEngine::invoke_signed(
    const Instruction& instruction,
    const std::vector<AccountInfo>& caller_accounts,
    const PublicKey& caller_program_id,
    const std::vector<SignerSeeds>& signer_seeds,
    ExecutionContext& context) const {

    std::vector<PublicKey> derived_signers;
    derived_signers.reserve(signer_seeds.size());
    for (const auto& seeds : signer_seeds) {
        PublicKey derived;
        ProgramResult derived_result = create_program_address(seeds, caller_program_id, derived);
        if (derived_result.is_err()) {
            return ExecutionOutcome::from_program_result(derived_result, 0);
        }
        derived_signers.push_back(std::move(derived));
    }

    for (const auto& meta : instruction.accounts) {
        auto caller = std::find_if(caller_accounts.begin(), caller_accounts.end(),
            [&meta](const AccountInfo& info) { return info.key() == meta.pubkey; });
        if (caller == caller_accounts.end()) {
            LOG_DEBUG("svm", "CPI account ", encode_base58(meta.pubkey), " not passed by caller");
            return ExecutionOutcome::from_program_result(ProgramError::NotEnoughAccountKeys, 0);
        }

        if (meta.is_signer && !caller->is_signer() &&
            std::find(derived_signers.begin(), derived_signers.end(), meta.pubkey) ==
                derived_signers.end()) {
            context.log_messages.push_back(encode_base58(meta.pubkey) +
                                           "'s signer privilege escalated");
            return ExecutionOutcome::from_program_result(ProgramError::MissingRequiredSignature, 0);
        }

        if (meta.is_writable && !caller->is_writable()) {
            context.log_messages.push_back(encode_base58(meta.pubkey) +
                                           "'s writable privilege escalated");
            return ExecutionOutcome::from_program_result(ProgramError::PrivilegeEscalation, 0);
        }
    }

    return process_instruction(instruction, context);
}

ExecutionOutcome ExecutionEngine::process_instruction(
    const Instruction& instruction,
    ExecutionContext& context) const {

    ExecutionOutcome outcome;
    const std::string program_name = encode_base58(instruction.program_id);

    const BuiltinProgram* program = find_program(instruction.program_id);
    if (!program) {
        outcome.result = ExecutionResult::ACCOUNT_NOT_FOUND;
        outcome.error_details = "Program not found: " + program_name;
        return outcome;
    }

    if (context.invoke_depth + 1 > MAX_INVOKE_DEPTH) {
        outcome.result = ExecutionResult::CALL_DEPTH_EXCEEDED;
        outcome.error_details = "Maximum invoke depth exceeded";
        return outcome;
    }

    uint64_t consumed_before = context.consumed_compute_units;
    uint64_t cost = program->compute_units();
    if (cost > context.max_compute_units - context.consumed_compute_units) {
        context.consumed_compute_units = context.max_compute_units;
        context.log_messages.push_back("Program " + program_name + " failed: exceeded CUs meter");
        outcome.result = ExecutionResult::COMPUTE_BUDGET_EXCEEDED;
        outcome.compute_units_consumed = context.consumed_compute_units - consumed_before;
        outcome.error_details = "Compute budget exceeded";
        return outcome;
    }
    context.consumed_compute_units += cost;

    context.log_messages.push_back("Program " + program_name + " invoke [" +
                                   std::to_string(context.invoke_depth + 1) + "]");

    // Capture pre-state of every referenced account
    load_instruction_accounts(instruction, context);
    std::unordered_map<PublicKey, AccountSnapshot> pre_state;
    std::unordered_set<PublicKey> writable_keys;
    for (const auto& meta : instruction.accounts) {
        if (meta.is_writable) {
            writable_keys.insert(meta.pubkey);
        }
        if (pre_state.find(meta.pubkey) == pre_state.end()) {
            const ProgramAccount& account = context.accounts.at(meta.pubkey);
            pre_state.emplace(meta.pubkey,
                              AccountSnapshot{account.lamports, account.data, account.owner});
        }
    }

    context.invoke_depth++;
    outcome = program->execute(instruction, context);
    context.invoke_depth--;

    if (outcome.is_success()) {
        Lamports pre_total = 0;
        Lamports post_total = 0;
        bool overflow = false;
        for (const auto& entry : pre_state) {
            const ProgramAccount& post = context.accounts.at(entry.first);
            overflow |= !checked_add(pre_total, entry.second.lamports, pre_total);
            overflow |= !checked_add(post_total, post.lamports, post_total);

            if (writable_keys.count(entry.first) == 0 &&
                (post.lamports != entry.second.lamports ||
                 post.data != entry.second.data ||
                 post.owner != entry.second.owner)) {
                outcome = ExecutionOutcome::from_program_result(ProgramError::ReadonlyDataModified, 0);
                break;
            }
        }
        if (outcome.is_success() && overflow) {
            outcome = ExecutionOutcome::from_program_result(ProgramError::ArithmeticOverflow, 0);
        } else if (outcome.is_success() && pre_total != post_total) {
            outcome = ExecutionOutcome::from_program_result(ProgramError::UnbalancedInstruction, 0);
        }
    }

    outcome.compute_units_consumed = context.consumed_compute_units - consumed_before;

    if (outcome.is_success()) {
        context.modified_accounts.insert(writable_keys.begin(), writable_keys.end());
        context.log_messages.push_back("Program " + program_name + " success");
    } else {
        context.log_messages.push_back("Program " + program_name + " failed: " +
                                       outcome.error_details);
    }
    return outcome;
}

void ExecutionEngine::set_compute_budget(uint64_t max_compute_units) {
    impl_->max_compute_units_ = max_compute_units;
}

uint64_t ExecutionEngine::get_compute_budget() const {
    return impl_->max_compute_units_;
}

uint64_t ExecutionEngine::get_total_instructions_executed() const {
    return impl_->total_instructions_executed_;
}

uint64_t ExecutionEngine::get_total_compute_units_consumed() const {
    return impl_->total_compute_units_consumed_;
}

} // namespace svm
} // namespace altprog
