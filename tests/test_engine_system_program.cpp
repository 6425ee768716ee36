#include "test_framework.h"
#include "svm/engine.h"
#include "svm/system_program.h"
#include <memory>

using namespace altprog::common;
using namespace altprog::svm;

namespace {

PublicKey make_key(uint8_t fill) {
    return PublicKey(PUBKEY_BYTES, fill);
}

void fund(ExecutionContext& context, const PublicKey& key, Lamports lamports) {
    ProgramAccount account;
    account.lamports = lamports;
    account.owner = system_program_id();
    context.accounts[key] = account;
}

Lamports balance(const ExecutionContext& context, const PublicKey& key) {
    auto it = context.accounts.find(key);
    return it == context.accounts.end() ? 0 : it->second.lamports;
}

bool logs_contain(const ExecutionOutcome& outcome, const std::string& needle) {
    for (const auto& line : outcome.logs) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Builtin that credits lamports out of nowhere
class MintingProgram : public BuiltinProgram {
public:
    PublicKey get_program_id() const override { return make_key(0xE1); }
    uint64_t compute_units() const override { return 10; }
    ExecutionOutcome execute(const Instruction& instruction, ExecutionContext& context) const override {
        auto accounts = context.resolve_accounts(instruction);
        accounts[0].set_lamports(accounts[0].lamports() + 1);
        return ExecutionOutcome::from_program_result(ProgramResult::ok(), 10);
    }
};

// Builtin that writes into every account it is handed
class ScribblingProgram : public BuiltinProgram {
public:
    PublicKey get_program_id() const override { return make_key(0xE2); }
    uint64_t compute_units() const override { return 10; }
    ExecutionOutcome execute(const Instruction& instruction, ExecutionContext& context) const override {
        auto accounts = context.resolve_accounts(instruction);
        for (auto& account : accounts) {
            account.data_mut().push_back(0x55);
        }
        return ExecutionOutcome::from_program_result(ProgramResult::ok(), 10);
    }
};

// Builtin that moves lamports out of an address it derives, via the system program
class VaultProgram : public BuiltinProgram {
public:
    static SignerSeeds vault_seeds() {
        auto found = find_program_address({{'v', 'a', 'u', 'l', 't'}}, make_key(0xE3));
        return {{'v', 'a', 'u', 'l', 't'}, {found->second}};
    }
    static PublicKey vault_address() {
        PublicKey address;
        if (create_program_address(vault_seeds(), make_key(0xE3), address).is_err()) {
            throw std::runtime_error("vault derivation failed");
        }
        return address;
    }

    explicit VaultProgram(bool sign) : sign_(sign) {}

    PublicKey get_program_id() const override { return make_key(0xE3); }
    uint64_t compute_units() const override { return 100; }
    ExecutionOutcome execute(const Instruction& instruction, ExecutionContext& context) const override {
        auto accounts = context.resolve_accounts(instruction);
        Instruction inner = system_instruction::transfer(accounts[0].key(), accounts[1].key(), 500);
        std::vector<SignerSeeds> seeds;
        if (sign_) {
            seeds.push_back(vault_seeds());
        }
        ExecutionOutcome inner_outcome =
            context.engine->invoke_signed(inner, accounts, get_program_id(), seeds, context);
        return ExecutionOutcome::from_program_result(inner_outcome.to_program_result(), 100);
    }

private:
    bool sign_;
};

Instruction call(const PublicKey& program_id, std::vector<AccountMeta> accounts) {
    Instruction instruction;
    instruction.program_id = program_id;
    instruction.accounts = std::move(accounts);
    return instruction;
}

void test_transfer() {
    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<SystemProgram>());
    ExecutionContext context;
    fund(context, make_key(1), 1000);

    auto outcome = engine.execute_transaction(
        {system_instruction::transfer(make_key(1), make_key(2), 400)}, context);

    ASSERT_TRUE(outcome.is_success());
    ASSERT_EQ(600u, balance(context, make_key(1)));
    ASSERT_EQ(400u, balance(context, make_key(2)));
    ASSERT_EQ(SystemProgram::COMPUTE_UNITS, outcome.compute_units_consumed);
    ASSERT_TRUE(logs_contain(outcome, "Program 11111111111111111111111111111111 invoke [1]"));
    ASSERT_TRUE(logs_contain(outcome, "Program 11111111111111111111111111111111 success"));
    ASSERT_EQ(1u, engine.get_total_instructions_executed());
}

void test_transfer_failures() {
    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<SystemProgram>());
    ExecutionContext context;
    fund(context, make_key(1), 100);

    auto outcome = engine.execute_transaction(
        {system_instruction::transfer(make_key(1), make_key(2), 400)}, context);
    ASSERT_FALSE(outcome.is_success());
    ASSERT_TRUE(outcome.result == ExecutionResult::PROGRAM_ERROR);
    ASSERT_EQ(ProgramError::InsufficientFunds, *outcome.program_error);
    ASSERT_EQ(100u, balance(context, make_key(1)));

    Instruction unsigned_transfer = system_instruction::transfer(make_key(1), make_key(2), 10);
    unsigned_transfer.accounts[0].is_signer = false;
    outcome = engine.execute_transaction({unsigned_transfer}, context);
    ASSERT_EQ(ProgramError::MissingRequiredSignature, *outcome.program_error);

    Instruction malformed = system_instruction::transfer(make_key(1), make_key(2), 10);
    malformed.data.pop_back();
    outcome = engine.execute_transaction({malformed}, context);
    ASSERT_EQ(ProgramError::InvalidInstructionData, *outcome.program_error);
}

void test_allocate_and_assign() {
    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<SystemProgram>());
    ExecutionContext context;
    fund(context, make_key(3), 5000);
    PublicKey new_owner = make_key(0x99);

    auto outcome = engine.execute_transaction(
        {system_instruction::allocate(make_key(3), 64),
         system_instruction::assign(make_key(3), new_owner)}, context);

    ASSERT_TRUE(outcome.is_success());
    ASSERT_EQ(64u, context.accounts[make_key(3)].data.size());
    ASSERT_EQ(new_owner, context.accounts[make_key(3)].owner);

    // Already allocated and no longer system owned
    outcome = engine.execute_transaction({system_instruction::allocate(make_key(3), 64)}, context);
    ASSERT_EQ(ProgramError::AccountAlreadyInUse, *outcome.program_error);
}

void test_create_account() {
    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<SystemProgram>());
    ExecutionContext context;
    fund(context, make_key(4), 10000);

    auto outcome = engine.execute_transaction(
        {system_instruction::create_account(make_key(4), make_key(5), 2500, 16, make_key(0x77))},
        context);

    ASSERT_TRUE(outcome.is_success());
    ASSERT_EQ(7500u, balance(context, make_key(4)));
    ASSERT_EQ(2500u, balance(context, make_key(5)));
    ASSERT_EQ(16u, context.accounts[make_key(5)].data.size());
    ASSERT_EQ(make_key(0x77), context.accounts[make_key(5)].owner);

    outcome = engine.execute_transaction(
        {system_instruction::create_account(make_key(4), make_key(5), 1, 0, make_key(0x77))},
        context);
    ASSERT_EQ(ProgramError::AccountAlreadyInUse, *outcome.program_error);
}

void test_transaction_rollback() {
    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<SystemProgram>());
    ExecutionContext context;
    fund(context, make_key(1), 1000);

    auto outcome = engine.execute_transaction(
        {system_instruction::transfer(make_key(1), make_key(2), 300),
         system_instruction::transfer(make_key(2), make_key(3), 301)}, context);

    ASSERT_FALSE(outcome.is_success());
    ASSERT_EQ(1u, outcome.failed_instruction_index);
    ASSERT_EQ(1000u, balance(context, make_key(1)));
    ASSERT_EQ(0u, balance(context, make_key(2)));
    ASSERT_TRUE(context.modified_accounts.empty());
}

void test_context_engine_released() {
    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<SystemProgram>());
    engine.register_builtin_program(std::make_unique<VaultProgram>(true));
    ExecutionContext context;
    fund(context, make_key(1), 1000);
    fund(context, VaultProgram::vault_address(), 1000);
    ASSERT_TRUE(context.engine == nullptr);

    // The engine pointer is live while a builtin invokes through it
    auto outcome = engine.execute_transaction(
        {call(make_key(0xE3), {AccountMeta::writable(VaultProgram::vault_address(), false),
                               AccountMeta::writable(make_key(2), false)})}, context);
    ASSERT_TRUE(outcome.is_success());
    ASSERT_TRUE(context.engine == nullptr);

    outcome = engine.execute_transaction(
        {system_instruction::transfer(make_key(1), make_key(3), 5000)}, context);
    ASSERT_FALSE(outcome.is_success());
    ASSERT_TRUE(context.engine == nullptr);

    // A caller's own engine pointer survives a nested transaction
    ExecutionEngine outer;
    context.engine = &outer;
    outcome = engine.execute_transaction(
        {system_instruction::transfer(make_key(1), make_key(3), 10)}, context);
    ASSERT_TRUE(outcome.is_success());
    ASSERT_TRUE(context.engine == &outer);
}

void test_unknown_program_and_budget() {
    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<SystemProgram>());
    ExecutionContext context;
    fund(context, make_key(1), 1000);

    auto outcome = engine.execute_transaction({call(make_key(0x42), {})}, context);
    ASSERT_TRUE(outcome.result == ExecutionResult::ACCOUNT_NOT_FOUND);

    engine.set_compute_budget(100);
    ASSERT_EQ(100u, engine.get_compute_budget());
    outcome = engine.execute_transaction(
        {system_instruction::transfer(make_key(1), make_key(2), 1)}, context);
    ASSERT_TRUE(outcome.result == ExecutionResult::COMPUTE_BUDGET_EXCEEDED);
    ASSERT_EQ(1000u, balance(context, make_key(1)));
}

void test_lamport_conservation() {
    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<MintingProgram>());
    ExecutionContext context;
    fund(context, make_key(1), 1000);

    auto outcome = engine.execute_transaction(
        {call(make_key(0xE1), {AccountMeta::writable(make_key(1), false)})}, context);

    ASSERT_EQ(ProgramError::UnbalancedInstruction, *outcome.program_error);
    ASSERT_EQ(1000u, balance(context, make_key(1)));
}

void test_readonly_accounts_protected() {
    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<ScribblingProgram>());
    ExecutionContext context;
    fund(context, make_key(1), 1000);
    fund(context, make_key(2), 1000);

    auto outcome = engine.execute_transaction(
        {call(make_key(0xE2), {AccountMeta::writable(make_key(1), false),
                               AccountMeta::readonly(make_key(2), false)})}, context);
    ASSERT_EQ(ProgramError::ReadonlyDataModified, *outcome.program_error);
    ASSERT_TRUE(context.accounts[make_key(1)].data.empty());

    outcome = engine.execute_transaction(
        {call(make_key(0xE2), {AccountMeta::writable(make_key(1), false)})}, context);
    ASSERT_TRUE(outcome.is_success());
    ASSERT_EQ(1u, context.accounts[make_key(1)].data.size());
}

void test_signed_invocation() {
    PublicKey vault = VaultProgram::vault_address();

    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<SystemProgram>());
    engine.register_builtin_program(std::make_unique<VaultProgram>(true));
    ExecutionContext context;
    fund(context, vault, 2000);

    auto outcome = engine.execute_transaction(
        {call(make_key(0xE3), {AccountMeta::writable(vault, false),
                               AccountMeta::writable(make_key(9), false)})}, context);

    ASSERT_TRUE(outcome.is_success());
    ASSERT_EQ(1500u, balance(context, vault));
    ASSERT_EQ(500u, balance(context, make_key(9)));
    ASSERT_EQ(100u + SystemProgram::COMPUTE_UNITS, outcome.compute_units_consumed);
    ASSERT_TRUE(logs_contain(outcome, "Program 11111111111111111111111111111111 invoke [2]"));
}

void test_invocation_privileges() {
    PublicKey vault = VaultProgram::vault_address();

    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<SystemProgram>());
    engine.register_builtin_program(std::make_unique<VaultProgram>(false));
    ExecutionContext context;
    fund(context, vault, 2000);

    // Without seeds the vault cannot sign
    auto outcome = engine.execute_transaction(
        {call(make_key(0xE3), {AccountMeta::writable(vault, false),
                               AccountMeta::writable(make_key(9), false)})}, context);
    ASSERT_EQ(ProgramError::MissingRequiredSignature, *outcome.program_error);
    ASSERT_EQ(2000u, balance(context, vault));

    // Caller only has read access to the recipient
    ExecutionEngine signing_engine;
    signing_engine.register_builtin_program(std::make_unique<SystemProgram>());
    signing_engine.register_builtin_program(std::make_unique<VaultProgram>(true));
    outcome = signing_engine.execute_transaction(
        {call(make_key(0xE3), {AccountMeta::writable(vault, false),
                               AccountMeta::readonly(make_key(9), false)})}, context);
    ASSERT_EQ(ProgramError::PrivilegeEscalation, *outcome.program_error);
}

void test_account_resize_limits() {
    ProgramAccount account;
    PublicKey key = make_key(7);
    AccountInfo writable(key, false, true, account);

    ASSERT_TRUE(writable.resize(MAX_PERMITTED_DATA_INCREASE).is_ok());
    ASSERT_EQ(ProgramError::InvalidRealloc, writable.resize(MAX_PERMITTED_DATA_INCREASE + 1));
    ASSERT_TRUE(writable.resize(0).is_ok());
    ASSERT_EQ(0u, account.data.size());

    AccountInfo readonly(key, false, false, account);
    ASSERT_EQ(ProgramError::ReadonlyDataModified, readonly.resize(8));
}

void test_empty_accounts_removed_on_commit() {
    ExecutionEngine engine;
    engine.register_builtin_program(std::make_unique<SystemProgram>());
    ExecutionContext context;
    fund(context, make_key(1), 1000);

    auto outcome = engine.execute_transaction(
        {system_instruction::transfer(make_key(1), make_key(2), 1000)}, context);

    ASSERT_TRUE(outcome.is_success());
    ASSERT_TRUE(context.accounts.find(make_key(1)) == context.accounts.end());
    ASSERT_EQ(1000u, balance(context, make_key(2)));
}

} // anonymous namespace

int main() {
    std::cout << "=== Execution Engine and System Program Test Suite ===" << std::endl;

    TestRunner runner;

    runner.run_test("Transfer", test_transfer);
    runner.run_test("Transfer Failures", test_transfer_failures);
    runner.run_test("Allocate And Assign", test_allocate_and_assign);
    runner.run_test("Create Account", test_create_account);
    runner.run_test("Transaction Rollback", test_transaction_rollback);
    runner.run_test("Context Engine Released", test_context_engine_released);
    runner.run_test("Unknown Program And Budget", test_unknown_program_and_budget);
    runner.run_test("Lamport Conservation", test_lamport_conservation);
    runner.run_test("Readonly Accounts Protected", test_readonly_accounts_protected);
    runner.run_test("Signed Invocation", test_signed_invocation);
    runner.run_test("Invocation Privileges", test_invocation_privileges);
    runner.run_test("Account Resize Limits", test_account_resize_limits);
    runner.run_test("Empty Accounts Removed On Commit", test_empty_accounts_removed_on_commit);

    runner.print_summary();
    return runner.all_passed() ? 0 : 1;
}
