#include "svm/system_program.h"
#include "common/base58.h"
#include "common/logging.h"
#include <limits>

namespace altprog {
namespace svm {

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

bool read_pubkey(const std::vector<uint8_t>& data, size_t offset, PublicKey& key) {
    if (offset > data.size() || data.size() - offset < PUBKEY_BYTES) {
        return false;
    }
    key.assign(data.begin() + offset, data.begin() + offset + PUBKEY_BYTES);
    return true;
}

std::vector<uint8_t> encode_tag(SystemInstruction tag) {
    std::vector<uint8_t> data;
    write_le<uint32_t>(data, static_cast<uint32_t>(tag));
    return data;
}

} // namespace

const PublicKey& system_program_id() {
    static const PublicKey id(PUBKEY_BYTES, 0);
    return id;
}

PublicKey SystemProgram::get_program_id() const {
    return system_program_id();
}

ExecutionOutcome SystemProgram::execute(
    const Instruction& instruction,
    ExecutionContext& context) const {

    uint32_t tag = 0;
    if (!read_le<uint32_t>(instruction.data, 0, tag)) {
        return ExecutionOutcome::from_program_result(ProgramError::InvalidInstructionData,
                                                     COMPUTE_UNITS);
    }

    std::vector<AccountInfo> accounts = context.resolve_accounts(instruction);
    const auto& data = instruction.data;
    ProgramResult result;

    switch (static_cast<SystemInstruction>(tag)) {
        case SystemInstruction::CreateAccount: {
            Lamports lamports = 0;
            uint64_t space = 0;
            PublicKey owner;
            if (data.size() != TAG_SIZE + 8 + 8 + PUBKEY_BYTES ||
                !read_le<uint64_t>(data, TAG_SIZE, lamports) ||
                !read_le<uint64_t>(data, TAG_SIZE + 8, space) ||
                !read_pubkey(data, TAG_SIZE + 16, owner)) {
                result = ProgramError::InvalidInstructionData;
                break;
            }
            result = handle_create_account(accounts, lamports, space, owner, context);
            break;
        }
        case SystemInstruction::Assign: {
            PublicKey owner;
            if (data.size() != TAG_SIZE + PUBKEY_BYTES || !read_pubkey(data, TAG_SIZE, owner)) {
                result = ProgramError::InvalidInstructionData;
                break;
            }
            result = handle_assign(accounts, owner, context);
            break;
        }
        case SystemInstruction::Transfer: {
            Lamports lamports = 0;
            if (data.size() != TAG_SIZE + 8 || !read_le<uint64_t>(data, TAG_SIZE, lamports)) {
                result = ProgramError::InvalidInstructionData;
                break;
            }
            result = handle_transfer(accounts, lamports, context);
            break;
        }
        case SystemInstruction::Allocate: {
            uint64_t space = 0;
            if (data.size() != TAG_SIZE + 8 || !read_le<uint64_t>(data, TAG_SIZE, space)) {
                result = ProgramError::InvalidInstructionData;
                break;
            }
            result = handle_allocate(accounts, space, context);
            break;
        }
        default:
            result = ProgramError::InvalidInstructionData;
            break;
    }

    return ExecutionOutcome::from_program_result(result, COMPUTE_UNITS);
}

ProgramResult SystemProgram::handle_create_account(std::vector<AccountInfo>& accounts,
                                                   Lamports lamports, uint64_t space,
                                                   const PublicKey& owner,
                                                   ExecutionContext& context) const {
    if (accounts.size() < 2) {
        return ProgramError::NotEnoughAccountKeys;
    }

    AccountInfo& to = accounts[1];
    if (to.lamports() != 0 || to.data_len() != 0 || to.owner() != system_program_id()) {
        context.log_messages.push_back("Create Account: account " + encode_base58(to.key()) +
                                       " already in use");
        return ProgramError::AccountAlreadyInUse;
    }

    // Allocate and Assign operate on their first account
    std::vector<AccountInfo> target{accounts[1]};
    ProgramResult allocated = handle_allocate(target, space, context);
    if (allocated.is_err()) {
        return allocated;
    }
    ProgramResult assigned = handle_assign(target, owner, context);
    if (assigned.is_err()) {
        return assigned;
    }
    return handle_transfer(accounts, lamports, context);
}

ProgramResult SystemProgram::handle_assign(std::vector<AccountInfo>& accounts,
                                           const PublicKey& owner,
                                           ExecutionContext& context) const {
    if (accounts.empty()) {
        return ProgramError::NotEnoughAccountKeys;
    }

    AccountInfo& account = accounts[0];
    if (account.owner() == owner) {
        return ProgramResult::ok();
    }
    if (!account.is_signer()) {
        context.log_messages.push_back("Assign: account " + encode_base58(account.key()) +
                                       " must sign");
        return ProgramError::MissingRequiredSignature;
    }
    if (!account.is_writable()) {
        return ProgramError::ReadonlyDataModified;
    }

    account.assign(owner);
    return ProgramResult::ok();
}

ProgramResult SystemProgram::handle_transfer(std::vector<AccountInfo>& accounts,
                                             Lamports lamports,
                                             ExecutionContext& context) const {
    if (accounts.size() < 2) {
        return ProgramError::NotEnoughAccountKeys;
    }

    AccountInfo& from = accounts[0];
    AccountInfo& to = accounts[1];

    if (!from.is_signer()) {
        context.log_messages.push_back("Transfer: `from` account " + encode_base58(from.key()) +
                                       " must sign");
        return ProgramError::MissingRequiredSignature;
    }
    if (!from.is_writable() || !to.is_writable()) {
        return ProgramError::ReadonlyDataModified;
    }
    if (!from.data().empty()) {
        context.log_messages.push_back("Transfer: `from` must not carry data");
        return ProgramError::InvalidArgument;
    }
    if (from.lamports() < lamports) {
        context.log_messages.push_back("Transfer: insufficient lamports " +
                                       std::to_string(from.lamports()) + ", need " +
                                       std::to_string(lamports));
        return ProgramError::InsufficientFunds;
    }
    if (from.key() == to.key()) {
        return ProgramResult::ok();
    }

    if (to.lamports() > std::numeric_limits<Lamports>::max() - lamports) {
        return ProgramError::ArithmeticOverflow;
    }
    Lamports credited = to.lamports() + lamports;

    from.set_lamports(from.lamports() - lamports);
    to.set_lamports(credited);

    LOG_TRACE("svm", "Transferred ", lamports, " lamports to ", encode_base58(to.key()));
    return ProgramResult::ok();
}

ProgramResult SystemProgram::handle_allocate(std::vector<AccountInfo>& accounts,
                                             uint64_t space,
                                             ExecutionContext& context) const {
    if (accounts.empty()) {
        return ProgramError::NotEnoughAccountKeys;
    }

    AccountInfo& account = accounts[0];
    if (!account.is_signer()) {
        context.log_messages.push_back("Allocate: 'to' account " + encode_base58(account.key()) +
                                       " must sign");
        return ProgramError::MissingRequiredSignature;
    }
    if (account.data_len() != 0 || account.owner() != system_program_id()) {
        context.log_messages.push_back("Allocate: account " + encode_base58(account.key()) +
                                       " already in use");
        return ProgramError::AccountAlreadyInUse;
    }
    if (space > MAX_PERMITTED_DATA_LENGTH) {
        return ProgramError::InvalidRealloc;
    }

    return account.resize(static_cast<size_t>(space));
}

namespace system_instruction {

Instruction create_account(const PublicKey& from, const PublicKey& to,
                           Lamports lamports, uint64_t space,
                           const PublicKey& owner) {
    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(from, true), AccountMeta::writable(to, true)};
    instruction.data = encode_tag(SystemInstruction::CreateAccount);
    write_le<uint64_t>(instruction.data, lamports);
    write_le<uint64_t>(instruction.data, space);
    instruction.data.insert(instruction.data.end(), owner.begin(), owner.end());
    return instruction;
}

Instruction assign(const PublicKey& account, const PublicKey& owner) {
    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(account, true)};
    instruction.data = encode_tag(SystemInstruction::Assign);
    instruction.data.insert(instruction.data.end(), owner.begin(), owner.end());
    return instruction;
}

Instruction transfer(const PublicKey& from, const PublicKey& to, Lamports lamports) {
    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(from, true), AccountMeta::writable(to, false)};
    instruction.data = encode_tag(SystemInstruction::Transfer);
    write_le<uint64_t>(instruction.data, lamports);
    return instruction;
}

Instruction allocate(const PublicKey& account, uint64_t space) {
    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(account, true)};
    instruction.data = encode_tag(SystemInstruction::Allocate);
    write_le<uint64_t>(instruction.data, space);
    return instruction;
}

} // namespace system_instruction

} // namespace svm
} // namespace altprog
