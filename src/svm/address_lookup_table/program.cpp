#include "svm/address_lookup_table/program.h"
#include "common/logging.h"

namespace altprog {
namespace svm {
namespace address_lookup_table {

namespace {

struct InstructionVisitor {
    const Processor& processor;
    std::vector<AccountInfo>& accounts;
    ExecutionContext& context;

    ProgramResult operator()(const CreateLookupTable& create) const {
        return processor.process_create_lookup_table(accounts, create.recent_slot,
                                                     create.bump_seed, context);
    }
    ProgramResult operator()(const FreezeLookupTable&) const {
        return processor.process_freeze_lookup_table(accounts, context);
    }
    ProgramResult operator()(const ExtendLookupTable& extend) const {
        return processor.process_extend_lookup_table(accounts, extend.new_addresses, context);
    }
    ProgramResult operator()(const DeactivateLookupTable&) const {
        return processor.process_deactivate_lookup_table(accounts, context);
    }
    ProgramResult operator()(const CloseLookupTable&) const {
        return processor.process_close_lookup_table(accounts, context);
    }
};

} // namespace

AddressLookupTableProgram::AddressLookupTableProgram()
    : AddressLookupTableProgram(LookupTableConfig()) {}

AddressLookupTableProgram::AddressLookupTableProgram(const LookupTableConfig& config)
    : processor_(address_lookup_table_program_id(), config) {}

PublicKey AddressLookupTableProgram::get_program_id() const {
    return processor_.program_id();
}

uint64_t AddressLookupTableProgram::compute_units() const {
    return processor_.config().compute_units;
}

ExecutionOutcome AddressLookupTableProgram::execute(
    const Instruction& instruction,
    ExecutionContext& context) const {

    LookupTableInstruction decoded;
    ProgramResult result = decode_instruction(instruction.data, decoded);
    if (result.is_err()) {
        LOG_DEBUG("address_lookup_table", "Rejected malformed instruction of ",
                  instruction.data.size(), " bytes");
        return ExecutionOutcome::from_program_result(result, compute_units());
    }

    context.log(std::string("Instruction: ") + instruction_name(decoded));

    std::vector<AccountInfo> accounts = context.resolve_accounts(instruction);
    result = std::visit(InstructionVisitor{processor_, accounts, context}, decoded);
    return ExecutionOutcome::from_program_result(result, compute_units());
}

} // namespace address_lookup_table
} // namespace svm
} // namespace altprog
