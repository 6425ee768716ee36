#pragma once

#include "svm/engine.h"

namespace altprog {
namespace svm {

/// Address of the system program (all zero bytes)
const PublicKey& system_program_id();

/**
 * System program instruction tags (u32 little-endian prefix)
 */
enum class SystemInstruction : uint32_t {
    CreateAccount = 0,
    Assign = 1,
    Transfer = 2,
    Allocate = 8,
};

/**
 * Native system program: owns fresh accounts and moves lamports.
 *
 * Only the instructions other builtins invoke are implemented.
 */
class SystemProgram : public BuiltinProgram {
public:
    static constexpr uint64_t COMPUTE_UNITS = 150;

    PublicKey get_program_id() const override;
    uint64_t compute_units() const override { return COMPUTE_UNITS; }

    ExecutionOutcome execute(
        const Instruction& instruction,
        ExecutionContext& context
    ) const override;

private:
    ProgramResult handle_create_account(std::vector<AccountInfo>& accounts,
                                        Lamports lamports, uint64_t space,
                                        const PublicKey& owner,
                                        ExecutionContext& context) const;
    ProgramResult handle_assign(std::vector<AccountInfo>& accounts,
                                const PublicKey& owner,
                                ExecutionContext& context) const;
    ProgramResult handle_transfer(std::vector<AccountInfo>& accounts,
                                  Lamports lamports,
                                  ExecutionContext& context) const;
    ProgramResult handle_allocate(std::vector<AccountInfo>& accounts,
                                  uint64_t space,
                                  ExecutionContext& context) const;
};

namespace system_instruction {

Instruction create_account(const PublicKey& from, const PublicKey& to,
                           Lamports lamports, uint64_t space,
                           const PublicKey& owner);
Instruction assign(const PublicKey& account, const PublicKey& owner);
Instruction transfer(const PublicKey& from, const PublicKey& to, Lamports lamports);
Instruction allocate(const PublicKey& account, uint64_t space);

} // namespace system_instruction

} // namespace svm
} // namespace altprog
