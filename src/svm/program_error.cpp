#include "svm/program_error.h"

namespace altprog {
namespace svm {

const char* program_error_to_string(ProgramError error) noexcept {
    switch (error) {
        case ProgramError::InvalidAccountData: return "InvalidAccountData";
        case ProgramError::InvalidInstructionData: return "InvalidInstructionData";
        case ProgramError::UninitializedAccount: return "UninitializedAccount";
        case ProgramError::NotEnoughAccountKeys: return "NotEnoughAccountKeys";
        case ProgramError::InvalidArgument: return "InvalidArgument";
        case ProgramError::InvalidSeeds: return "InvalidSeeds";
        case ProgramError::ArithmeticOverflow: return "ArithmeticOverflow";
        case ProgramError::InvalidRealloc: return "InvalidRealloc";
        case ProgramError::UnbalancedInstruction: return "UnbalancedInstruction";
        case ProgramError::ReadonlyDataModified: return "ReadonlyDataModified";
        case ProgramError::MissingRequiredSignature: return "MissingRequiredSignature";
        case ProgramError::IncorrectAuthority: return "IncorrectAuthority";
        case ProgramError::Immutable: return "Immutable";
        case ProgramError::InvalidAccountOwner: return "InvalidAccountOwner";
        case ProgramError::InvalidAuthority: return "InvalidAuthority";
        case ProgramError::PrivilegeEscalation: return "PrivilegeEscalation";
        case ProgramError::AlreadyDeactivated: return "AlreadyDeactivated";
        case ProgramError::DeactivationRequired: return "DeactivationRequired";
        case ProgramError::NotReady: return "NotReady";
        case ProgramError::SameSlotExtend: return "SameSlotExtend";
        case ProgramError::ExceedsMaxEntries: return "ExceedsMaxEntries";
        case ProgramError::EmptyLookupTable: return "EmptyLookupTable";
        case ProgramError::InvalidSlot: return "InvalidSlot";
        case ProgramError::AccountAlreadyInitialized: return "AccountAlreadyInitialized";
        case ProgramError::AccountAlreadyInUse: return "AccountAlreadyInUse";
        case ProgramError::InsufficientFunds: return "InsufficientFunds";
        case ProgramError::AccountDataTooSmall: return "AccountDataTooSmall";
        case ProgramError::UnsupportedProgramId: return "UnsupportedProgramId";
        case ProgramError::ComputationalBudgetExceeded: return "ComputationalBudgetExceeded";
        case ProgramError::CallDepth: return "CallDepth";
    }
    return "UnknownError";
}

std::ostream& operator<<(std::ostream& os, ProgramError error) {
    return os << program_error_to_string(error);
}

std::ostream& operator<<(std::ostream& os, const ProgramResult& result) {
    if (result.is_ok()) {
        return os << "Ok";
    }
    return os << "Err(" << program_error_to_string(result.error()) << ")";
}

} // namespace svm
} // namespace altprog
