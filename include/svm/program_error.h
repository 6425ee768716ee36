#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace altprog {
namespace svm {

/**
 * Errors a builtin program can surface to the runtime.
 *
 * Structural, authorization, lifecycle and resource failures share one
 * enumeration so the host can report them uniformly. None of them is ever
 * recovered inside a program.
 */
enum class ProgramError : uint8_t {
    // Structural
    InvalidAccountData,
    InvalidInstructionData,
    UninitializedAccount,
    NotEnoughAccountKeys,
    InvalidArgument,
    InvalidSeeds,
    ArithmeticOverflow,
    InvalidRealloc,
    UnbalancedInstruction,
    ReadonlyDataModified,

    // Authorization
    MissingRequiredSignature,
    IncorrectAuthority,
    Immutable,
    InvalidAccountOwner,
    InvalidAuthority,
    PrivilegeEscalation,

    // Lookup table lifecycle
    AlreadyDeactivated,
    DeactivationRequired,
    NotReady,
    SameSlotExtend,
    ExceedsMaxEntries,
    EmptyLookupTable,
    InvalidSlot,
    AccountAlreadyInitialized,
    AccountAlreadyInUse,

    // Resource
    InsufficientFunds,
    AccountDataTooSmall,

    // Host failures surfaced through cross-program invocation
    UnsupportedProgramId,
    ComputationalBudgetExceeded,
    CallDepth,
};

const char* program_error_to_string(ProgramError error) noexcept;

std::ostream& operator<<(std::ostream& os, ProgramError error);

/**
 * Outcome of a program-level operation: success, or exactly one ProgramError.
 *
 * Implicitly constructible from a ProgramError so handlers can
 * `return ProgramError::Immutable;`.
 */
class ProgramResult {
public:
    ProgramResult() = default;
    ProgramResult(ProgramError error) : error_(error) {}  // NOLINT(google-explicit-constructor)

    static ProgramResult ok() { return ProgramResult(); }

    bool is_ok() const noexcept { return !error_.has_value(); }
    bool is_err() const noexcept { return error_.has_value(); }

    /// @warning Only call this if is_err() returns true
    ProgramError error() const { return *error_; }

    explicit operator bool() const noexcept { return is_ok(); }

    friend bool operator==(const ProgramResult& a, const ProgramResult& b) {
        return a.error_ == b.error_;
    }
    friend bool operator!=(const ProgramResult& a, const ProgramResult& b) {
        return !(a == b);
    }

private:
    std::optional<ProgramError> error_;
};

std::ostream& operator<<(std::ostream& os, const ProgramResult& result);

} // namespace svm
} // namespace altprog
