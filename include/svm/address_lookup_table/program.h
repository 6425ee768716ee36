#pragma once

#include "svm/address_lookup_table/instruction.h"
#include "svm/address_lookup_table/processor.h"
#include "svm/engine.h"

namespace altprog {
namespace svm {
namespace address_lookup_table {

/**
 * Address lookup table builtin program
 *
 * Decodes the instruction once into a typed variant and routes it to the
 * matching Processor handler.
 */
class AddressLookupTableProgram : public BuiltinProgram {
public:
    static constexpr uint64_t DEFAULT_COMPUTE_UNITS = 750;

    AddressLookupTableProgram();
    explicit AddressLookupTableProgram(const LookupTableConfig& config);

    PublicKey get_program_id() const override;
    uint64_t compute_units() const override;

    ExecutionOutcome execute(
        const Instruction& instruction,
        ExecutionContext& context
    ) const override;

    const LookupTableConfig& config() const { return processor_.config(); }

private:
    Processor processor_;
};

} // namespace address_lookup_table
} // namespace svm
} // namespace altprog
