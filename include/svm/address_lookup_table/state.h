#pragma once

#include "common/types.h"
#include "svm/program_error.h"
#include "svm/sysvars.h"
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace altprog {
namespace svm {
namespace address_lookup_table {

using namespace altprog::common;

/// Size of the serialized ProgramState header preceding the addresses
constexpr size_t LOOKUP_TABLE_META_SIZE = 56;

/// Protocol maximum number of addresses per table
constexpr size_t LOOKUP_TABLE_MAX_ADDRESSES = 256;

/// deactivation_slot value of a table that has not been deactivated
constexpr Slot DEACTIVATION_SLOT_NONE = std::numeric_limits<Slot>::max();

// Header field offsets
constexpr size_t DISCRIMINANT_OFFSET = 0;
constexpr size_t DEACTIVATION_SLOT_OFFSET = 4;
constexpr size_t LAST_EXTENDED_SLOT_OFFSET = 12;
constexpr size_t START_INDEX_OFFSET = 20;
constexpr size_t AUTHORITY_TAG_OFFSET = 21;
constexpr size_t AUTHORITY_OFFSET = 22;
constexpr size_t PADDING_OFFSET = 54;

enum class ProgramState : uint32_t {
    Uninitialized = 0,
    LookupTable = 1,
};

/**
 * Lookup table header
 */
struct LookupTableMeta {
    /// DEACTIVATION_SLOT_NONE while the table is active
    Slot deactivation_slot = DEACTIVATION_SLOT_NONE;
    /// Slot of the most recent extend, 0 if never extended
    Slot last_extended_slot = 0;
    /// Address count immediately before the most recent extend
    uint8_t last_extended_slot_start_index = 0;
    /// Absent once frozen
    std::optional<PublicKey> authority;

    LookupTableMeta() = default;
    explicit LookupTableMeta(const PublicKey& authority_key) : authority(authority_key) {}

    bool is_deactivated() const { return deactivation_slot != DEACTIVATION_SLOT_NONE; }
    bool is_frozen() const { return !authority.has_value(); }

    bool operator==(const LookupTableMeta& other) const {
        return deactivation_slot == other.deactivation_slot &&
               last_extended_slot == other.last_extended_slot &&
               last_extended_slot_start_index == other.last_extended_slot_start_index &&
               authority == other.authority;
    }
    bool operator!=(const LookupTableMeta& other) const { return !(*this == other); }
};

/**
 * Decode the header and count the stored addresses.
 *
 * An Uninitialized discriminant yields a default meta and zero addresses.
 * Fails with InvalidAccountData when the buffer is shorter than the header,
 * the discriminant or authority tag is unknown, or the address region is
 * not a whole number of entries within the protocol maximum.
 */
ProgramResult decode(const std::vector<uint8_t>& data,
                     ProgramState& state,
                     LookupTableMeta& meta,
                     size_t& address_count);

/**
 * Overwrite the header with an initialized table state.
 * Address entries are left untouched.
 */
ProgramResult encode(const LookupTableMeta& meta, std::vector<uint8_t>& data);

/**
 * Write addresses at the slot after the current address_count.
 * The buffer must already be sized for them.
 */
ProgramResult append_addresses(std::vector<uint8_t>& data,
                               size_t address_count,
                               const std::vector<PublicKey>& addresses);

/// Write the header of a freshly created table owned by authority
ProgramResult serialize_new_lookup_table(std::vector<uint8_t>& data,
                                         const PublicKey& authority);

/**
 * Activation status of a table relative to the current slot
 */
struct LookupTableStatus {
    enum class Kind {
        Activated,
        Deactivating,
        Deactivated,
    };

    Kind kind = Kind::Activated;
    /// Slots left before the table can be closed (Deactivating only)
    size_t remaining_blocks = 0;

    static LookupTableStatus activated() { return {Kind::Activated, 0}; }
    static LookupTableStatus deactivating(size_t remaining) { return {Kind::Deactivating, remaining}; }
    static LookupTableStatus deactivated() { return {Kind::Deactivated, 0}; }
};

const char* lookup_table_status_to_string(LookupTableStatus::Kind kind);

/**
 * Read-only decoded table: header plus addresses
 */
class AddressLookupTable {
public:
    /// Fails like decode(), and with UninitializedAccount for an empty state
    static ProgramResult deserialize(const std::vector<uint8_t>& data, AddressLookupTable& out);

    const LookupTableMeta& meta() const { return meta_; }
    const std::vector<PublicKey>& addresses() const { return addresses_; }
    size_t len() const { return addresses_.size(); }

    std::optional<PublicKey> lookup(size_t index) const;

    LookupTableStatus status(Slot current_slot, const SlotHashes& slot_hashes) const;

    /// Only activated or deactivating tables may be used by transactions
    bool is_active(Slot current_slot, const SlotHashes& slot_hashes) const {
        return status(current_slot, slot_hashes).kind != LookupTableStatus::Kind::Deactivated;
    }

private:
    LookupTableMeta meta_;
    std::vector<PublicKey> addresses_;
};

} // namespace address_lookup_table
} // namespace svm
} // namespace altprog
