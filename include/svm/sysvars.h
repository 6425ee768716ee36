#pragma once

#include "common/types.h"
#include "svm/program_error.h"
#include <optional>
#include <utility>
#include <vector>

namespace altprog {
namespace svm {

using namespace altprog::common;

const PublicKey& slot_hashes_sysvar_id();
const PublicKey& clock_sysvar_id();

/**
 * SlotHashes sysvar: recent (slot, bank hash) pairs, newest first.
 *
 * Account layout: u64 LE entry count, then per entry a u64 LE slot
 * followed by a 32-byte hash.
 */
class SlotHashes {
public:
    static constexpr size_t MAX_ENTRIES = 512;
    static constexpr size_t ENTRY_SIZE = 8 + HASH_BYTES;

    using Entry = std::pair<Slot, Hash>;

    SlotHashes() = default;

    /// Entries are sorted by descending slot and truncated to MAX_ENTRIES
    explicit SlotHashes(std::vector<Entry> entries);

    /**
     * Decode sysvar account data.
     * Fails with InvalidAccountData when the buffer is shorter than its count
     * claims.
     */
    static ProgramResult deserialize(const std::vector<uint8_t>& data, SlotHashes& out);

    std::vector<uint8_t> serialize() const;

    /// Record a new slot at the front, dropping the oldest past MAX_ENTRIES
    void add(Slot slot, const Hash& hash);

    /// Index of slot counted from the newest entry
    std::optional<size_t> position(Slot slot) const;
    bool contains(Slot slot) const { return position(slot).has_value(); }

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};

} // namespace svm
} // namespace altprog
