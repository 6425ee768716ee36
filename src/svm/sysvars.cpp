#include "svm/sysvars.h"
#include "common/base58.h"
#include <algorithm>

namespace altprog {
namespace svm {

namespace {

template<typename T>
T read_le(const std::vector<uint8_t>& data, size_t offset) {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(data[offset + i]) << (i * 8);
    }
    return value;
}

template<typename T>
void write_le(std::vector<uint8_t>& data, size_t offset, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        data[offset + i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
}

} // namespace

const PublicKey& slot_hashes_sysvar_id() {
    static const PublicKey id = pubkey_from_base58("SysvarS1otHashes111111111111111111111111111");
    return id;
}

const PublicKey& clock_sysvar_id() {
    static const PublicKey id = pubkey_from_base58("SysvarC1ock11111111111111111111111111111111");
    return id;
}

SlotHashes::SlotHashes(std::vector<Entry> entries) : entries_(std::move(entries)) {
    std::stable_sort(entries_.begin(), entries_.end(),
                     [](const Entry& a, const Entry& b) { return a.first > b.first; });
    if (entries_.size() > MAX_ENTRIES) {
        entries_.resize(MAX_ENTRIES);
    }
}

ProgramResult SlotHashes::deserialize(const std::vector<uint8_t>& data, SlotHashes& out) {
    if (data.size() < sizeof(uint64_t)) {
        return ProgramError::InvalidAccountData;
    }

    uint64_t count = read_le<uint64_t>(data, 0);
    if (count > MAX_ENTRIES || count > (data.size() - sizeof(uint64_t)) / ENTRY_SIZE) {
        return ProgramError::InvalidAccountData;
    }

    std::vector<Entry> entries;
    entries.reserve(static_cast<size_t>(count));
    size_t offset = sizeof(uint64_t);
    for (uint64_t i = 0; i < count; ++i) {
        Slot slot = read_le<uint64_t>(data, offset);
        offset += sizeof(uint64_t);
        Hash hash(data.begin() + offset, data.begin() + offset + HASH_BYTES);
        offset += HASH_BYTES;
        entries.emplace_back(slot, std::move(hash));
    }

    out.entries_ = std::move(entries);
    return ProgramResult::ok();
}

std::vector<uint8_t> SlotHashes::serialize() const {
    std::vector<uint8_t> data(sizeof(uint64_t) + entries_.size() * ENTRY_SIZE, 0);

    write_le<uint64_t>(data, 0, entries_.size());
    size_t offset = sizeof(uint64_t);
    for (const auto& entry : entries_) {
        write_le<uint64_t>(data, offset, entry.first);
        offset += sizeof(uint64_t);
        std::copy_n(entry.second.begin(), std::min(entry.second.size(), HASH_BYTES),
                    data.begin() + offset);
        offset += HASH_BYTES;
    }
    return data;
}

void SlotHashes::add(Slot slot, const Hash& hash) {
    auto it = std::lower_bound(entries_.begin(), entries_.end(), slot,
                               [](const Entry& entry, Slot value) { return entry.first > value; });
    if (it != entries_.end() && it->first == slot) {
        it->second = hash;
        return;
    }
    entries_.insert(it, Entry(slot, hash));
    if (entries_.size() > MAX_ENTRIES) {
        entries_.resize(MAX_ENTRIES);
    }
}

std::optional<size_t> SlotHashes::position(Slot slot) const {
    // Binary search over descending slots
    auto it = std::lower_bound(entries_.begin(), entries_.end(), slot,
                               [](const Entry& entry, Slot value) { return entry.first > value; });
    if (it == entries_.end() || it->first != slot) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - entries_.begin());
}

} // namespace svm
} // namespace altprog
