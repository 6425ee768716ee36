#include "svm/address_lookup_table/state.h"
#include <algorithm>

namespace altprog {
namespace svm {
namespace address_lookup_table {

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

ProgramResult decode(const std::vector<uint8_t>& data,
                     ProgramState& state,
                     LookupTableMeta& meta,
                     size_t& address_count) {
    if (data.size() < LOOKUP_TABLE_META_SIZE) {
        return ProgramError::InvalidAccountData;
    }

    uint32_t discriminant = read_le<uint32_t>(data, DISCRIMINANT_OFFSET);
    if (discriminant == static_cast<uint32_t>(ProgramState::Uninitialized)) {
        state = ProgramState::Uninitialized;
        meta = LookupTableMeta();
        address_count = 0;
        return ProgramResult::ok();
    }
    if (discriminant != static_cast<uint32_t>(ProgramState::LookupTable)) {
        return ProgramError::InvalidAccountData;
    }

    LookupTableMeta decoded;
    decoded.deactivation_slot = read_le<uint64_t>(data, DEACTIVATION_SLOT_OFFSET);
    decoded.last_extended_slot = read_le<uint64_t>(data, LAST_EXTENDED_SLOT_OFFSET);
    decoded.last_extended_slot_start_index = data[START_INDEX_OFFSET];

    switch (data[AUTHORITY_TAG_OFFSET]) {
        case 0:
            break;
        case 1:
            decoded.authority = PublicKey(data.begin() + AUTHORITY_OFFSET,
                                          data.begin() + AUTHORITY_OFFSET + PUBKEY_BYTES);
            break;
        default:
            return ProgramError::InvalidAccountData;
    }

    size_t address_bytes = data.size() - LOOKUP_TABLE_META_SIZE;
    if (address_bytes % PUBKEY_BYTES != 0 ||
        address_bytes / PUBKEY_BYTES > LOOKUP_TABLE_MAX_ADDRESSES) {
        return ProgramError::InvalidAccountData;
    }

    state = ProgramState::LookupTable;
    meta = std::move(decoded);
    address_count = address_bytes / PUBKEY_BYTES;
    return ProgramResult::ok();
}

ProgramResult encode(const LookupTableMeta& meta, std::vector<uint8_t>& data) {
    if (data.size() < LOOKUP_TABLE_META_SIZE) {
        return ProgramError::AccountDataTooSmall;
    }
    if (meta.authority && meta.authority->size() != PUBKEY_BYTES) {
        return ProgramError::InvalidArgument;
    }

    write_le<uint32_t>(data, DISCRIMINANT_OFFSET, static_cast<uint32_t>(ProgramState::LookupTable));
    write_le<uint64_t>(data, DEACTIVATION_SLOT_OFFSET, meta.deactivation_slot);
    write_le<uint64_t>(data, LAST_EXTENDED_SLOT_OFFSET, meta.last_extended_slot);
    data[START_INDEX_OFFSET] = meta.last_extended_slot_start_index;

    auto authority_begin = data.begin() + AUTHORITY_OFFSET;
    if (meta.authority) {
        data[AUTHORITY_TAG_OFFSET] = 1;
        std::copy(meta.authority->begin(), meta.authority->end(), authority_begin);
    } else {
        data[AUTHORITY_TAG_OFFSET] = 0;
        std::fill(authority_begin, authority_begin + PUBKEY_BYTES, 0);
    }

    write_le<uint16_t>(data, PADDING_OFFSET, 0);
    return ProgramResult::ok();
}

ProgramResult append_addresses(std::vector<uint8_t>& data,
                               size_t address_count,
                               const std::vector<PublicKey>& addresses) {
    if (address_count + addresses.size() > LOOKUP_TABLE_MAX_ADDRESSES) {
        return ProgramError::InvalidAccountData;
    }

    size_t offset = LOOKUP_TABLE_META_SIZE + address_count * PUBKEY_BYTES;
    if (offset + addresses.size() * PUBKEY_BYTES > data.size()) {
        return ProgramError::InvalidAccountData;
    }

    for (const auto& address : addresses) {
        if (address.size() != PUBKEY_BYTES) {
            return ProgramError::InvalidArgument;
        }
    }
    for (const auto& address : addresses) {
        std::copy(address.begin(), address.end(), data.begin() + offset);
        offset += PUBKEY_BYTES;
    }
    return ProgramResult::ok();
}

ProgramResult serialize_new_lookup_table(std::vector<uint8_t>& data,
                                         const PublicKey& authority) {
    return encode(LookupTableMeta(authority), data);
}

const char* lookup_table_status_to_string(LookupTableStatus::Kind kind) {
    switch (kind) {
        case LookupTableStatus::Kind::Activated: return "Activated";
        case LookupTableStatus::Kind::Deactivating: return "Deactivating";
        case LookupTableStatus::Kind::Deactivated: return "Deactivated";
    }
    return "Unknown";
}

ProgramResult AddressLookupTable::deserialize(const std::vector<uint8_t>& data,
                                              AddressLookupTable& out) {
    ProgramState state = ProgramState::Uninitialized;
    LookupTableMeta meta;
    size_t address_count = 0;

    ProgramResult decoded = decode(data, state, meta, address_count);
    if (decoded.is_err()) {
        return decoded;
    }
    if (state != ProgramState::LookupTable) {
        return ProgramError::UninitializedAccount;
    }

    std::vector<PublicKey> addresses;
    addresses.reserve(address_count);
    for (size_t i = 0; i < address_count; ++i) {
        auto begin = data.begin() + LOOKUP_TABLE_META_SIZE + i * PUBKEY_BYTES;
        addresses.emplace_back(begin, begin + PUBKEY_BYTES);
    }

    out.meta_ = std::move(meta);
    out.addresses_ = std::move(addresses);
    return ProgramResult::ok();
}

std::optional<PublicKey> AddressLookupTable::lookup(size_t index) const {
    if (index >= addresses_.size()) {
        return std::nullopt;
    }
    return addresses_[index];
}

LookupTableStatus AddressLookupTable::status(Slot current_slot,
                                             const SlotHashes& slot_hashes) const {
    if (!meta_.is_deactivated()) {
        return LookupTableStatus::activated();
    }
    if (meta_.deactivation_slot == current_slot) {
        return LookupTableStatus::deactivating(SlotHashes::MAX_ENTRIES + 1);
    }
    if (auto position = slot_hashes.position(meta_.deactivation_slot)) {
        return LookupTableStatus::deactivating(SlotHashes::MAX_ENTRIES - *position);
    }
    return LookupTableStatus::deactivated();
}

} // namespace address_lookup_table
} // namespace svm
} // namespace altprog
