#include "common/base58.h"
#include "common/logging.h"
#include "svm/address_lookup_table/instruction.h"
#include "svm/address_lookup_table/state.h"
#include "svm/runtime_config.h"
#include "svm/sysvars.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace altprog::common;
using namespace altprog::svm;
using namespace altprog::svm::address_lookup_table;

void print_usage() {
    std::cout << "Address Lookup Table inspection CLI\n";
    std::cout << "Usage: alt-inspect [command] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  decode <path>             Decode a lookup table account (raw or hex)\n";
    std::cout << "  derive <authority> <slot> Derive the table address for an authority\n\n";
    std::cout << "Options:\n";
    std::cout << "  --json                    Print JSON instead of text\n";
    std::cout << "  --slot <n>                Current slot for the activation status\n";
    std::cout << "  --slot-hashes <path>      SlotHashes sysvar data (raw or hex)\n";
    std::cout << "  --config <path>           Runtime configuration file\n";
    std::cout << "  --help                    Show this help message\n";
}

// Files holding only hex digits (optionally 0x-prefixed) are decoded as hex
Result<std::vector<uint8_t>> read_account_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::vector<uint8_t>>("Cannot open " + path);
    }
    std::vector<uint8_t> raw((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());

    std::string text(raw.begin(), raw.end());
    text.erase(std::remove_if(text.begin(), text.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               text.end());
    std::string digits = text.rfind("0x", 0) == 0 ? text.substr(2) : text;
    bool is_hex = !digits.empty() &&
                  std::all_of(digits.begin(), digits.end(),
                              [](unsigned char c) { return std::isxdigit(c); });
    if (is_hex) {
        return from_hex(text);
    }
    return Result<std::vector<uint8_t>>(std::move(raw));
}

nlohmann::json table_to_json(const AddressLookupTable& table,
                             const std::optional<LookupTableStatus>& status) {
    const auto& meta = table.meta();
    nlohmann::json j;
    j["deactivation_slot"] = meta.is_deactivated() ? nlohmann::json(meta.deactivation_slot)
                                                   : nlohmann::json(nullptr);
    j["last_extended_slot"] = meta.last_extended_slot;
    j["last_extended_slot_start_index"] = meta.last_extended_slot_start_index;
    j["authority"] = meta.authority ? nlohmann::json(encode_base58(*meta.authority))
                                    : nlohmann::json(nullptr);
    j["frozen"] = meta.is_frozen();

    nlohmann::json addresses = nlohmann::json::array();
    for (const auto& address : table.addresses()) {
        addresses.push_back(encode_base58(address));
    }
    j["addresses"] = addresses;

    if (status) {
        j["status"] = lookup_table_status_to_string(status->kind);
        if (status->kind == LookupTableStatus::Kind::Deactivating) {
            j["remaining_blocks"] = status->remaining_blocks;
        }
    }
    return j;
}

void print_table(const AddressLookupTable& table,
                 const std::optional<LookupTableStatus>& status) {
    const auto& meta = table.meta();
    std::cout << "Lookup Table:\n";
    std::cout << "  Authority: "
              << (meta.authority ? encode_base58(*meta.authority) : std::string("(frozen)")) << "\n";
    std::cout << "  Deactivation Slot: "
              << (meta.is_deactivated() ? std::to_string(meta.deactivation_slot)
                                        : std::string("none")) << "\n";
    std::cout << "  Last Extended Slot: " << meta.last_extended_slot << "\n";
    std::cout << "  Last Extended Start Index: "
              << static_cast<int>(meta.last_extended_slot_start_index) << "\n";
    if (status) {
        std::cout << "  Status: " << lookup_table_status_to_string(status->kind);
        if (status->kind == LookupTableStatus::Kind::Deactivating) {
            std::cout << " (" << status->remaining_blocks << " blocks remaining)";
        }
        std::cout << "\n";
    }
    std::cout << "  Addresses (" << table.len() << "):\n";
    for (size_t i = 0; i < table.len(); ++i) {
        std::cout << "    [" << i << "] " << encode_base58(table.addresses()[i]) << "\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    bool json_output = false;
    std::optional<Slot> current_slot;
    std::string slot_hashes_path;
    std::string config_path;

    // Parse options
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            json_output = true;
        } else if (arg == "--slot" && i + 1 < argc) {
            try {
                current_slot = std::stoull(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid slot: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--slot-hashes" && i + 1 < argc) {
            slot_hashes_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help") {
            print_usage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    if (command == "--help") {
        print_usage();
        return 0;
    }

    RuntimeConfig config = RuntimeConfigManager::create_default();
    if (!config_path.empty()) {
        auto loaded = RuntimeConfigManager::load_from_file(config_path);
        if (!loaded) {
            std::cerr << "Failed to load configuration from " << config_path << std::endl;
            return 1;
        }
        config = *loaded;
    }
    RuntimeConfigManager::apply_logging(config);

    if (command == "decode") {
        if (positional.empty()) {
            std::cerr << "Decode command requires a file path\n";
            return 1;
        }

        auto data = read_account_file(positional[0]);
        if (!data.is_ok()) {
            std::cerr << "Failed to read account: " << data.error() << std::endl;
            return 1;
        }
        LOG_DEBUG("alt_inspect", "Read ", data.value().size(), " bytes from ", positional[0]);

        AddressLookupTable table;
        ProgramResult decoded = AddressLookupTable::deserialize(data.value(), table);
        if (decoded.is_err()) {
            std::cerr << "Failed to decode lookup table: " << decoded << std::endl;
            return 1;
        }

        std::optional<LookupTableStatus> status;
        if (current_slot) {
            SlotHashes slot_hashes;
            if (!slot_hashes_path.empty()) {
                auto sysvar_data = read_account_file(slot_hashes_path);
                if (!sysvar_data.is_ok()) {
                    std::cerr << "Failed to read SlotHashes: " << sysvar_data.error() << std::endl;
                    return 1;
                }
                ProgramResult loaded = SlotHashes::deserialize(sysvar_data.value(), slot_hashes);
                if (loaded.is_err()) {
                    std::cerr << "Failed to decode SlotHashes: " << loaded << std::endl;
                    return 1;
                }
            }
            status = table.status(*current_slot, slot_hashes);
        }

        if (json_output) {
            std::cout << table_to_json(table, status).dump(2) << std::endl;
        } else {
            print_table(table, status);
        }

    } else if (command == "derive") {
        if (positional.size() < 2) {
            std::cerr << "Derive command requires an authority and a slot\n";
            return 1;
        }

        auto authority = decode_pubkey(positional[0]);
        if (!authority.is_ok()) {
            std::cerr << "Invalid authority: " << authority.error() << std::endl;
            return 1;
        }
        Slot recent_slot = 0;
        try {
            recent_slot = std::stoull(positional[1]);
        } catch (const std::exception&) {
            std::cerr << "Invalid slot: " << positional[1] << std::endl;
            return 1;
        }

        auto derived = derive_lookup_table_address(authority.value(), recent_slot);
        if (!derived) {
            std::cerr << "No viable lookup table address for these seeds\n";
            return 1;
        }

        if (json_output) {
            nlohmann::json j;
            j["address"] = encode_base58(derived->first);
            j["bump_seed"] = derived->second;
            std::cout << j.dump(2) << std::endl;
        } else {
            std::cout << "Lookup table address: " << encode_base58(derived->first) << "\n";
            std::cout << "Bump seed: " << static_cast<int>(derived->second) << "\n";
        }

    } else {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage();
        return 1;
    }

    return 0;
}
