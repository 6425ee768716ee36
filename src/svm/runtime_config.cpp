#include "svm/runtime_config.h"
#include <fstream>

namespace altprog {
namespace svm {

RuntimeConfig RuntimeConfigManager::create_default() {
    RuntimeConfig config;

    config.compute_budget = 200000;
    config.log_level = "INFO";
    config.json_logging = false;
    config.async_logging = false;

    // Mainnet rent parameters
    config.rent.lamports_per_byte_year = RentCalculator::DEFAULT_LAMPORTS_PER_BYTE_YEAR;
    config.rent.exemption_threshold = RentCalculator::DEFAULT_EXEMPTION_THRESHOLD;

    config.lookup_table.max_addresses = address_lookup_table::LOOKUP_TABLE_MAX_ADDRESSES;
    config.lookup_table.max_addresses_per_extend = address_lookup_table::LOOKUP_TABLE_MAX_ADDRESSES;
    config.lookup_table.allow_same_slot_extend = false;
    config.lookup_table.compute_units = 750;

    return config;
}

std::string RuntimeConfigManager::validate_config(const RuntimeConfig& config) {
    if (config.compute_budget == 0) {
        return "Compute budget must be positive";
    }

    if (!parse_log_level(config.log_level)) {
        return "Invalid log level: " + config.log_level;
    }

    if (config.rent.lamports_per_byte_year == 0) {
        return "Rent lamports_per_byte_year must be positive";
    }
    if (!(config.rent.exemption_threshold > 0.0)) {
        return "Rent exemption_threshold must be positive";
    }

    const auto& table = config.lookup_table;
    if (table.max_addresses == 0 ||
        table.max_addresses > address_lookup_table::LOOKUP_TABLE_MAX_ADDRESSES) {
        return "Lookup table max_addresses must be between 1 and " +
               std::to_string(address_lookup_table::LOOKUP_TABLE_MAX_ADDRESSES);
    }
    if (table.max_addresses_per_extend == 0 ||
        table.max_addresses_per_extend > table.max_addresses) {
        return "Lookup table max_addresses_per_extend must be between 1 and max_addresses";
    }
    if (table.compute_units > config.compute_budget) {
        return "Lookup table compute_units exceed the compute budget";
    }

    return ""; // Valid
}

std::optional<RuntimeConfig> RuntimeConfigManager::load_from_json(const nlohmann::json& json) {
    RuntimeConfig config = create_default();
    try {
        config = json.get<RuntimeConfig>();
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("config", "Invalid runtime configuration: ", e.what());
        return std::nullopt;
    }

    std::string error = validate_config(config);
    if (!error.empty()) {
        LOG_ERROR("config", "Invalid runtime configuration: ", error);
        return std::nullopt;
    }
    return config;
}

std::optional<RuntimeConfig> RuntimeConfigManager::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_ERROR("config", "Cannot open configuration file: ", config_path);
        return std::nullopt;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("config", "Failed to parse ", config_path, ": ", e.what());
        return std::nullopt;
    }
    return load_from_json(json);
}

bool RuntimeConfigManager::save_to_file(const RuntimeConfig& config,
                                        const std::string& config_path) {
    std::ofstream file(config_path);
    if (!file.is_open()) {
        LOG_ERROR("config", "Cannot write configuration file: ", config_path);
        return false;
    }
    file << to_json(config).dump(2) << std::endl;
    return file.good();
}

nlohmann::json RuntimeConfigManager::to_json(const RuntimeConfig& config) {
    return nlohmann::json(config);
}

void RuntimeConfigManager::apply_logging(const RuntimeConfig& config) {
    auto& logger = Logger::instance();
    if (auto level = parse_log_level(config.log_level)) {
        logger.set_level(*level);
    }
    logger.set_json_format(config.json_logging);
    logger.set_async_logging(config.async_logging);
}

} // namespace svm
} // namespace altprog

namespace nlohmann {

using altprog::svm::RentCalculator;
using altprog::svm::RuntimeConfig;
using altprog::svm::address_lookup_table::LookupTableConfig;

void adl_serializer<RentCalculator::RentConfig>::to_json(json& j,
                                                        const RentCalculator::RentConfig& config) {
    j = json{
        {"lamports_per_byte_year", config.lamports_per_byte_year},
        {"exemption_threshold", config.exemption_threshold}
    };
}

void adl_serializer<RentCalculator::RentConfig>::from_json(const json& j,
                                                          RentCalculator::RentConfig& config) {
    config.lamports_per_byte_year = j.value("lamports_per_byte_year", config.lamports_per_byte_year);
    config.exemption_threshold = j.value("exemption_threshold", config.exemption_threshold);
}

void adl_serializer<LookupTableConfig>::to_json(json& j, const LookupTableConfig& config) {
    j = json{
        {"max_addresses", config.max_addresses},
        {"max_addresses_per_extend", config.max_addresses_per_extend},
        {"allow_same_slot_extend", config.allow_same_slot_extend},
        {"compute_units", config.compute_units}
    };
}

void adl_serializer<LookupTableConfig>::from_json(const json& j, LookupTableConfig& config) {
    config.max_addresses = j.value("max_addresses", config.max_addresses);
    config.max_addresses_per_extend =
        j.value("max_addresses_per_extend", config.max_addresses_per_extend);
    config.allow_same_slot_extend = j.value("allow_same_slot_extend", config.allow_same_slot_extend);
    config.compute_units = j.value("compute_units", config.compute_units);
}

void adl_serializer<RuntimeConfig>::to_json(json& j, const RuntimeConfig& config) {
    j = json{
        {"compute_budget", config.compute_budget},
        {"log_level", config.log_level},
        {"json_logging", config.json_logging},
        {"async_logging", config.async_logging},
        {"rent", config.rent},
        {"lookup_table", config.lookup_table}
    };
}

void adl_serializer<RuntimeConfig>::from_json(const json& j, RuntimeConfig& config) {
    config.compute_budget = j.value("compute_budget", config.compute_budget);
    config.log_level = j.value("log_level", config.log_level);
    config.json_logging = j.value("json_logging", config.json_logging);
    config.async_logging = j.value("async_logging", config.async_logging);
    if (j.contains("rent")) {
        j.at("rent").get_to(config.rent);
    }
    if (j.contains("lookup_table")) {
        j.at("lookup_table").get_to(config.lookup_table);
    }
}

} // namespace nlohmann
