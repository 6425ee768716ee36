#pragma once

#include "common/logging.h"
#include "svm/address_lookup_table/processor.h"
#include "svm/rent_calculator.h"
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace altprog {
namespace svm {

/**
 * @brief Runtime configuration for the execution harness and its builtins
 */
struct RuntimeConfig {
    uint64_t compute_budget = 200000;

    // Logging
    std::string log_level = "INFO";
    bool json_logging = false;
    bool async_logging = false;

    RentCalculator::RentConfig rent;
    address_lookup_table::LookupTableConfig lookup_table;
};

/**
 * @brief Runtime configuration loader and manager
 */
class RuntimeConfigManager {
public:
    /**
     * @brief Load configuration from JSON file
     * @param config_path path to configuration file
     * @return loaded configuration, or nullopt if the file is unreadable,
     *         malformed or fails validation
     */
    static std::optional<RuntimeConfig> load_from_file(const std::string& config_path);

    /**
     * @brief Save configuration to JSON file
     * @return true if save successful
     */
    static bool save_to_file(const RuntimeConfig& config, const std::string& config_path);

    /**
     * @brief Load configuration from JSON object
     *
     * Missing keys keep their defaults.
     * @return loaded configuration, or nullopt if a value has the wrong type
     *         or fails validation
     */
    static std::optional<RuntimeConfig> load_from_json(const nlohmann::json& json);

    static nlohmann::json to_json(const RuntimeConfig& config);

    static RuntimeConfig create_default();

    /**
     * @brief Validate configuration
     * @return validation error message, or empty string if valid
     */
    static std::string validate_config(const RuntimeConfig& config);

    /// Apply log level, format and async mode to the global Logger
    static void apply_logging(const RuntimeConfig& config);
};

} // namespace svm
} // namespace altprog

// JSON serialization support
namespace nlohmann {

template<>
struct adl_serializer<altprog::svm::RentCalculator::RentConfig> {
    static void to_json(json& j, const altprog::svm::RentCalculator::RentConfig& config);
    static void from_json(const json& j, altprog::svm::RentCalculator::RentConfig& config);
};

template<>
struct adl_serializer<altprog::svm::address_lookup_table::LookupTableConfig> {
    static void to_json(json& j, const altprog::svm::address_lookup_table::LookupTableConfig& config);
    static void from_json(const json& j, altprog::svm::address_lookup_table::LookupTableConfig& config);
};

template<>
struct adl_serializer<altprog::svm::RuntimeConfig> {
    static void to_json(json& j, const altprog::svm::RuntimeConfig& config);
    static void from_json(const json& j, altprog::svm::RuntimeConfig& config);
};

} // namespace nlohmann
