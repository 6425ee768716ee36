#include "test_framework.h"
#include "svm/address_lookup_table/program.h"
#include "svm/runtime_config.h"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace altprog::common;
using namespace altprog::svm;

namespace {

const char* const TEMP_CONFIG_PATH = "altprog_runtime_config_test.json";

void test_default_config() {
    RuntimeConfig config = RuntimeConfigManager::create_default();

    ASSERT_EQ(200000u, config.compute_budget);
    ASSERT_EQ(std::string("INFO"), config.log_level);
    ASSERT_FALSE(config.json_logging);
    ASSERT_FALSE(config.async_logging);
    ASSERT_EQ(3480u, config.rent.lamports_per_byte_year);
    ASSERT_EQ(256u, config.lookup_table.max_addresses);
    ASSERT_EQ(256u, config.lookup_table.max_addresses_per_extend);
    ASSERT_FALSE(config.lookup_table.allow_same_slot_extend);
    ASSERT_EQ(750u, config.lookup_table.compute_units);
    ASSERT_EQ(std::string(), RuntimeConfigManager::validate_config(config));
}

void test_json_round_trip() {
    RuntimeConfig config = RuntimeConfigManager::create_default();
    config.compute_budget = 50000;
    config.log_level = "DEBUG";
    config.json_logging = true;
    config.rent.lamports_per_byte_year = 1000;
    config.rent.exemption_threshold = 1.5;
    config.lookup_table.max_addresses = 64;
    config.lookup_table.max_addresses_per_extend = 16;
    config.lookup_table.allow_same_slot_extend = true;

    nlohmann::json json = RuntimeConfigManager::to_json(config);
    ASSERT_EQ(64u, json["lookup_table"]["max_addresses"].get<size_t>());

    auto loaded = RuntimeConfigManager::load_from_json(json);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(50000u, loaded->compute_budget);
    ASSERT_EQ(std::string("DEBUG"), loaded->log_level);
    ASSERT_TRUE(loaded->json_logging);
    ASSERT_EQ(1000u, loaded->rent.lamports_per_byte_year);
    ASSERT_EQ(16u, loaded->lookup_table.max_addresses_per_extend);
    ASSERT_TRUE(loaded->lookup_table.allow_same_slot_extend);
}

void test_partial_json_keeps_defaults() {
    auto loaded = RuntimeConfigManager::load_from_json(
        nlohmann::json::parse(R"({"lookup_table": {"allow_same_slot_extend": true}})"));

    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(200000u, loaded->compute_budget);
    ASSERT_EQ(256u, loaded->lookup_table.max_addresses);
    ASSERT_TRUE(loaded->lookup_table.allow_same_slot_extend);

    auto empty = RuntimeConfigManager::load_from_json(nlohmann::json::object());
    ASSERT_TRUE(empty.has_value());
    ASSERT_EQ(750u, empty->lookup_table.compute_units);
}

void test_invalid_configs_rejected() {
    ASSERT_FALSE(RuntimeConfigManager::load_from_json(
        nlohmann::json::parse(R"({"log_level": "LOUD"})")).has_value());
    ASSERT_FALSE(RuntimeConfigManager::load_from_json(
        nlohmann::json::parse(R"({"lookup_table": {"max_addresses": 300}})")).has_value());
    ASSERT_FALSE(RuntimeConfigManager::load_from_json(
        nlohmann::json::parse(R"({"lookup_table": {"max_addresses": 8, "max_addresses_per_extend": 9}})"))
        .has_value());
    ASSERT_FALSE(RuntimeConfigManager::load_from_json(
        nlohmann::json::parse(R"({"compute_budget": 0})")).has_value());
    ASSERT_FALSE(RuntimeConfigManager::load_from_json(
        nlohmann::json::parse(R"({"compute_budget": 500})")).has_value());
    ASSERT_FALSE(RuntimeConfigManager::load_from_json(
        nlohmann::json::parse(R"({"rent": {"exemption_threshold": 0.0}})")).has_value());

    // Wrong value types
    ASSERT_FALSE(RuntimeConfigManager::load_from_json(
        nlohmann::json::parse(R"({"compute_budget": "lots"})")).has_value());
    ASSERT_FALSE(RuntimeConfigManager::load_from_json(
        nlohmann::json::parse(R"({"lookup_table": {"allow_same_slot_extend": "yes"}})")).has_value());
    ASSERT_FALSE(RuntimeConfigManager::load_from_json(nlohmann::json::array()).has_value());
}

void test_file_save_and_load() {
    RuntimeConfig config = RuntimeConfigManager::create_default();
    config.lookup_table.max_addresses = 128;
    config.log_level = "WARN";

    ASSERT_TRUE(RuntimeConfigManager::save_to_file(config, TEMP_CONFIG_PATH));
    auto loaded = RuntimeConfigManager::load_from_file(TEMP_CONFIG_PATH);
    std::remove(TEMP_CONFIG_PATH);

    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(128u, loaded->lookup_table.max_addresses);
    ASSERT_EQ(std::string("WARN"), loaded->log_level);
}

void test_file_errors() {
    ASSERT_FALSE(RuntimeConfigManager::load_from_file("does/not/exist.json").has_value());

    {
        std::ofstream file(TEMP_CONFIG_PATH);
        file << "{ \"compute_budget\": ";
    }
    auto loaded = RuntimeConfigManager::load_from_file(TEMP_CONFIG_PATH);
    std::remove(TEMP_CONFIG_PATH);
    ASSERT_FALSE(loaded.has_value());
}

void test_apply_logging() {
    auto& logger = Logger::instance();
    LogLevel previous = logger.get_level();

    RuntimeConfig config = RuntimeConfigManager::create_default();
    config.log_level = "debug";
    config.json_logging = true;
    RuntimeConfigManager::apply_logging(config);
    ASSERT_TRUE(logger.get_level() == LogLevel::DEBUG);

    std::ostringstream captured;
    logger.set_output(&captured);
    LOG_DEBUG("config_test", "value=", 42);
    logger.set_output(nullptr);

    ASSERT_CONTAINS(captured.str(), "\"module\":\"config_test\"");
    ASSERT_CONTAINS(captured.str(), "\"message\":\"value=42\"");

    logger.set_json_format(false);
    logger.set_level(previous);
}

void test_async_logging_from_config() {
    auto& logger = Logger::instance();
    LogLevel previous = logger.get_level();

    auto loaded = RuntimeConfigManager::load_from_json(
        nlohmann::json::parse(R"({"log_level": "INFO", "async_logging": true})"));
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded->async_logging);
    ASSERT_TRUE(RuntimeConfigManager::to_json(*loaded)["async_logging"].get<bool>());

    std::ostringstream captured;
    logger.set_output(&captured);
    RuntimeConfigManager::apply_logging(*loaded);
    ASSERT_TRUE(logger.is_async_logging());

    LOG_INFO("config_test", "queued entry");

    // Switching async off drains the queue before returning
    loaded->async_logging = false;
    RuntimeConfigManager::apply_logging(*loaded);
    ASSERT_FALSE(logger.is_async_logging());
    logger.set_output(nullptr);

    ASSERT_CONTAINS(captured.str(), "[config_test] queued entry");
    logger.set_level(previous);
}

void test_structured_rejection_log() {
    auto& logger = Logger::instance();
    LogLevel previous = logger.get_level();

    std::ostringstream captured;
    logger.set_output(&captured);
    logger.set_level(LogLevel::DEBUG);

    ExecutionContext context;
    context.slot = 77;
    ProgramAccount authority_account;
    PublicKey authority(PUBKEY_BYTES, 0xA2);
    AccountInfo authority_info(authority, false, false, authority_account);
    address_lookup_table::LookupTableMeta meta(authority);
    ProgramResult result =
        address_lookup_table::require_authority_signer(authority_info, meta, context);

    logger.set_output(nullptr);
    logger.set_level(previous);

    ASSERT_EQ(ProgramError::MissingRequiredSignature, result);
    ASSERT_CONTAINS(captured.str(), "(error: MissingRequiredSignature)");
    ASSERT_CONTAINS(captured.str(), "slot=77");
}

void test_program_uses_configured_limits() {
    RuntimeConfig config = RuntimeConfigManager::create_default();
    config.lookup_table.compute_units = 900;
    config.lookup_table.max_addresses = 32;

    address_lookup_table::AddressLookupTableProgram program(config.lookup_table);
    ASSERT_EQ(900u, program.compute_units());
    ASSERT_EQ(32u, program.config().max_addresses);

    address_lookup_table::AddressLookupTableProgram defaults;
    ASSERT_EQ(address_lookup_table::AddressLookupTableProgram::DEFAULT_COMPUTE_UNITS,
              defaults.compute_units());
}

} // anonymous namespace

int main() {
    std::cout << "=== Runtime Configuration Test Suite ===" << std::endl;

    TestRunner runner;

    runner.run_test("Default Config", test_default_config);
    runner.run_test("JSON Round Trip", test_json_round_trip);
    runner.run_test("Partial JSON Keeps Defaults", test_partial_json_keeps_defaults);
    runner.run_test("Invalid Configs Rejected", test_invalid_configs_rejected);
    runner.run_test("File Save And Load", test_file_save_and_load);
    runner.run_test("File Errors", test_file_errors);
    runner.run_test("Apply Logging", test_apply_logging);
    runner.run_test("Async Logging From Config", test_async_logging_from_config);
    runner.run_test("Structured Rejection Log", test_structured_rejection_log);
    runner.run_test("Program Uses Configured Limits", test_program_uses_configured_limits);

    runner.print_summary();
    return runner.all_passed() ? 0 : 1;
}
