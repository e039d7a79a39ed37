/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace taskweave {

struct GraphConfig {
    bool normalize_relates_to = true;           ///< Store relates-to with the smaller id as source
    uint32_t reporting_chain_max_depth = 100;   ///< Read-path guard for reports_to walks
};

struct PourConfig {
    bool default_ephemeral = false;
    uint32_t max_extends_depth = 10;            ///< Longest playbook inheritance chain
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::string audit_file_prefix = "audit";
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    GraphConfig graph;
    PourConfig pour;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace taskweave
