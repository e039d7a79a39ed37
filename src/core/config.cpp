/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <limits>

namespace taskweave {

namespace {

/// Reads an integer key into `out`, rejecting values below `min` or above uint32 range.
template <typename Node>
Result<void> read_count(Node table, std::string_view section, std::string_view key,
                        int64_t min, uint32_t& out) {
    int64_t value = table[key].value_or(static_cast<int64_t>(out));
    if (value < min || value > std::numeric_limits<uint32_t>::max()) {
        return Error{ErrorCode::ConfigError,
                     std::string{section} + "." + std::string{key} + " must be at least "
                         + std::to_string(min) + ", got " + std::to_string(value)};
    }
    out = static_cast<uint32_t>(value);
    return {};
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [graph]
        if (auto graph = tbl["graph"]; graph.is_table()) {
            config.graph.normalize_relates_to =
                graph["normalize_relates_to"].value_or(true);
            if (auto r = read_count(graph, "graph", "reporting_chain_max_depth", 1,
                                    config.graph.reporting_chain_max_depth); !r) {
                return r.error();
            }
        }

        // [pour]
        if (auto pour = tbl["pour"]; pour.is_table()) {
            config.pour.default_ephemeral = pour["default_ephemeral"].value_or(false);
            if (auto r = read_count(pour, "pour", "max_extends_depth", 0,
                                    config.pour.max_extends_depth); !r) {
                return r.error();
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            if (auto r = read_count(telemetry, "telemetry", "max_file_size_mb", 1,
                                    config.telemetry.max_file_size_mb); !r) {
                return r.error();
            }
            if (auto r = read_count(telemetry, "telemetry", "rotate_count", 0,
                                    config.telemetry.rotate_count); !r) {
                return r.error();
            }
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.audit_file_prefix =
                telemetry["audit_file_prefix"].value_or(std::string{"audit"});
        }

        if (!parse_log_level(config.telemetry.log_level)) {
            return Error{ErrorCode::ConfigError,
                         "Unknown log level: " + config.telemetry.log_level};
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace taskweave
