// include/config/registry_config.h
#pragma once

#include "../types.h"
#include "../debug_utils.h"
#include "../registry_error/result.h"

#include <nlohmann/json.hpp>

#include <string>
#include <cstddef>

namespace schemata {
namespace config {

/**
 * @brief Startup settings for a SchemaRegistry.
 *
 * An empty data_directory keeps everything in memory. Entries recovered from
 * config.log take precedence over default_compatibility.
 */
struct RegistryConfig {
    std::string data_directory;
    CompatibilityMode default_compatibility = CompatibilityMode::BACKWARD;
    bool flush_on_write = true;
    size_t max_schema_bytes = 1024 * 1024;
    LogLevel log_level = LogLevel::INFO;

    // A schema log record carries both the raw and the canonical text, so each
    // stays well under half of the 64 MiB record limit.
    static constexpr size_t MAX_SCHEMA_BYTES_LIMIT = 16 * 1024 * 1024;

    registry::Status validate() const;
    nlohmann::json toJson() const;

    // Missing keys keep their defaults; unknown keys are ignored.
    static registry::Result<RegistryConfig> fromJson(const nlohmann::json& j);
    static registry::Result<RegistryConfig> fromJsonFile(const std::string& path);
};

} // namespace config
} // namespace schemata
