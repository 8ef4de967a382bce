// src/config/registry_config.cpp

#include "../../include/config/registry_config.h"
#include "../../include/registry_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>

#include <fstream>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace schemata {

NLOHMANN_JSON_SERIALIZE_ENUM(CompatibilityMode, {
    {CompatibilityMode::NONE, "NONE"},
    {CompatibilityMode::BACKWARD, "BACKWARD"},
    {CompatibilityMode::BACKWARD_TRANSITIVE, "BACKWARD_TRANSITIVE"},
    {CompatibilityMode::FORWARD, "FORWARD"},
    {CompatibilityMode::FORWARD_TRANSITIVE, "FORWARD_TRANSITIVE"},
    {CompatibilityMode::FULL, "FULL"},
    {CompatibilityMode::FULL_TRANSITIVE, "FULL_TRANSITIVE"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(LogLevel, {
    {LogLevel::TRACE, "TRACE"},
    {LogLevel::INFO, "INFO"},
    {LogLevel::WARN, "WARN"},
    {LogLevel::ERROR, "ERROR"},
    {LogLevel::FATAL, "FATAL"},
    {LogLevel::OFF, "OFF"}
})

namespace config {

namespace {

registry::RegistryError invalidConfig(const std::string& key, const std::string& reason) {
    return REGISTRY_ERROR_WITH_DETAILS(registry::ErrorCode::INVALID_CONFIGURATION,
                                       "Invalid registry configuration", key + ": " + reason)
        .withContext("parameter", key);
}

} // anonymous namespace

registry::Status RegistryConfig::validate() const {
    if (max_schema_bytes == 0) {
        return invalidConfig("max_schema_bytes", "must be greater than zero");
    }
    if (max_schema_bytes > MAX_SCHEMA_BYTES_LIMIT) {
        return invalidConfig("max_schema_bytes", "must not exceed " + std::to_string(MAX_SCHEMA_BYTES_LIMIT) +
                                                 " bytes, half the log record limit");
    }
    return registry::Status();
}

json RegistryConfig::toJson() const {
    return json{
        {"data_directory", data_directory},
        {"default_compatibility", default_compatibility},
        {"flush_on_write", flush_on_write},
        {"max_schema_bytes", max_schema_bytes},
        {"log_level", log_level}
    };
}

registry::Result<RegistryConfig> RegistryConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        return invalidConfig("<root>", "configuration must be a JSON object");
    }

    RegistryConfig cfg;
    try {
        if (j.contains("data_directory")) {
            j.at("data_directory").get_to(cfg.data_directory);
        }
        if (j.contains("default_compatibility")) {
            auto mode = parseCompatibilityMode(j.at("default_compatibility").get<std::string>());
            if (!mode.isOk()) {
                return invalidConfig("default_compatibility", mode.error().details);
            }
            cfg.default_compatibility = mode.value();
        }
        if (j.contains("flush_on_write")) {
            j.at("flush_on_write").get_to(cfg.flush_on_write);
        }
        if (j.contains("max_schema_bytes")) {
            const json& limit = j.at("max_schema_bytes");
            if (!limit.is_number_integer() || limit.get<int64_t>() < 0) {
                return invalidConfig("max_schema_bytes", "must be a non-negative integer");
            }
            j.at("max_schema_bytes").get_to(cfg.max_schema_bytes);
        }
        if (j.contains("log_level")) {
            std::string text = j.at("log_level").get<std::string>();
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            auto level = magic_enum::enum_cast<LogLevel>(text);
            if (!level) {
                return invalidConfig("log_level", "unknown level '" + text + "'");
            }
            cfg.log_level = *level;
        }
    } catch (const json::exception& e) {
        return invalidConfig("<root>", e.what());
    }

    RETURN_IF_ERROR(cfg.validate());
    return cfg;
}

registry::Result<RegistryConfig> RegistryConfig::fromJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return registry::RegistryError::ioError(registry::ErrorCode::IO_READ_ERROR, "open config file", path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        return invalidConfig("<file>", std::string("malformed JSON: ") + e.what()).withFilePath(path);
    }
    return fromJson(j);
}

} // namespace config
} // namespace schemata
