// include/registry_error/registry_error.h
#pragma once

#include "error_codes.h"
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include <map>

namespace registry {

/**
 * @brief Error value carried by every failed registry operation.
 *
 * The context map names the parameter or rule that caused the failure
 * ("subject", "version", "schema_id", "rule", ...).
 */
class RegistryError {
public:
    ErrorCode code;
    ErrorSeverity severity;
    ErrorCategory category;
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path;
    std::optional<size_t> line_number;
    std::optional<std::string> function_name;
    std::chrono::system_clock::time_point timestamp;
    std::map<std::string, std::string> context;

    RegistryError(ErrorCode code, const std::string& message = "");
    RegistryError(ErrorCode code, const std::string& message, const std::string& details);

    RegistryError& withDetails(const std::string& details);
    RegistryError& withSuggestedAction(const std::string& action);
    RegistryError& withLocation(const std::string& file, size_t line, const std::string& function);
    RegistryError& withContext(const std::string& key, const std::string& value);
    RegistryError& withFilePath(const std::string& path);

    bool isRecoverable() const;
    bool isNotFound() const;
    std::string toString() const;
    std::string toDetailedString() const;
    std::string toJson() const;

    // Factories for the registry taxonomy
    static RegistryError invalidArgument(const std::string& parameter, const std::string& reason);
    static RegistryError invalidMode(const std::string& mode_text);
    static RegistryError schemaParse(const std::string& diagnostic);
    static RegistryError incompatible(const std::string& rule, const std::string& details);
    static RegistryError subjectNotFound(const std::string& scope_key);
    static RegistryError versionNotFound(const std::string& scope_key, const std::string& version);
    static RegistryError schemaIdNotFound(int64_t schema_id);
    static RegistryError schemaNotFound(const std::string& scope_key);
    static RegistryError corruption(const std::string& log_path, const std::string& details);
    static RegistryError ioError(ErrorCode code, const std::string& operation, const std::string& path);
    static RegistryError internal(const std::string& details);
};

} // namespace registry
