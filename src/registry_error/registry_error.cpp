// src/registry_error/registry_error.cpp
#include "registry_error/registry_error.h"
#include "registry_error/error_utils.h"

#include <nlohmann/json.hpp>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace registry {

RegistryError::RegistryError(ErrorCode code, const std::string& message)
    : code(code)
    , severity(error_utils::getErrorSeverity(code))
    , category(error_utils::getErrorCategory(code))
    , message(message.empty() ? std::string(error_utils::errorCodeToString(code)) : message)
    , timestamp(std::chrono::system_clock::now()) {
}

RegistryError::RegistryError(ErrorCode code, const std::string& message, const std::string& details)
    : RegistryError(code, message) {
    this->details = details;
}

RegistryError& RegistryError::withDetails(const std::string& details_param) {
    this->details = details_param;
    return *this;
}

RegistryError& RegistryError::withSuggestedAction(const std::string& action) {
    this->suggested_action = action;
    return *this;
}

RegistryError& RegistryError::withLocation(const std::string& file, size_t line, const std::string& function) {
    this->file_path = file;
    this->line_number = line;
    this->function_name = function;
    return *this;
}

RegistryError& RegistryError::withContext(const std::string& key, const std::string& value) {
    this->context[key] = value;
    return *this;
}

RegistryError& RegistryError::withFilePath(const std::string& path) {
    this->file_path = path;
    return *this;
}

bool RegistryError::isRecoverable() const {
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}

bool RegistryError::isNotFound() const {
    return error_utils::isNotFoundError(code);
}

std::string RegistryError::toString() const {
    std::ostringstream oss;
    oss << "[" << error_utils::severityToString(severity) << "] "
        << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << "): "
        << message;
    if (!details.empty()) {
        oss << " - " << details;
    }
    return oss.str();
}

std::string RegistryError::toDetailedString() const {
    std::ostringstream oss;

    oss << "Error Details:\n";
    oss << "  Code: " << error_utils::errorCodeToString(code)
        << " (" << static_cast<int>(code) << ")\n";
    oss << "  Severity: " << error_utils::severityToString(severity) << "\n";
    oss << "  Category: " << error_utils::categoryToString(category) << "\n";
    oss << "  Message: " << message << "\n";

    if (!details.empty()) {
        oss << "  Details: " << details << "\n";
    }
    if (!suggested_action.empty()) {
        oss << "  Suggested Action: " << suggested_action << "\n";
    }
    if (file_path && line_number && function_name) {
        oss << "  Location: " << *function_name << " at " << *file_path << ":" << *line_number << "\n";
    } else if (file_path) {
        oss << "  File Path: " << *file_path << "\n";
    }
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [key, value] : context) {
            oss << "    " << key << ": " << value << "\n";
        }
    }

    auto time_t_val = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);
    oss << "  Timestamp: " << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ") << "\n";

    return oss.str();
}

std::string RegistryError::toJson() const {
    nlohmann::json j = {
        {"error_code", static_cast<int>(code)},
        {"code_name", std::string(error_utils::errorCodeToString(code))},
        {"severity", std::string(error_utils::severityToString(severity))},
        {"category", std::string(error_utils::categoryToString(category))},
        {"message", message}
    };
    if (!details.empty()) j["details"] = details;
    if (!suggested_action.empty()) j["suggested_action"] = suggested_action;
    if (!context.empty()) j["context"] = context;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch());
    j["timestamp_ms"] = ms.count();
    return j.dump();
}

// --- Factories ---

RegistryError RegistryError::invalidArgument(const std::string& parameter, const std::string& reason) {
    return RegistryError(ErrorCode::INVALID_ARGUMENT, "Invalid " + parameter)
        .withDetails(reason)
        .withContext("parameter", parameter);
}

RegistryError RegistryError::invalidMode(const std::string& mode_text) {
    return RegistryError(ErrorCode::INVALID_MODE, "Invalid compatibility mode")
        .withDetails("'" + mode_text + "' is not one of NONE, BACKWARD, BACKWARD_TRANSITIVE, FORWARD, "
                     "FORWARD_TRANSITIVE, FULL, FULL_TRANSITIVE")
        .withContext("parameter", "compatibility")
        .withContext("mode", mode_text);
}

RegistryError RegistryError::schemaParse(const std::string& diagnostic) {
    return RegistryError(ErrorCode::SCHEMA_PARSE_ERROR, "Schema failed to parse")
        .withDetails(diagnostic)
        .withContext("parameter", "schema");
}

RegistryError RegistryError::incompatible(const std::string& rule, const std::string& details_param) {
    return RegistryError(ErrorCode::INCOMPATIBLE_SCHEMA, "Schema is incompatible with the subject's history")
        .withDetails(details_param)
        .withContext("rule", rule);
}

RegistryError RegistryError::subjectNotFound(const std::string& scope_key) {
    return RegistryError(ErrorCode::SUBJECT_NOT_FOUND, "Subject not found")
        .withDetails("Subject: " + scope_key)
        .withContext("subject", scope_key);
}

RegistryError RegistryError::versionNotFound(const std::string& scope_key, const std::string& version) {
    return RegistryError(ErrorCode::VERSION_NOT_FOUND, "Version not found")
        .withDetails("Subject: " + scope_key + ", version: " + version)
        .withContext("subject", scope_key)
        .withContext("version", version);
}

RegistryError RegistryError::schemaIdNotFound(int64_t schema_id) {
    return RegistryError(ErrorCode::SCHEMA_ID_NOT_FOUND, "Schema id not found")
        .withDetails("Schema id: " + std::to_string(schema_id))
        .withContext("schema_id", std::to_string(schema_id));
}

RegistryError RegistryError::schemaNotFound(const std::string& scope_key) {
    return RegistryError(ErrorCode::SCHEMA_NOT_FOUND, "Schema not registered under subject")
        .withDetails("Subject: " + scope_key)
        .withContext("subject", scope_key);
}

RegistryError RegistryError::corruption(const std::string& log_path, const std::string& details_param) {
    return RegistryError(ErrorCode::LOG_CORRUPTION, "Registry log corruption detected")
        .withDetails(details_param)
        .withFilePath(log_path)
        .withSuggestedAction("Restore the data directory from a backup");
}

RegistryError RegistryError::ioError(ErrorCode io_code, const std::string& operation, const std::string& path) {
    return RegistryError(io_code, "I/O operation failed")
        .withDetails("Operation: " + operation)
        .withFilePath(path)
        .withSuggestedAction("Check file permissions and disk space");
}

RegistryError RegistryError::internal(const std::string& details_param) {
    return RegistryError(ErrorCode::INTERNAL_ERROR, "Internal registry error")
        .withDetails(details_param);
}

} // namespace registry
