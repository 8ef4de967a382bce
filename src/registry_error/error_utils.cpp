// src/registry_error/error_utils.cpp

#include "registry_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace registry {
namespace error_utils {

// ErrorCode values sit far outside magic_enum's reflection range, so they get
// an explicit table. The small enums below are reflected.
std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";

        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_MODE: return "INVALID_MODE";
        case ErrorCode::SCHEMA_TOO_LARGE: return "SCHEMA_TOO_LARGE";

        case ErrorCode::SCHEMA_PARSE_ERROR: return "SCHEMA_PARSE_ERROR";
        case ErrorCode::INCOMPATIBLE_SCHEMA: return "INCOMPATIBLE_SCHEMA";

        case ErrorCode::SUBJECT_NOT_FOUND: return "SUBJECT_NOT_FOUND";
        case ErrorCode::VERSION_NOT_FOUND: return "VERSION_NOT_FOUND";
        case ErrorCode::SCHEMA_ID_NOT_FOUND: return "SCHEMA_ID_NOT_FOUND";
        case ErrorCode::SCHEMA_NOT_FOUND: return "SCHEMA_NOT_FOUND";
        case ErrorCode::ALREADY_EXISTS: return "ALREADY_EXISTS";

        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";

        case ErrorCode::IO_READ_ERROR: return "IO_READ_ERROR";
        case ErrorCode::IO_WRITE_ERROR: return "IO_WRITE_ERROR";
        case ErrorCode::DIRECTORY_NOT_FOUND: return "DIRECTORY_NOT_FOUND";
        case ErrorCode::LOG_CORRUPTION: return "LOG_CORRUPTION";

        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "UNKNOWN_ERROR_CODE";
}

std::string_view severityToString(ErrorSeverity severity) {
    auto name = magic_enum::enum_name(severity);
    return name.empty() ? std::string_view("UNKNOWN_SEVERITY") : name;
}

std::string_view categoryToString(ErrorCategory category) {
    auto name = magic_enum::enum_name(category);
    return name.empty() ? std::string_view("UNKNOWN_CATEGORY") : name;
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
        case ErrorCode::ALREADY_EXISTS:
            return ErrorSeverity::INFO;

        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::INVALID_MODE:
        case ErrorCode::SCHEMA_TOO_LARGE:
        case ErrorCode::SCHEMA_PARSE_ERROR:
        case ErrorCode::INCOMPATIBLE_SCHEMA:
        case ErrorCode::SUBJECT_NOT_FOUND:
        case ErrorCode::VERSION_NOT_FOUND:
        case ErrorCode::SCHEMA_ID_NOT_FOUND:
        case ErrorCode::SCHEMA_NOT_FOUND:
            return ErrorSeverity::WARNING;

        case ErrorCode::INVALID_CONFIGURATION:
        case ErrorCode::IO_READ_ERROR:
        case ErrorCode::IO_WRITE_ERROR:
        case ErrorCode::DIRECTORY_NOT_FOUND:
            return ErrorSeverity::ERROR;

        case ErrorCode::LOG_CORRUPTION:
        case ErrorCode::INTERNAL_ERROR:
            return ErrorSeverity::CRITICAL;

        default:
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    int code_value = static_cast<int>(code);

    if (code_value >= 1000 && code_value < 2000) {
        return ErrorCategory::REQUEST_VALIDATION;
    } else if (code_value >= 2000 && code_value < 3000) {
        return ErrorCategory::SCHEMA;
    } else if (code_value >= 3000 && code_value < 4000) {
        return ErrorCategory::LOOKUP;
    } else if (code_value >= 4000 && code_value < 5000) {
        return ErrorCategory::CONFIGURATION;
    } else if (code_value >= 5000 && code_value < 6000) {
        return ErrorCategory::PERSISTENCE;
    }
    return ErrorCategory::GENERIC;
}

bool isNotFoundError(ErrorCode code) {
    return code == ErrorCode::SUBJECT_NOT_FOUND || code == ErrorCode::VERSION_NOT_FOUND ||
           code == ErrorCode::SCHEMA_ID_NOT_FOUND || code == ErrorCode::SCHEMA_NOT_FOUND;
}

bool isCallerError(ErrorCode code) {
    ErrorCategory category = getErrorCategory(code);
    return category == ErrorCategory::REQUEST_VALIDATION || category == ErrorCategory::SCHEMA;
}

bool isPersistenceError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::PERSISTENCE; }

bool isRecoverable(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}

} // namespace error_utils
} // namespace registry
