// include/registry_error/error_codes.h
#pragma once

namespace registry {

/**
 * @brief Error codes for registry operations.
 *
 * Ranges group the codes by the layer that raises them. The numeric values
 * are stable and may be exposed by a transport layer.
 */
enum class ErrorCode : int {
    OK = 0,

    // Request validation (1000-1999)
    INVALID_ARGUMENT = 1001,
    INVALID_MODE = 1002,
    SCHEMA_TOO_LARGE = 1003,

    // Schema content (2000-2999)
    SCHEMA_PARSE_ERROR = 2001,
    INCOMPATIBLE_SCHEMA = 2002,

    // Lookup (3000-3999)
    SUBJECT_NOT_FOUND = 3001,
    VERSION_NOT_FOUND = 3002,
    SCHEMA_ID_NOT_FOUND = 3003,
    SCHEMA_NOT_FOUND = 3004,
    ALREADY_EXISTS = 3005,     // Resolved to the existing identity; never surfaced by the façade

    // Configuration (4000-4999)
    INVALID_CONFIGURATION = 4001,

    // Persistence (5000-5999)
    IO_READ_ERROR = 5001,
    IO_WRITE_ERROR = 5002,
    DIRECTORY_NOT_FOUND = 5003,
    LOG_CORRUPTION = 5004,

    // Generic (10000+)
    INTERNAL_ERROR = 10001
};

/**
 * @brief Error severity levels
 */
enum class ErrorSeverity {
    INFO,       // Informational, the operation resolved to an existing result
    WARNING,    // Caller error, nothing changed
    ERROR,      // Operation failed, registry state is intact
    CRITICAL,   // Store or log damage, the registry may be inconsistent
    FATAL       // Cannot continue
};

enum class ErrorCategory {
    REQUEST_VALIDATION,
    SCHEMA,
    LOOKUP,
    CONFIGURATION,
    PERSISTENCE,
    GENERIC
};

} // namespace registry
