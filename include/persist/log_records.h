// include/persist/log_records.h
#pragma once

#include "../types.h"
#include "../registry_error/result.h"

#include <string>
#include <cstdint>

namespace schemata {
namespace persist {

enum class LogRecordType : uint8_t {
    SCHEMA_PUT = 1,
    VERSION_APPEND = 2,
    VERSION_DELETE = 3,
    CONFIG_SET = 4,
    CONFIG_CLEAR = 5
};

// schemas.log
struct SchemaLogRecord {
    SchemaId id = INVALID_SCHEMA_ID;
    std::string fingerprint;
    std::string canonical_text;
    std::string raw_text;

    std::string encode() const;
    static registry::Result<SchemaLogRecord> decode(const std::string& payload);
};

// versions.log; schema_id is unused for VERSION_DELETE.
struct VersionLogRecord {
    LogRecordType type = LogRecordType::VERSION_APPEND;
    std::string scope;
    VersionNumber version = INVALID_VERSION;
    SchemaId schema_id = INVALID_SCHEMA_ID;

    std::string encode() const;
    static registry::Result<VersionLogRecord> decode(const std::string& payload);
};

// config.log; an empty scope addresses the global default.
struct ConfigLogRecord {
    LogRecordType type = LogRecordType::CONFIG_SET;
    std::string scope;
    CompatibilityMode mode = CompatibilityMode::BACKWARD;

    bool isGlobal() const { return scope.empty(); }

    std::string encode() const;
    static registry::Result<ConfigLogRecord> decode(const std::string& payload);
};

} // namespace persist
} // namespace schemata
