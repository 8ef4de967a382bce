// src/persist/log_records.cpp

#include "../../include/persist/log_records.h"
#include "../../include/serialization_utils.h"

#include <magic_enum/magic_enum.hpp>

#include <sstream>

namespace schemata {
namespace persist {

namespace {

void writeType(std::ostream& out, LogRecordType type) {
    SerializeInt<uint8_t>(out, static_cast<uint8_t>(type));
}

LogRecordType readType(std::istream& in) {
    auto raw = DeserializeInt<uint8_t>(in);
    auto type = magic_enum::enum_cast<LogRecordType>(raw);
    if (!type) {
        throw std::runtime_error("unknown record type " + std::to_string(raw));
    }
    return *type;
}

void expectFullyConsumed(std::istream& in) {
    if (in.peek() != std::char_traits<char>::eof()) {
        throw std::runtime_error("trailing bytes after record");
    }
}

} // anonymous namespace

std::string SchemaLogRecord::encode() const {
    std::ostringstream out(std::ios::binary);
    writeType(out, LogRecordType::SCHEMA_PUT);
    SerializeInt<int64_t>(out, id);
    SerializeString(out, fingerprint);
    SerializeString(out, canonical_text);
    SerializeString(out, raw_text);
    return out.str();
}

registry::Result<SchemaLogRecord> SchemaLogRecord::decode(const std::string& payload) {
    std::istringstream in(payload, std::ios::binary);
    SchemaLogRecord record;
    try {
        if (readType(in) != LogRecordType::SCHEMA_PUT) {
            throw std::runtime_error("not a schema record");
        }
        record.id = DeserializeInt<int64_t>(in);
        record.fingerprint = DeserializeString(in);
        record.canonical_text = DeserializeString(in);
        record.raw_text = DeserializeString(in);
        expectFullyConsumed(in);
    } catch (const std::exception& e) {
        return registry::RegistryError::corruption("schemas.log", std::string("bad schema record: ") + e.what());
    }
    if (record.id <= INVALID_SCHEMA_ID) {
        return registry::RegistryError::corruption("schemas.log", "schema record with non-positive id " +
                                                   std::to_string(record.id));
    }
    return record;
}

std::string VersionLogRecord::encode() const {
    std::ostringstream out(std::ios::binary);
    writeType(out, type);
    SerializeString(out, scope);
    SerializeInt<int32_t>(out, version);
    if (type == LogRecordType::VERSION_APPEND) {
        SerializeInt<int64_t>(out, schema_id);
    }
    return out.str();
}

registry::Result<VersionLogRecord> VersionLogRecord::decode(const std::string& payload) {
    std::istringstream in(payload, std::ios::binary);
    VersionLogRecord record;
    try {
        record.type = readType(in);
        if (record.type != LogRecordType::VERSION_APPEND && record.type != LogRecordType::VERSION_DELETE) {
            throw std::runtime_error("not a version record");
        }
        record.scope = DeserializeString(in);
        record.version = DeserializeInt<int32_t>(in);
        if (record.type == LogRecordType::VERSION_APPEND) {
            record.schema_id = DeserializeInt<int64_t>(in);
        }
        expectFullyConsumed(in);
    } catch (const std::exception& e) {
        return registry::RegistryError::corruption("versions.log", std::string("bad version record: ") + e.what());
    }
    if (record.version <= INVALID_VERSION) {
        return registry::RegistryError::corruption("versions.log", "version record with non-positive version");
    }
    return record;
}

std::string ConfigLogRecord::encode() const {
    std::ostringstream out(std::ios::binary);
    writeType(out, type);
    SerializeString(out, scope);
    if (type == LogRecordType::CONFIG_SET) {
        SerializeInt<uint8_t>(out, static_cast<uint8_t>(mode));
    }
    return out.str();
}

registry::Result<ConfigLogRecord> ConfigLogRecord::decode(const std::string& payload) {
    std::istringstream in(payload, std::ios::binary);
    ConfigLogRecord record;
    try {
        record.type = readType(in);
        if (record.type != LogRecordType::CONFIG_SET && record.type != LogRecordType::CONFIG_CLEAR) {
            throw std::runtime_error("not a config record");
        }
        record.scope = DeserializeString(in);
        if (record.type == LogRecordType::CONFIG_SET) {
            auto mode = magic_enum::enum_cast<CompatibilityMode>(DeserializeInt<uint8_t>(in));
            if (!mode) {
                throw std::runtime_error("unknown compatibility mode");
            }
            record.mode = *mode;
        }
        expectFullyConsumed(in);
    } catch (const std::exception& e) {
        return registry::RegistryError::corruption("config.log", std::string("bad config record: ") + e.what());
    }
    if (record.type == LogRecordType::CONFIG_CLEAR && record.isGlobal()) {
        return registry::RegistryError::corruption("config.log", "the global default cannot be cleared");
    }
    return record;
}

} // namespace persist
} // namespace schemata
