// include/registry/schema_registry.h
#pragma once

#include "../types.h"
#include "../canonical/schema_canonicalizer.h"
#include "../compat/compatibility_checker.h"
#include "../config/config_store.h"
#include "../config/registry_config.h"
#include "../store/schema_store.h"
#include "../store/subject_version_index.h"
#include "../persist/append_log.h"
#include "../registry_error/result.h"
#include "../registry_error/error_context.h"
#include "scope_lock_table.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace schemata {

struct RegisterResult {
    SchemaId id = INVALID_SCHEMA_ID;
    VersionNumber version = INVALID_VERSION;
    bool created = false;   // false when the scope already had a live version with this schema
};

struct RegisteredSchema {
    std::string subject;
    SchemaType type = SchemaType::VALUE;
    VersionNumber version = INVALID_VERSION;
    std::shared_ptr<const store::Schema> schema;
};

struct SubjectConfig {
    CompatibilityMode mode = CompatibilityMode::BACKWARD;
    bool is_override = false;   // false: inherited from the global default
};

struct CompatibilityReport {
    bool is_compatible = true;
    std::vector<compat::Incompatibility> violations;

    std::vector<std::string> messages() const;
};

struct SubjectVersion {
    std::string subject;
    SchemaType type = SchemaType::VALUE;
    VersionNumber version = INVALID_VERSION;
};

void to_json(nlohmann::json& j, const RegisterResult& result);
void to_json(nlohmann::json& j, const RegisteredSchema& registered);
void to_json(nlohmann::json& j, const CompatibilityReport& report);

/**
 * @class SchemaRegistry
 * @brief Entry point for all registry operations.
 *
 * Owns the schema store, the subject-version index, the config store and,
 * when a data directory is configured, their logs. Reads run concurrently;
 * writes to one scope serialize on that scope's mutex. Every failed operation
 * is reported to the error context before it is returned.
 */
class SchemaRegistry {
public:
    /**
     * @brief Opens a registry, replaying any logs found in config.data_directory.
     * @param canonicalizer Defaults to AvroCanonicalizer when null.
     */
    static registry::Result<std::unique_ptr<SchemaRegistry>> open(
        const config::RegistryConfig& config,
        std::unique_ptr<canonical::SchemaCanonicalizer> canonicalizer = nullptr);

    ~SchemaRegistry();

    SchemaRegistry(const SchemaRegistry&) = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    // --- Schemas and versions ---
    registry::Result<RegisterResult> registerSchema(const std::string& subject, const std::string& type,
                                                    const std::string& schema_text);
    registry::Result<std::shared_ptr<const store::Schema>> getSchemaById(SchemaId id) const;
    registry::Result<RegisteredSchema> getSchema(const std::string& subject, const std::string& type,
                                                 const VersionRef& version = VersionRef::latest()) const;
    registry::Result<std::vector<VersionNumber>> listVersions(const std::string& subject, const std::string& type,
                                                              bool include_deleted = false) const;
    std::set<std::string> listSubjects(bool include_deleted = false) const;
    registry::Result<VersionNumber> deleteVersion(const std::string& subject, const std::string& type,
                                                  const VersionRef& version);
    registry::Result<std::vector<VersionNumber>> deleteSubject(const std::string& subject, const std::string& type);
    registry::Result<RegisteredSchema> checkSchema(const std::string& subject, const std::string& type,
                                                   const std::string& schema_text) const;
    registry::Result<std::vector<SubjectVersion>> getVersionsForSchemaId(SchemaId id) const;

    // --- Compatibility ---
    registry::Result<CompatibilityReport> testCompatibility(const std::string& subject, const std::string& type,
                                                            const std::string& schema_text,
                                                            const VersionRef& version = VersionRef::latest()) const;

    // --- Configuration ---
    CompatibilityMode getGlobalConfig() const;
    registry::Status setGlobalConfig(const std::string& mode_text);
    registry::Status setSubjectConfig(const std::string& subject, const std::string& type, const std::string& mode_text);
    registry::Result<SubjectConfig> getSubjectConfig(const std::string& subject, const std::string& type) const;
    registry::Result<bool> clearSubjectConfig(const std::string& subject, const std::string& type);

    // --- Diagnostics ---
    const registry::ErrorContext& errorContext() const { return error_context_; }
    void setErrorHandler(std::shared_ptr<registry::ErrorHandler> handler);
    const config::RegistryConfig& config() const { return config_; }
    // Scopes that have held a write lock.
    size_t lockedScopeCount() const { return scope_locks_.size(); }

private:
    SchemaRegistry(const config::RegistryConfig& config,
                   std::unique_ptr<canonical::SchemaCanonicalizer> canonicalizer);

    registry::Status openPersistence();
    registry::Status replaySchemas();
    registry::Status replayVersions();
    registry::Status replayConfig();

    registry::Result<canonical::CanonicalSchema> canonicalizeChecked(const std::string& schema_text) const;
    registry::Result<std::vector<std::shared_ptr<const avro::AvroSchema>>> loadStructures(
        const std::vector<store::VersionEntry>& entries) const;
    registry::Result<RegisteredSchema> makeRegistered(const ScopeKey& scope, const store::VersionEntry& entry) const;

    template<typename T>
    T track(T result) const {
        if (!result.isOk()) {
            error_context_.reportError(result.error());
        }
        return result;
    }

    config::RegistryConfig config_;
    std::unique_ptr<canonical::SchemaCanonicalizer> canonicalizer_;
    compat::CompatibilityChecker checker_;

    std::unique_ptr<persist::AppendLog> schemas_log_;
    std::unique_ptr<persist::AppendLog> versions_log_;
    std::unique_ptr<persist::AppendLog> config_log_;

    std::unique_ptr<store::SchemaStore> schemas_;
    std::unique_ptr<store::SubjectVersionIndex> versions_;
    std::unique_ptr<config::ConfigStore> config_store_;

    mutable ScopeLockTable scope_locks_;
    mutable registry::ErrorContext error_context_;
};

} // namespace schemata
