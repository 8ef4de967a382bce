// src/registry/schema_registry.cpp

#include "../../include/registry/schema_registry.h"
#include "../../include/canonical/avro_canonicalizer.h"
#include "../../include/persist/log_records.h"
#include "../../include/registry_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace schemata {

namespace {

registry::RegistryError encodeFailure(const std::string& path, const std::exception& e) {
    return registry::RegistryError::ioError(registry::ErrorCode::IO_WRITE_ERROR, "encode record", path)
        .withDetails(e.what());
}

registry::Status checkVersionRef(const VersionRef& version) {
    if (!version.isValid()) {
        return registry::RegistryError::invalidArgument("version", "must be 'latest' or a positive number, got " +
                                                                   version.toString());
    }
    return registry::Status();
}

} // anonymous namespace

// --- JSON views ---

std::vector<std::string> CompatibilityReport::messages() const {
    std::vector<std::string> out;
    out.reserve(violations.size());
    for (const auto& violation : violations) {
        out.push_back(violation.toString());
    }
    return out;
}

void to_json(json& j, const RegisterResult& result) {
    j = json{{"id", result.id}, {"version", result.version}, {"created", result.created}};
}

void to_json(json& j, const RegisteredSchema& registered) {
    j = json{
        {"subject", registered.subject},
        {"type", toString(registered.type)},
        {"version", registered.version},
        {"id", registered.schema ? registered.schema->id : INVALID_SCHEMA_ID},
        {"schema", registered.schema ? registered.schema->canonical_body : std::string()}
    };
}

void to_json(json& j, const CompatibilityReport& report) {
    j = json{{"is_compatible", report.is_compatible}, {"messages", report.messages()}};
}

// --- Lifecycle ---

SchemaRegistry::SchemaRegistry(const config::RegistryConfig& config,
                               std::unique_ptr<canonical::SchemaCanonicalizer> canonicalizer)
    : config_(config), canonicalizer_(std::move(canonicalizer)) {
    if (!canonicalizer_) {
        canonicalizer_ = std::make_unique<canonical::AvroCanonicalizer>();
    }
}

SchemaRegistry::~SchemaRegistry() {
    if (schemas_log_) schemas_log_->close();
    if (versions_log_) versions_log_->close();
    if (config_log_) config_log_->close();
}

registry::Result<std::unique_ptr<SchemaRegistry>> SchemaRegistry::open(
        const config::RegistryConfig& config,
        std::unique_ptr<canonical::SchemaCanonicalizer> canonicalizer) {
    RETURN_IF_ERROR(config.validate());
    setLogLevel(config.log_level);

    std::unique_ptr<SchemaRegistry> reg(new SchemaRegistry(config, std::move(canonicalizer)));

    if (config.data_directory.empty()) {
        reg->schemas_ = std::make_unique<store::SchemaStore>();
        reg->versions_ = std::make_unique<store::SubjectVersionIndex>();
        reg->config_store_ = std::make_unique<config::ConfigStore>(config.default_compatibility);
        LOG_INFO("[SchemaRegistry] Opened in-memory registry (", reg->canonicalizer_->format(), ")");
        return std::move(reg);
    }

    RETURN_IF_ERROR(reg->openPersistence());
    LOG_INFO("[SchemaRegistry] Opened registry at ", config.data_directory, " with ",
             reg->schemas_->size(), " schema(s) and ", reg->versions_->listSubjects().size(), " live subject(s)");
    return std::move(reg);
}

registry::Status SchemaRegistry::openPersistence() {
    std::error_code ec;
    fs::create_directories(config_.data_directory, ec);
    if (ec || !fs::is_directory(config_.data_directory)) {
        return registry::RegistryError::ioError(registry::ErrorCode::DIRECTORY_NOT_FOUND,
                                                "create data directory", config_.data_directory)
            .withDetails(ec ? ec.message() : std::string("not a directory"));
    }

    const fs::path dir(config_.data_directory);
    schemas_log_ = std::make_unique<persist::AppendLog>((dir / "schemas.log").string(), config_.flush_on_write);
    versions_log_ = std::make_unique<persist::AppendLog>((dir / "versions.log").string(), config_.flush_on_write);
    config_log_ = std::make_unique<persist::AppendLog>((dir / "config.log").string(), config_.flush_on_write);

    persist::AppendLog* schemas_log = schemas_log_.get();
    schemas_ = std::make_unique<store::SchemaStore>([schemas_log](const store::Schema& schema) -> registry::Status {
        persist::SchemaLogRecord record;
        record.id = schema.id;
        record.fingerprint = schema.fingerprint;
        record.canonical_text = schema.canonical_body;
        record.raw_text = schema.raw_body;
        try {
            return schemas_log->append(record.encode());
        } catch (const std::exception& e) {
            return encodeFailure(schemas_log->path(), e);
        }
    });

    persist::AppendLog* versions_log = versions_log_.get();
    versions_ = std::make_unique<store::SubjectVersionIndex>(
        [schemas_log, versions_log](const std::vector<persist::VersionLogRecord>& records) -> registry::Status {
            // A version record must never reach disk ahead of the schema it names.
            RETURN_IF_ERROR(schemas_log->flush());
            std::vector<std::string> payloads;
            payloads.reserve(records.size());
            try {
                for (const auto& record : records) {
                    payloads.push_back(record.encode());
                }
            } catch (const std::exception& e) {
                return encodeFailure(versions_log->path(), e);
            }
            return versions_log->appendBatch(payloads);
        });

    persist::AppendLog* config_log = config_log_.get();
    config_store_ = std::make_unique<config::ConfigStore>(
        config_.default_compatibility,
        [config_log](const persist::ConfigLogRecord& record) -> registry::Status {
            try {
                return config_log->append(record.encode());
            } catch (const std::exception& e) {
                return encodeFailure(config_log->path(), e);
            }
        });

    // Versions reference schema ids, so schemas replay first.
    RETURN_IF_ERROR(replaySchemas());
    RETURN_IF_ERROR(replayVersions());
    RETURN_IF_ERROR(replayConfig());
    return registry::Status();
}

registry::Status SchemaRegistry::replaySchemas() {
    auto stats = schemas_log_->openAndReplay([this](const std::string& payload) -> registry::Status {
        auto decoded = persist::SchemaLogRecord::decode(payload);
        if (!decoded.isOk()) {
            return std::move(decoded.error());
        }
        persist::SchemaLogRecord& record = decoded.value();

        // Re-derive the structure and check the stored fingerprint still matches.
        auto canonical = canonicalizer_->canonicalize(record.canonical_text);
        if (!canonical.isOk()) {
            return registry::RegistryError::corruption(schemas_log_->path(),
                "schema id " + std::to_string(record.id) + " no longer parses: " + canonical.error().details);
        }
        if (canonical->fingerprint != record.fingerprint) {
            return registry::RegistryError::corruption(schemas_log_->path(),
                "fingerprint mismatch for schema id " + std::to_string(record.id));
        }

        store::Schema schema;
        schema.id = record.id;
        schema.fingerprint = std::move(record.fingerprint);
        schema.canonical_body = std::move(record.canonical_text);
        schema.raw_body = std::move(record.raw_text);
        schema.structure = canonical->structure;
        return schemas_->restore(std::move(schema));
    });
    if (!stats.isOk()) {
        return std::move(stats.error());
    }
    LOG_TRACE("[SchemaRegistry] Replayed ", stats->records, " schema record(s)");
    return registry::Status();
}

registry::Status SchemaRegistry::replayVersions() {
    auto stats = versions_log_->openAndReplay([this](const std::string& payload) -> registry::Status {
        auto decoded = persist::VersionLogRecord::decode(payload);
        if (!decoded.isOk()) {
            return std::move(decoded.error());
        }
        const persist::VersionLogRecord& record = decoded.value();

        auto scope = ScopeKey::parse(record.scope);
        if (!scope.isOk()) {
            return registry::RegistryError::corruption(versions_log_->path(),
                "unparseable scope '" + format_subject_for_print(record.scope) + "'");
        }
        if (record.type == persist::LogRecordType::VERSION_DELETE) {
            return versions_->restoreDelete(record.scope, record.version);
        }
        if (!schemas_->getById(record.schema_id).isOk()) {
            return registry::RegistryError::corruption(versions_log_->path(),
                "version " + std::to_string(record.version) + " of " + record.scope +
                " references unknown schema id " + std::to_string(record.schema_id));
        }
        return versions_->restoreAppend(record.scope, record.version, record.schema_id);
    });
    if (!stats.isOk()) {
        return std::move(stats.error());
    }
    LOG_TRACE("[SchemaRegistry] Replayed ", stats->records, " version record(s)");
    return registry::Status();
}

registry::Status SchemaRegistry::replayConfig() {
    auto stats = config_log_->openAndReplay([this](const std::string& payload) -> registry::Status {
        auto decoded = persist::ConfigLogRecord::decode(payload);
        if (!decoded.isOk()) {
            return std::move(decoded.error());
        }
        if (!decoded->isGlobal() && !ScopeKey::parse(decoded->scope).isOk()) {
            return registry::RegistryError::corruption(config_log_->path(),
                "unparseable scope '" + format_subject_for_print(decoded->scope) + "'");
        }
        return config_store_->restore(decoded.value());
    });
    if (!stats.isOk()) {
        return std::move(stats.error());
    }
    return registry::Status();
}

void SchemaRegistry::setErrorHandler(std::shared_ptr<registry::ErrorHandler> handler) {
    error_context_.setErrorHandler(std::move(handler));
}

// --- Helpers ---

registry::Result<canonical::CanonicalSchema> SchemaRegistry::canonicalizeChecked(const std::string& schema_text) const {
    if (schema_text.size() > config_.max_schema_bytes) {
        return REGISTRY_ERROR_WITH_DETAILS(registry::ErrorCode::SCHEMA_TOO_LARGE, "Schema text too large",
                                           std::to_string(schema_text.size()) + " bytes exceeds the limit of " +
                                           std::to_string(config_.max_schema_bytes))
            .withContext("parameter", "schema");
    }
    auto canonical = canonicalizer_->canonicalize(schema_text);
    if (canonical.isOk() && canonical->canonical_text.size() > config_.max_schema_bytes) {
        // Full-name expansion can make the canonical form much larger than the input.
        return REGISTRY_ERROR_WITH_DETAILS(registry::ErrorCode::SCHEMA_TOO_LARGE, "Canonical schema too large",
                                           std::to_string(canonical->canonical_text.size()) +
                                           " canonical bytes exceeds the limit of " +
                                           std::to_string(config_.max_schema_bytes))
            .withContext("parameter", "schema");
    }
    return canonical;
}

registry::Result<std::vector<std::shared_ptr<const avro::AvroSchema>>> SchemaRegistry::loadStructures(
        const std::vector<store::VersionEntry>& entries) const {
    std::vector<std::shared_ptr<const avro::AvroSchema>> structures;
    structures.reserve(entries.size());
    for (const auto& entry : entries) {
        auto schema = schemas_->getById(entry.schema_id);
        if (!schema.isOk()) {
            return registry::RegistryError::internal("version " + std::to_string(entry.version) +
                                                     " references missing schema id " +
                                                     std::to_string(entry.schema_id));
        }
        structures.push_back(schema.value()->structure);
    }
    return structures;
}

registry::Result<RegisteredSchema> SchemaRegistry::makeRegistered(const ScopeKey& scope,
                                                                  const store::VersionEntry& entry) const {
    auto schema = schemas_->getById(entry.schema_id);
    if (!schema.isOk()) {
        return registry::RegistryError::internal("version " + std::to_string(entry.version) + " of " +
                                                 scope.str() + " references missing schema id " +
                                                 std::to_string(entry.schema_id));
    }
    RegisteredSchema registered;
    registered.subject = scope.subject();
    registered.type = scope.type();
    registered.version = entry.version;
    registered.schema = std::move(schema.value());
    return registered;
}

// --- Schemas and versions ---

registry::Result<RegisterResult> SchemaRegistry::registerSchema(const std::string& subject, const std::string& type,
                                                                const std::string& schema_text) {
    return track([&]() -> registry::Result<RegisterResult> {
        auto scope = ScopeKey::make(subject, type);
        if (!scope.isOk()) return std::move(scope.error());

        auto canonical = canonicalizeChecked(schema_text);
        if (!canonical.isOk()) {
            return std::move(canonical.error()).withContext("subject", scope->str());
        }

        ScopeGuard guard(scope_locks_, scope->str());

        // Same schema already live under this scope: nothing to do.
        if (auto existing_id = schemas_->findByFingerprint(canonical->fingerprint)) {
            if (auto entry = versions_->findLiveBySchemaId(*scope, *existing_id)) {
                return RegisterResult{*existing_id, entry->version, false};
            }
        }

        CompatibilityMode mode = config_store_->getEffectiveMode(*scope);
        if (mode != CompatibilityMode::NONE) {
            std::vector<store::VersionEntry> history = versions_->liveHistory(*scope);
            if (!history.empty()) {
                if (!isTransitive(mode)) {
                    history.erase(history.begin(), history.end() - 1);
                }
                auto references = loadStructures(history);
                if (!references.isOk()) return std::move(references.error());

                auto verdict = checker_.isCompatible(*canonical->structure, references.value(), mode);
                if (!verdict.compatible) {
                    std::string details;
                    for (const auto& violation : verdict.violations) {
                        if (!details.empty()) details += "; ";
                        details += violation.toString();
                    }
                    LOG_INFO("[SchemaRegistry] Rejected schema for ", format_subject_for_print(scope->str()),
                             " under ", toString(mode), ": ", verdict.violations.size(), " violation(s)");
                    return registry::RegistryError::incompatible(verdict.violations.front().rule(), details)
                        .withContext("subject", scope->str())
                        .withContext("mode", toString(mode));
                }
            }
        }

        store::PutOutcome put;
        ASSIGN_OR_RETURN(put, schemas_->put(canonical.value(), schema_text));

        store::AppendOutcome appended;
        ASSIGN_OR_RETURN(appended, versions_->appendVersion(*scope, put.id));

        LOG_INFO("[SchemaRegistry] Registered ", format_subject_for_print(scope->str()), " v", appended.version,
                 " -> schema id ", put.id, put.created ? " (new)" : " (existing)");
        return RegisterResult{put.id, appended.version, !appended.already_existed};
    }());
}

registry::Result<std::shared_ptr<const store::Schema>> SchemaRegistry::getSchemaById(SchemaId id) const {
    return track(schemas_->getById(id));
}

registry::Result<RegisteredSchema> SchemaRegistry::getSchema(const std::string& subject, const std::string& type,
                                                             const VersionRef& version) const {
    return track([&]() -> registry::Result<RegisteredSchema> {
        auto scope = ScopeKey::make(subject, type);
        if (!scope.isOk()) return std::move(scope.error());

        RETURN_IF_ERROR(checkVersionRef(version));

        auto entry = versions_->getVersion(*scope, version);
        if (!entry.isOk()) return std::move(entry.error());
        return makeRegistered(*scope, entry.value());
    }());
}

registry::Result<std::vector<VersionNumber>> SchemaRegistry::listVersions(const std::string& subject,
                                                                          const std::string& type,
                                                                          bool include_deleted) const {
    return track([&]() -> registry::Result<std::vector<VersionNumber>> {
        auto scope = ScopeKey::make(subject, type);
        if (!scope.isOk()) return std::move(scope.error());
        return versions_->listVersions(*scope, include_deleted);
    }());
}

std::set<std::string> SchemaRegistry::listSubjects(bool include_deleted) const {
    return versions_->listSubjects(include_deleted);
}

registry::Result<VersionNumber> SchemaRegistry::deleteVersion(const std::string& subject, const std::string& type,
                                                              const VersionRef& version) {
    return track([&]() -> registry::Result<VersionNumber> {
        auto scope = ScopeKey::make(subject, type);
        if (!scope.isOk()) return std::move(scope.error());

        RETURN_IF_ERROR(checkVersionRef(version));
        if (!versions_->hasLiveVersions(*scope)) {
            return registry::RegistryError::versionNotFound(scope->str(), version.toString());
        }

        ScopeGuard guard(scope_locks_, scope->str());
        VersionNumber target = version.number();
        if (version.isLatest()) {
            auto latest = versions_->getVersion(*scope, version);
            if (!latest.isOk()) return std::move(latest.error());
            target = latest->version;
        }
        auto deleted = versions_->softDeleteVersion(*scope, target);
        if (deleted.isOk()) {
            LOG_INFO("[SchemaRegistry] Deleted ", format_subject_for_print(scope->str()), " v", target);
        }
        return deleted;
    }());
}

registry::Result<std::vector<VersionNumber>> SchemaRegistry::deleteSubject(const std::string& subject,
                                                                           const std::string& type) {
    return track([&]() -> registry::Result<std::vector<VersionNumber>> {
        auto scope = ScopeKey::make(subject, type);
        if (!scope.isOk()) return std::move(scope.error());

        if (!versions_->hasLiveVersions(*scope)) {
            return std::vector<VersionNumber>();
        }

        ScopeGuard guard(scope_locks_, scope->str());
        auto deleted = versions_->deleteSubject(*scope);
        if (deleted.isOk() && !deleted->empty()) {
            LOG_INFO("[SchemaRegistry] Deleted subject ", format_subject_for_print(scope->str()), " (",
                     deleted->size(), " version(s))");
        }
        return deleted;
    }());
}

registry::Result<RegisteredSchema> SchemaRegistry::checkSchema(const std::string& subject, const std::string& type,
                                                               const std::string& schema_text) const {
    return track([&]() -> registry::Result<RegisteredSchema> {
        auto scope = ScopeKey::make(subject, type);
        if (!scope.isOk()) return std::move(scope.error());

        auto canonical = canonicalizeChecked(schema_text);
        if (!canonical.isOk()) {
            return std::move(canonical.error()).withContext("subject", scope->str());
        }

        auto id = schemas_->findByFingerprint(canonical->fingerprint);
        if (!id) {
            return registry::RegistryError::schemaNotFound(scope->str());
        }
        auto entry = versions_->findLiveBySchemaId(*scope, *id);
        if (!entry) {
            return registry::RegistryError::schemaNotFound(scope->str());
        }
        return makeRegistered(*scope, *entry);
    }());
}

registry::Result<std::vector<SubjectVersion>> SchemaRegistry::getVersionsForSchemaId(SchemaId id) const {
    return track([&]() -> registry::Result<std::vector<SubjectVersion>> {
        auto schema = schemas_->getById(id);
        if (!schema.isOk()) return std::move(schema.error());

        std::vector<SubjectVersion> result;
        for (const auto& sv : versions_->findBySchemaId(id)) {
            auto scope = ScopeKey::parse(sv.scope);
            if (!scope.isOk()) {
                return registry::RegistryError::internal("index holds unparseable scope '" +
                                                         format_subject_for_print(sv.scope) + "'");
            }
            result.push_back(SubjectVersion{scope->subject(), scope->type(), sv.version});
        }
        return result;
    }());
}

// --- Compatibility ---

registry::Result<CompatibilityReport> SchemaRegistry::testCompatibility(const std::string& subject,
                                                                        const std::string& type,
                                                                        const std::string& schema_text,
                                                                        const VersionRef& version) const {
    return track([&]() -> registry::Result<CompatibilityReport> {
        auto scope = ScopeKey::make(subject, type);
        if (!scope.isOk()) return std::move(scope.error());

        RETURN_IF_ERROR(checkVersionRef(version));

        auto canonical = canonicalizeChecked(schema_text);
        if (!canonical.isOk()) {
            return std::move(canonical.error()).withContext("subject", scope->str());
        }

        CompatibilityMode mode = config_store_->getEffectiveMode(*scope);
        std::vector<store::VersionEntry> references;
        if (version.isLatest()) {
            references = versions_->liveHistory(*scope);
            if (references.empty()) {
                return registry::RegistryError::versionNotFound(scope->str(), version.toString());
            }
        } else {
            // An explicit version is the only reference, whatever the mode.
            auto entry = versions_->getVersion(*scope, version);
            if (!entry.isOk()) return std::move(entry.error());
            references.push_back(entry.value());
        }

        auto structures = loadStructures(references);
        if (!structures.isOk()) return std::move(structures.error());

        auto verdict = checker_.isCompatible(*canonical->structure, structures.value(), mode);
        CompatibilityReport report;
        report.is_compatible = verdict.compatible;
        report.violations = std::move(verdict.violations);
        return report;
    }());
}

// --- Configuration ---

CompatibilityMode SchemaRegistry::getGlobalConfig() const {
    return config_store_->getGlobalDefault();
}

registry::Status SchemaRegistry::setGlobalConfig(const std::string& mode_text) {
    return track([&]() -> registry::Status {
        auto mode = config::ConfigStore::parseMode(mode_text);
        if (!mode.isOk()) return std::move(mode.error());
        return config_store_->setGlobalDefault(mode.value());
    }());
}

registry::Status SchemaRegistry::setSubjectConfig(const std::string& subject, const std::string& type,
                                                  const std::string& mode_text) {
    return track([&]() -> registry::Status {
        auto scope = ScopeKey::make(subject, type);
        if (!scope.isOk()) return std::move(scope.error());
        auto mode = config::ConfigStore::parseMode(mode_text);
        if (!mode.isOk()) return std::move(mode.error()).withContext("subject", scope->str());

        ScopeGuard guard(scope_locks_, scope->str());
        return config_store_->setOverride(*scope, mode.value());
    }());
}

registry::Result<SubjectConfig> SchemaRegistry::getSubjectConfig(const std::string& subject,
                                                                 const std::string& type) const {
    return track([&]() -> registry::Result<SubjectConfig> {
        auto scope = ScopeKey::make(subject, type);
        if (!scope.isOk()) return std::move(scope.error());

        SubjectConfig cfg;
        if (auto mode = config_store_->getOverride(*scope)) {
            cfg.mode = *mode;
            cfg.is_override = true;
        } else {
            cfg.mode = config_store_->getGlobalDefault();
        }
        return cfg;
    }());
}

registry::Result<bool> SchemaRegistry::clearSubjectConfig(const std::string& subject, const std::string& type) {
    return track([&]() -> registry::Result<bool> {
        auto scope = ScopeKey::make(subject, type);
        if (!scope.isOk()) return std::move(scope.error());

        if (!config_store_->getOverride(*scope)) {
            return false;
        }

        ScopeGuard guard(scope_locks_, scope->str());
        return config_store_->clearOverride(*scope);
    }());
}

} // namespace schemata
