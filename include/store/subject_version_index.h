// include/store/subject_version_index.h
#pragma once

#include "../types.h"
#include "../persist/log_records.h"
#include "../registry_error/result.h"

#include <map>
#include <set>
#include <vector>
#include <string>
#include <optional>
#include <shared_mutex>
#include <functional>

namespace schemata {
namespace store {

struct VersionEntry {
    VersionNumber version = INVALID_VERSION;
    SchemaId schema_id = INVALID_SCHEMA_ID;
    bool deleted = false;
};

struct AppendOutcome {
    VersionNumber version = INVALID_VERSION;
    bool already_existed = false;
};

struct ScopeVersion {
    std::string scope;
    VersionNumber version = INVALID_VERSION;
};

/**
 * @class SubjectVersionIndex
 * @brief Per-scope ordered version histories.
 *
 * Version numbers continue from the highest number ever assigned in a scope,
 * so numbers are never reused, even after the whole subject was deleted.
 * Deletion only sets a flag. Callers serialize writers per scope; the index
 * itself only guarantees map consistency.
 */
class SubjectVersionIndex {
public:
    // Invoked under the write lock before the change becomes visible.
    using PersistFn = std::function<registry::Status(const std::vector<persist::VersionLogRecord>&)>;

    explicit SubjectVersionIndex(PersistFn persist = nullptr);

    registry::Result<AppendOutcome> appendVersion(const ScopeKey& scope, SchemaId schema_id);

    // Ascending. SUBJECT_NOT_FOUND when the result would be empty.
    registry::Result<std::vector<VersionNumber>> listVersions(const ScopeKey& scope,
                                                              bool include_deleted = false) const;
    registry::Result<VersionEntry> getVersion(const ScopeKey& scope, const VersionRef& ref) const;
    registry::Result<VersionNumber> softDeleteVersion(const ScopeKey& scope, VersionNumber version);
    // Returns the versions it deleted, ascending; empty if nothing was live.
    registry::Result<std::vector<VersionNumber>> deleteSubject(const ScopeKey& scope);

    std::set<std::string> listSubjects(bool include_deleted = false) const;

    bool hasLiveVersions(const ScopeKey& scope) const;
    // Live entries, oldest first.
    std::vector<VersionEntry> liveHistory(const ScopeKey& scope) const;
    std::optional<VersionEntry> findLiveBySchemaId(const ScopeKey& scope, SchemaId schema_id) const;
    // Every live (scope, version) that references schema_id.
    std::vector<ScopeVersion> findBySchemaId(SchemaId schema_id) const;

    // Recovery
    registry::Status restoreAppend(const std::string& scope, VersionNumber version, SchemaId schema_id);
    registry::Status restoreDelete(const std::string& scope, VersionNumber version);

private:
    struct SubjectEntry {
        std::map<VersionNumber, VersionEntry> versions;
        VersionNumber max_assigned = INVALID_VERSION;

        bool hasLive() const;
    };

    const SubjectEntry* findEntry(const std::string& scope) const;
    registry::Status persistRecords(const std::vector<persist::VersionLogRecord>& records);

    PersistFn persist_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, SubjectEntry> subjects_;
};

} // namespace store
} // namespace schemata
