// src/store/subject_version_index.cpp

#include "../../include/store/subject_version_index.h"
#include "../../include/registry_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <limits>
#include <mutex>

namespace schemata {
namespace store {

bool SubjectVersionIndex::SubjectEntry::hasLive() const {
    for (const auto& kv : versions) {
        if (!kv.second.deleted) return true;
    }
    return false;
}

SubjectVersionIndex::SubjectVersionIndex(PersistFn persist) : persist_(std::move(persist)) {}

const SubjectVersionIndex::SubjectEntry* SubjectVersionIndex::findEntry(const std::string& scope) const {
    auto it = subjects_.find(scope);
    return it == subjects_.end() ? nullptr : &it->second;
}

registry::Status SubjectVersionIndex::persistRecords(const std::vector<persist::VersionLogRecord>& records) {
    if (!persist_ || records.empty()) {
        return registry::Status();
    }
    return persist_(records);
}

registry::Result<AppendOutcome> SubjectVersionIndex::appendVersion(const ScopeKey& scope, SchemaId schema_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    SubjectEntry& entry = subjects_[scope.str()];

    for (const auto& kv : entry.versions) {
        if (!kv.second.deleted && kv.second.schema_id == schema_id) {
            return AppendOutcome{kv.first, true};
        }
    }

    if (entry.max_assigned == std::numeric_limits<VersionNumber>::max()) {
        return registry::RegistryError::internal("version numbers exhausted for " + scope.str());
    }
    VersionNumber next = entry.max_assigned + 1;

    persist::VersionLogRecord record;
    record.type = persist::LogRecordType::VERSION_APPEND;
    record.scope = scope.str();
    record.version = next;
    record.schema_id = schema_id;
    RETURN_IF_ERROR(persistRecords({record}));

    entry.versions.emplace(next, VersionEntry{next, schema_id, false});
    entry.max_assigned = next;
    LOG_TRACE("[SubjectVersionIndex] ", format_subject_for_print(scope.str()), " v", next, " -> schema ", schema_id);
    return AppendOutcome{next, false};
}

registry::Result<std::vector<VersionNumber>> SubjectVersionIndex::listVersions(const ScopeKey& scope,
                                                                               bool include_deleted) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<VersionNumber> result;
    if (const SubjectEntry* entry = findEntry(scope.str())) {
        for (const auto& kv : entry->versions) {
            if (include_deleted || !kv.second.deleted) {
                result.push_back(kv.first);
            }
        }
    }
    if (result.empty()) {
        return registry::RegistryError::subjectNotFound(scope.str());
    }
    return result;
}

registry::Result<VersionEntry> SubjectVersionIndex::getVersion(const ScopeKey& scope, const VersionRef& ref) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const SubjectEntry* entry = findEntry(scope.str());
    if (entry) {
        if (ref.isLatest()) {
            for (auto it = entry->versions.rbegin(); it != entry->versions.rend(); ++it) {
                if (!it->second.deleted) {
                    return it->second;
                }
            }
        } else {
            auto it = entry->versions.find(ref.number());
            if (it != entry->versions.end() && !it->second.deleted) {
                return it->second;
            }
        }
    }
    return registry::RegistryError::versionNotFound(scope.str(), ref.toString());
}

registry::Result<VersionNumber> SubjectVersionIndex::softDeleteVersion(const ScopeKey& scope, VersionNumber version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto entry = subjects_.find(scope.str());
    if (entry == subjects_.end()) {
        return registry::RegistryError::versionNotFound(scope.str(), std::to_string(version));
    }
    auto it = entry->second.versions.find(version);
    if (it == entry->second.versions.end() || it->second.deleted) {
        return registry::RegistryError::versionNotFound(scope.str(), std::to_string(version));
    }

    persist::VersionLogRecord record;
    record.type = persist::LogRecordType::VERSION_DELETE;
    record.scope = scope.str();
    record.version = version;
    RETURN_IF_ERROR(persistRecords({record}));

    it->second.deleted = true;
    return version;
}

registry::Result<std::vector<VersionNumber>> SubjectVersionIndex::deleteSubject(const ScopeKey& scope) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<VersionNumber> deleted;
    auto entry = subjects_.find(scope.str());
    if (entry == subjects_.end()) {
        return deleted;
    }

    std::vector<persist::VersionLogRecord> records;
    for (const auto& kv : entry->second.versions) {
        if (kv.second.deleted) continue;
        persist::VersionLogRecord record;
        record.type = persist::LogRecordType::VERSION_DELETE;
        record.scope = scope.str();
        record.version = kv.first;
        records.push_back(std::move(record));
        deleted.push_back(kv.first);
    }
    RETURN_IF_ERROR(persistRecords(records));

    for (VersionNumber v : deleted) {
        entry->second.versions[v].deleted = true;
    }
    return deleted;
}

std::set<std::string> SubjectVersionIndex::listSubjects(bool include_deleted) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::set<std::string> result;
    for (const auto& kv : subjects_) {
        if (kv.second.versions.empty()) continue;
        if (include_deleted || kv.second.hasLive()) {
            result.insert(kv.first);
        }
    }
    return result;
}

bool SubjectVersionIndex::hasLiveVersions(const ScopeKey& scope) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const SubjectEntry* entry = findEntry(scope.str());
    return entry && entry->hasLive();
}

std::vector<VersionEntry> SubjectVersionIndex::liveHistory(const ScopeKey& scope) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<VersionEntry> history;
    if (const SubjectEntry* entry = findEntry(scope.str())) {
        for (const auto& kv : entry->versions) {
            if (!kv.second.deleted) history.push_back(kv.second);
        }
    }
    return history;
}

std::optional<VersionEntry> SubjectVersionIndex::findLiveBySchemaId(const ScopeKey& scope, SchemaId schema_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (const SubjectEntry* entry = findEntry(scope.str())) {
        for (const auto& kv : entry->versions) {
            if (!kv.second.deleted && kv.second.schema_id == schema_id) {
                return kv.second;
            }
        }
    }
    return std::nullopt;
}

std::vector<ScopeVersion> SubjectVersionIndex::findBySchemaId(SchemaId schema_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ScopeVersion> result;
    for (const auto& subject : subjects_) {
        for (const auto& kv : subject.second.versions) {
            if (!kv.second.deleted && kv.second.schema_id == schema_id) {
                result.push_back(ScopeVersion{subject.first, kv.first});
            }
        }
    }
    return result;
}

registry::Status SubjectVersionIndex::restoreAppend(const std::string& scope, VersionNumber version, SchemaId schema_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    SubjectEntry& entry = subjects_[scope];
    if (version <= entry.max_assigned) {
        return registry::RegistryError::corruption("versions.log", "version " + std::to_string(version) +
                                                   " of " + scope + " is not above " +
                                                   std::to_string(entry.max_assigned));
    }
    entry.versions.emplace(version, VersionEntry{version, schema_id, false});
    entry.max_assigned = version;
    return registry::Status();
}

registry::Status SubjectVersionIndex::restoreDelete(const std::string& scope, VersionNumber version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto entry = subjects_.find(scope);
    if (entry == subjects_.end()) {
        return registry::RegistryError::corruption("versions.log", "delete of unknown scope " + scope);
    }
    auto it = entry->second.versions.find(version);
    if (it == entry->second.versions.end()) {
        return registry::RegistryError::corruption("versions.log", "delete of unknown version " +
                                                   std::to_string(version) + " in " + scope);
    }
    it->second.deleted = true;
    return registry::Status();
}

} // namespace store
} // namespace schemata
