// src/config/config_store.cpp

#include "../../include/config/config_store.h"
#include "../../include/registry_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <mutex>

namespace schemata {
namespace config {

ConfigStore::ConfigStore(CompatibilityMode global_default, PersistFn persist)
    : persist_(std::move(persist)), global_default_(global_default) {}

CompatibilityMode ConfigStore::getEffectiveMode(const ScopeKey& scope) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = overrides_.find(scope.str());
    return it == overrides_.end() ? global_default_ : it->second;
}

CompatibilityMode ConfigStore::getGlobalDefault() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return global_default_;
}

std::optional<CompatibilityMode> ConfigStore::getOverride(const ScopeKey& scope) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = overrides_.find(scope.str());
    if (it == overrides_.end()) {
        return std::nullopt;
    }
    return it->second;
}

registry::Status ConfigStore::setGlobalDefault(CompatibilityMode mode) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (persist_) {
        persist::ConfigLogRecord record;
        record.type = persist::LogRecordType::CONFIG_SET;
        record.mode = mode;
        RETURN_IF_ERROR(persist_(record));
    }
    global_default_ = mode;
    LOG_INFO("[ConfigStore] Global compatibility set to ", toString(mode));
    return registry::Status();
}

registry::Status ConfigStore::setOverride(const ScopeKey& scope, CompatibilityMode mode) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (persist_) {
        persist::ConfigLogRecord record;
        record.type = persist::LogRecordType::CONFIG_SET;
        record.scope = scope.str();
        record.mode = mode;
        RETURN_IF_ERROR(persist_(record));
    }
    overrides_[scope.str()] = mode;
    LOG_INFO("[ConfigStore] Compatibility for ", format_subject_for_print(scope.str()), " set to ", toString(mode));
    return registry::Status();
}

registry::Result<bool> ConfigStore::clearOverride(const ScopeKey& scope) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = overrides_.find(scope.str());
    if (it == overrides_.end()) {
        return false;
    }
    if (persist_) {
        persist::ConfigLogRecord record;
        record.type = persist::LogRecordType::CONFIG_CLEAR;
        record.scope = scope.str();
        RETURN_IF_ERROR(persist_(record));
    }
    overrides_.erase(it);
    return true;
}

registry::Result<CompatibilityMode> ConfigStore::parseMode(const std::string& text) {
    return parseCompatibilityMode(text);
}

registry::Status ConfigStore::restore(const persist::ConfigLogRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (record.type == persist::LogRecordType::CONFIG_SET) {
        if (record.isGlobal()) {
            global_default_ = record.mode;
        } else {
            overrides_[record.scope] = record.mode;
        }
    } else {
        overrides_.erase(record.scope);
    }
    return registry::Status();
}

} // namespace config
} // namespace schemata
