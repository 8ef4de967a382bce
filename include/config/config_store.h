// include/config/config_store.h
#pragma once

#include "../types.h"
#include "../persist/log_records.h"
#include "../registry_error/result.h"

#include <map>
#include <string>
#include <optional>
#include <shared_mutex>
#include <functional>

namespace schemata {
namespace config {

/**
 * @class ConfigStore
 * @brief Global default compatibility mode plus per-scope overrides.
 *
 * The global default always has a value. Changes go through the persist
 * callback before they become visible.
 */
class ConfigStore {
public:
    using PersistFn = std::function<registry::Status(const persist::ConfigLogRecord&)>;

    explicit ConfigStore(CompatibilityMode global_default, PersistFn persist = nullptr);

    // Override if present, else the global default.
    CompatibilityMode getEffectiveMode(const ScopeKey& scope) const;
    CompatibilityMode getGlobalDefault() const;
    std::optional<CompatibilityMode> getOverride(const ScopeKey& scope) const;

    registry::Status setGlobalDefault(CompatibilityMode mode);
    registry::Status setOverride(const ScopeKey& scope, CompatibilityMode mode);
    // Returns whether an override existed.
    registry::Result<bool> clearOverride(const ScopeKey& scope);

    static registry::Result<CompatibilityMode> parseMode(const std::string& text);

    // Recovery
    registry::Status restore(const persist::ConfigLogRecord& record);

private:
    PersistFn persist_;
    mutable std::shared_mutex mutex_;
    CompatibilityMode global_default_;
    std::map<std::string, CompatibilityMode> overrides_;
};

} // namespace config
} // namespace schemata
