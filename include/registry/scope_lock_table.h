// include/registry/scope_lock_table.h
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace schemata {

/**
 * @brief Lazily created mutex per scope key.
 *
 * Writers to one scope serialize on its mutex; different scopes proceed in
 * parallel. Entries live as long as the table.
 */
class ScopeLockTable {
public:
    std::shared_ptr<std::mutex> mutexFor(const std::string& scope) {
        // Fast path (read lock)
        {
            std::shared_lock<std::shared_mutex> lock(table_mutex_);
            auto it = locks_.find(scope);
            if (it != locks_.end()) {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(table_mutex_);
        auto& slot = locks_[scope];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        return slot;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(table_mutex_);
        return locks_.size();
    }

private:
    mutable std::shared_mutex table_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};

/**
 * @brief Holds one scope's mutex for the lifetime of the guard.
 */
class ScopeGuard {
public:
    ScopeGuard(ScopeLockTable& table, const std::string& scope)
        : mutex_(table.mutexFor(scope)), lock_(*mutex_) {}

private:
    std::shared_ptr<std::mutex> mutex_;
    std::lock_guard<std::mutex> lock_;
};

} // namespace schemata
