// include/registry_error/error_context.h
#pragma once

#include "registry_error.h"
#include <memory>
#include <deque>
#include <vector>
#include <unordered_map>
#include <mutex>

namespace registry {

class ErrorHandler;

/**
 * @brief Tracks failures reported by the registry façade: per-code counters,
 * a bounded window of recent errors and an optional handler.
 */
class ErrorContext {
private:
    std::shared_ptr<ErrorHandler> handler_;
    std::deque<RegistryError> recent_errors_;
    std::unordered_map<ErrorCode, size_t> error_counts_;
    mutable std::mutex mutex_;

    static constexpr size_t MAX_RECENT_ERRORS = 100;

public:
    explicit ErrorContext(std::shared_ptr<ErrorHandler> handler = nullptr);

    void setErrorHandler(std::shared_ptr<ErrorHandler> handler);
    void reportError(const RegistryError& error);

    size_t getErrorCount(ErrorCode code) const;
    size_t getTotalErrorCount() const;
    std::vector<RegistryError> getRecentErrors(size_t count = 10) const;

    bool hasRepeatedErrors(ErrorCode code, size_t threshold = 5) const;

    void clearErrors();
};

} // namespace registry
