// src/registry_error/error_context.cpp

#include "registry_error/error_context.h"
#include "registry_error/error_handler.h"
#include "debug_utils.h"

#include <algorithm>
#include <numeric>

namespace registry {

namespace {

bool isCritical(const RegistryError& error) {
    return error.severity == ErrorSeverity::CRITICAL || error.severity == ErrorSeverity::FATAL;
}

} // anonymous namespace

ErrorContext::ErrorContext(std::shared_ptr<ErrorHandler> handler)
    : handler_(std::move(handler)) {
}

void ErrorContext::setErrorHandler(std::shared_ptr<ErrorHandler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void ErrorContext::reportError(const RegistryError& error) {
    // Caller mistakes are routine; only log what points at the registry itself.
    if (isCritical(error)) {
        LOG_ERROR("[ErrorContext] ", error.toString());
    }

    std::shared_ptr<ErrorHandler> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++error_counts_[error.code];
        recent_errors_.push_back(error);
        while (recent_errors_.size() > MAX_RECENT_ERRORS) {
            recent_errors_.pop_front();
        }
        handler = handler_;
    }

    // Handlers run unlocked so they may query this context.
    if (!handler) {
        return;
    }
    if (isCritical(error)) {
        handler->handleCriticalError(error);
    } else {
        handler->handleError(error);
    }
}

size_t ErrorContext::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_counts_.find(code);
    return it == error_counts_.end() ? 0 : it->second;
}

size_t ErrorContext::getTotalErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::accumulate(error_counts_.begin(), error_counts_.end(), size_t{0},
                           [](size_t sum, const auto& entry) { return sum + entry.second; });
}

std::vector<RegistryError> ErrorContext::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t take = std::min(count, recent_errors_.size());
    return std::vector<RegistryError>(recent_errors_.end() - static_cast<std::ptrdiff_t>(take),
                                      recent_errors_.end());
}

bool ErrorContext::hasRepeatedErrors(ErrorCode code, size_t threshold) const {
    return getErrorCount(code) >= threshold;
}

void ErrorContext::clearErrors() {
    std::lock_guard<std::mutex> lock(mutex_);
    recent_errors_.clear();
    error_counts_.clear();
}

} // namespace registry
