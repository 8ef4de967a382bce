// include/registry_error/error_handler.h
#pragma once

#include "registry_error.h"

namespace registry {

/**
 * @brief Hook for embedders that forward registry failures elsewhere
 * (metrics, alerting). Called with the ErrorContext lock held; keep it short.
 */
class ErrorHandler {
public:
    virtual ~ErrorHandler() = default;
    virtual void handleError(const RegistryError& error) = 0;
    virtual void handleCriticalError(const RegistryError& error) = 0;
};

} // namespace registry
