// include/registry_error/error_utils.h
#pragma once

#include "error_codes.h"
#include "registry_error.h"
#include "result.h"

#include <string_view>

namespace registry {
namespace error_utils {

    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);
    std::string_view categoryToString(ErrorCategory category);

    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);

    bool isNotFoundError(ErrorCode code);
    bool isCallerError(ErrorCode code);   // Caller supplied something wrong; never retried
    bool isPersistenceError(ErrorCode code);
    bool isRecoverable(ErrorCode code);

} // namespace error_utils

#define REGISTRY_ERROR(code, message) \
    registry::RegistryError(code, message).withLocation(__FILE__, __LINE__, __FUNCTION__)

#define REGISTRY_ERROR_WITH_DETAILS(code, message, details) \
    registry::RegistryError(code, message, details).withLocation(__FILE__, __LINE__, __FUNCTION__)

#define RETURN_IF_ERROR(result_expression) \
    do { \
        auto&& _tmp_status_macro_result = (result_expression); \
        if (!_tmp_status_macro_result.isOk()) { \
            return std::move(_tmp_status_macro_result.error()); \
        } \
    } while(0)

// Usage: ASSIGN_OR_RETURN(existing_var, function_returning_result());
#define ASSIGN_OR_RETURN(var, result_expression) \
    do { \
        auto&& _tmp_assign_macro_result = (result_expression); \
        if (!_tmp_assign_macro_result.isOk()) { \
            return std::move(_tmp_assign_macro_result.error()); \
        } \
        var = std::move(_tmp_assign_macro_result.value()); \
    } while(0)

} // namespace registry
