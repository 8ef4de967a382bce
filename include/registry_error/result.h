// include/registry_error/result.h
#pragma once

#include "registry_error.h"
#include <optional>
#include <stdexcept>
#include <utility>
#include <type_traits>

namespace registry {

/**
 * @brief Either a value or a RegistryError, never both.
 *
 * Accessing the wrong side throws std::logic_error; callers are expected to
 * branch on isOk() first.
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::optional<RegistryError> error_;

public:
    Result(T val) : value_(std::move(val)) {}
    Result(RegistryError err) : error_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool hasValue() const { return value_.has_value(); }
    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return hasValue(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const& {
        if (!hasValue()) throw std::logic_error("Result has no value: " + error_->toString());
        return *value_;
    }
    T& value() & {
        if (!hasValue()) throw std::logic_error("Result has no value: " + error_->toString());
        return *value_;
    }
    T&& value() && {
        if (!hasValue()) throw std::logic_error("Result has no value: " + error_->toString());
        return std::move(*value_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }
    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }

    const RegistryError& error() const& {
        if (!hasError()) throw std::logic_error("Result has no error");
        return *error_;
    }
    RegistryError& error() & {
        if (!hasError()) throw std::logic_error("Result has no error");
        return *error_;
    }
    RegistryError&& error() && {
        if (!hasError()) throw std::logic_error("Result has no error");
        return std::move(*error_);
    }

    // Shortcut for tests and transport code that map errors to statuses.
    ErrorCode code() const { return hasError() ? error_->code : ErrorCode::OK; }

    T valueOr(T fallback) const& {
        return hasValue() ? *value_ : std::move(fallback);
    }

    // If Ok, applies func to the value; otherwise forwards the error.
    template<typename F>
    auto map(F&& func) const& -> Result<std::decay_t<decltype(func(std::declval<const T&>()))>> {
        using U = std::decay_t<decltype(func(std::declval<const T&>()))>;
        if (hasValue()) {
            return Result<U>(func(*value_));
        }
        return Result<U>(*error_);
    }
};

template<>
class Result<void> {
private:
    std::optional<RegistryError> error_;

public:
    Result() = default;
    Result(RegistryError err) : error_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return !hasError(); }
    explicit operator bool() const { return isOk(); }

    const RegistryError& error() const& {
        if (!hasError()) throw std::logic_error("Status has no error");
        return *error_;
    }
    RegistryError& error() & {
        if (!hasError()) throw std::logic_error("Status has no error");
        return *error_;
    }
    RegistryError&& error() && {
        if (!hasError()) throw std::logic_error("Status has no error");
        return std::move(*error_);
    }

    ErrorCode code() const { return hasError() ? error_->code : ErrorCode::OK; }
};

using Status = Result<void>;

} // namespace registry
