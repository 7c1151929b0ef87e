#pragma once

#include <verspec/error.hpp>
#include <optional>
#include <variant>

namespace verspec {

// Either a value or the VerspecError that prevented producing it.
template<typename T>
class Result {
    std::variant<T, VerspecError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from VerspecError so VERSPEC_TRY can return errors across Result<T> types
    Result(VerspecError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(VerspecError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<VerspecError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    VerspecError& error() & { return std::get<VerspecError>(data_); }
    const VerspecError& error() const& { return std::get<VerspecError>(data_); }
    VerspecError&& error() && { return std::get<VerspecError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    // Drops the error; the "try" entry points are built on this.
    std::optional<T> to_optional() && {
        if (is_ok()) return std::get<T>(std::move(data_));
        return std::nullopt;
    }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) const -> decltype(f(std::declval<const T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<const T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) const {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define VERSPEC_TRY(expr) \
    do { \
        auto _verspec_result = (expr); \
        if (_verspec_result.is_err()) return std::move(_verspec_result).error(); \
    } while(0)

} // namespace verspec
