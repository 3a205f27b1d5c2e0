#pragma once

#include <resx/error.hpp>
#include <variant>
#include <utility>

namespace resx {

template<typename T>
class Result {
    std::variant<T, ResxError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ResxError so RESX_TRY can forward errors between Result types
    Result(ResxError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ResxError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ResxError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ResxError& error() & { return std::get<ResxError>(data_); }
    const ResxError& error() const& { return std::get<ResxError>(data_); }
    ResxError&& error() && { return std::get<ResxError>(std::move(data_)); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
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

#define RESX_TRY(expr) \
    do { \
        auto _resx_result = (expr); \
        if (_resx_result.is_err()) return std::move(_resx_result).error(); \
    } while(0)

} // namespace resx
