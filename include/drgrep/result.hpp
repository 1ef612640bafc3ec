#pragma once

#include <drgrep/error.hpp>
#include <variant>
#include <functional>

namespace drgrep {

template<typename T>
class Result {
    std::variant<T, DrgrepError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from DrgrepError so DRGREP_TRY can return errors across Result<T> types
    Result(DrgrepError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(DrgrepError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<DrgrepError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    DrgrepError& error() & { return std::get<DrgrepError>(data_); }
    const DrgrepError& error() const& { return std::get<DrgrepError>(data_); }
    DrgrepError&& error() && { return std::get<DrgrepError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Rewrite the error (e.g. to attach the file it came from); Ok passes through.
    template<typename F>
    Result map_error(F&& f) && {
        if (is_ok()) {
            return std::move(*this);
        }
        return Result(f(std::move(error())));
    }

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

#define DRGREP_TRY(expr) \
    do { \
        auto _drgrep_result = (expr); \
        if (_drgrep_result.is_err()) return std::move(_drgrep_result).error(); \
    } while(0)

} // namespace drgrep
