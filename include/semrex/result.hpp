#pragma once

#include <semrex/error.hpp>
#include <variant>
#include <functional>
#include <utility>

namespace semrex {

template<typename T>
class Result {
    std::variant<T, SemrexError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SemrexError so SEMREX_TRY can forward errors between Result types
    Result(SemrexError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SemrexError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SemrexError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SemrexError& error() & { return std::get<SemrexError>(data_); }
    const SemrexError& error() const& { return std::get<SemrexError>(data_); }
    SemrexError&& error() && { return std::get<SemrexError>(std::move(data_)); }

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

    // Rewrite the error (e.g. add context); Ok passes through untouched.
    template<typename F>
    Result map_error(F&& f) && {
        if (is_ok()) return std::move(*this);
        return Result::err(f(std::move(*this).error()));
    }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SEMREX_TRY(expr) \
    do { \
        auto _semrex_result = (expr); \
        if (_semrex_result.is_err()) return std::move(_semrex_result).error(); \
    } while(0)

} // namespace semrex
