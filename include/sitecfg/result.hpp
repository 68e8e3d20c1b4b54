#pragma once

#include <sitecfg/error.hpp>
#include <variant>
#include <utility>

namespace sitecfg {

template<typename T>
class Result {
    std::variant<T, SiteError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SiteError so SITECFG_TRY can forward errors between Result types
    Result(SiteError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SiteError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SiteError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SiteError& error() & { return std::get<SiteError>(data_); }
    const SiteError& error() const& { return std::get<SiteError>(data_); }
    SiteError&& error() && { return std::get<SiteError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SITECFG_TRY(expr) \
    do { \
        auto _sitecfg_result = (expr); \
        if (_sitecfg_result.is_err()) return std::move(_sitecfg_result).error(); \
    } while(0)

} // namespace sitecfg
