#pragma once

#include <resub/error.hpp>
#include <variant>
#include <utility>

namespace resub {

// Either a value or the ResubError that prevented producing it.
template<typename T>
class Result {
    std::variant<T, ResubError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ResubError so RESUB_TRY can return errors across Result<T> types
    Result(ResubError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ResubError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ResubError>(data_); }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ResubError& error() & { return std::get<ResubError>(data_); }
    const ResubError& error() const& { return std::get<ResubError>(data_); }
    ResubError&& error() && { return std::get<ResubError>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    template<typename F>
    auto map(F&& f) && -> Result<decltype(f(std::declval<T&&>()))> {
        using U = decltype(f(std::declval<T&&>()));
        if (is_ok()) {
            return Result<U>::ok(f(std::move(*this).value()));
        }
        return Result<U>::err(std::move(*this).error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        using R = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return f(value());
        }
        return R::err(error());
    }

    // Recover from an error; f takes the error and returns a Result<T>.
    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }

    // Attach rules-file context to an error on its way out
    Result with_location(const std::string& file, int line = 0) && {
        if (is_err()) {
            auto& e = error();
            if (e.file.empty()) e.file = file;
            if (e.line == 0) e.line = line;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define RESUB_TRY(expr) \
    do { \
        auto _resub_result = (expr); \
        if (_resub_result.is_err()) return std::move(_resub_result).error(); \
    } while(0)

#define RESUB_CONCAT_INNER(a, b) a##b
#define RESUB_CONCAT(a, b) RESUB_CONCAT_INNER(a, b)

// RESUB_TRY_ASSIGN(auto x, make_x()); binds the value or returns the error.
#define RESUB_TRY_ASSIGN(decl, expr) \
    RESUB_TRY_ASSIGN_IMPL(RESUB_CONCAT(_resub_tmp_, __LINE__), decl, expr)

#define RESUB_TRY_ASSIGN_IMPL(tmp, decl, expr) \
    auto tmp = (expr); \
    if (tmp.is_err()) return std::move(tmp).error(); \
    decl = std::move(tmp).value()

} // namespace resub
