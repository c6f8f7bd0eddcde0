#pragma once

#include <fencelint/error.hpp>
#include <utility>
#include <variant>

namespace fencelint {

template<typename T>
class Result {
    std::variant<T, FencelintError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from FencelintError so FENCELINT_TRY can return errors across Result<T> types
    Result(FencelintError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(FencelintError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<FencelintError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    FencelintError& error() & { return std::get<FencelintError>(data_); }
    const FencelintError& error() const& { return std::get<FencelintError>(data_); }
    FencelintError&& error() && { return std::get<FencelintError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

#define FENCELINT_TRY(expr) \
    do { \
        auto _fencelint_result = (expr); \
        if (_fencelint_result.is_err()) return std::move(_fencelint_result).error(); \
    } while(0)

} // namespace fencelint
