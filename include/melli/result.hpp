#pragma once

#include <melli/error.hpp>
#include <utility>
#include <variant>

namespace melli {

template<typename T>
class Result {
    std::variant<T, MelliError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from MelliError so MELLI_TRY can return errors across Result<T> types
    Result(MelliError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(MelliError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<MelliError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    MelliError& error() & { return std::get<MelliError>(data_); }
    const MelliError& error() const& { return std::get<MelliError>(data_); }
    MelliError&& error() && { return std::get<MelliError>(std::move(data_)); }

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

    // Outcomes compare equal when both hold equal values or equal errors.
    bool operator==(const Result& o) const { return data_ == o.data_; }
    bool operator!=(const Result& o) const { return !(*this == o); }
};

#define MELLI_TRY(expr) \
    do { \
        auto _melli_result = (expr); \
        if (_melli_result.is_err()) return std::move(_melli_result).error(); \
    } while(0)

} // namespace melli
