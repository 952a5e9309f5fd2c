#pragma once

#include <grg/error.hpp>
#include <variant>
#include <utility>

namespace grg {

template<typename T>
class Result {
    std::variant<T, GrgError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from GrgError so fallible functions can `return GrgError{...}`
    Result(GrgError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(GrgError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<GrgError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    GrgError& error() & { return std::get<GrgError>(data_); }
    const GrgError& error() const& { return std::get<GrgError>(data_); }
    GrgError&& error() && { return std::get<GrgError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

} // namespace grg
