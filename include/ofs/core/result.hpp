#pragma once

#include "ofs/core/error.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace ofs {

/**
 * @brief Outcome of a fallible engine operation: a value or an ofs::Error
 *
 * Every component reports failures through this type so callers can branch
 * on ErrorKind (retry on Network/Timeout, fall back to cache on Offline)
 * without catching exceptions.
 *
 * EXAMPLE:
 * auto rows = store.query("SELECT ...", {});
 * if (rows.failed_with(ErrorKind::Quota)) { ... }
 * if (rows.is_error()) { return Err<Foo>(rows.error()); }
 */
template<typename T>
class Result {
public:
    static Result success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result failure(Error error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    bool failed_with(ErrorKind kind) const { return is_error() && error().kind == kind; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    Error& error() { return std::get<1>(data_); }
    const Error& error() const { return std::get<1>(data_); }

    T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, Error> data_;
};

// Operations that only succeed or fail.
template<>
class Result<void> {
public:
    static Result success() { return Result(std::nullopt); }
    static Result failure(Error error) { return Result(std::move(error)); }

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    bool failed_with(ErrorKind kind) const { return is_error() && error_->kind == kind; }

    const Error& error() const { return error_.value(); }

private:
    explicit Result(std::optional<Error> error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>::success(std::move(value)); }

inline Result<void> Ok() { return Result<void>::success(); }

template<typename T>
Result<T> Err(Error error) { return Result<T>::failure(std::move(error)); }

template<typename T>
Result<T> Fail(ErrorKind kind, std::string message) {
    return Result<T>::failure(Error{kind, std::move(message)});
}

} // namespace ofs
