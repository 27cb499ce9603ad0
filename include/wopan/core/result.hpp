#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace wopan {

/**
 * @file result.hpp
 * @brief Value-or-error return type used across the relay
 *
 * Library code that can fail returns Result instead of throwing. Upload,
 * crypto, media and server code use Expected<T> (Result<T, wopan::Error>,
 * see error.hpp); the HTTP parsing helpers keep the plain string error.
 *
 * EXAMPLE:
 * auto window = reader.next();
 * if (window.is_error()) {
 *     return Err<UploadOutcome>(window.error());
 * }
 * send(window.value());
 */

// Wrappers keep construction unambiguous when T and E are the same type
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = std::string>
class Result {
public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    /// Only valid when is_ok()
    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    /// Only valid when is_error()
    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Outcome of an operation with nothing to return
 */
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

template<typename T, typename E = std::string>
Result<T, E> Ok(T value) { return Result<T, E>(OkValue<T>(std::move(value))); }

template<typename E = std::string>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

} // namespace wopan
