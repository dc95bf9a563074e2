// =============================================================================
// Tapdeck - Result Type for Load/Validate Paths
// =============================================================================
// Result<T, E> holds either a success value or an error. Used where failure is
// an expected outcome the caller inspects (config files, needle images, action
// table validation). The device layer reports faults with exceptions instead
// (see errors.hpp).
//
// Usage:
//   Result<int> parsePort(const std::string& s) {
//       if (s.empty()) return Err<int>("empty port");
//       return Ok(std::stoi(s));
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace tapdeck {

// Generic error with message
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// File / parse error codes carried in Error::code
enum ErrorCode : int {
    kErrNone = 0,
    kErrNotFound = 1,
    kErrParse = 2,
    kErrDecode = 3,
    kErrValidation = 4,
};

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

private:
    std::variant<std::monostate, E> data_;
};

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(std::string message, int code = 0) {
    return Result<T, Error>(Error(std::move(message), code));
}

} // namespace tapdeck
