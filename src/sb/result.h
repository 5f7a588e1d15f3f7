#pragma once

/// @file sb/result.h
/// @brief Result<T, E> for error handling without exceptions
///
/// Modeled after C++23's std::expected, with Rust-style naming.
///
/// Example:
/// @code
/// Result<int> divide(int a, int b) {
///     if (b == 0) {
///         return Result<int>::failure(ResultError::INVALID_ARGUMENT, "Division by zero");
///     }
///     return Result<int>::success(a / b);
/// }
///
/// auto result = divide(10, 2);
/// if (result.ok()) {
///     int value = result.value();
/// }
/// @endcode

#include <string>
#include <utility>

#include "sb/int.h"

namespace sb {

/// @brief Error codes reported by StripBang operations
enum class ResultError : u8 {
    OK,                     ///< No error (not typically used)
    UNKNOWN,                ///< Unknown or unspecified error
    INVALID_ARGUMENT,       ///< Invalid argument provided
    OUT_OF_RANGE,           ///< Value out of valid range
    NOT_INITIALIZED,        ///< Required collaborator missing
    IO_ERROR                ///< Input/output error
};

/// @brief Human readable name of an error code
const char* toString(ResultError err);

/// @brief Error information carried by a failed Result
template<typename E>
struct ErrorInfo {
    E code;
    std::string message;

    ErrorInfo() : code(E{}) {}
    ErrorInfo(E err, const char* msg) : code(err), message(msg ? msg : "") {}
};

/// @brief Value or error returned by operations that can fail
/// @tparam T The type of the successful value (must be default constructible)
/// @tparam E The error code type
template<typename T, typename E = ResultError>
class expected {
public:
    /// @brief Default constructor (creates error state)
    expected() : mOk(false), mValue() {}

    bool ok() const { return mOk; }
    explicit operator bool() const { return ok(); }

    /// @brief Get error code (only meaningful if !ok())
    E error() const { return mError.code; }

    /// @brief Get error message (only meaningful if !ok())
    const char* message() const { return mError.message.c_str(); }

    /// @warning Undefined behavior if called when !ok()
    T& value() { return mValue; }
    const T& value() const { return mValue; }

    static expected success(T value) {
        expected r;
        r.mOk = true;
        r.mValue = std::move(value);
        return r;
    }

    static expected failure(E err, const char* msg = nullptr) {
        expected r;
        r.mError = ErrorInfo<E>(err, msg);
        return r;
    }

    static expected failure(E err, const std::string& msg) {
        return failure(err, msg.c_str());
    }

    /// @brief Forward the error of another result with a different value type
    template<typename U>
    static expected failure(const expected<U, E>& other) {
        return failure(other.error(), other.message());
    }

private:
    bool mOk;
    T mValue;
    ErrorInfo<E> mError;
};

/// @brief Specialization for operations with no value to return
template<typename E>
class expected<void, E> {
public:
    /// @brief Default constructor (creates error state)
    expected() : mOk(false) {}

    bool ok() const { return mOk; }
    explicit operator bool() const { return ok(); }

    E error() const { return mError.code; }
    const char* message() const { return mError.message.c_str(); }

    static expected success() {
        expected r;
        r.mOk = true;
        return r;
    }

    static expected failure(E err, const char* msg = nullptr) {
        expected r;
        r.mError = ErrorInfo<E>(err, msg);
        return r;
    }

    static expected failure(E err, const std::string& msg) {
        return failure(err, msg.c_str());
    }

    template<typename U>
    static expected failure(const expected<U, E>& other) {
        return failure(other.error(), other.message());
    }

private:
    bool mOk;
    ErrorInfo<E> mError;
};

template<typename T, typename E = ResultError>
using Result = expected<T, E>;

/// @brief Result of an operation with no value
typedef Result<void> Status;

} // namespace sb
