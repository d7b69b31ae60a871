/**
 * @file result.hpp
 * @brief Error handling with Result<T> type
 *
 * Inbound sync handlers must never throw into the embedding application,
 * so fallible operations (decoding, validation, config loading) report
 * failure through Result instead.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "types.hpp"

namespace tandem {

// ============================================================================
// Error
// ============================================================================

/// Error code plus human-readable detail
class Error {
public:
    Error(ErrorCode code, std::string message)
        : m_code(code), m_message(std::move(message)) {}

    ErrorCode code() const { return m_code; }

    /// Detail if any, else the code's name
    const char* what() const {
        return m_message.empty() ? errorCodeToString(m_code) : m_message.c_str();
    }

private:
    ErrorCode m_code;
    std::string m_message;
};

// ============================================================================
// Result<T>
// ============================================================================

/**
 * @brief Either a value or an Error
 *
 * Test with operator bool before value(); value() on an error and error()
 * on a success throw, which is a programming mistake, not a runtime path.
 */
template<typename T>
class Result {
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(Error error) : m_data(std::move(error)) {}

    [[nodiscard]] bool ok() const { return m_data.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() & { requireValue(); return std::get<0>(m_data); }
    const T& value() const& { requireValue(); return std::get<0>(m_data); }
    T&& value() && { requireValue(); return std::get<0>(std::move(m_data)); }

    const Error& error() const& {
        if (ok()) {
            throw std::logic_error("Result::error() on success");
        }
        return std::get<1>(m_data);
    }

private:
    void requireValue() const {
        if (!ok()) {
            throw std::runtime_error(std::get<1>(m_data).what());
        }
    }

    std::variant<T, Error> m_data;
};

/// Success carries nothing; only the error is stored
template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : m_error(std::move(error)) {}

    [[nodiscard]] bool ok() const { return !m_error; }
    explicit operator bool() const { return ok(); }

    const Error& error() const& {
        if (!m_error) {
            throw std::logic_error("Result::error() on success");
        }
        return *m_error;
    }

private:
    std::optional<Error> m_error;
};

// ============================================================================
// Factories
// ============================================================================

template<typename T>
inline Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
inline Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error(code, std::move(message)));
}

template<typename T = void>
inline Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

} // namespace tandem
