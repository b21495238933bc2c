/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for Pichuka
 * @author Pichuka Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Pichuka. All rights reserved.
 *
 * Configuration loading and high score file I/O report failures through
 * these codes. The per-frame path never produces one.
 */

#pragma once

#ifndef PICHUKA_CORE_ERROR_CODES_HPP
#define PICHUKA_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace Pichuka {

/**
 * @brief Error categories, taken from the high byte of a code
 */
enum class ErrorCategory : uint8_t {
    None   = 0x00,
    Config = 0x08,
    IO     = 0x09
};

/**
 * @brief Failure reasons
 *
 * - 0x0000: Success
 * - 0x08xx: configuration file or values
 * - 0x09xx: file system
 */
enum class ErrorCode : uint16_t {
    Success = 0x0000,

    ConfigMissing      = 0x0801,  ///< A required setting is empty
    ConfigInvalid      = 0x0802,  ///< Wrong type, out of range or inconsistent
    ConfigFileNotFound = 0x0803,
    ConfigParseFailed  = 0x0804,  ///< Not a JSON object

    IOError         = 0x0900,
    FileTooLarge    = 0x0902,
    FileWriteFailed = 0x0903
};

[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint16_t>(code) >> 8) & 0xFF);
}

[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

/**
 * @brief "Category: message" text for logs and console output
 */
[[nodiscard]] std::string describeError(ErrorCode code);

/**
 * @brief Either a value of type T or the ErrorCode explaining its absence
 *
 * @example
 * ```cpp
 * auto config = Config::ConfigLoader().load("pichuka.json");
 * if (config.isFailure()) {
 *     std::cerr << describeError(config.error()) << std::endl;
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(const T& value) : m_data(value) {}
    Result(T&& value) : m_data(std::move(value)) {}
    Result(ErrorCode error) : m_data(error) {}

    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }

    /// Throws std::runtime_error on a failed result
    [[nodiscard]] const T& value() const {
        if (isFailure()) {
            throw std::runtime_error("Result holds an error, not a value");
        }
        return std::get<T>(m_data);
    }

    /// Throws std::runtime_error on a successful result
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Result holds a value, not an error");
        }
        return std::get<ErrorCode>(m_data);
    }

private:
    std::variant<T, ErrorCode> m_data;
};

template<>
class Result<void> {
public:
    Result() : m_error(ErrorCode::Success) {}
    Result(ErrorCode error) : m_error(error) {}

    [[nodiscard]] bool isSuccess() const noexcept { return m_error == ErrorCode::Success; }
    [[nodiscard]] bool isFailure() const noexcept { return m_error != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error() const noexcept { return m_error; }

private:
    ErrorCode m_error;
};

using VoidResult = Result<void>;

/**
 * @brief Return the error of a failed result from the enclosing function
 */
#define PICHUKA_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

} // namespace Pichuka

#endif // PICHUKA_CORE_ERROR_CODES_HPP
