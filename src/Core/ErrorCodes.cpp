/**
 * @file ErrorCodes.cpp
 * @brief Human-readable descriptions for Pichuka error codes
 * @author Pichuka Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Pichuka. All rights reserved.
 */

#include "Pichuka/Core/ErrorCodes.hpp"

namespace Pichuka {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:            return "Success";
        case ErrorCode::ConfigMissing:      return "Required configuration missing";
        case ErrorCode::ConfigInvalid:      return "Configuration value invalid";
        case ErrorCode::ConfigFileNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed:  return "Configuration parse failed";
        case ErrorCode::IOError:            return "I/O error";
        case ErrorCode::FileTooLarge:       return "File too large";
        case ErrorCode::FileWriteFailed:    return "File write failed";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:   return "None";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::IO:     return "IO";
    }
    return "Unknown";
}

std::string describeError(ErrorCode code) {
    std::string text(getCategoryName(getErrorCategory(code)));
    text += ": ";
    text += getErrorMessage(code);
    return text;
}

} // namespace Pichuka
