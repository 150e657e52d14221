#pragma once

#include "youwee/util.hpp"
#include <string>

namespace youwee {

enum class ErrorCategory {
    None,
    Config,
    Filesystem,
    Parse,
    Command,
    Internal
};

enum class ErrorCode {
    None,
    Unknown,
    ConfigInvalid,
    ConfigUnsupported,
    FileUnreadable,
    ParseFailure,
    UnknownCommand
};

struct ErrorInfo {
    ErrorCategory category{ErrorCategory::None};
    ErrorCode code{ErrorCode::None};
    std::string userMessage;
    std::string detail;
};

inline const char* errorCategoryLabel(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::Filesystem: return "Filesystem";
        case ErrorCategory::Parse: return "Parse";
        case ErrorCategory::Command: return "Command";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

inline const char* errorCodeLabel(ErrorCode c) {
    switch (c) {
        case ErrorCode::None: return "None";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
        case ErrorCode::ConfigUnsupported: return "ConfigUnsupported";
        case ErrorCode::FileUnreadable: return "FileUnreadable";
        case ErrorCode::ParseFailure: return "ParseFailure";
        case ErrorCode::UnknownCommand: return "UnknownCommand";
        default: return "Unknown";
    }
}

// Map an error message produced inside this project to a category/code pair
// and a short message fit for the user.
inline ErrorInfo classifyError(const std::string& detail, ErrorCategory hint = ErrorCategory::None) {
    ErrorInfo out;
    out.detail = detail;
    out.category = hint;
    out.code = ErrorCode::Unknown;

    const std::string l = util::toLowerCopy(detail);
    auto set = [&](ErrorCategory cat, ErrorCode code, const char* user) {
        out.category = cat;
        out.code = code;
        out.userMessage = user;
    };

    if (l.find("unknown command") != std::string::npos) {
        set(ErrorCategory::Command, ErrorCode::UnknownCommand, "The requested command is not available.");
    } else if (l.find("invalid config json") != std::string::npos || l.find("invalid config line") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::ConfigInvalid, "Configuration format is invalid.");
    } else if (l.find("unsupported log_level") != std::string::npos || l.find("unsupported") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::ConfigUnsupported, "A configuration value is not supported.");
    } else if (l.find("cannot read") != std::string::npos || l.find("cannot open") != std::string::npos) {
        set(ErrorCategory::Filesystem, ErrorCode::FileUnreadable, "A file could not be read.");
    } else if (l.find("parse") != std::string::npos || l.find("malformed") != std::string::npos || l.find("json") != std::string::npos) {
        set(ErrorCategory::Parse, ErrorCode::ParseFailure, "Received malformed data.");
    }

    if (out.category == ErrorCategory::None) out.category = ErrorCategory::Internal;
    if (out.userMessage.empty()) {
        switch (out.category) {
            case ErrorCategory::Config: out.userMessage = "Configuration error."; break;
            case ErrorCategory::Filesystem: out.userMessage = "Storage error."; break;
            case ErrorCategory::Parse: out.userMessage = "Data parsing error."; break;
            case ErrorCategory::Command: out.userMessage = "Command error."; break;
            case ErrorCategory::Internal: out.userMessage = "Internal application error."; break;
            default: out.userMessage = "Unknown error."; break;
        }
    }
    return out;
}

} // namespace youwee
