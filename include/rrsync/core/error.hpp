#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace rrsync {

enum class ErrorCode {
    Unknown = 1,
    ConfigurationError,
    InvalidConfig,
    ProtocolPrecondition,
    PolicyViolation,
    UnknownOption,
    DisabledOption,
    TraversalAttempt,
    MalformedSyntax,
    ExpansionLimit,
    IoError,
    DispatchFailure,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Stable upper-case name of an error code, used in debug logging.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::ConfigurationError: return "CONFIGURATION_ERROR";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::ProtocolPrecondition: return "PROTOCOL_PRECONDITION";
        case ErrorCode::PolicyViolation: return "POLICY_VIOLATION";
        case ErrorCode::UnknownOption: return "UNKNOWN_OPTION";
        case ErrorCode::DisabledOption: return "DISABLED_OPTION";
        case ErrorCode::TraversalAttempt: return "TRAVERSAL_ATTEMPT";
        case ErrorCode::MalformedSyntax: return "MALFORMED_SYNTAX";
        case ErrorCode::ExpansionLimit: return "EXPANSION_LIMIT";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::DispatchFailure: return "DISPATCH_FAILURE";
        default: return "UNKNOWN";
    }
}

} // namespace rrsync
