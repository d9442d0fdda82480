#pragma once
#include <string>
#include <variant>

namespace costbridge::core::errors {

    // Typed error categories for everything between the caller and the tool server
    enum class ErrorCategory {
        ProcessStart,   // The tool server could not be located or spawned
        Handshake,      // initialize rejected, or the session is not Ready
        Protocol,       // Malformed, unexpected or late wire message
        BrokenPipe,     // The pipe to the child broke mid-call
        InvalidCall,    // Caller supplied a call missing required fields
        ToolFailure,    // The server answered with an error
        Input,          // Bad CLI flag or config value
        Internal        // Logic bug or library failure
    };

    struct BridgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // A Result holds either a successful value of type T, or a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Session-fatal errors leave the protocol client Closed; a fresh
    // supervisor/client pair is needed afterwards.
    inline bool is_session_fatal(const BridgeError& error) {
        return error.category == ErrorCategory::ProcessStart ||
               error.category == ErrorCategory::Handshake ||
               error.category == ErrorCategory::BrokenPipe;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::ProcessStart: return "ProcessStartError";
            case ErrorCategory::Handshake:    return "HandshakeError";
            case ErrorCategory::Protocol:     return "ProtocolError";
            case ErrorCategory::BrokenPipe:   return "BrokenPipeError";
            case ErrorCategory::InvalidCall:  return "InvalidCallError";
            case ErrorCategory::ToolFailure:  return "ToolFailure";
            case ErrorCategory::Input:        return "InputError";
            case ErrorCategory::Internal:     return "InternalError";
            default: return "UnknownError";
        }
    }

} // namespace costbridge::core::errors
