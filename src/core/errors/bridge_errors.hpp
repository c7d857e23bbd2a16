#pragma once
#include <string>
#include <variant>

namespace bridge::core::errors {

    // 1. Typed error categories, one per failure the bridge can surface
    enum class ErrorCategory {
        Decode,                   // Malformed or incomplete request line
        UnknownTool,              // Tool name absent from the registry
        NotImplemented,           // Registered but intentionally not forwarded
        BackendUnreachable,       // Connection refused or timed out
        BackendMalformedResponse, // Backend body could not be parsed
        Input,                    // Invalid command-line configuration
        Internal                  // I/O failure or unexpected exception
    };

    // The standardized error payload
    struct BridgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation Strategy (Result Object)
    // A Result holds either a successful value of type T, OR a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

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

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Decode: return "decode";
            case ErrorCategory::UnknownTool: return "unknown_tool";
            case ErrorCategory::NotImplemented: return "not_implemented";
            case ErrorCategory::BackendUnreachable: return "backend_unreachable";
            case ErrorCategory::BackendMalformedResponse: return "backend_malformed_response";
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace bridge::core::errors
