#include "safewhisper/error.hpp"

namespace safewhisper {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InitializationError: return "InitializationError";
        case ErrorCode::TokenizationOverflow: return "TokenizationOverflow";
        case ErrorCode::LookupFailed: return "LookupFailed";
        case ErrorCode::EncodingError: return "EncodingError";
        case ErrorCode::NativeCallFailed: return "NativeCallFailed";
    }
    return "Unknown";
}

static std::string formatMessage(ErrorCode code, const std::string& message) {
    return std::string(toString(code)) + ": " + message;
}

Error::Error(ErrorCode code, const std::string& message, int nativeCode)
    : std::runtime_error(formatMessage(code, message)), code_(code), nativeCode_(nativeCode) {}

} // namespace safewhisper
