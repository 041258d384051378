#ifndef SAFEWHISPER_ERROR_HPP
#define SAFEWHISPER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace safewhisper {

enum class ErrorCode {
    InvalidArgument,
    InitializationError,
    TokenizationOverflow,
    LookupFailed,
    EncodingError,
    NativeCallFailed
};

const char* toString(ErrorCode code) noexcept;

// Every fallible call in the library throws this type.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message, int nativeCode = 0);

    ErrorCode code() const noexcept { return code_; }

    // Status returned by the engine for NativeCallFailed, 0 otherwise.
    int nativeCode() const noexcept { return nativeCode_; }

private:
    ErrorCode code_;
    int nativeCode_;
};

} // namespace safewhisper

#endif
