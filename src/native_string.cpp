#include "native_string.hpp"

#include "safewhisper/error.hpp"
#include "safewhisper/utf8.hpp"

namespace safewhisper {
namespace detail {

void requireNoNul(std::string_view text, const char* what) {
    const auto pos = text.find('\0');
    if (pos != std::string_view::npos) {
        throw Error(ErrorCode::InvalidArgument,
                    std::string(what) + " contains a NUL byte at offset " + std::to_string(pos));
    }
}

std::string_view borrowNativeString(const char* ptr, const std::string& what) {
    if (!ptr) throw Error(ErrorCode::LookupFailed, what + " returned null");
    return std::string_view(ptr);
}

std::string_view borrowNativeText(const char* ptr, const std::string& what) {
    const std::string_view bytes = borrowNativeString(ptr, what);
    if (!isValidUtf8(bytes)) throw Error(ErrorCode::EncodingError, what + " is not valid UTF-8");
    return bytes;
}

} // namespace detail
} // namespace safewhisper
