#ifndef SAFEWHISPER_NATIVE_STRING_HPP
#define SAFEWHISPER_NATIVE_STRING_HPP

#include <string>
#include <string_view>

namespace safewhisper {
namespace detail {

// Throws InvalidArgument if text cannot be passed as a C string.
void requireNoNul(std::string_view text, const char* what);

// Throws LookupFailed on null.
std::string_view borrowNativeString(const char* ptr, const std::string& what);

// Like borrowNativeString but also throws EncodingError on invalid UTF-8.
std::string_view borrowNativeText(const char* ptr, const std::string& what);

} // namespace detail
} // namespace safewhisper

#endif
