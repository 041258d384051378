#ifndef SAFEWHISPER_UTF8_HPP
#define SAFEWHISPER_UTF8_HPP

#include <string_view>

namespace safewhisper {

// Strict check: rejects overlong forms, surrogates and code points past U+10FFFF.
bool isValidUtf8(std::string_view bytes) noexcept;

} // namespace safewhisper

#endif
