#include "safewhisper/language.hpp"

#include "native_string.hpp"
#include "safewhisper/error.hpp"

#include <whisper.h>

namespace safewhisper {

static void requireKnownId(int id) {
    if (id < 0 || id > whisper_lang_max_id()) {
        throw Error(ErrorCode::LookupFailed, "unknown language id " + std::to_string(id));
    }
}

int maxLanguageId() { return whisper_lang_max_id(); }

int languageId(const std::string& code) {
    detail::requireNoNul(code, "language code");

    const int id = whisper_lang_id(code.c_str());
    if (id < 0) throw Error(ErrorCode::LookupFailed, "unknown language \"" + code + "\"");
    return id;
}

std::string languageCode(int id) {
    requireKnownId(id);
    return std::string(detail::borrowNativeString(whisper_lang_str(id), "code of language " + std::to_string(id)));
}

std::string languageName(int id) {
    requireKnownId(id);
    return std::string(detail::borrowNativeString(whisper_lang_str_full(id), "name of language " + std::to_string(id)));
}

std::string systemInfo() {
    return std::string(detail::borrowNativeString(whisper_print_system_info(), "system info"));
}

} // namespace safewhisper
