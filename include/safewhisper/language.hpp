#ifndef SAFEWHISPER_LANGUAGE_HPP
#define SAFEWHISPER_LANGUAGE_HPP

#include <string>

namespace safewhisper {

// Largest valid language id; ids run from 0 to this value.
int maxLanguageId();

// "en" -> 0. Throws LookupFailed for unknown codes.
int languageId(const std::string& code);

// 0 -> "en". Throws LookupFailed for unknown ids.
std::string languageCode(int id);

// 0 -> "english". Throws LookupFailed for unknown ids.
std::string languageName(int id);

// Compute backends the engine was built with.
std::string systemInfo();

} // namespace safewhisper

#endif
