#ifndef SAFEWHISPER_NATIVE_PARAMS_HPP
#define SAFEWHISPER_NATIVE_PARAMS_HPP

#include "safewhisper/context_params.hpp"
#include "safewhisper/full_params.hpp"

#include <whisper.h>

namespace safewhisper {
namespace detail {

whisper_context_params toNativeParams(const ContextParams& params);

// Validates params and maps them onto whisper_full_params. The result points
// into params (language, prompt) and must not outlive it. Callbacks are not set.
whisper_full_params toNativeParams(const FullParams& params);

} // namespace detail
} // namespace safewhisper

#endif
