#ifndef SAFEWHISPER_RUN_CALLBACKS_HPP
#define SAFEWHISPER_RUN_CALLBACKS_HPP

#include "safewhisper/full_params.hpp"
#include "safewhisper/segment.hpp"

#include <whisper.h>

#include <exception>

namespace safewhisper {
namespace detail {

// Copies segment `index` out of a finished or running state.
Segment readSegment(whisper_state* state, int index);

// Carries user callbacks through the engine's C callbacks. An exception from
// a callback is parked here, stops the run and is rethrown by State::full
// once the engine has returned.
struct CallbackBridge {
    const FullParams* params = nullptr;
    std::exception_ptr error;
};

// Points the native callbacks of `native` at `bridge`. The abort callback is
// always set; the others only when params has a matching user callback.
void bindCallbacks(whisper_full_params& native, CallbackBridge& bridge);

} // namespace detail
} // namespace safewhisper

#endif
