#include "run_callbacks.hpp"

#include "native_string.hpp"

#include <algorithm>
#include <string>

namespace safewhisper {
namespace detail {

Segment readSegment(whisper_state* state, int index) {
    Segment seg;
    seg.index = index;
    seg.start = whisper_full_get_segment_t0_from_state(state, index);
    seg.end = whisper_full_get_segment_t1_from_state(state, index);
    seg.text = std::string(borrowNativeString(whisper_full_get_segment_text_from_state(state, index),
                                              "text of segment " + std::to_string(index)));
    seg.speakerTurnNext = whisper_full_get_segment_speaker_turn_next_from_state(state, index);
    return seg;
}

namespace {

void onNewSegment(whisper_context* /*ctx*/, whisper_state* state, int newSegments, void* userData) {
    auto* bridge = static_cast<CallbackBridge*>(userData);
    if (bridge->error) return;

    try {
        const int n = whisper_full_n_segments_from_state(state);
        for (int i = std::max(0, n - newSegments); i < n; ++i) {
            bridge->params->onSegment(readSegment(state, i));
        }
    } catch (...) {
        bridge->error = std::current_exception();
    }
}

void onProgress(whisper_context* /*ctx*/, whisper_state* /*state*/, int percent, void* userData) {
    auto* bridge = static_cast<CallbackBridge*>(userData);
    if (bridge->error) return;

    try {
        bridge->params->onProgress(percent);
    } catch (...) {
        bridge->error = std::current_exception();
    }
}

bool shouldAbort(void* userData) {
    return static_cast<const CallbackBridge*>(userData)->error != nullptr;
}

} // namespace

void bindCallbacks(whisper_full_params& native, CallbackBridge& bridge) {
    if (bridge.params && bridge.params->onSegment) {
        native.new_segment_callback = &onNewSegment;
        native.new_segment_callback_user_data = &bridge;
    }
    if (bridge.params && bridge.params->onProgress) {
        native.progress_callback = &onProgress;
        native.progress_callback_user_data = &bridge;
    }
    native.abort_callback = &shouldAbort;
    native.abort_callback_user_data = &bridge;
}

} // namespace detail
} // namespace safewhisper
