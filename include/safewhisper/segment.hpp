#ifndef SAFEWHISPER_SEGMENT_HPP
#define SAFEWHISPER_SEGMENT_HPP

#include <cstdint>
#include <string>

namespace safewhisper {

// A transcribed segment, copied out of the run state.
struct Segment {
    int index = 0;

    // Centiseconds from the start of the submitted audio.
    int64_t start = 0;
    int64_t end = 0;

    // Raw engine bytes, normally UTF-8.
    std::string text;

    bool speakerTurnNext = false;
};

} // namespace safewhisper

#endif
