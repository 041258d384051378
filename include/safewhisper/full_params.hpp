#ifndef SAFEWHISPER_FULL_PARAMS_HPP
#define SAFEWHISPER_FULL_PARAMS_HPP

#include "safewhisper/segment.hpp"
#include "safewhisper/token.hpp"

#include <functional>
#include <string>
#include <vector>

namespace safewhisper {

enum class SamplingStrategy { Greedy, BeamSearch };

// Parameters of a full transcription run. Defaults match whisper.cpp except
// for the print flags, which are off.
struct FullParams {
    SamplingStrategy strategy = SamplingStrategy::Greedy;
    int bestOf = 5;       // greedy only
    int beamSize = 5;     // beam search only
    float patience = -1.0f;

    int threads = 4;
    int maxTextContext = 16384;
    int offsetMs = 0;
    int durationMs = 0;   // 0 = until the end

    bool translate = false;
    bool noContext = true;
    bool noTimestamps = false;
    bool singleSegment = false;

    bool printSpecial = false;
    bool printProgress = false;
    bool printRealtime = false;
    bool printTimestamps = false;

    bool tokenTimestamps = false;
    float timestampTokenThreshold = 0.01f;
    float timestampSumThreshold = 0.01f;
    int maxLength = 0;    // characters per segment, 0 = unlimited
    bool splitOnWord = false;
    int maxTokens = 0;    // tokens per segment, 0 = unlimited

    int audioContext = 0; // 0 = model default
    bool tinydiarize = false;

    std::string initialPrompt;
    std::vector<TokenId> promptTokens;

    // "auto" or empty = detect.
    std::string language = "en";
    bool detectLanguage = false;

    bool suppressBlank = true;

    float temperature = 0.0f;
    float maxInitialTimestamp = 1.0f;
    float lengthPenalty = -1.0f;
    float temperatureIncrement = 0.2f;
    float entropyThreshold = 2.4f;
    float logprobThreshold = -1.0f;
    float noSpeechThreshold = 0.6f;

    // Invoked on the calling thread from inside State::full. An exception
    // thrown here stops further callbacks and is rethrown once the engine returns.
    std::function<void(const Segment& segment)> onSegment;
    std::function<void(int percent)> onProgress;
};

} // namespace safewhisper

#endif
