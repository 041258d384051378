#ifndef SAFEWHISPER_STATE_HPP
#define SAFEWHISPER_STATE_HPP

#include "safewhisper/full_params.hpp"
#include "safewhisper/segment.hpp"
#include "safewhisper/token.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct whisper_context;
struct whisper_state;

namespace safewhisper {

class Context;

struct LanguageDetection {
    int id = -1;
    std::string code;

    // Indexed by language id, 0..maxLanguageId().
    std::vector<float> probabilities;
};

// Working memory of one transcription session.
//
// Holds a reference to the model of the Context it was created from, so
// the model stays loaded even if that Context is destroyed first.
//
// Not thread-safe: use one State per concurrent session. Results of a run
// stay readable until the next run on the same State.
class State {
public:
    explicit State(const Context& context);
    ~State();

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    // Complete pipeline: mel, encode, decode. Input is 16 kHz mono float PCM.
    void full(const FullParams& params, const std::vector<float>& pcm);
    void full(const FullParams& params, const float* samples, std::size_t count);

    // Runs full() and returns the concatenated segment text; empty input gives "".
    std::string transcribe(const std::vector<float>& pcm, const FullParams& params = FullParams());

    void pcmToMel(const std::vector<float>& pcm, int threads);
    void setMel(const std::vector<float>& mel, int melBands);
    void encode(int offset, int threads);
    void decode(const std::vector<TokenId>& tokens, int nPast, int threads);

    // Needs a mel spectrogram (pcmToMel or setMel) and a multilingual model.
    LanguageDetection detectLanguage(int offsetMs, int threads);

    int melLength() const;
    int detectedLanguageId() const;

    int segmentCount() const;
    Segment segment(int index) const;
    std::vector<Segment> segments() const;
    std::string text() const;

    std::string segmentText(int index) const;
    std::string segmentBytes(int index) const;
    int64_t segmentStart(int index) const;
    int64_t segmentEnd(int index) const;
    bool segmentSpeakerTurnNext(int index) const;

    int tokenCount(int segment) const;
    TokenId tokenId(int segment, int token) const;
    std::string tokenText(int segment, int token) const;
    std::string tokenBytes(int segment, int token) const;
    TokenData tokenData(int segment, int token) const;
    float tokenProbability(int segment, int token) const;

private:
    struct StateDeleter {
        void operator()(whisper_state* state) const noexcept;
    };

    void checkSegment(int index) const;
    void checkToken(int segment, int token) const;

    // Declared first so the native state is freed before the model reference.
    std::shared_ptr<whisper_context> model_;
    std::unique_ptr<whisper_state, StateDeleter> state_;
};

} // namespace safewhisper

#endif
