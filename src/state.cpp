#include "safewhisper/state.hpp"

#include "native_params.hpp"
#include "native_string.hpp"
#include "run_callbacks.hpp"
#include "safewhisper/context.hpp"
#include "safewhisper/error.hpp"
#include "safewhisper/language.hpp"
#include "safewhisper/log.hpp"

#include <whisper.h>

#include <climits>
#include <exception>

namespace safewhisper {

static const char* kComponent = "State";

static void requireThreads(int threads) {
    if (threads < 1) {
        throw Error(ErrorCode::InvalidArgument, "threads must be at least 1, got " + std::to_string(threads));
    }
}

static int toCount(std::size_t count, const char* what) {
    if (count > static_cast<std::size_t>(INT_MAX)) {
        throw Error(ErrorCode::InvalidArgument, std::string("too many ") + what + ": " + std::to_string(count));
    }
    return static_cast<int>(count);
}

static void checkStatus(int rc, const char* call) {
    if (rc != 0) {
        throw Error(ErrorCode::NativeCallFailed, std::string(call) + " failed with code " + std::to_string(rc), rc);
    }
}

void State::StateDeleter::operator()(whisper_state* state) const noexcept { whisper_free_state(state); }

// Constructor
State::State(const Context& context) : model_(context.model_) {
    whisper_state* raw = whisper_init_state(model_.get());
    if (!raw) {
        log(LogLevel::Error, kComponent, "whisper_init_state returned null");
        throw Error(ErrorCode::InitializationError, "failed to allocate transcription state");
    }
    state_.reset(raw);
    log(LogLevel::Debug, kComponent, "state allocated");
}

// Destructor
State::~State() = default;

void State::full(const FullParams& params, const std::vector<float>& pcm) {
    full(params, pcm.data(), pcm.size());
}

void State::full(const FullParams& params, const float* samples, std::size_t count) {
    if (!samples || count == 0) throw Error(ErrorCode::InvalidArgument, "no audio samples");

    whisper_full_params fp = detail::toNativeParams(params);

    detail::CallbackBridge bridge;
    bridge.params = &params;
    detail::bindCallbacks(fp, bridge);

    const int rc = whisper_full_with_state(model_.get(), state_.get(), fp, samples, toCount(count, "samples"));

    if (bridge.error) std::rethrow_exception(bridge.error);
    checkStatus(rc, "whisper_full_with_state");
}

std::string State::transcribe(const std::vector<float>& pcm, const FullParams& params) {
    if (pcm.empty()) return {};

    full(params, pcm);
    return text();
}

void State::pcmToMel(const std::vector<float>& pcm, int threads) {
    requireThreads(threads);
    if (pcm.empty()) throw Error(ErrorCode::InvalidArgument, "no audio samples");

    checkStatus(whisper_pcm_to_mel_with_state(model_.get(), state_.get(), pcm.data(), toCount(pcm.size(), "samples"), threads),
                "whisper_pcm_to_mel_with_state");
}

void State::setMel(const std::vector<float>& mel, int melBands) {
    if (melBands < 1) {
        throw Error(ErrorCode::InvalidArgument, "melBands must be at least 1, got " + std::to_string(melBands));
    }
    if (mel.empty() || mel.size() % static_cast<std::size_t>(melBands) != 0) {
        throw Error(ErrorCode::InvalidArgument,
                    "mel data of " + std::to_string(mel.size()) + " values is not a multiple of " +
                        std::to_string(melBands) + " bands");
    }

    const int frames = toCount(mel.size() / static_cast<std::size_t>(melBands), "mel frames");
    checkStatus(whisper_set_mel_with_state(model_.get(), state_.get(), mel.data(), frames, melBands),
                "whisper_set_mel_with_state");
}

void State::encode(int offset, int threads) {
    requireThreads(threads);
    if (offset < 0) throw Error(ErrorCode::InvalidArgument, "offset must not be negative");

    checkStatus(whisper_encode_with_state(model_.get(), state_.get(), offset, threads), "whisper_encode_with_state");
}

void State::decode(const std::vector<TokenId>& tokens, int nPast, int threads) {
    requireThreads(threads);
    if (tokens.empty()) throw Error(ErrorCode::InvalidArgument, "no tokens to decode");
    if (nPast < 0) throw Error(ErrorCode::InvalidArgument, "nPast must not be negative");

    checkStatus(whisper_decode_with_state(model_.get(), state_.get(), tokens.data(), toCount(tokens.size(), "tokens"),
                                          nPast, threads),
                "whisper_decode_with_state");
}

LanguageDetection State::detectLanguage(int offsetMs, int threads) {
    requireThreads(threads);
    if (offsetMs < 0) throw Error(ErrorCode::InvalidArgument, "offsetMs must not be negative");

    LanguageDetection result;
    result.probabilities.assign(static_cast<std::size_t>(maxLanguageId()) + 1, 0.0f);

    const int id = whisper_lang_auto_detect_with_state(model_.get(), state_.get(), offsetMs, threads,
                                                       result.probabilities.data());
    if (id < 0) {
        throw Error(ErrorCode::NativeCallFailed, "language detection failed with code " + std::to_string(id), id);
    }

    result.id = id;
    result.code = languageCode(id);
    return result;
}

int State::melLength() const { return whisper_n_len_from_state(state_.get()); }

int State::detectedLanguageId() const { return whisper_full_lang_id_from_state(state_.get()); }

int State::segmentCount() const { return whisper_full_n_segments_from_state(state_.get()); }

void State::checkSegment(int index) const {
    const int n = segmentCount();
    if (index < 0 || index >= n) {
        throw Error(ErrorCode::InvalidArgument,
                    "segment " + std::to_string(index) + " out of range [0, " + std::to_string(n) + ")");
    }
}

void State::checkToken(int segment, int token) const {
    checkSegment(segment);
    const int n = whisper_full_n_tokens_from_state(state_.get(), segment);
    if (token < 0 || token >= n) {
        throw Error(ErrorCode::InvalidArgument, "token " + std::to_string(token) + " of segment " +
                                                    std::to_string(segment) + " out of range [0, " +
                                                    std::to_string(n) + ")");
    }
}

Segment State::segment(int index) const {
    checkSegment(index);
    return detail::readSegment(state_.get(), index);
}

std::vector<Segment> State::segments() const {
    std::vector<Segment> out;
    const int n = segmentCount();
    out.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) out.push_back(detail::readSegment(state_.get(), i));
    return out;
}

std::string State::text() const {
    std::string out;
    const int n = segmentCount();
    for (int i = 0; i < n; ++i) out += segmentBytes(i);
    return out;
}

std::string State::segmentBytes(int index) const {
    checkSegment(index);
    return std::string(detail::borrowNativeString(whisper_full_get_segment_text_from_state(state_.get(), index),
                                                  "text of segment " + std::to_string(index)));
}

std::string State::segmentText(int index) const {
    checkSegment(index);
    return std::string(detail::borrowNativeText(whisper_full_get_segment_text_from_state(state_.get(), index),
                                                "text of segment " + std::to_string(index)));
}

int64_t State::segmentStart(int index) const {
    checkSegment(index);
    return whisper_full_get_segment_t0_from_state(state_.get(), index);
}

int64_t State::segmentEnd(int index) const {
    checkSegment(index);
    return whisper_full_get_segment_t1_from_state(state_.get(), index);
}

bool State::segmentSpeakerTurnNext(int index) const {
    checkSegment(index);
    return whisper_full_get_segment_speaker_turn_next_from_state(state_.get(), index);
}

int State::tokenCount(int segment) const {
    checkSegment(segment);
    return whisper_full_n_tokens_from_state(state_.get(), segment);
}

TokenId State::tokenId(int segment, int token) const {
    checkToken(segment, token);
    return whisper_full_get_token_id_from_state(state_.get(), segment, token);
}

std::string State::tokenBytes(int segment, int token) const {
    checkToken(segment, token);
    return std::string(detail::borrowNativeString(
        whisper_full_get_token_text_from_state(model_.get(), state_.get(), segment, token),
        "text of token " + std::to_string(token) + " in segment " + std::to_string(segment)));
}

std::string State::tokenText(int segment, int token) const {
    checkToken(segment, token);
    return std::string(detail::borrowNativeText(
        whisper_full_get_token_text_from_state(model_.get(), state_.get(), segment, token),
        "text of token " + std::to_string(token) + " in segment " + std::to_string(segment)));
}

TokenData State::tokenData(int segment, int token) const {
    checkToken(segment, token);
    const whisper_token_data raw = whisper_full_get_token_data_from_state(state_.get(), segment, token);

    TokenData data;
    data.id = raw.id;
    data.timestampId = raw.tid;
    data.probability = raw.p;
    data.logProbability = raw.plog;
    data.timestampProbability = raw.pt;
    data.timestampProbabilitySum = raw.ptsum;
    data.t0 = raw.t0;
    data.t1 = raw.t1;
    data.voiceLength = raw.vlen;
    return data;
}

float State::tokenProbability(int segment, int token) const {
    checkToken(segment, token);
    return whisper_full_get_token_p_from_state(state_.get(), segment, token);
}

} // namespace safewhisper
