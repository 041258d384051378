#include "native_params.hpp"

#include "native_string.hpp"
#include "safewhisper/error.hpp"

#include <string>

namespace safewhisper {
namespace detail {

whisper_context_params toNativeParams(const ContextParams& params) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = params.useGpu;
    cparams.flash_attn = params.flashAttn;
    cparams.gpu_device = params.gpuDevice;
    return cparams;
}

static void requireAtLeastOne(int value, const char* what) {
    if (value < 1) {
        throw Error(ErrorCode::InvalidArgument,
                    std::string(what) + " must be at least 1, got " + std::to_string(value));
    }
}

whisper_full_params toNativeParams(const FullParams& params) {
    requireAtLeastOne(params.threads, "threads");
    if (params.strategy == SamplingStrategy::Greedy) {
        requireAtLeastOne(params.bestOf, "bestOf");
    } else {
        requireAtLeastOne(params.beamSize, "beamSize");
    }
    requireNoNul(params.language, "language");
    requireNoNul(params.initialPrompt, "initialPrompt");

    const whisper_sampling_strategy strategy =
        params.strategy == SamplingStrategy::BeamSearch ? WHISPER_SAMPLING_BEAM_SEARCH
                                                        : WHISPER_SAMPLING_GREEDY;

    whisper_full_params fp = whisper_full_default_params(strategy);

    fp.n_threads = params.threads;
    fp.n_max_text_ctx = params.maxTextContext;
    fp.offset_ms = params.offsetMs;
    fp.duration_ms = params.durationMs;

    fp.translate = params.translate;
    fp.no_context = params.noContext;
    fp.no_timestamps = params.noTimestamps;
    fp.single_segment = params.singleSegment;

    fp.print_special = params.printSpecial;
    fp.print_progress = params.printProgress;
    fp.print_realtime = params.printRealtime;
    fp.print_timestamps = params.printTimestamps;

    fp.token_timestamps = params.tokenTimestamps;
    fp.thold_pt = params.timestampTokenThreshold;
    fp.thold_ptsum = params.timestampSumThreshold;
    fp.max_len = params.maxLength;
    fp.split_on_word = params.splitOnWord;
    fp.max_tokens = params.maxTokens;

    fp.audio_ctx = params.audioContext;
    fp.tdrz_enable = params.tinydiarize;

    fp.initial_prompt = params.initialPrompt.empty() ? nullptr : params.initialPrompt.c_str();
    fp.prompt_tokens = params.promptTokens.empty() ? nullptr : params.promptTokens.data();
    fp.prompt_n_tokens = static_cast<int>(params.promptTokens.size());

    fp.language = params.language.c_str();
    fp.detect_language = params.detectLanguage;

    fp.suppress_blank = params.suppressBlank;

    fp.temperature = params.temperature;
    fp.max_initial_ts = params.maxInitialTimestamp;
    fp.length_penalty = params.lengthPenalty;
    fp.temperature_inc = params.temperatureIncrement;
    fp.entropy_thold = params.entropyThreshold;
    fp.logprob_thold = params.logprobThreshold;
    fp.no_speech_thold = params.noSpeechThreshold;

    fp.greedy.best_of = params.bestOf;
    fp.beam_search.beam_size = params.beamSize;
    fp.beam_search.patience = params.patience;

    return fp;
}

} // namespace detail
} // namespace safewhisper
