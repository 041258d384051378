#ifndef SAFEWHISPER_TOKEN_HPP
#define SAFEWHISPER_TOKEN_HPP

#include <cstdint>

namespace safewhisper {

// Same width as whisper_token.
using TokenId = int32_t;

// Per-token decoding data copied out of a finished run.
struct TokenData {
    TokenId id = 0;
    TokenId timestampId = 0;

    float probability = 0.0f;
    float logProbability = 0.0f;
    float timestampProbability = 0.0f;
    float timestampProbabilitySum = 0.0f;

    // Centiseconds, -1 unless token timestamps were requested.
    int64_t t0 = -1;
    int64_t t1 = -1;

    float voiceLength = 0.0f;
};

} // namespace safewhisper

#endif
