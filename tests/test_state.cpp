#include "safewhisper/context.hpp"
#include "safewhisper/error.hpp"
#include "safewhisper/language.hpp"
#include "safewhisper/state.hpp"
#include "test_model.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace safewhisper;

namespace {

FullParams quickParams() {
    FullParams params;
    params.threads = 2;
    params.language = "en";
    return params;
}

} // namespace

class StateTest : public test::ModelTest {};

TEST_F(StateTest, StateKeepsModelAliveAfterContextIsGone) {
    std::unique_ptr<State> state;
    {
        Context ctx(test::modelPath());
        state = std::make_unique<State>(ctx);
    }

    ASSERT_NO_THROW(state->full(quickParams(), test::silence()));
    EXPECT_GE(state->segmentCount(), 0);
    EXPECT_GT(state->melLength(), 0);
}

TEST_F(StateTest, CreateStateFromContext) {
    State a = context().createState();
    State b = context().createState();

    EXPECT_EQ(a.segmentCount(), 0);
    EXPECT_EQ(b.segmentCount(), 0);
}

TEST_F(StateTest, FullRejectsInvalidInput) {
    State state(context());

    try {
        state.full(quickParams(), std::vector<float>());
        FAIL() << "expected InvalidArgument";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }

    FullParams params = quickParams();
    params.threads = 0;
    try {
        state.full(params, test::silence());
        FAIL() << "expected InvalidArgument";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}

TEST_F(StateTest, TranscribeOfNothingIsEmpty) {
    State state(context());
    EXPECT_EQ(state.transcribe(std::vector<float>()), "");
}

TEST_F(StateTest, SegmentCallbackSeesEverySegment) {
    State state(context());

    std::vector<Segment> seen;
    FullParams params = quickParams();
    params.onSegment = [&](const Segment& seg) { seen.push_back(seg); };

    state.full(params, test::silence(2000));

    ASSERT_EQ(static_cast<int>(seen.size()), state.segmentCount());
    std::string joined;
    for (std::size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i].index, static_cast<int>(i));
        EXPECT_EQ(seen[i].text, state.segmentBytes(static_cast<int>(i)));
        EXPECT_LE(seen[i].start, seen[i].end);
        joined += seen[i].text;
    }
    EXPECT_EQ(state.text(), joined);
}

TEST_F(StateTest, CallbackExceptionIsRethrownAfterRun) {
    State state(context());

    bool called = false;
    FullParams params = quickParams();
    params.onProgress = [&](int) {
        called = true;
        throw std::runtime_error("stop");
    };

    try {
        state.full(params, test::silence());
        EXPECT_FALSE(called);
    } catch (const std::runtime_error& e) {
        EXPECT_TRUE(called);
        EXPECT_STREQ(e.what(), "stop");
    }
}

TEST_F(StateTest, ResultIndicesAreRangeChecked) {
    State state(context());
    state.full(quickParams(), test::silence());

    const int n = state.segmentCount();
    EXPECT_THROW(state.segment(-1), Error);
    EXPECT_THROW(state.segment(n), Error);
    EXPECT_THROW(state.segmentText(n), Error);
    EXPECT_THROW(state.tokenCount(n), Error);
    EXPECT_THROW(state.tokenId(n, 0), Error);

    for (int i = 0; i < n; ++i) {
        const int tokens = state.tokenCount(i);
        EXPECT_THROW(state.tokenData(i, tokens), Error);
        for (int j = 0; j < tokens; ++j) {
            const TokenData data = state.tokenData(i, j);
            EXPECT_EQ(data.id, state.tokenId(i, j));
            EXPECT_GE(data.probability, 0.0f);
            EXPECT_LE(data.probability, 1.0f);
            EXPECT_FLOAT_EQ(state.tokenProbability(i, j), data.probability);
        }
    }
}

TEST_F(StateTest, SetMelValidatesShape) {
    State state(context());
    const int bands = context().property(ModelProperty::ModelMels);

    EXPECT_THROW(state.setMel(std::vector<float>(), bands), Error);
    EXPECT_THROW(state.setMel(std::vector<float>(3, 0.0f), 2), Error);
    EXPECT_THROW(state.setMel(std::vector<float>(4, 0.0f), 0), Error);

    EXPECT_NO_THROW(state.setMel(std::vector<float>(static_cast<std::size_t>(bands) * 100, 0.0f), bands));
    EXPECT_GT(state.melLength(), 0);
}

TEST_F(StateTest, IncrementalEncodeAndDecode) {
    State state(context());

    state.pcmToMel(test::silence(), 2);
    EXPECT_GT(state.melLength(), 0);

    EXPECT_NO_THROW(state.encode(0, 2));
    EXPECT_NO_THROW(state.decode({context().specialToken(SpecialToken::StartOfText)}, 0, 2));

    EXPECT_THROW(state.decode({}, 0, 2), Error);
    EXPECT_THROW(state.encode(0, 0), Error);
    EXPECT_THROW(state.pcmToMel(std::vector<float>(), 2), Error);
}

TEST_F(StateTest, LanguageDetectionNeedsMel) {
    State state(context());
    try {
        state.detectLanguage(0, 2);
        FAIL() << "expected NativeCallFailed";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NativeCallFailed);
        EXPECT_LT(e.nativeCode(), 0);
    }
}

TEST_F(StateTest, LanguageDetectionOnMultilingualModel) {
    if (!context().isMultilingual()) GTEST_SKIP() << "model is English-only";

    State state(context());
    state.pcmToMel(test::silence(), 2);

    const LanguageDetection detected = state.detectLanguage(0, 2);
    EXPECT_GE(detected.id, 0);
    EXPECT_LE(detected.id, maxLanguageId());
    EXPECT_EQ(detected.code, languageCode(detected.id));
    EXPECT_EQ(detected.probabilities.size(), static_cast<std::size_t>(maxLanguageId()) + 1);
}
