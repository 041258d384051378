#ifndef SAFEWHISPER_TEST_MODEL_HPP
#define SAFEWHISPER_TEST_MODEL_HPP

#include "safewhisper/context.hpp"
#include "safewhisper/log.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#ifndef SAFEWHISPER_DEFAULT_TEST_MODEL
#define SAFEWHISPER_DEFAULT_TEST_MODEL "models/whisper/ggml-tiny.en.bin"
#endif

namespace safewhisper {
namespace test {

inline std::string modelPath() {
    const char* env = std::getenv("SAFEWHISPER_TEST_MODEL");
    if (env && *env) return env;
    return SAFEWHISPER_DEFAULT_TEST_MODEL;
}

inline bool modelAvailable() {
    std::ifstream f(modelPath(), std::ios::binary);
    return f.good();
}

inline std::vector<uint8_t> readModelFile() {
    std::ifstream f(modelPath(), std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// One second of silence at 16 kHz.
inline std::vector<float> silence(int ms = 1000) {
    return std::vector<float>(static_cast<std::size_t>(16 * ms), 0.0f);
}

// Shares one loaded model across the tests of a suite; skips when the
// model file is not present.
class ModelTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        setLogLevel(LogLevel::Warn);
        if (modelAvailable()) context_ = std::make_unique<Context>(modelPath());
    }

    static void TearDownTestSuite() {
        context_.reset();
        setLogLevel(LogLevel::Info);
    }

    void SetUp() override {
        if (!context_) GTEST_SKIP() << "model not found at " << modelPath() << " (set SAFEWHISPER_TEST_MODEL)";
    }

    static const Context& context() { return *context_; }

private:
    static inline std::unique_ptr<Context> context_;
};

} // namespace test
} // namespace safewhisper

#endif
