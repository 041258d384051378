#include "safewhisper/log.hpp"

#include <whisper.h>

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace safewhisper {

static std::atomic<LogLevel> g_level{LogLevel::Info};
static std::mutex g_sinkMutex;
static LogSink g_sink;

const char* toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "?";
}

static void consoleSink(LogLevel level, const std::string& component, const std::string& message) {
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << component << "] [" << toString(level) << "] " << message << std::endl;
}

void setLogLevel(LogLevel level) { g_level.store(level); }

LogLevel logLevel() { return g_level.load(); }

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_sink = std::move(sink);
}

void log(LogLevel level, const std::string& component, const std::string& message) {
    if (level == LogLevel::Off || level < g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (g_sink) {
        g_sink(level, component, message);
    } else {
        consoleSink(level, component, message);
    }
}

static LogLevel fromGgml(ggml_log_level level) {
    switch (level) {
        case GGML_LOG_LEVEL_ERROR: return LogLevel::Error;
        case GGML_LOG_LEVEL_WARN: return LogLevel::Warn;
        case GGML_LOG_LEVEL_INFO: return LogLevel::Info;
        case GGML_LOG_LEVEL_DEBUG: return LogLevel::Debug;
        default: return LogLevel::Debug;
    }
}

// Runs on whatever thread the engine logs from; must not throw into C code.
static void nativeLogCallback(ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text) return;

    std::string message(text);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) message.pop_back();
    if (message.empty()) return;

    try {
        log(fromGgml(level), "whisper", message);
    } catch (const std::exception& e) {
        std::cerr << "[whisper] [ERROR] log sink threw: " << e.what() << std::endl;
    }
}

void installNativeLogHook() { whisper_log_set(&nativeLogCallback, nullptr); }

void removeNativeLogHook() { whisper_log_set(nullptr, nullptr); }

} // namespace safewhisper
