#ifndef SAFEWHISPER_LOG_HPP
#define SAFEWHISPER_LOG_HPP

#include <functional>
#include <string>

namespace safewhisper {

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

using LogSink = std::function<void(LogLevel level,
                                   const std::string& component,
                                   const std::string& message)>;

const char* toString(LogLevel level) noexcept;

// Messages below this level are dropped before reaching the sink. Default: Info.
void setLogLevel(LogLevel level);
LogLevel logLevel();

// Replaces the console sink. Passing an empty sink restores it.
// The sink is called with an internal mutex held.
void setLogSink(LogSink sink);

void log(LogLevel level, const std::string& component, const std::string& message);

// Routes whisper.cpp / ggml output through the sink under the "whisper" component.
void installNativeLogHook();
void removeNativeLogHook();

} // namespace safewhisper

#endif
