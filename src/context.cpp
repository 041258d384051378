#include "safewhisper/context.hpp"

#include "model_property_table.hpp"
#include "native_params.hpp"
#include "native_string.hpp"
#include "safewhisper/error.hpp"
#include "safewhisper/log.hpp"

#include <whisper.h>

#include <algorithm>
#include <type_traits>
#include <utility>

namespace safewhisper {

static_assert(std::is_same<TokenId, whisper_token>::value, "TokenId must match whisper_token");

static const char* kComponent = "Context";

static std::string describeModel(whisper_context* ctx) {
    return std::string(detail::borrowNativeText(whisper_model_type_readable(ctx), "model type"));
}

std::shared_ptr<whisper_context> Context::adoptModel(whisper_context* raw, const std::string& source) {
    if (!raw) {
        log(LogLevel::Error, kComponent, "failed to load model from " + source);
        throw Error(ErrorCode::InitializationError, "failed to load model from " + source);
    }

    return std::shared_ptr<whisper_context>(raw, [](whisper_context* ctx) { whisper_free(ctx); });
}

// Constructor
Context::Context(const std::string& modelPath, const ContextParams& params) {
    detail::requireNoNul(modelPath, "model path");

    const whisper_context_params cparams = detail::toNativeParams(params);
    model_ = adoptModel(whisper_init_from_file_with_params_no_state(modelPath.c_str(), cparams), modelPath);

    log(LogLevel::Info, kComponent, "loaded model from " + modelPath + " (" + describeModel(model_.get()) + ")");
}

Context::Context(std::shared_ptr<whisper_context> model) : model_(std::move(model)) {}

// Destructor
Context::~Context() = default;

Context Context::fromFile(const std::string& modelPath, const ContextParams& params) {
    return Context(modelPath, params);
}

std::shared_ptr<whisper_context> Context::loadBuffer(const void* data, std::size_t size,
                                                    const ContextParams& params) {
    const std::string source = "memory buffer (" + std::to_string(size) + " bytes)";
    if (!data || size == 0) {
        log(LogLevel::Error, kComponent, "failed to load model from empty " + source);
        throw Error(ErrorCode::InitializationError, "failed to load model from empty " + source);
    }

    const whisper_context_params cparams = detail::toNativeParams(params);

    // The loader only reads from the buffer; the API takes it as non-const.
    whisper_context* raw =
        whisper_init_from_buffer_with_params_no_state(const_cast<void*>(data), size, cparams);

    std::shared_ptr<whisper_context> model = adoptModel(raw, source);
    log(LogLevel::Info, kComponent, "loaded model from " + source + " (" + describeModel(model.get()) + ")");
    return model;
}

Context::Context(const void* data, std::size_t size, const ContextParams& params)
    : model_(loadBuffer(data, size, params)) {}

Context::Context(const std::vector<uint8_t>& buffer, const ContextParams& params)
    : Context(buffer.data(), buffer.size(), params) {}

Context Context::fromBuffer(const void* data, std::size_t size, const ContextParams& params) {
    return Context(data, size, params);
}

Context Context::fromBuffer(const std::vector<uint8_t>& buffer, const ContextParams& params) {
    return Context(buffer, params);
}

State Context::createState() const { return State(*this); }

std::vector<TokenId> Context::tokenize(std::string_view text, int maxTokens) const {
    detail::requireNoNul(text, "text");
    if (maxTokens < 0) {
        throw Error(ErrorCode::InvalidArgument, "maxTokens must not be negative, got " + std::to_string(maxTokens));
    }

    // Every token covers at least one byte of text.
    const int capacity = static_cast<int>(std::min<std::size_t>(static_cast<std::size_t>(maxTokens), text.size()));

    const std::string terminated(text);
    std::vector<TokenId> tokens(static_cast<std::size_t>(capacity));

    const int n = whisper_tokenize(model_.get(), terminated.c_str(), tokens.data(), capacity);
    if (n < 0) {
        // Older engines return -1; newer ones return minus the required count.
        std::string message = "text does not fit in " + std::to_string(maxTokens) + " tokens";
        if (n < -1) message += " (needs " + std::to_string(-n) + ")";
        log(LogLevel::Warn, kComponent, message);
        throw Error(ErrorCode::TokenizationOverflow, message);
    }

    tokens.resize(static_cast<std::size_t>(n));
    return tokens;
}

std::string_view Context::tokenToBytes(TokenId token) const {
    // whisper_token_to_str throws across the C boundary for unknown ids.
    const int vocab = property(ModelProperty::Vocab);
    if (token < 0 || token >= vocab) {
        throw Error(ErrorCode::LookupFailed,
                    "token " + std::to_string(token) + " is outside the vocabulary [0, " + std::to_string(vocab) + ")");
    }
    return detail::borrowNativeString(whisper_token_to_str(model_.get(), token),
                                      "text of token " + std::to_string(token));
}

std::string_view Context::tokenToText(TokenId token) const {
    const std::string_view bytes = tokenToBytes(token);
    return detail::borrowNativeText(bytes.data(), "text of token " + std::to_string(token));
}

std::string Context::modelTypeDescription() const { return describeModel(model_.get()); }

int Context::property(ModelProperty property) const noexcept {
    return detail::readModelProperty(model_.get(), property);
}

TokenId Context::specialToken(SpecialToken token) const noexcept {
    return detail::readSpecialToken(model_.get(), token);
}

TokenId Context::languageToken(int languageId) const noexcept {
    return whisper_token_lang(model_.get(), languageId);
}

bool Context::isMultilingual() const noexcept { return whisper_is_multilingual(model_.get()) != 0; }

void Context::printDiagnostics() const { whisper_print_timings(model_.get()); }

void Context::resetDiagnostics() { whisper_reset_timings(model_.get()); }

} // namespace safewhisper
