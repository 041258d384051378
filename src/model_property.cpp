#include "model_property_table.hpp"

#include <whisper.h>

#include <iterator>

namespace safewhisper {

namespace {

struct PropertyEntry {
    ModelProperty property;
    std::string_view name;
    int (*read)(whisper_context*);
};

struct SpecialTokenEntry {
    SpecialToken token;
    std::string_view name;
    whisper_token (*read)(whisper_context*);
};

// One row per native accessor. Adding a property means adding a row here.
const PropertyEntry kProperties[] = {
    {ModelProperty::Vocab, "n_vocab", [](whisper_context* c) { return whisper_n_vocab(c); }},
    {ModelProperty::TextContext, "n_text_ctx", [](whisper_context* c) { return whisper_n_text_ctx(c); }},
    {ModelProperty::AudioContext, "n_audio_ctx", [](whisper_context* c) { return whisper_n_audio_ctx(c); }},
    {ModelProperty::ModelVocab, "model_n_vocab", [](whisper_context* c) { return whisper_model_n_vocab(c); }},
    {ModelProperty::ModelAudioContext, "model_n_audio_ctx", [](whisper_context* c) { return whisper_model_n_audio_ctx(c); }},
    {ModelProperty::ModelAudioState, "model_n_audio_state", [](whisper_context* c) { return whisper_model_n_audio_state(c); }},
    {ModelProperty::ModelAudioHead, "model_n_audio_head", [](whisper_context* c) { return whisper_model_n_audio_head(c); }},
    {ModelProperty::ModelAudioLayer, "model_n_audio_layer", [](whisper_context* c) { return whisper_model_n_audio_layer(c); }},
    {ModelProperty::ModelTextContext, "model_n_text_ctx", [](whisper_context* c) { return whisper_model_n_text_ctx(c); }},
    {ModelProperty::ModelTextState, "model_n_text_state", [](whisper_context* c) { return whisper_model_n_text_state(c); }},
    {ModelProperty::ModelTextHead, "model_n_text_head", [](whisper_context* c) { return whisper_model_n_text_head(c); }},
    {ModelProperty::ModelTextLayer, "model_n_text_layer", [](whisper_context* c) { return whisper_model_n_text_layer(c); }},
    {ModelProperty::ModelMels, "model_n_mels", [](whisper_context* c) { return whisper_model_n_mels(c); }},
    {ModelProperty::ModelFtype, "model_ftype", [](whisper_context* c) { return whisper_model_ftype(c); }},
    {ModelProperty::ModelType, "model_type", [](whisper_context* c) { return whisper_model_type(c); }},
};

const SpecialTokenEntry kSpecialTokens[] = {
    {SpecialToken::EndOfText, "eot", [](whisper_context* c) { return whisper_token_eot(c); }},
    {SpecialToken::StartOfText, "sot", [](whisper_context* c) { return whisper_token_sot(c); }},
    {SpecialToken::StartOfLm, "solm", [](whisper_context* c) { return whisper_token_solm(c); }},
    {SpecialToken::Previous, "prev", [](whisper_context* c) { return whisper_token_prev(c); }},
    {SpecialToken::NoSpeech, "nosp", [](whisper_context* c) { return whisper_token_nosp(c); }},
    {SpecialToken::NoTimestamps, "not", [](whisper_context* c) { return whisper_token_not(c); }},
    {SpecialToken::Begin, "beg", [](whisper_context* c) { return whisper_token_beg(c); }},
    {SpecialToken::Translate, "translate", [](whisper_context* c) { return whisper_token_translate(c); }},
    {SpecialToken::Transcribe, "transcribe", [](whisper_context* c) { return whisper_token_transcribe(c); }},
};

const PropertyEntry& entryFor(ModelProperty property) noexcept {
    for (const auto& e : kProperties) {
        if (e.property == property) return e;
    }
    return kProperties[0];
}

const SpecialTokenEntry& entryFor(SpecialToken token) noexcept {
    for (const auto& e : kSpecialTokens) {
        if (e.token == token) return e;
    }
    return kSpecialTokens[0];
}

} // namespace

std::string_view name(ModelProperty property) noexcept { return entryFor(property).name; }

std::string_view name(SpecialToken token) noexcept { return entryFor(token).name; }

const std::vector<ModelProperty>& modelProperties() {
    static const std::vector<ModelProperty> all = [] {
        std::vector<ModelProperty> v;
        v.reserve(std::size(kProperties));
        for (const auto& e : kProperties) v.push_back(e.property);
        return v;
    }();
    return all;
}

const std::vector<SpecialToken>& specialTokens() {
    static const std::vector<SpecialToken> all = [] {
        std::vector<SpecialToken> v;
        v.reserve(std::size(kSpecialTokens));
        for (const auto& e : kSpecialTokens) v.push_back(e.token);
        return v;
    }();
    return all;
}

std::optional<ModelProperty> findModelProperty(std::string_view name) {
    for (const auto& e : kProperties) {
        if (e.name == name) return e.property;
    }
    return std::nullopt;
}

std::optional<SpecialToken> findSpecialToken(std::string_view name) {
    for (const auto& e : kSpecialTokens) {
        if (e.name == name) return e.token;
    }
    return std::nullopt;
}

namespace detail {

int readModelProperty(whisper_context* ctx, ModelProperty property) noexcept {
    return entryFor(property).read(ctx);
}

TokenId readSpecialToken(whisper_context* ctx, SpecialToken token) noexcept {
    return entryFor(token).read(ctx);
}

} // namespace detail
} // namespace safewhisper
