#ifndef SAFEWHISPER_MODEL_PROPERTY_HPP
#define SAFEWHISPER_MODEL_PROPERTY_HPP

#include <optional>
#include <string_view>
#include <vector>

namespace safewhisper {

// Integer metadata of a loaded model.
enum class ModelProperty {
    Vocab,
    TextContext,
    AudioContext,
    ModelVocab,
    ModelAudioContext,
    ModelAudioState,
    ModelAudioHead,
    ModelAudioLayer,
    ModelTextContext,
    ModelTextState,
    ModelTextHead,
    ModelTextLayer,
    ModelMels,
    ModelFtype,
    ModelType
};

// Reserved tokens of the vocabulary.
enum class SpecialToken {
    EndOfText,
    StartOfText,
    StartOfLm,
    Previous,
    NoSpeech,
    NoTimestamps,
    Begin,
    Translate,
    Transcribe
};

// Names follow the whisper.cpp accessor suffix ("n_vocab", "model_n_mels", "eot", ...).
std::string_view name(ModelProperty property) noexcept;
std::string_view name(SpecialToken token) noexcept;

const std::vector<ModelProperty>& modelProperties();
const std::vector<SpecialToken>& specialTokens();

std::optional<ModelProperty> findModelProperty(std::string_view name);
std::optional<SpecialToken> findSpecialToken(std::string_view name);

} // namespace safewhisper

#endif
