#ifndef SAFEWHISPER_MODEL_PROPERTY_TABLE_HPP
#define SAFEWHISPER_MODEL_PROPERTY_TABLE_HPP

#include "safewhisper/model_property.hpp"
#include "safewhisper/token.hpp"

struct whisper_context;

namespace safewhisper {
namespace detail {

int readModelProperty(whisper_context* ctx, ModelProperty property) noexcept;
TokenId readSpecialToken(whisper_context* ctx, SpecialToken token) noexcept;

} // namespace detail
} // namespace safewhisper

#endif
