#ifndef SAFEWHISPER_SAFEWHISPER_HPP
#define SAFEWHISPER_SAFEWHISPER_HPP

#include "safewhisper/context.hpp"
#include "safewhisper/context_params.hpp"
#include "safewhisper/error.hpp"
#include "safewhisper/full_params.hpp"
#include "safewhisper/language.hpp"
#include "safewhisper/log.hpp"
#include "safewhisper/model_property.hpp"
#include "safewhisper/segment.hpp"
#include "safewhisper/state.hpp"
#include "safewhisper/token.hpp"
#include "safewhisper/utf8.hpp"

#endif
