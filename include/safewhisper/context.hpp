#ifndef SAFEWHISPER_CONTEXT_HPP
#define SAFEWHISPER_CONTEXT_HPP

#include "safewhisper/context_params.hpp"
#include "safewhisper/model_property.hpp"
#include "safewhisper/state.hpp"
#include "safewhisper/token.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct whisper_context;

namespace safewhisper {

// A loaded model.
//
// Neither copyable nor movable, so a Context is valid for as long as it is
// in scope; wrap it in a smart pointer to share or relocate it. The native
// model is released when the Context and every State created from it are
// gone, in whichever order that happens.
//
// The const members only read model memory and may be called from several
// threads at once. resetDiagnostics writes the engine's timing counters and
// needs exclusive access.
class Context {
public:
    explicit Context(const std::string& modelPath, const ContextParams& params = ContextParams());

    // The buffer is parsed during the call and may be released afterwards.
    Context(const void* data, std::size_t size, const ContextParams& params = ContextParams());
    explicit Context(const std::vector<uint8_t>& buffer, const ContextParams& params = ContextParams());
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    static Context fromFile(const std::string& modelPath, const ContextParams& params = ContextParams());

    static Context fromBuffer(const void* data, std::size_t size,
                              const ContextParams& params = ContextParams());
    static Context fromBuffer(const std::vector<uint8_t>& buffer,
                              const ContextParams& params = ContextParams());

    State createState() const;

    // Returns at most maxTokens ids. Throws TokenizationOverflow when the
    // text needs more than that.
    std::vector<TokenId> tokenize(std::string_view text, int maxTokens) const;

    // Views into the model vocabulary, valid while the model is loaded.
    std::string_view tokenToText(TokenId token) const;
    std::string_view tokenToBytes(TokenId token) const;

    std::string modelTypeDescription() const;

    int property(ModelProperty property) const noexcept;
    TokenId specialToken(SpecialToken token) const noexcept;
    TokenId languageToken(int languageId) const noexcept;
    bool isMultilingual() const noexcept;

    // Engine timing counters, printed through the engine's logger.
    void printDiagnostics() const;
    void resetDiagnostics();

private:
    friend class State;

    explicit Context(std::shared_ptr<whisper_context> model);

    static std::shared_ptr<whisper_context> adoptModel(whisper_context* raw, const std::string& source);
    static std::shared_ptr<whisper_context> loadBuffer(const void* data, std::size_t size, const ContextParams& params);

    std::shared_ptr<whisper_context> model_;
};

} // namespace safewhisper

#endif
