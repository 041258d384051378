#ifndef SAFEWHISPER_CONTEXT_PARAMS_HPP
#define SAFEWHISPER_CONTEXT_PARAMS_HPP

namespace safewhisper {

struct ContextParams {
    bool useGpu = false;
    bool flashAttn = false;
    int gpuDevice = 0;
};

} // namespace safewhisper

#endif
