#include "livescribe/asr/default_backends.hpp"
#include "livescribe/asr/remote_asr.hpp"
#include "livescribe/asr/whisper_asr.hpp"

namespace livescribe {

BackendFactories default_backend_factories(int whisper_threads) {
    BackendFactories f;
    f[static_cast<std::size_t>(Mode::OnDevice)] = [whisper_threads](const BackendParams& p) {
        WhisperASR::Config c;
        c.model = p.model.empty() ? default_model_for(Mode::OnDevice) : p.model;
        c.thread_count = whisper_threads;
        return std::unique_ptr<TranscriptionBackend>(std::make_unique<WhisperASR>(c));
    };
    f[static_cast<std::size_t>(Mode::RemoteA)] = [](const BackendParams& p) {
        return std::unique_ptr<TranscriptionBackend>(std::make_unique<OpenAIASR>(p.api_key, p.model));
    };
    f[static_cast<std::size_t>(Mode::RemoteB)] = [](const BackendParams& p) {
        return std::unique_ptr<TranscriptionBackend>(std::make_unique<ElevenLabsASR>(p.api_key, p.model));
    };
    return f;
}

} // namespace livescribe
