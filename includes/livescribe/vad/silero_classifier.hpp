#pragma once
#include "livescribe/vad/audio_history.hpp"
#include "livescribe/vad/speech_classifier.hpp"

#include <memory>
#include <string>

struct whisper_vad_context;

namespace livescribe {

// Silero VAD through whisper.cpp. 16 kHz only. whisper_vad_detect_speech()
// starts from a zeroed LSTM state on every call, so each window is scored
// at the end of the last ~0.5 s of audio.
class SileroClassifier : public SpeechClassifier {
public:
    // Throws std::runtime_error if the model cannot be loaded or probed.
    SileroClassifier(const std::string& model_path, int sample_rate, int n_threads = 1);
    ~SileroClassifier() override;

    float probability(const float* window, std::size_t n) override;
    void reset() override;

    static ClassifierFactory factory(const std::string& model_path);

private:
    struct ContextDeleter {
        void operator()(whisper_vad_context* ctx) const;
    };
    static constexpr std::size_t kHistorySamples = 16 * 512;

    std::unique_ptr<whisper_vad_context, ContextDeleter> ctx_;
    AudioHistory history_{kHistorySamples};
};

} // namespace livescribe
