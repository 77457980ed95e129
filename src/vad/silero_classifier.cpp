#include "livescribe/vad/silero_classifier.hpp"
#include "livescribe/core/log.hpp"

#include <whisper.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace livescribe {

void SileroClassifier::ContextDeleter::operator()(whisper_vad_context* ctx) const {
    if (ctx) whisper_vad_free(ctx);
}

SileroClassifier::SileroClassifier(const std::string& model_path, int sample_rate, int n_threads) {
    if (sample_rate != WHISPER_SAMPLE_RATE) {
        throw std::runtime_error("Silero VAD expects 16 kHz audio, got " + std::to_string(sample_rate));
    }
    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("VAD model not found: " + model_path);
    }

    whisper_vad_context_params params = whisper_vad_default_context_params();
    params.n_threads = std::max(1, n_threads);
    params.use_gpu = false;

    ctx_.reset(whisper_vad_init_from_file_with_params(model_path.c_str(), params));
    if (!ctx_) {
        throw std::runtime_error("Failed to load VAD model: " + model_path);
    }

    std::vector<float> probe(512, 0.0f);
    if (!whisper_vad_detect_speech(ctx_.get(), probe.data(), static_cast<int>(probe.size()))) {
        throw std::runtime_error("VAD model failed its probe run");
    }
    log::info("Silero VAD loaded: " + model_path);
}

SileroClassifier::~SileroClassifier() = default;

float SileroClassifier::probability(const float* window, std::size_t n) {
    if (!window || n == 0) {
        throw std::runtime_error("empty VAD window");
    }
    const std::vector<float>& audio = history_.append(window, n);
    if (!whisper_vad_detect_speech(ctx_.get(), audio.data(), static_cast<int>(audio.size()))) {
        throw std::runtime_error("whisper_vad_detect_speech failed");
    }
    const int n_probs = whisper_vad_n_probs(ctx_.get());
    const float* probs = whisper_vad_probs(ctx_.get());
    if (n_probs <= 0 || !probs) {
        throw std::runtime_error("VAD returned no probabilities");
    }
    return probs[n_probs - 1];
}

void SileroClassifier::reset() {
    history_.clear();
}

ClassifierFactory SileroClassifier::factory(const std::string& model_path) {
    return [model_path](int sample_rate) -> std::unique_ptr<SpeechClassifier> {
        return std::make_unique<SileroClassifier>(model_path, sample_rate);
    };
}

} // namespace livescribe
