#pragma once
#include "livescribe/asr/transcription.hpp"

#include <string>
#include <vector>

struct whisper_context;

namespace livescribe {

// On-device transcription with whisper.cpp.
class WhisperASR : public TranscriptionBackend {
public:
    struct Config {
        std::string model = "base";   // name ("base") or a path to a ggml .bin
        int thread_count = 4;
        bool translate_to_english = false;
    };

    // Loads the model. Throws BackendInitError if no candidate path loads.
    explicit WhisperASR(const Config& config);
    ~WhisperASR() override;

    WhisperASR(const WhisperASR&) = delete;
    WhisperASR& operator=(const WhisperASR&) = delete;

    const char* name() const override { return "local"; }
    TranscriptionResult transcribe(const SpeechSegment& segment, const TranscribeOptions& options) override;

    // "base" -> models/ggml-base.bin; anything with a '/' or ending in .bin is used as-is.
    static std::string model_file(const std::string& model);

private:
    Config config_;
    whisper_context* ctx_{nullptr};
};

} // namespace livescribe
