#pragma once
#include "livescribe/asr/transcription.hpp"

#include <string>

namespace livescribe {

// Remote engine A: OpenAI audio transcriptions (WAV upload, temperature 0).
class OpenAIASR : public TranscriptionBackend {
public:
    // Throws BackendInitError without an API key.
    OpenAIASR(std::string api_key, std::string model);

    const char* name() const override { return "openai"; }
    TranscriptionResult transcribe(const SpeechSegment& segment, const TranscribeOptions& options) override;

private:
    std::string api_key_;
    std::string model_;
};

// Remote engine B: ElevenLabs speech-to-text (WAV upload).
class ElevenLabsASR : public TranscriptionBackend {
public:
    // Throws BackendInitError without an API key.
    ElevenLabsASR(std::string api_key, std::string model_id);

    const char* name() const override { return "elevenlabs"; }
    TranscriptionResult transcribe(const SpeechSegment& segment, const TranscribeOptions& options) override;

private:
    std::string api_key_;
    std::string model_id_;
};

} // namespace livescribe
