#include "livescribe/asr/whisper_asr.hpp"
#include "livescribe/asr/remote_response.hpp"
#include "livescribe/core/errors.hpp"
#include "livescribe/core/log.hpp"

#include <whisper.h>

#include <filesystem>

namespace livescribe {

std::string WhisperASR::model_file(const std::string& model) {
    if (model.find('/') != std::string::npos || model.ends_with(".bin")) {
        return model;
    }
    return "models/ggml-" + model + ".bin";
}

WhisperASR::WhisperASR(const Config& config) : config_(config) {
    const std::string file = model_file(config_.model);
    // Try multiple possible locations for the model file
    std::vector<std::filesystem::path> candidates = {
        file,
        std::filesystem::current_path() / file,
        std::filesystem::current_path() / ".." / file,
        std::filesystem::current_path() / "../.." / file
    };

    for (const auto& path : candidates) {
        log::debug("Trying to load model from: " + path.string());
        if (!std::filesystem::exists(path)) continue;
        whisper_context_params cparams = whisper_context_default_params();
        ctx_ = whisper_init_from_file_with_params(path.string().c_str(), cparams);
        if (ctx_) {
            log::info("Loaded whisper model from: " + path.string());
            return;
        }
    }

    std::string tried;
    for (const auto& path : candidates) tried += "\n  " + path.string();
    throw BackendInitError("Failed to load whisper model '" + config_.model + "'. Tried:" + tried);
}

WhisperASR::~WhisperASR() {
    if (ctx_) {
        whisper_free(ctx_);
    }
}

TranscriptionResult WhisperASR::transcribe(const SpeechSegment& segment, const TranscribeOptions& options) {
    if (!ctx_) {
        return TranscriptionResult::failure(ErrorKind::NotInitialized, "model not loaded", name());
    }
    if (segment.empty()) {
        return TranscriptionResult::success("", name());
    }
    if (segment.sample_rate != WHISPER_SAMPLE_RATE) {
        return TranscriptionResult::failure(ErrorKind::MalformedAudio,
                                            "expected 16 kHz, got " + std::to_string(segment.sample_rate), name());
    }

    const std::string language = options.language.empty() ? "auto" : options.language;

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = config_.translate_to_english;
    wparams.language         = language.c_str();
    wparams.n_threads        = config_.thread_count;
    wparams.offset_ms        = 0;
    wparams.duration_ms      = 0;
    wparams.single_segment   = true;
    wparams.no_context       = true;

    log::debug("Local transcription of " + std::to_string(segment.duration_sec()) + "s, language " + language);
    if (whisper_full(ctx_, wparams, segment.samples.data(), static_cast<int>(segment.samples.size())) != 0) {
        log::error("whisper_full failed");
        return TranscriptionResult::failure(ErrorKind::Device, "whisper_full failed", name());
    }

    std::string result;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(ctx_, i);
        if (text) {
            if (!result.empty()) {
                result += " ";
            }
            result += text;
        }
    }
    return TranscriptionResult::success(trim(result), name());
}

} // namespace livescribe
