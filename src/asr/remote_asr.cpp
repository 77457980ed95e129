#include "livescribe/asr/remote_asr.hpp"
#include "livescribe/asr/http_client.hpp"
#include "livescribe/asr/remote_response.hpp"
#include "livescribe/asr/wav_encoder.hpp"
#include "livescribe/core/errors.hpp"
#include "livescribe/core/log.hpp"


namespace livescribe {

namespace {

constexpr const char* kOpenAIUrl = "https://api.openai.com/v1/audio/transcriptions";
constexpr const char* kElevenLabsUrl = "https://api.elevenlabs.io/v1/speech-to-text";
constexpr long kRequestTimeoutSec = 60;

// Shared response handling for both remote engines.
TranscriptionResult to_result(const http::Response& resp, const char* backend) {
    if (resp.status == 0) {
        log::error(std::string(backend) + " request failed: " + resp.error);
        return TranscriptionResult::failure(resp.timed_out ? ErrorKind::Timeout : ErrorKind::Network,
                                            resp.error, backend);
    }
    if (resp.status < 200 || resp.status >= 300) {
        log::error(std::string(backend) + " API error " + std::to_string(resp.status) + ": "
                   + resp.body.substr(0, 300));
        return classify_http_error(resp.status, resp.body, backend);
    }
    std::string text = extract_text(resp.body);
    log::debug(std::string(backend) + " result: " + (text.size() > 100 ? text.substr(0, 100) + "..." : text));
    return TranscriptionResult::success(std::move(text), backend);
}

} // namespace

OpenAIASR::OpenAIASR(std::string api_key, std::string model)
    : api_key_(std::move(api_key)), model_(std::move(model)) {
    if (api_key_.empty()) {
        throw BackendInitError("OpenAI API key missing");
    }
    if (model_.empty()) model_ = "whisper-1";
}

TranscriptionResult OpenAIASR::transcribe(const SpeechSegment& segment, const TranscribeOptions& options) {
    if (segment.empty()) {
        return TranscriptionResult::failure(ErrorKind::MalformedAudio, "empty segment", name());
    }
    std::vector<http::FormPart> parts = {
        {"file", encode_wav_pcm16(segment.samples, segment.sample_rate), "audio.wav", "audio/wav"},
        {"model", model_, "", ""},
        {"temperature", "0", "", ""},
        {"response_format", "json", "", ""},
    };
    if (!options.language.empty()) parts.push_back({"language", options.language, "", ""});
    if (!options.prompt.empty()) parts.push_back({"prompt", options.prompt, "", ""});

    log::debug("OpenAI transcription: model " + model_ + ", " + std::to_string(segment.duration_sec()) + "s"
               + (options.prompt.empty() ? "" : ", with prompt"));
    auto resp = http::post_multipart(kOpenAIUrl, {"Authorization: Bearer " + api_key_}, parts, kRequestTimeoutSec);
    return to_result(resp, name());
}

ElevenLabsASR::ElevenLabsASR(std::string api_key, std::string model_id)
    : api_key_(std::move(api_key)), model_id_(std::move(model_id)) {
    if (api_key_.empty()) {
        throw BackendInitError("ElevenLabs API key missing");
    }
    if (model_id_.empty()) {
        throw BackendInitError("ElevenLabs model id not specified");
    }
}

TranscriptionResult ElevenLabsASR::transcribe(const SpeechSegment& segment, const TranscribeOptions& options) {
    if (segment.empty()) {
        return TranscriptionResult::failure(ErrorKind::MalformedAudio, "empty segment", name());
    }
    std::vector<http::FormPart> parts = {
        {"file", encode_wav_pcm16(segment.samples, segment.sample_rate), "audio.wav", "audio/wav"},
        {"model_id", model_id_, "", ""},
    };
    if (!options.language.empty()) parts.push_back({"language_code", options.language, "", ""});

    log::debug("ElevenLabs transcription: model " + model_id_ + ", " + std::to_string(segment.duration_sec()) + "s");
    auto resp = http::post_multipart(kElevenLabsUrl, {"xi-api-key: " + api_key_}, parts, kRequestTimeoutSec);
    return to_result(resp, name());
}

} // namespace livescribe
