#include "livescribe/asr/transcription.hpp"

#include <map>

namespace livescribe {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotInitialized: return "not-initialized";
    case ErrorKind::Auth: return "auth";
    case ErrorKind::Quota: return "quota";
    case ErrorKind::MalformedAudio: return "malformed-audio";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::Network: return "network";
    case ErrorKind::Api: return "api";
    case ErrorKind::Device: return "device";
    case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

TranscriptionResult TranscriptionResult::success(std::string text, std::string backend) {
    TranscriptionResult r;
    r.ok = true;
    r.text = std::move(text);
    r.backend = std::move(backend);
    return r;
}

TranscriptionResult TranscriptionResult::failure(ErrorKind kind, std::string detail, std::string backend) {
    TranscriptionResult r;
    r.ok = false;
    r.kind = kind;
    r.detail = std::move(detail);
    r.backend = std::move(backend);
    return r;
}

std::string TranscriptionResult::sentinel() const {
    if (ok) return {};
    switch (kind) {
    case ErrorKind::NotInitialized: return "[Not-Initialized-Error]";
    case ErrorKind::Auth: return "[Auth-Error]";
    case ErrorKind::Quota: return "[Quota-Error]";
    case ErrorKind::MalformedAudio: return "[Audio-Error]";
    case ErrorKind::Timeout: return "[Timeout-Error]";
    case ErrorKind::Network: return "[Network-Error]";
    case ErrorKind::Api:
        return detail.empty() ? "[API-Error]" : "[API-Error: " + detail + "]";
    case ErrorKind::Device: return "[Device-Error]";
    case ErrorKind::Unknown: break;
    }
    return "[Transcription-Error]";
}

bool is_error_sentinel(const std::string& text) {
    return text.size() > 2 && text.front() == '[' && text.back() == ']'
        && text.find("Error") != std::string::npos;
}

std::string language_prompt(const std::string& language) {
    static const std::map<std::string, std::string> kNames = {
        {"de", "German"}, {"en", "English"}, {"fr", "French"}, {"es", "Spanish"},
    };
    if (language.empty()) return {};
    auto it = kNames.find(language);
    return "The following transcription is in " + (it != kNames.end() ? it->second : language) + ".";
}

} // namespace livescribe
