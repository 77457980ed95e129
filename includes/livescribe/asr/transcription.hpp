#pragma once
#include "livescribe/audio/audio_frame.hpp"

#include <memory>
#include <string>

namespace livescribe {

enum class ErrorKind {
    NotInitialized,
    Auth,
    Quota,
    MalformedAudio,
    Timeout,
    Network,
    Api,
    Device,
    Unknown,
};

const char* to_string(ErrorKind kind);

// Outcome of one backend call. Failures carry a kind and a short detail
// (for Api, the HTTP status).
struct TranscriptionResult {
    bool ok = false;
    std::string text;
    ErrorKind kind = ErrorKind::Unknown;
    std::string detail;
    std::string backend;

    static TranscriptionResult success(std::string text, std::string backend);
    static TranscriptionResult failure(ErrorKind kind, std::string detail, std::string backend);

    // Bracketed marker for plain-text channels, e.g. "[Auth-Error]", "[API-Error: 500]".
    std::string sentinel() const;
};

// True for strings produced by TranscriptionResult::sentinel().
bool is_error_sentinel(const std::string& text);

struct TranscribeOptions {
    std::string language;   // empty = auto-detect
    std::string prompt;     // remote-A only
};

// Remote-A prompt: "The following transcription is in German." for de/en/fr/es,
// the code itself otherwise. Empty language gives an empty prompt.
std::string language_prompt(const std::string& language);

struct BackendParams {
    std::string model;
    std::string api_key;

    bool operator==(const BackendParams& other) const {
        return model == other.model && api_key == other.api_key;
    }
};

// One transcription engine. Construction loads/creates the client and throws
// BackendInitError on failure. transcribe() reports errors in the result.
class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;

    virtual const char* name() const = 0;
    virtual TranscriptionResult transcribe(const SpeechSegment& segment, const TranscribeOptions& options) = 0;
};

} // namespace livescribe
