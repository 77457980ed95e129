#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>
#include "livescribe/asr/remote_response.hpp"
#include "livescribe/asr/transcription.hpp"
#include "livescribe/asr/wav_encoder.hpp"

using namespace livescribe;

namespace {
std::uint32_t u32_at(const std::string& s, std::size_t off) {
    std::uint32_t v = 0;
    for (int i = 3; i >= 0; --i) v = (v << 8) | static_cast<unsigned char>(s[off + i]);
    return v;
}
} // namespace

int main() {
    // Sentinels
    {
        assert(TranscriptionResult::failure(ErrorKind::Auth, "401", "openai").sentinel() == "[Auth-Error]");
        assert(TranscriptionResult::failure(ErrorKind::Api, "500", "openai").sentinel() == "[API-Error: 500]");
        assert(TranscriptionResult::failure(ErrorKind::MalformedAudio, "", "x").sentinel() == "[Audio-Error]");
        assert(TranscriptionResult::success("hi", "local").sentinel().empty());

        const ErrorKind kinds[] = {ErrorKind::NotInitialized, ErrorKind::Auth, ErrorKind::Quota,
                                   ErrorKind::MalformedAudio, ErrorKind::Timeout, ErrorKind::Network,
                                   ErrorKind::Api, ErrorKind::Device, ErrorKind::Unknown};
        for (auto k : kinds) {
            assert(is_error_sentinel(TranscriptionResult::failure(k, "x", "b").sentinel()));
        }
        assert(!is_error_sentinel("hello"));
        assert(!is_error_sentinel("[music]"));
    }

    assert(language_prompt("de") == "The following transcription is in German.");
    assert(language_prompt("it") == "The following transcription is in it.");
    assert(language_prompt("").empty());

    // WAV container
    {
        auto wav = encode_wav_pcm16({0.0f, 1.0f, -1.0f, 2.0f}, 16000);
        assert(wav.size() == 44 + 8);
        assert(wav.compare(0, 4, "RIFF") == 0);
        assert(wav.compare(8, 4, "WAVE") == 0);
        assert(u32_at(wav, 4) == 36 + 8);
        assert(u32_at(wav, 24) == 16000);
        assert(u32_at(wav, 40) == 8);
        assert(static_cast<unsigned char>(wav[46]) == 0xFF && static_cast<unsigned char>(wav[47]) == 0x7F);
        assert(static_cast<unsigned char>(wav[48]) == 0x01 && static_cast<unsigned char>(wav[49]) == 0x80);
        // clipped
        assert(static_cast<unsigned char>(wav[50]) == 0xFF && static_cast<unsigned char>(wav[51]) == 0x7F);
    }

    // Response shapes
    {
        assert(extract_text(R"({"text": "  hello world  "})") == "hello world");
        assert(extract_text(R"({"foo": 1})") == R"({"foo":1})");
        assert(extract_text(R"(["a"])") == R"(["a"])");
        assert(extract_text("plain text\n") == "plain text");
    }

    // HTTP status mapping
    {
        assert(classify_http_error(401, "", "openai").kind == ErrorKind::Auth);
        assert(classify_http_error(403, "", "openai").kind == ErrorKind::Auth);
        assert(classify_http_error(429, "", "openai").kind == ErrorKind::Quota);
        auto short_audio = classify_http_error(400, R"({"error":"Audio file is too short"})", "openai");
        assert(short_audio.kind == ErrorKind::MalformedAudio);
        assert(short_audio.sentinel() == "[Audio-Error]");
        assert(classify_http_error(400, "bad parameter", "openai").kind == ErrorKind::Api);
        auto server = classify_http_error(500, "", "elevenlabs");
        assert(server.kind == ErrorKind::Api && server.sentinel() == "[API-Error: 500]");
        assert(!server.ok && server.backend == "elevenlabs");
    }
    return 0;
}
