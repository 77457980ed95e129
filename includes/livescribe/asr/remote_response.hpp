#pragma once
#include "livescribe/asr/transcription.hpp"

#include <string>

namespace livescribe {

// Pulls the transcript out of a remote API body. A JSON object with a string
// "text" field yields that (trimmed); any other JSON is dumped as-is; a body
// that is not JSON is returned raw.
std::string extract_text(const std::string& body);

// Maps an HTTP error status (and body) to a failed result.
TranscriptionResult classify_http_error(long status, const std::string& body, const std::string& backend);

std::string trim(const std::string& s);

} // namespace livescribe
