#include "livescribe/asr/remote_response.hpp"
#include "livescribe/core/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace livescribe {

using json = nlohmann::json;

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string extract_text(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return trim(body);
    }
    if (j.is_object()) {
        auto it = j.find("text");
        if (it != j.end() && it->is_string()) {
            return trim(it->get<std::string>());
        }
    }
    log::warn("Unexpected response shape: " + j.dump().substr(0, 200));
    return j.dump();
}

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

TranscriptionResult classify_http_error(long status, const std::string& body, const std::string& backend) {
    const std::string code = std::to_string(status);
    if (status == 401 || status == 403) {
        return TranscriptionResult::failure(ErrorKind::Auth, code, backend);
    }
    if (status == 429) {
        return TranscriptionResult::failure(ErrorKind::Quota, code, backend);
    }
    if (status == 408 || status == 504) {
        return TranscriptionResult::failure(ErrorKind::Timeout, code, backend);
    }
    if (status == 400 || status == 413 || status == 422) {
        const std::string b = lower(body);
        if (b.find("audio") != std::string::npos || b.find("too short") != std::string::npos
            || b.find("file") != std::string::npos) {
            return TranscriptionResult::failure(ErrorKind::MalformedAudio, code, backend);
        }
    }
    return TranscriptionResult::failure(ErrorKind::Api, code, backend);
}

} // namespace livescribe
