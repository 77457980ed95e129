#include "livescribe/core/config.hpp"
#include "livescribe/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

using std::string;

namespace livescribe {

static inline void trim_inplace(string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static inline string unquote(const string& s) {
    if (s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''))) {
        return s.substr(1, s.size()-2);
    }
    return s;
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

std::optional<Mode> parse_mode(const std::string& name) {
    if (ieq(name, "local") || ieq(name, "on-device") || ieq(name, "ondevice")) return Mode::OnDevice;
    if (ieq(name, "openai") || ieq(name, "remote-a")) return Mode::RemoteA;
    if (ieq(name, "elevenlabs") || ieq(name, "remote-b")) return Mode::RemoteB;
    return std::nullopt;
}

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::OnDevice: return "local";
        case Mode::RemoteA:  return "openai";
        case Mode::RemoteB:  return "elevenlabs";
    }
    return "unknown";
}

const char* default_model_for(Mode mode) {
    switch (mode) {
        case Mode::OnDevice: return "base";
        case Mode::RemoteA:  return "whisper-1";
        case Mode::RemoteB:  return "scribe_v1";
    }
    return "";
}

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/livescribe/livescribe.conf";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/livescribe/livescribe.conf";
}

namespace {

std::optional<int> as_int(const string& s) {
    try { size_t pos = 0; int v = std::stoi(s, &pos); if (pos != s.size()) return std::nullopt; return v; }
    catch (const std::exception&) { return std::nullopt; }
}
std::optional<double> as_double(const string& s) {
    try { size_t pos = 0; double v = std::stod(s, &pos); if (pos != s.size()) return std::nullopt; return v; }
    catch (const std::exception&) { return std::nullopt; }
}
std::optional<bool> as_bool(const string& s) {
    if (ieq(s, "true") || ieq(s,"yes") || ieq(s,"on") || s=="1") return true;
    if (ieq(s, "false")|| ieq(s,"no")  || ieq(s,"off") || s=="0") return false;
    return std::nullopt;
}

template <typename T, typename U>
bool assign(T& dst, const std::optional<U>& v) {
    if (!v) return false;
    dst = static_cast<T>(*v);
    return true;
}

} // namespace

bool apply_setting(AppConfig& cfg, const std::string& key, const std::string& val) {
    SessionConfig& s = cfg.session;

    if (ieq(key, "mode")) {
        auto m = parse_mode(val);
        if (!m) return false;
        s.mode = *m;
        return true;
    }
    if (ieq(key, "device")) {
        auto d = as_int(val);
        if (!d) return false;
        if (*d < 0) s.device.reset(); else s.device = *d;
        return true;
    }
    if (ieq(key, "sample_rate") || ieq(key, "samplerate")) return assign(s.sample_rate, as_int(val));
    if (ieq(key, "channels")) return assign(s.channels, as_int(val));
    if (ieq(key, "model") || ieq(key, "model_name") || ieq(key, "remote_model")) { s.model = val; return true; }
    if (ieq(key, "language")) { s.language = ieq(val, "auto") ? string() : val; return true; }
    if (ieq(key, "output_file") || ieq(key, "output_path")) { s.output_path = expand_path(val); return true; }
    if (ieq(key, "output_format") || ieq(key, "file_format")) {
        if (ieq(val, "txt") || ieq(val, "text")) s.output_format = OutputFormat::Text;
        else if (ieq(val, "json")) s.output_format = OutputFormat::Json;
        else return false;
        return true;
    }
    if (ieq(key, "energy_threshold")) return assign(s.energy_threshold, as_double(val));
    if (ieq(key, "min_buffer_sec") || ieq(key, "min_buffer")) return assign(s.min_buffer_sec, as_double(val));
    if (ieq(key, "silence_sec") || ieq(key, "silence")) return assign(s.silence_sec, as_double(val));
    if (ieq(key, "use_vad") || ieq(key, "vad")) return assign(s.use_vad, as_bool(val));
    if (ieq(key, "vad_threshold")) return assign(s.vad_threshold, as_double(val));
    if (ieq(key, "vad_min_silence_ms")) return assign(s.vad_min_silence_ms, as_int(val));
    if (ieq(key, "vad_min_speech_ms")) return assign(s.vad_min_speech_ms, as_int(val));
    if (ieq(key, "vad_adaptive")) return assign(s.vad_adaptive, as_bool(val));
    if (ieq(key, "vad_padding")) return assign(s.vad_padding, as_bool(val));
    if (ieq(key, "vad_padding_ms")) return assign(s.vad_padding_ms, as_int(val));
    if (ieq(key, "vad_model") || ieq(key, "vad_model_path")) { s.vad_model_path = expand_path(val); return true; }
    if (ieq(key, "filter_parentheses")) return assign(s.filter_parentheses, as_bool(val));
    if (ieq(key, "integration") || ieq(key, "send_to_streamerbot")) return assign(s.integration_enabled, as_bool(val));
    if (ieq(key, "integration_prefix") || ieq(key, "stt_prefix")) { s.integration_prefix = val; return true; }

    if (ieq(key, "openai_api_key")) { cfg.openai_api_key = val; return true; }
    if (ieq(key, "elevenlabs_api_key")) { cfg.elevenlabs_api_key = val; return true; }
    if (ieq(key, "log_level")) { cfg.log_level = val; return true; }
    if (ieq(key, "log_dir")) { cfg.log_dir = expand_path(val); return true; }
    if (ieq(key, "filter_file")) { cfg.filter_path = expand_path(val); return true; }
    if (ieq(key, "filter_file_remote_b") || ieq(key, "filter_file_el")) { cfg.filter_path_remote_b = expand_path(val); return true; }
    if (ieq(key, "replacements_file")) { cfg.replacements_path = expand_path(val); return true; }
    if (ieq(key, "integration_url") || ieq(key, "streamerbot_url")) { cfg.integration_url = val; return true; }
    if (ieq(key, "control_channel")) return assign(cfg.control_channel, as_bool(val));
    return false;
}

void load_config_file(const std::string& path, AppConfig& cfg) {
    std::ifstream f(path);
    if (!f.good()) return; // missing is fine

    string line;
    while (std::getline(f, line)) {
        // strip comments
        auto pos_hash = line.find('#');
        auto pos_sc   = line.find(';');
        auto pos_cmt  = std::min(pos_hash == string::npos ? line.size() : pos_hash,
                                  pos_sc   == string::npos ? line.size() : pos_sc);
        line = line.substr(0, pos_cmt);
        trim_inplace(line);
        if (line.empty()) continue;

        // allow 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) continue;

        string key = line.substr(0, sep);
        string val = line.substr(sep+1);
        trim_inplace(key);
        trim_inplace(val);
        if (key.empty() || val.empty()) continue;

        apply_setting(cfg, key, unquote(val));
    }
}

void resolve_credentials(AppConfig& cfg) {
    auto from_env = [](const char* name) {
        const char* v = std::getenv(name);
        return v ? string(v) : string();
    };
    if (cfg.openai_api_key.empty()) cfg.openai_api_key = from_env("OPENAI_API_KEY");
    if (cfg.elevenlabs_api_key.empty()) cfg.elevenlabs_api_key = from_env("ELEVENLABS_API_KEY");

    switch (cfg.session.mode) {
        case Mode::RemoteA: cfg.session.api_key = cfg.openai_api_key; break;
        case Mode::RemoteB: cfg.session.api_key = cfg.elevenlabs_api_key; break;
        case Mode::OnDevice: cfg.session.api_key.clear(); break;
    }
}

void validate(const SessionConfig& cfg) {
    if (static_cast<std::size_t>(cfg.mode) >= kModeCount) {
        throw ConfigurationError("Unsupported processing mode");
    }
    if (cfg.sample_rate <= 0) {
        throw ConfigurationError("Invalid sample rate: " + std::to_string(cfg.sample_rate));
    }
    if (cfg.channels < 1) {
        throw ConfigurationError("Invalid channel count: " + std::to_string(cfg.channels));
    }
    if (cfg.mode == Mode::OnDevice && cfg.sample_rate != 16000) {
        throw ConfigurationError("On-device transcription requires 16000 Hz capture, got "
                                 + std::to_string(cfg.sample_rate));
    }
    if (cfg.mode != Mode::OnDevice && cfg.api_key.empty()) {
        throw ConfigurationError(string("Missing API key for mode '") + mode_name(cfg.mode) + "'");
    }
    if (cfg.min_buffer_sec <= 0.0 || cfg.silence_sec <= 0.0) {
        throw ConfigurationError("Buffer and silence durations must be positive");
    }
    if (cfg.vad_threshold < 0.0f || cfg.vad_threshold > 1.0f) {
        throw ConfigurationError("VAD threshold must be within [0, 1]");
    }
    if (cfg.vad_min_silence_ms <= 0 || cfg.vad_min_speech_ms <= 0 || cfg.vad_padding_ms < 0) {
        throw ConfigurationError("VAD durations must be positive");
    }
}

} // namespace livescribe
