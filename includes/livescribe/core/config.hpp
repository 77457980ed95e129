#pragma once
#include "livescribe/text/post_processor.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace livescribe {

// Transcription engines. Values index the backend dispatch table.
enum class Mode { OnDevice = 0, RemoteA = 1, RemoteB = 2 };
inline constexpr std::size_t kModeCount = 3;

// "local"/"on-device", "openai"/"remote-a", "elevenlabs"/"remote-b".
std::optional<Mode> parse_mode(const std::string& name);
const char* mode_name(Mode mode);
// whisper "base", "whisper-1", "scribe_v1".
const char* default_model_for(Mode mode);

enum class OutputFormat { Text, Json };

// Everything a single transcription session needs.
struct SessionConfig {
    Mode mode = Mode::OnDevice;
    std::optional<int> device;              // empty: default input device
    int sample_rate = 16000;
    int channels = 1;
    std::string model;                      // on-device model name or remote model id; empty: default_model_for(mode)
    std::string api_key;                    // credential for the active remote mode
    std::string language;                   // empty: auto-detect

    std::string output_path;                // empty: no file sink
    OutputFormat output_format = OutputFormat::Text;

    float energy_threshold = 50.0f;         // compared against RMS * 1000
    double min_buffer_sec = 5.0;
    double silence_sec = 2.0;

    bool use_vad = false;
    float vad_threshold = 0.55f;
    int vad_min_silence_ms = 2500;
    int vad_min_speech_ms = 200;
    bool vad_adaptive = true;
    bool vad_padding = true;
    int vad_padding_ms = 200;
    std::string vad_model_path = "models/ggml-silero-v5.1.2.bin";

    text::FilterRules filters;
    text::ReplacementRules replacements;
    bool filter_parentheses = false;

    bool integration_enabled = false;
    std::string integration_prefix = "StreamerXY speaks: ";

    std::string effective_model() const {
        return model.empty() ? std::string(default_model_for(mode)) : model;
    }
};

// Application-level settings around the session.
struct AppConfig {
    SessionConfig session;

    std::string openai_api_key;
    std::string elevenlabs_api_key;

    std::string log_level = "INFO";
    std::string log_dir = "logs";

    std::string filter_path = "filter/filter_patterns.txt";
    std::string filter_path_remote_b = "filter/filter_patterns_el.txt";
    std::string replacements_path = "filter/replacements.json";

    std::string integration_url;            // empty: integration payloads are only logged
    bool control_channel = false;
};

// Returns $XDG_CONFIG_HOME/livescribe/livescribe.conf or ~/.config/livescribe/livescribe.conf
std::string default_config_path();

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

// Applies one `key = value` setting. Returns false (and leaves cfg untouched)
// for unknown keys or values that do not parse.
bool apply_setting(AppConfig& cfg, const std::string& key, const std::string& value);

// Load config file if it exists. Simple key = value lines; '#' or ';' start
// comments and strings may be quoted. Missing file leaves `cfg` unchanged.
void load_config_file(const std::string& path, AppConfig& cfg);

// Fills session.api_key from the per-mode keys (falling back to
// OPENAI_API_KEY / ELEVENLABS_API_KEY in the environment).
void resolve_credentials(AppConfig& cfg);

// Throws ConfigurationError if the session cannot be started as configured.
void validate(const SessionConfig& cfg);

} // namespace livescribe
