#include "livescribe/asr/backend_registry.hpp"
#include "livescribe/asr/default_backends.hpp"
#include "livescribe/asr/http_client.hpp"
#include "livescribe/audio/audio_capture.hpp"
#include "livescribe/control/control_channel.hpp"
#include "livescribe/core/cancellation.hpp"
#include "livescribe/core/config.hpp"
#include "livescribe/core/errors.hpp"
#include "livescribe/core/log.hpp"
#include "livescribe/output/integration_worker.hpp"
#include "livescribe/output/status_message.hpp"
#include "livescribe/session/orchestrator.hpp"
#include "livescribe/text/post_processor.hpp"
#include "livescribe/vad/silero_classifier.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace livescribe;

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

struct Args {
    bool list_devices = false;
    std::string config_path;
    std::vector<std::pair<std::string, std::string>> overrides;  // applied after the config file
};

static void print_help() {
    std::cout << "livescribe - live microphone transcription\n"
              << "      --config <path>            Config file (default XDG)\n"
              << "  -l, --list-devices             List input devices\n"
              << "  -m, --mode <local|openai|elevenlabs>\n"
              << "  -d, --device <index>           Input device index (-1 = default)\n"
              << "      --sr <Hz>                  Sample rate (default 16000)\n"
              << "      --channels <n>             Capture channels, down-mixed to mono\n"
              << "      --model <name>             On-device model name (base, small, ...)\n"
              << "      --remote-model <id>        Remote model id (whisper-1, scribe_v1, ...)\n"
              << "      --language <code>          Target language, empty/auto = detect\n"
              << "  -o, --output <path>            Append transcripts to file\n"
              << "      --format <txt|json>        Output file format\n"
              << "      --energy <n>               Energy threshold (default 50)\n"
              << "      --min-buffer <sec>         Flush after this much audio (default 5)\n"
              << "      --silence <sec>            Silence that ends an utterance (default 2)\n"
              << "      --vad                      Use the neural VAD\n"
              << "      --vad-threshold <p>        Speech probability threshold (default 0.55)\n"
              << "      --vad-min-silence <ms>     Silence that closes a VAD segment (default 2500)\n"
              << "      --vad-min-speech <ms>      Speech needed to open a VAD segment (default 200)\n"
              << "      --vad-model <path>         Silero model for whisper.cpp\n"
              << "      --filter-parentheses       Drop (...) and [...] from transcripts\n"
              << "      --integration              Send transcripts to the integration endpoint\n"
              << "      --integration-url <url>    HTTP endpoint receiving JSON payloads\n"
              << "      --prefix <text>            Prefix for integration payloads\n"
              << "      --control                  Read TOGGLE_RECORD / PING / QUIT from stdin\n"
              << "      --log-level <level>        DEBUG, INFO, WARNING, ERROR\n";
}

static Args parse_args(int argc, char** argv) {
    Args a{};
    a.config_path = default_config_path();

    auto set = [&](const char* key, std::string value) { a.overrides.emplace_back(key, std::move(value)); };

    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        const bool has_value = i + 1 < argc;
        if      (s == "--list-devices" || s == "-l") a.list_devices = true;
        else if (s == "--config" && has_value) a.config_path = expand_path(argv[++i]);
        else if ((s == "--mode" || s == "-m") && has_value) set("mode", argv[++i]);
        else if ((s == "--device" || s == "-d") && has_value) set("device", argv[++i]);
        else if (s == "--sr" && has_value) set("sample_rate", argv[++i]);
        else if (s == "--channels" && has_value) set("channels", argv[++i]);
        else if ((s == "--model" || s == "--remote-model") && has_value) set("model", argv[++i]);
        else if (s == "--language" && has_value) set("language", argv[++i]);
        else if ((s == "--output" || s == "-o") && has_value) set("output_path", argv[++i]);
        else if (s == "--format" && has_value) set("output_format", argv[++i]);
        else if (s == "--energy" && has_value) set("energy_threshold", argv[++i]);
        else if (s == "--min-buffer" && has_value) set("min_buffer_sec", argv[++i]);
        else if (s == "--silence" && has_value) set("silence_sec", argv[++i]);
        else if (s == "--vad") set("use_vad", "true");
        else if (s == "--vad-threshold" && has_value) set("vad_threshold", argv[++i]);
        else if (s == "--vad-min-silence" && has_value) set("vad_min_silence_ms", argv[++i]);
        else if (s == "--vad-min-speech" && has_value) set("vad_min_speech_ms", argv[++i]);
        else if (s == "--vad-model" && has_value) set("vad_model", argv[++i]);
        else if (s == "--filter-parentheses") set("filter_parentheses", "true");
        else if (s == "--integration") set("integration", "true");
        else if (s == "--integration-url" && has_value) set("integration_url", argv[++i]);
        else if (s == "--prefix" && has_value) set("integration_prefix", argv[++i]);
        else if (s == "--control") set("control_channel", "true");
        else if (s == "--log-level" && has_value) set("log_level", argv[++i]);
        else if (s == "--help" || s == "-h") {
            print_help();
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << s << " (see --help)\n";
            std::exit(2);
        }
    }
    return a;
}

static void load_rules(AppConfig& cfg) {
    SessionConfig& s = cfg.session;
    const bool remote_b = s.mode == Mode::RemoteB;
    s.filters = text::load_filter_patterns(remote_b ? cfg.filter_path_remote_b : cfg.filter_path,
                                           text::default_filter_patterns(s.mode == Mode::RemoteA));
    s.replacements = text::load_replacements(cfg.replacements_path);
    log::info("Loaded " + std::to_string(s.filters.size()) + " filter patterns, "
              + std::to_string(s.replacements.size()) + " replacements");
}

// A running session and the thread driving it.
struct ActiveSession {
    CancellationToken cancel;
    PortAudioSource source;
    std::thread thread;
};

int main(int argc, char** argv) {
    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    Args args = parse_args(argc, argv);

    if (args.list_devices) {
        auto devs = PortAudioSource::list_input_devices();
        for (const auto& d : devs) std::cout << d << "\n";
        return 0;
    }

    AppConfig cfg;
    load_config_file(args.config_path, cfg);
    for (const auto& [key, value] : args.overrides) {
        if (!apply_setting(cfg, key, value)) {
            std::cerr << "Invalid value for " << key << ": " << value << "\n";
            return 2;
        }
    }
    log::set_level(log::parse_level(cfg.log_level));
    const std::string log_path = log::init_file(cfg.log_dir);
    if (!log_path.empty()) log::debug("Logging to " + log_path);

    resolve_credentials(cfg);
    load_rules(cfg);

    if (cfg.session.device) {
        log::info("Using input device: " + PortAudioSource::device_summary(*cfg.session.device));
    }

    BackendRegistry backends(default_backend_factories());
    StatusQueue status;
    IntegrationQueue integration(kIntegrationQueueCapacity);

    IntegrationWorker integration_worker(integration, [url = cfg.integration_url](const std::string& payload) {
        if (url.empty()) {
            log::info("Integration payload: " + payload);
            return true;
        }
        auto resp = http::post_json(url, payload, 10);
        if (resp.status < 200 || resp.status >= 300) {
            log::warn("Integration POST failed: "
                      + (resp.status == 0 ? resp.error : "HTTP " + std::to_string(resp.status)));
            return false;
        }
        return true;
    });
    if (cfg.session.integration_enabled) integration_worker.start();

    MessageQueue<ControlCommand> commands(16);
    ControlChannel control(STDIN_FILENO, commands, [](const std::string& reply) {
        std::cout << reply << std::endl;
    });
    if (cfg.control_channel) control.start();

    const ClassifierFactory classifiers = SileroClassifier::factory(cfg.session.vad_model_path);
    std::unique_ptr<ActiveSession> session;

    auto start_session = [&] {
        try {
            session = std::make_unique<ActiveSession>();
        } catch (const CaptureError& e) {
            log::error(std::string("Audio capture unavailable: ") + e.what());
            session.reset();
            return false;
        }
        ActiveSession* s = session.get();
        s->thread = std::thread([&cfg, &backends, &classifiers, &status, &integration, s] {
            Orchestrator orchestrator(cfg.session, s->source, backends, classifiers, status,
                                      cfg.session.integration_enabled ? &integration : nullptr);
            orchestrator.run(s->cancel);
        });
        return true;
    };

    if (!start_session() && !cfg.control_channel) {
        return 1;
    }

    bool quit = false;
    while (true) {
        if (g_stop.exchange(false)) {
            log::info("Stopping...");
            quit = true;
            if (session) session->cancel.cancel();
        }

        ControlCommand cmd;
        while (commands.try_pop(cmd)) {
            if (cmd == ControlCommand::Quit) {
                quit = true;
                if (session) session->cancel.cancel();
            } else if (cmd == ControlCommand::ToggleRecord) {
                if (session) session->cancel.cancel();
                else start_session();
            }
        }
        if (quit && !session) break;

        StatusMessage msg;
        if (!status.pop_for(msg, std::chrono::milliseconds(100))) continue;

        switch (msg.kind) {
        case StatusMessage::Kind::Transcription:
            std::cout << msg.text << std::endl;
            break;
        case StatusMessage::Kind::Status: log::info(msg.text); break;
        case StatusMessage::Kind::Warning: log::warn(msg.text); break;
        case StatusMessage::Kind::Error: log::error(msg.text); break;
        case StatusMessage::Kind::Finished:
            if (session && session->thread.joinable()) session->thread.join();
            session.reset();
            if (!cfg.control_channel) quit = true;
            break;
        }
    }

    control.stop();
    integration_worker.stop();
    log::close_file();
    return 0;
}
