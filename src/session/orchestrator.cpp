#include "livescribe/session/orchestrator.hpp"
#include "livescribe/core/errors.hpp"
#include "livescribe/core/log.hpp"
#include "livescribe/text/post_processor.hpp"

#include <iomanip>
#include <sstream>

namespace livescribe {

namespace {

EnergyGate::Config gate_config(const SessionConfig& c) {
    EnergyGate::Config g;
    g.sample_rate = c.sample_rate;
    g.energy_threshold = c.energy_threshold;
    g.min_buffer_sec = c.min_buffer_sec;
    g.silence_sec = c.silence_sec;
    return g;
}

OutputFanout::Config fanout_config(const SessionConfig& c) {
    OutputFanout::Config f;
    f.output_path = c.output_path;
    f.format = c.output_format;
    f.integration_enabled = c.integration_enabled;
    f.integration_prefix = c.integration_prefix;
    return f;
}

std::string secs(double s) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << s << "s";
    return oss.str();
}

} // namespace

const char* to_string(Orchestrator::State state) {
    switch (state) {
    case Orchestrator::State::Init: return "INIT";
    case Orchestrator::State::Streaming: return "STREAMING";
    case Orchestrator::State::Draining: return "DRAINING";
    case Orchestrator::State::Stopped: return "STOPPED";
    case Orchestrator::State::Error: return "ERROR";
    }
    return "UNKNOWN";
}

Orchestrator::Orchestrator(SessionConfig config,
                           AudioSource& source,
                           BackendRegistry& backends,
                           ClassifierFactory classifiers,
                           StatusQueue& status,
                           IntegrationQueue* integration,
                           ClockFn clock,
                           Options options)
    : config_(std::move(config)),
      source_(source),
      backends_(backends),
      classifiers_(std::move(classifiers)),
      status_(status),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })),
      options_(options),
      fanout_(fanout_config(config_), status, integration),
      gate_(gate_config(config_)) {
}

void Orchestrator::emit(StatusMessage::Kind kind, std::string text) {
    if (!status_.push(StatusMessage{kind, std::move(text)})) {
        log::warn("Status queue full, message dropped");
    }
}

void Orchestrator::run(CancellationToken& cancel) {
    if (started_) {
        log::warn("Session already ran; create a new one to record again");
        return;
    }
    started_ = true;

    bool ready = false;
    try {
        ready = initialize();
    } catch (const std::exception& e) {
        fail(e);
    }
    if (ready) {
        state_ = State::Streaming;
        try {
            stream(cancel);
        } catch (const std::exception& e) {
            fail(e);
            cancel.cancel();
        }
        try {
            drain();
        } catch (const std::exception& e) {
            fail(e);
        }
    }
    finish_session();
}

void Orchestrator::fail(const std::exception& e) {
    if (state_ != State::Init) state_ = State::Error;
    if (error_reason_.empty()) error_reason_ = e.what();
    log::error(std::string("Session failed: ") + e.what());
    emit(StatusMessage::Kind::Error, std::string("Session failed: ") + e.what());
}

bool Orchestrator::initialize() {
    state_ = State::Init;
    try {
        validate(config_);
    } catch (const ConfigurationError& e) {
        error_reason_ = e.what();
        log::error(std::string("Configuration error: ") + e.what());
        emit(StatusMessage::Kind::Error, std::string("Configuration error: ") + e.what());
        return false;
    }

    BackendParams params{config_.effective_model(), config_.api_key};
    if (!backends_.initialize(config_.mode, params)) {
        error_reason_ = backends_.last_error().empty() ? "backend not initialized" : backends_.last_error();
        emit(StatusMessage::Kind::Error,
             std::string("Could not initialize ") + mode_name(config_.mode) + " backend: " + error_reason_);
        return false;
    }

    CaptureParams capture;
    capture.sample_rate = config_.sample_rate;
    capture.channels = config_.channels;
    capture.frames_per_buffer = static_cast<unsigned long>(config_.sample_rate / 10);
    capture.device_index = config_.device;
    try {
        source_.open(capture);
        capture_open_ = true;
    } catch (const CaptureError& e) {
        error_reason_ = e.what();
        log::error(std::string("Audio capture failed: ") + e.what());
        emit(StatusMessage::Kind::Error, std::string("Audio capture failed: ") + e.what());
        return false;
    }

    build_segmenter();
    emit(StatusMessage::Kind::Status,
         std::string("Recording (") + mode_name(config_.mode) + ", " + (vad_ ? "VAD" : "energy gate") + ")");
    return true;
}

void Orchestrator::build_segmenter() {
    if (!config_.use_vad) return;
    if (!classifiers_) {
        log::warn("No VAD classifier available, using energy gate");
        emit(StatusMessage::Kind::Warning, "VAD unavailable, using energy gate");
        return;
    }

    VoiceActivityDetector::Config vc;
    vc.threshold = config_.vad_threshold;
    vc.min_silence_ms = config_.vad_min_silence_ms;
    vc.min_speech_ms = config_.vad_min_speech_ms;
    vc.sample_rate = config_.sample_rate;
    vc.adaptive_threshold = config_.vad_adaptive;
    vc.padding = config_.vad_padding;
    vc.padding_ms = config_.vad_padding_ms;
    vc.debug = log::level() == log::Level::Debug;
    try {
        vad_ = std::make_unique<VoiceActivityDetector>(vc, classifiers_(config_.sample_rate));
    } catch (const std::exception& e) {
        vad_.reset();
        log::warn(std::string("VAD unavailable, using energy gate for this session: ") + e.what());
        emit(StatusMessage::Kind::Warning, "VAD unavailable, using energy gate");
    }
}

void Orchestrator::stream(CancellationToken& cancel) {
    AudioFrame frame;
    while (!cancel.is_cancelled()) {
        AudioSource::ReadStatus rs;
        try {
            rs = source_.read(frame, options_.read_timeout);
        } catch (const CaptureError& e) {
            state_ = State::Error;
            error_reason_ = e.what();
            log::error(std::string("Audio stream failed: ") + e.what());
            emit(StatusMessage::Kind::Error, std::string("Audio stream failed: ") + e.what());
            cancel.cancel();
            break;
        }

        const auto now = clock_();
        if (rs == AudioSource::ReadStatus::Frame) {
            on_frame(frame, now);
        } else {
            on_timeout(now);
        }
    }
}

void Orchestrator::on_frame(const AudioFrame& frame, Clock::time_point now) {
    ++stats_.frames;
    if (frame.input_overflow) {
        if (stats_.overflow_frames++ == 0) {
            log::warn("Audio input overflow");
        } else {
            log::debug("Audio input overflow (" + std::to_string(stats_.overflow_frames) + ")");
        }
    }

    if (!vad_) {
        if (auto seg = gate_.push(frame, now)) {
            transcribe(*seg);
        }
        return;
    }

    auto result = vad_->process_chunk(frame.samples);
    switch (result.status) {
    case VoiceActivityDetector::Status::SpeechEnded:
        if (auto merged = assembler_.add(std::move(*result.segment), now)) {
            transcribe(*merged);
        }
        return;
    case VoiceActivityDetector::Status::Error:
        if (++stats_.vad_errors >= static_cast<std::size_t>(options_.vad_error_budget)) {
            fall_back_to_energy_gate(now);
            if (auto seg = gate_.push(frame, now)) {
                transcribe(*seg);
            }
            return;
        }
        break;
    case VoiceActivityDetector::Status::Processing:
        break;
    }
    if (auto merged = assembler_.poll(now)) {
        transcribe(*merged);
    }
}

void Orchestrator::on_timeout(Clock::time_point now) {
    if (vad_) {
        if (auto merged = assembler_.poll(now)) {
            transcribe(*merged);
        }
    } else if (auto seg = gate_.on_timeout(now)) {
        transcribe(*seg);
    }
}

void Orchestrator::fall_back_to_energy_gate(Clock::time_point now) {
    log::error("VAD failed " + std::to_string(stats_.vad_errors)
               + " times, switching to energy gate for the rest of the session");
    emit(StatusMessage::Kind::Warning, "VAD failing, switched to energy gate");

    // Hand over whatever speech the VAD path already holds.
    flush_vad(now);
    vad_.reset();
    gate_.reset();
}

void Orchestrator::flush_vad(Clock::time_point now) {
    for (auto& seg : vad_->flush()) {
        if (auto merged = assembler_.add(std::move(seg), now)) {
            transcribe(*merged);
        }
    }
    if (auto rest = assembler_.finish()) {
        transcribe(*rest);
    }
}

void Orchestrator::drain() {
    log::debug(std::string("Draining after ") + to_string(state_));
    state_ = State::Draining;
    const auto now = clock_();

    if (vad_) {
        flush_vad(now);
    } else if (auto seg = gate_.finish()) {
        transcribe(*seg);
    }

    if (capture_open_) {
        source_.close();
        capture_open_ = false;
    }
    const std::size_t dropped = source_.discard_pending();
    if (dropped > 0) {
        log::debug("Discarded " + std::to_string(dropped) + " queued frames");
    }
}

void Orchestrator::transcribe(const SpeechSegment& segment) {
    const int id = ++segment_id_;
    ++stats_.segments;
    log::info("Segment " + std::to_string(id) + ": " + secs(segment.duration_sec()) + " -> " + mode_name(config_.mode));
    emit(StatusMessage::Kind::Status, "Processing segment " + std::to_string(id));

    TranscribeOptions opts;
    opts.language = config_.language;
    if (config_.mode == Mode::RemoteA) {
        opts.prompt = language_prompt(config_.language);
    }

    const TranscriptionResult result = backends_.transcribe(segment, config_.mode, opts);
    if (!result.ok) {
        ++stats_.backend_errors;
        log::error("Segment " + std::to_string(id) + " failed (" + result.backend + ", "
                   + to_string(result.kind) + "): " + result.detail);
        emit(StatusMessage::Kind::Status, "Segment " + std::to_string(id) + " " + result.sentinel());
        return;
    }

    std::string text = text::apply_replacements(result.text, config_.replacements);
    text = text::filter(text, config_.filters, config_.filter_parentheses);
    if (text.empty() || is_error_sentinel(text)) {
        log::debug("Segment " + std::to_string(id) + " produced no text after filtering");
    } else {
        fanout_.publish(text);
        ++stats_.transcriptions;
    }
    emit(StatusMessage::Kind::Status, "Segment " + std::to_string(id) + " finished");
}

void Orchestrator::finish_session() {
    if (capture_open_) {
        capture_open_ = false;
        try {
            source_.close();
        } catch (const std::exception& e) {
            log::warn(std::string("Closing audio capture failed: ") + e.what());
        }
    }
    if (error_reason_.empty()) {
        emit(StatusMessage::Kind::Status, "Recording stopped by user");
    } else if (state_ == State::Init) {
        emit(StatusMessage::Kind::Status, "Recording not started: " + error_reason_);
    } else {
        emit(StatusMessage::Kind::Status, "Recording stopped due to error: " + error_reason_);
    }
    state_ = State::Stopped;
    log::info("Session stopped after " + std::to_string(stats_.segments) + " segments");
    emit(StatusMessage::Kind::Finished, "finished");
}

} // namespace livescribe
