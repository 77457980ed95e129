#pragma once
#include "livescribe/asr/backend_registry.hpp"
#include "livescribe/audio/audio_source.hpp"
#include "livescribe/audio/energy_gate.hpp"
#include "livescribe/core/cancellation.hpp"
#include "livescribe/core/config.hpp"
#include "livescribe/output/output_fanout.hpp"
#include "livescribe/output/status_message.hpp"
#include "livescribe/vad/segment_assembler.hpp"
#include "livescribe/vad/speech_classifier.hpp"
#include "livescribe/vad/voice_activity_detector.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace livescribe {

struct SessionOptions {
    std::chrono::milliseconds read_timeout{100};  // the loop's only blocking wait
    int vad_error_budget = 5;
};

// One transcription session: capture -> segmentation -> backend ->
// post-processing -> fanout. run() blocks on the calling thread until the
// session is stopped; every run ends with a final status and one "finished".
class Orchestrator {
public:
    enum class State { Init, Streaming, Draining, Stopped, Error };

    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    using Options = SessionOptions;

    struct Stats {
        std::size_t frames = 0;
        std::size_t overflow_frames = 0;
        std::size_t segments = 0;           // flushed to a backend
        std::size_t transcriptions = 0;     // published to the sinks
        std::size_t backend_errors = 0;
        std::size_t vad_errors = 0;
    };

    Orchestrator(SessionConfig config,
                 AudioSource& source,
                 BackendRegistry& backends,
                 ClassifierFactory classifiers,
                 StatusQueue& status,
                 IntegrationQueue* integration = nullptr,
                 ClockFn clock = {},
                 Options options = {});

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Runs the session once. Later calls are ignored.
    void run(CancellationToken& cancel);

    State state() const { return state_; }
    bool using_vad() const { return static_cast<bool>(vad_); }
    const Stats& stats() const { return stats_; }
    const std::string& error_reason() const { return error_reason_; }

private:
    bool initialize();
    void build_segmenter();
    void stream(CancellationToken& cancel);
    void on_frame(const AudioFrame& frame, Clock::time_point now);
    void on_timeout(Clock::time_point now);
    void fall_back_to_energy_gate(Clock::time_point now);
    void flush_vad(Clock::time_point now);
    void drain();
    void transcribe(const SpeechSegment& segment);
    void finish_session();
    void fail(const std::exception& e);
    void emit(StatusMessage::Kind kind, std::string text);

    SessionConfig config_;
    AudioSource& source_;
    BackendRegistry& backends_;
    ClassifierFactory classifiers_;
    StatusQueue& status_;
    ClockFn clock_;
    Options options_;

    OutputFanout fanout_;
    EnergyGate gate_;
    std::unique_ptr<VoiceActivityDetector> vad_;
    SegmentAssembler assembler_;

    State state_ = State::Init;
    bool started_ = false;
    bool capture_open_ = false;
    std::string error_reason_;
    int segment_id_ = 0;
    Stats stats_;
};

const char* to_string(Orchestrator::State state);

} // namespace livescribe
