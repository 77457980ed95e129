#pragma once
#include "livescribe/asr/transcription.hpp"
#include "livescribe/audio/audio_source.hpp"
#include "livescribe/core/cancellation.hpp"
#include "livescribe/core/errors.hpp"
#include "livescribe/vad/speech_classifier.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace livescribe::testing {

inline std::vector<float> tone(std::size_t n, float amplitude = 0.3f) {
    std::vector<float> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = amplitude * static_cast<float>(std::sin(2.0 * 3.14159265358979 * 440.0 * i / 16000.0));
    }
    return v;
}

inline std::vector<float> silence(std::size_t n) {
    return std::vector<float>(n, 0.0f);
}

// Manually advanced clock for time-based flush rules.
struct ManualClock {
    std::chrono::steady_clock::time_point now{std::chrono::seconds(1000)};

    void advance(double sec) {
        now += std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(sec));
    }
};

// Classifies a window by amplitude: loud windows are speech. Optionally
// throws for windows whose first sample equals `fail_marker`.
class AmplitudeClassifier : public SpeechClassifier {
public:
    explicit AmplitudeClassifier(float fail_marker = 2.0f) : fail_marker_(fail_marker) {}

    float probability(const float* window, std::size_t n) override {
        ++calls;
        if (n > 0 && window[0] == fail_marker_) {
            throw std::runtime_error("classifier failure");
        }
        float peak = 0.0f;
        for (std::size_t i = 0; i < n; ++i) peak = std::max(peak, std::fabs(window[i]));
        return peak > 0.05f ? 0.9f : 0.1f;
    }

    std::size_t calls = 0;

private:
    float fail_marker_;
};

// Every window fails.
class FailingClassifier : public SpeechClassifier {
public:
    float probability(const float*, std::size_t) override {
        throw std::runtime_error("inference failed");
    }
};

// Replays a fixed list of frames. Each read() first advances the clock by
// the frame duration (or the timeout when empty) and may fire a hook.
class ScriptedSource : public AudioSource {
public:
    ScriptedSource(ManualClock& clock, int sample_rate = 16000) : clock_(clock), sample_rate_(sample_rate) {}

    void add(std::vector<float> samples, bool overflow = false) {
        AudioFrame f;
        f.samples = std::move(samples);
        f.input_overflow = overflow;
        frames_.push_back(std::move(f));
    }

    void open(const CaptureParams& params) override {
        if (fail_open) throw CaptureError("device unavailable");
        opened_with = params;
        is_open = true;
        ++open_calls;
    }

    void close() override {
        is_open = false;
        ++close_calls;
    }

    ReadStatus read(AudioFrame& out, std::chrono::milliseconds timeout) override {
        ++reads;
        if (on_read) on_read(reads);
        if (fail_after_frames >= 0 && delivered >= static_cast<std::size_t>(fail_after_frames)) {
            throw CaptureError("stream died");
        }
        if (frames_.empty()) {
            clock_.advance(std::chrono::duration<double>(timeout).count());
            return ReadStatus::Timeout;
        }
        out = std::move(frames_.front());
        frames_.pop_front();
        ++delivered;
        clock_.advance(static_cast<double>(out.samples.size()) / sample_rate_);
        return ReadStatus::Frame;
    }

    std::size_t discard_pending() override {
        const std::size_t n = frames_.size();
        frames_.clear();
        return n;
    }

    bool fail_open = false;
    int fail_after_frames = -1;
    std::function<void(std::size_t)> on_read;

    bool is_open = false;
    int open_calls = 0;
    int close_calls = 0;
    std::size_t reads = 0;
    std::size_t delivered = 0;
    CaptureParams opened_with;

private:
    ManualClock& clock_;
    int sample_rate_;
    std::deque<AudioFrame> frames_;
};

// Records every call and answers from a script (default: "hello").
class FakeBackend : public TranscriptionBackend {
public:
    struct Log {
        std::vector<double> durations;
        std::vector<TranscribeOptions> options;
    };

    explicit FakeBackend(std::shared_ptr<Log> log, std::deque<TranscriptionResult> script = {})
        : log_(std::move(log)), script_(std::move(script)) {}

    const char* name() const override { return "fake"; }

    TranscriptionResult transcribe(const SpeechSegment& segment, const TranscribeOptions& options) override {
        log_->durations.push_back(segment.duration_sec());
        log_->options.push_back(options);
        if (script_.empty()) return TranscriptionResult::success("hello", name());
        auto r = script_.front();
        script_.pop_front();
        return r;
    }

private:
    std::shared_ptr<Log> log_;
    std::deque<TranscriptionResult> script_;
};

} // namespace livescribe::testing
