#pragma once
#include "livescribe/audio/audio_frame.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace livescribe {

// RMS + wall-clock segmenter. Accumulates every frame and decides when the
// buffer is worth transcribing:
//  - silence-close: after sound, `silence_sec` of below-threshold audio ends the
//    utterance. The trailing silent run is trimmed; what is left is flushed if it
//    is at least `min_flush_sec` long and discarded otherwise.
//  - buffer length: the buffer reached `min_buffer_sec`.
//  - read timeout: no frames for longer than `silence_sec` after sound.
// Silence-close is evaluated before buffer length.
class EnergyGate {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        int sample_rate = 16000;
        float energy_threshold = 50.0f;  // RMS is compared against threshold / 1000
        double min_buffer_sec = 5.0;
        double silence_sec = 2.0;
        double min_flush_sec = 0.5;
    };

    explicit EnergyGate(const Config& config);

    std::optional<SpeechSegment> push(const float* samples, std::size_t n, Clock::time_point now);
    std::optional<SpeechSegment> push(const AudioFrame& frame, Clock::time_point now) {
        return push(frame.samples.data(), frame.samples.size(), now);
    }

    // Time-based check for when the capture queue yielded nothing.
    std::optional<SpeechSegment> on_timeout(Clock::time_point now);

    // End of session: flush voiced content once if long enough, else discard.
    std::optional<SpeechSegment> finish();

    void reset();

    bool is_silent() const { return silent_; }
    std::size_t buffered_samples() const { return buffer_.size(); }

private:
    std::size_t voiced_samples() const;
    std::optional<SpeechSegment> take_or_discard(std::size_t voiced, const char* reason);

    Config config_;
    float rms_threshold_;
    std::size_t min_buffer_samples_;
    std::size_t silence_samples_;
    std::size_t min_flush_samples_;

    std::vector<float> buffer_;
    bool silent_ = true;
    std::size_t samples_since_sound_ = 0;
    Clock::time_point last_sound_{};
};

} // namespace livescribe
