#pragma once
#include "livescribe/audio/audio_frame.hpp"
#include "livescribe/vad/adaptive_threshold.hpp"
#include "livescribe/vad/speech_classifier.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace livescribe {

// Neural endpointing: slices audio into classifier windows and runs a
// trigger / hangover state machine over the per-window decisions.
class VoiceActivityDetector {
public:
    enum class Status { Processing, SpeechEnded, Error };

    struct Config {
        float threshold = 0.5f;
        int min_silence_ms = 500;
        int min_speech_ms = 250;
        int sample_rate = 16000;
        bool adaptive_threshold = true;
        bool padding = true;
        int padding_ms = 200;
        bool debug = false;
    };

    struct Result {
        Status status = Status::Processing;
        std::optional<SpeechSegment> segment;
    };

    // Sample accounting since the last reset():
    // fed == emitted + discarded + buffered. Padding is not counted as emitted.
    struct Stats {
        std::size_t fed = 0;
        std::size_t emitted = 0;
        std::size_t discarded = 0;
        std::size_t failed_windows = 0;
    };

    static constexpr int kMinSegmentMs = 200;

    // Throws ConfigurationError for a sample rate other than 8000 or 16000.
    VoiceActivityDetector(const Config& config, std::unique_ptr<SpeechClassifier> classifier);

    Result process_chunk(const float* samples, std::size_t n);
    Result process_chunk(const std::vector<float>& samples) {
        return process_chunk(samples.data(), samples.size());
    }

    // Session end. Full windows still pending are classified first, so this
    // can close more than one segment; a trailing partial window is dropped.
    // Same 200 ms rule applies.
    std::vector<SpeechSegment> flush();

    void reset();

    std::size_t window_size() const { return window_size_; }
    int min_speech_frames() const { return min_speech_frames_; }
    int min_silence_frames() const { return min_silence_frames_; }
    float threshold() const { return threshold_; }
    bool triggered() const { return triggered_; }
    const Stats& stats() const { return stats_; }
    std::size_t buffered_samples() const {
        return pending_.size() + onset_.size() + speech_.size();
    }

private:
    // Returns true when a segment was closed by this window.
    bool process_window(const float* window, bool& failed, std::optional<SpeechSegment>& out);
    std::optional<SpeechSegment> close_segment();
    void clear_state();

    Config config_;
    std::unique_ptr<SpeechClassifier> classifier_;
    AdaptiveThreshold adaptive_;
    std::size_t window_size_;
    int min_speech_frames_;
    int min_silence_frames_;
    int trailing_keep_frames_;
    std::size_t padding_samples_;

    float threshold_;
    bool triggered_ = false;
    int speech_frames_ = 0;
    int silence_frames_ = 0;
    std::vector<float> pending_;  // leftover partial window
    std::vector<float> onset_;    // speech windows before the trigger
    std::vector<float> speech_;   // current segment
    std::size_t windows_seen_ = 0;
    Stats stats_;
};

const char* to_string(VoiceActivityDetector::Status status);

} // namespace livescribe
