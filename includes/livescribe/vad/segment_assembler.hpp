#pragma once
#include "livescribe/audio/audio_frame.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace livescribe {

// Merges short VAD segments into chunks long enough to transcribe well.
class SegmentAssembler {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        double min_segment_sec = 0.3;        // shorter VAD segments are noise
        double hard_cap_sec = 4.5;
        double soft_min_sec = 2.5;
        double continuation_gap_sec = 1.5;   // closer than this = same utterance
        double idle_timeout_sec = 2.0;
        double min_flush_sec = 0.5;
    };

    SegmentAssembler();
    explicit SegmentAssembler(const Config& config);

    std::optional<SpeechSegment> add(SpeechSegment segment, Clock::time_point now);

    // Idle check, called when no new segment arrived.
    std::optional<SpeechSegment> poll(Clock::time_point now);

    // Session end: flush once if at least min_flush_sec is buffered.
    std::optional<SpeechSegment> finish();

    void clear();

    bool empty() const { return segments_.empty(); }
    std::size_t segment_count() const { return segments_.size(); }
    double buffered_sec() const { return total_sec_; }

private:
    std::optional<SpeechSegment> concatenate();

    Config config_;
    std::vector<SpeechSegment> segments_;
    double total_sec_ = 0.0;
    Clock::time_point last_append_{};
};

} // namespace livescribe
