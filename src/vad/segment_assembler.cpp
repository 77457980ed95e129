#include "livescribe/vad/segment_assembler.hpp"
#include "livescribe/core/log.hpp"

#include <stdexcept>

namespace livescribe {

namespace {
double seconds_between(SegmentAssembler::Clock::time_point a, SegmentAssembler::Clock::time_point b) {
    return std::chrono::duration<double>(b - a).count();
}
} // namespace

SegmentAssembler::SegmentAssembler() : SegmentAssembler(Config{}) {
}

SegmentAssembler::SegmentAssembler(const Config& config) : config_(config) {
}

void SegmentAssembler::clear() {
    segments_.clear();
    total_sec_ = 0.0;
}

std::optional<SpeechSegment> SegmentAssembler::concatenate() {
    std::optional<SpeechSegment> out;
    try {
        SpeechSegment merged;
        merged.sample_rate = segments_.front().sample_rate;
        std::size_t total = 0;
        for (const auto& s : segments_) {
            if (s.sample_rate != merged.sample_rate) {
                throw std::runtime_error("mixed sample rates in buffered segments");
            }
            total += s.samples.size();
        }
        merged.samples.reserve(total);
        for (const auto& s : segments_) {
            merged.samples.insert(merged.samples.end(), s.samples.begin(), s.samples.end());
        }
        log::debug("Assembled " + std::to_string(segments_.size()) + " segments, "
                   + std::to_string(merged.duration_sec()) + "s");
        out = std::move(merged);
    } catch (const std::exception& e) {
        log::error(std::string("Failed to concatenate segments: ") + e.what());
    }
    clear();
    return out;
}

std::optional<SpeechSegment> SegmentAssembler::add(SpeechSegment segment, Clock::time_point now) {
    const double dur = segment.duration_sec();
    if (dur < config_.min_segment_sec) {
        log::debug("Ignoring short VAD segment (" + std::to_string(dur) + "s)");
        return std::nullopt;
    }

    const bool continuation = !segments_.empty()
        && seconds_between(last_append_, now) < config_.continuation_gap_sec;

    segments_.push_back(std::move(segment));
    total_sec_ += dur;
    last_append_ = now;

    if (total_sec_ >= config_.hard_cap_sec) {
        return concatenate();
    }
    if (total_sec_ >= config_.soft_min_sec && !continuation && segments_.size() >= 2) {
        return concatenate();
    }
    return std::nullopt;
}

std::optional<SpeechSegment> SegmentAssembler::poll(Clock::time_point now) {
    if (segments_.empty()) return std::nullopt;
    if (seconds_between(last_append_, now) < config_.idle_timeout_sec) return std::nullopt;
    return finish();
}

std::optional<SpeechSegment> SegmentAssembler::finish() {
    if (segments_.empty()) return std::nullopt;
    if (total_sec_ >= config_.min_flush_sec) {
        return concatenate();
    }
    log::debug("Dropping " + std::to_string(total_sec_) + "s of stale audio");
    clear();
    return std::nullopt;
}

} // namespace livescribe
