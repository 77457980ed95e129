#include "livescribe/vad/voice_activity_detector.hpp"
#include "livescribe/audio/rms.hpp"
#include "livescribe/core/errors.hpp"
#include "livescribe/core/log.hpp"

#include <algorithm>

namespace livescribe {

namespace {

std::size_t window_for_rate(int sample_rate) {
    switch (sample_rate) {
    case 16000: return 512;
    case 8000: return 256;
    default:
        throw ConfigurationError("VAD supports 8000 or 16000 Hz, got " + std::to_string(sample_rate));
    }
}

// Durations become whole windows, rounded up.
int frames_for_ms(int ms, std::size_t window, int sample_rate) {
    if (ms <= 0) return 0;
    const long long num = static_cast<long long>(ms) * sample_rate;
    const long long den = static_cast<long long>(window) * 1000;
    return static_cast<int>((num + den - 1) / den);
}

AdaptiveThreshold::Config adaptive_config(float initial) {
    AdaptiveThreshold::Config c;
    c.initial = initial;
    return c;
}

} // namespace

const char* to_string(VoiceActivityDetector::Status status) {
    switch (status) {
    case VoiceActivityDetector::Status::Processing: return "PROCESSING";
    case VoiceActivityDetector::Status::SpeechEnded: return "SPEECH_ENDED";
    case VoiceActivityDetector::Status::Error: return "ERROR";
    }
    return "UNKNOWN";
}

VoiceActivityDetector::VoiceActivityDetector(const Config& config,
                                             std::unique_ptr<SpeechClassifier> classifier)
    : config_(config),
      classifier_(std::move(classifier)),
      adaptive_(adaptive_config(config.threshold)),
      window_size_(window_for_rate(config.sample_rate)),
      min_speech_frames_(frames_for_ms(config.min_speech_ms, window_size_, config.sample_rate)),
      min_silence_frames_(frames_for_ms(config.min_silence_ms, window_size_, config.sample_rate)),
      trailing_keep_frames_(std::min(3, min_silence_frames_ / 2)),
      padding_samples_(config.padding && config.padding_ms > 0
                           ? static_cast<std::size_t>(config.padding_ms) * config.sample_rate / 1000
                           : 0),
      threshold_(config.threshold) {
    if (!classifier_) {
        throw ConfigurationError("VAD requires a speech classifier");
    }
    if (config.threshold < 0.0f || config.threshold > 1.0f) {
        throw ConfigurationError("VAD threshold must be within [0, 1]");
    }
    min_speech_frames_ = std::max(1, min_speech_frames_);
    min_silence_frames_ = std::max(1, min_silence_frames_);
    log::debug("VAD: window " + std::to_string(window_size_) + " samples, min speech "
               + std::to_string(min_speech_frames_) + " windows, min silence "
               + std::to_string(min_silence_frames_) + " windows");
}

void VoiceActivityDetector::clear_state() {
    triggered_ = false;
    speech_frames_ = 0;
    silence_frames_ = 0;
    onset_.clear();
    speech_.clear();
}

void VoiceActivityDetector::reset() {
    clear_state();
    pending_.clear();
    windows_seen_ = 0;
    stats_ = Stats{};
    adaptive_.reset();
    threshold_ = config_.threshold;
    classifier_->reset();
}

std::optional<SpeechSegment> VoiceActivityDetector::close_segment() {
    std::vector<float> samples;
    samples.swap(speech_);
    clear_state();

    const std::size_t min_samples =
        static_cast<std::size_t>(kMinSegmentMs) * static_cast<std::size_t>(config_.sample_rate) / 1000;
    if (samples.size() < min_samples) {
        stats_.discarded += samples.size();
        if (config_.debug) log::debug("VAD dropped short segment (" + std::to_string(samples.size()) + " samples)");
        return std::nullopt;
    }
    stats_.emitted += samples.size();

    SpeechSegment seg;
    seg.sample_rate = config_.sample_rate;
    if (padding_samples_ > 0) {
        seg.samples.reserve(samples.size() + 2 * padding_samples_);
        seg.samples.assign(padding_samples_, 0.0f);
        seg.samples.insert(seg.samples.end(), samples.begin(), samples.end());
        seg.samples.insert(seg.samples.end(), padding_samples_, 0.0f);
    } else {
        seg.samples = std::move(samples);
    }
    return seg;
}

bool VoiceActivityDetector::process_window(const float* window, bool& failed,
                                           std::optional<SpeechSegment>& out) {
    ++windows_seen_;
    float prob = 0.0f;
    try {
        prob = classifier_->probability(window, window_size_);
    } catch (const std::exception& e) {
        // Skip this window only
        failed = true;
        ++stats_.failed_windows;
        stats_.discarded += window_size_;
        log::warn(std::string("VAD window failed: ") + e.what());
        return false;
    }

    if (config_.adaptive_threshold) {
        const double audio_time = static_cast<double>(windows_seen_ * window_size_) / config_.sample_rate;
        threshold_ = adaptive_.update(compute_rms(window, window_size_), audio_time);
    }
    const bool is_speech = prob >= threshold_;
    if (config_.debug) {
        log::debug("VAD p=" + std::to_string(prob) + " thr=" + std::to_string(threshold_)
                   + (is_speech ? " speech" : " silence"));
    }

    if (!triggered_) {
        if (is_speech) {
            onset_.insert(onset_.end(), window, window + window_size_);
            if (++speech_frames_ >= min_speech_frames_) {
                triggered_ = true;
                silence_frames_ = 0;
                speech_.swap(onset_);
                onset_.clear();
                if (config_.debug) log::debug("VAD triggered");
            }
        } else {
            stats_.discarded += onset_.size() + window_size_;
            onset_.clear();
            speech_frames_ = 0;
        }
        return false;
    }

    if (is_speech) {
        silence_frames_ = 0;
        speech_.insert(speech_.end(), window, window + window_size_);
        return false;
    }

    ++silence_frames_;
    if (silence_frames_ <= trailing_keep_frames_) {
        speech_.insert(speech_.end(), window, window + window_size_);
    } else {
        stats_.discarded += window_size_;
    }
    if (silence_frames_ < min_silence_frames_) {
        return false;
    }
    out = close_segment();
    return out.has_value();
}

VoiceActivityDetector::Result VoiceActivityDetector::process_chunk(const float* samples, std::size_t n) {
    Result result;
    if (samples && n > 0) {
        pending_.insert(pending_.end(), samples, samples + n);
        stats_.fed += n;
    }

    bool failed = false;
    std::size_t offset = 0;
    while (pending_.size() - offset >= window_size_) {
        const bool ended = process_window(pending_.data() + offset, failed, result.segment);
        offset += window_size_;
        if (ended) {
            // One segment per call; the rest waits for the next call.
            break;
        }
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));

    if (result.segment) {
        result.status = Status::SpeechEnded;
    } else if (failed) {
        result.status = Status::Error;
    }
    return result;
}

std::vector<SpeechSegment> VoiceActivityDetector::flush() {
    std::vector<SpeechSegment> segments;
    bool failed = false;
    std::size_t offset = 0;
    while (pending_.size() - offset >= window_size_) {
        std::optional<SpeechSegment> seg;
        if (process_window(pending_.data() + offset, failed, seg)) {
            segments.push_back(std::move(*seg));
        }
        offset += window_size_;
    }
    stats_.discarded += pending_.size() - offset;
    pending_.clear();

    if (!triggered_) {
        stats_.discarded += onset_.size();
        clear_state();
    } else if (auto seg = close_segment()) {
        segments.push_back(std::move(*seg));
    }
    return segments;
}

} // namespace livescribe
