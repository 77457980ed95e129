#include "livescribe/vad/adaptive_threshold.hpp"
#include "livescribe/core/log.hpp"

#include <algorithm>
#include <cmath>

namespace livescribe {

namespace {
constexpr float kFloorSmoothing = 0.95f;
constexpr float kEpsilon = 1e-9f;
} // namespace

AdaptiveThreshold::AdaptiveThreshold(const Config& config)
    : config_(config), threshold_(config.initial) {
}

void AdaptiveThreshold::reset() {
    threshold_ = config_.initial;
    noise_floor_ = 0.0f;
    last_adjust_sec_ = 0.0;
    rms_history_.clear();
    snr_history_.clear();
}

float AdaptiveThreshold::update(float rms, double audio_time_sec) {
    rms_history_.push(rms);
    if (!rms_history_.full()) {
        return threshold_;
    }

    const float p20 = rms_history_.percentile(0.2);
    if (rms <= p20) {
        noise_floor_ = noise_floor_ <= 0.0f
            ? rms
            : kFloorSmoothing * noise_floor_ + (1.0f - kFloorSmoothing) * rms;
    }
    if (noise_floor_ <= 0.0f) {
        return threshold_;
    }

    const float snr_db = 20.0f * std::log10((rms + kEpsilon) / (noise_floor_ + kEpsilon));
    snr_history_.push(snr_db);

    if (audio_time_sec - last_adjust_sec_ < config_.adjust_interval_sec
        || snr_history_.size() < kMinSnrSamples) {
        return threshold_;
    }
    last_adjust_sec_ = audio_time_sec;

    const float avg_snr = snr_history_.average();
    const float before = threshold_;
    if (avg_snr > config_.high_snr_db) {
        threshold_ = std::min(config_.max, threshold_ + config_.step);
    } else if (avg_snr < config_.low_snr_db) {
        threshold_ = std::max(config_.min, threshold_ - config_.step);
    } else if (threshold_ > config_.initial) {
        threshold_ = std::max(config_.initial, threshold_ - config_.relax_step);
    } else if (threshold_ < config_.initial) {
        threshold_ = std::min(config_.initial, threshold_ + config_.relax_step);
    }

    if (threshold_ != before) {
        log::debug("VAD threshold " + std::to_string(before) + " -> " + std::to_string(threshold_)
                   + " (avg SNR " + std::to_string(avg_snr) + " dB)");
    }
    return threshold_;
}

} // namespace livescribe
