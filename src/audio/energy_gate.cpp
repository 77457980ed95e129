#include "livescribe/audio/energy_gate.hpp"
#include "livescribe/audio/rms.hpp"
#include "livescribe/core/log.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace livescribe {

namespace {
std::size_t to_samples(double sec, int sample_rate) {
    return static_cast<std::size_t>(std::llround(sec * sample_rate));
}

std::string seconds(std::size_t samples, int sample_rate) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << static_cast<double>(samples) / sample_rate << "s";
    return oss.str();
}
} // namespace

EnergyGate::EnergyGate(const Config& config)
    : config_(config),
      rms_threshold_(config.energy_threshold / 1000.0f),
      min_buffer_samples_(to_samples(config.min_buffer_sec, config.sample_rate)),
      silence_samples_(to_samples(config.silence_sec, config.sample_rate)),
      min_flush_samples_(to_samples(config.min_flush_sec, config.sample_rate)) {
}

void EnergyGate::reset() {
    buffer_.clear();
    silent_ = true;
    samples_since_sound_ = 0;
    last_sound_ = {};
}

std::size_t EnergyGate::voiced_samples() const {
    return buffer_.size() - std::min(samples_since_sound_, buffer_.size());
}

std::optional<SpeechSegment> EnergyGate::take_or_discard(std::size_t voiced, const char* reason) {
    std::optional<SpeechSegment> out;
    if (voiced >= min_flush_samples_ && voiced > 0) {
        SpeechSegment seg;
        seg.sample_rate = config_.sample_rate;
        seg.samples.assign(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(voiced));
        log::debug(std::string("Energy gate flush (") + reason + "): " + seconds(voiced, config_.sample_rate));
        out = std::move(seg);
    } else if (!buffer_.empty()) {
        log::debug(std::string("Energy gate discarded short buffer (") + reason + "): "
                   + seconds(voiced, config_.sample_rate));
    }
    buffer_.clear();
    samples_since_sound_ = 0;
    return out;
}

std::optional<SpeechSegment> EnergyGate::push(const float* samples, std::size_t n, Clock::time_point now) {
    if (!samples || n == 0) return std::nullopt;
    buffer_.insert(buffer_.end(), samples, samples + n);

    bool silence_close = false;
    const float rms = compute_rms(samples, n);
    if (rms > rms_threshold_) {
        last_sound_ = now;
        samples_since_sound_ = 0;
        if (silent_) {
            log::debug("Sound detected");
            silent_ = false;
        }
    } else if (!silent_) {
        // Only count silence once something was heard
        samples_since_sound_ += n;
        if (samples_since_sound_ >= silence_samples_) {
            log::debug("Silence for " + std::to_string(config_.silence_sec) + "s detected");
            silent_ = true;
            silence_close = true;
        }
    }

    if (silence_close) {
        return take_or_discard(voiced_samples(), "silence");
    }
    if (buffer_.size() >= min_buffer_samples_) {
        if (silent_ && buffer_.size() < min_flush_samples_) {
            return std::nullopt;
        }
        samples_since_sound_ = 0;
        return take_or_discard(buffer_.size(), "buffer length");
    }
    return std::nullopt;
}

std::optional<SpeechSegment> EnergyGate::on_timeout(Clock::time_point now) {
    if (silent_) return std::nullopt;
    const auto since = std::chrono::duration<double>(now - last_sound_).count();
    if (since <= config_.silence_sec) return std::nullopt;

    silent_ = true;
    const std::size_t voiced = voiced_samples();
    if (voiced <= min_flush_samples_) {
        // Too little to be worth a request; keep it for the next utterance.
        return std::nullopt;
    }
    return take_or_discard(voiced, "read timeout");
}

std::optional<SpeechSegment> EnergyGate::finish() {
    if (silent_) {
        if (!buffer_.empty()) {
            log::debug("Energy gate dropped " + seconds(buffer_.size(), config_.sample_rate) + " of trailing silence");
        }
        buffer_.clear();
        samples_since_sound_ = 0;
        return std::nullopt;
    }
    silent_ = true;
    return take_or_discard(voiced_samples(), "session end");
}

} // namespace livescribe
