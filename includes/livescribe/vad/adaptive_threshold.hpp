#pragma once
#include "livescribe/core/ring_buffer.hpp"

namespace livescribe {

// Tracks a rolling noise floor and SNR and nudges the speech-probability
// threshold: tighter in clean conditions, looser in noise, otherwise back
// toward the configured value. Time is audio time, fed by the caller.
class AdaptiveThreshold {
public:
    struct Config {
        float initial = 0.5f;
        float min = 0.3f;
        float max = 0.7f;
        float step = 0.02f;
        float relax_step = 0.01f;
        double adjust_interval_sec = 2.0;
        float high_snr_db = 15.0f;
        float low_snr_db = 5.0f;
    };

    static constexpr std::size_t kRmsWindow = 10;
    static constexpr std::size_t kSnrWindow = 10;
    static constexpr std::size_t kMinSnrSamples = 3;

    explicit AdaptiveThreshold(const Config& config);

    // Feeds one window's RMS at `audio_time_sec` and returns the threshold to use.
    float update(float rms, double audio_time_sec);

    float threshold() const { return threshold_; }
    float noise_floor() const { return noise_floor_; }
    bool warmed_up() const { return rms_history_.full(); }

    void reset();

private:
    Config config_;
    float threshold_;
    float noise_floor_ = 0.0f;
    double last_adjust_sec_ = 0.0;
    RingBuffer<float> rms_history_{kRmsWindow};
    RingBuffer<float> snr_history_{kSnrWindow};
};

} // namespace livescribe
