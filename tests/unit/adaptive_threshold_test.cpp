#undef NDEBUG
#include <cassert>
#include <cmath>
#include "livescribe/vad/adaptive_threshold.hpp"

using livescribe::AdaptiveThreshold;

namespace {
bool near(float a, float b) { return std::fabs(a - b) < 1e-5f; }
constexpr double kWindowSec = 0.032;
} // namespace

int main() {
    AdaptiveThreshold::Config cfg;
    cfg.initial = 0.5f;

    // Inactive until the RMS window is full
    {
        AdaptiveThreshold at(cfg);
        for (int i = 0; i < 9; ++i) {
            assert(near(at.update(i % 2 ? 0.1f : 0.001f, 10.0 + i), 0.5f));
        }
        assert(!at.warmed_up());
        at.update(0.001f, 20.0);
        assert(at.warmed_up());
    }

    double t = 0.0;
    AdaptiveThreshold at(cfg);

    // Clean signal (avg SNR ~20 dB): tighten up to the maximum
    for (int i = 0; i < 2000; ++i) {
        t += kWindowSec;
        at.update(i % 2 ? 0.1f : 0.001f, t);
    }
    assert(near(at.threshold(), 0.7f));
    assert(near(at.noise_floor(), 0.001f));

    // Flat noise (SNR ~0 dB): loosen down to the minimum
    for (int i = 0; i < 2000; ++i) {
        t += kWindowSec;
        at.update(0.01f, t);
    }
    assert(near(at.threshold(), 0.3f));

    // Moderate SNR (~10 dB): relax back toward the initial value
    for (int i = 0; i < 4000; ++i) {
        t += kWindowSec;
        at.update(i % 2 ? 0.1f : 0.01f, t);
    }
    assert(near(at.threshold(), 0.5f));

    // Adjustments are rate limited to one per interval
    {
        AdaptiveThreshold fast(cfg);
        for (int i = 0; i < 60; ++i) fast.update(i % 2 ? 0.1f : 0.001f, 0.0 + i * kWindowSec);
        // 60 windows is under 2 s of audio
        assert(near(fast.threshold(), 0.5f));
    }

    at.reset();
    assert(near(at.threshold(), 0.5f));
    assert(!at.warmed_up());
    assert(at.noise_floor() == 0.0f);
    return 0;
}
