#pragma once
#include <cstddef>
#include <functional>
#include <memory>

namespace livescribe {

// Per-window speech probability. Implementations throw on inference failure;
// the detector skips the failed window.
class SpeechClassifier {
public:
    virtual ~SpeechClassifier() = default;

    virtual float probability(const float* window, std::size_t n) = 0;

    // Clears any recurrent state between sessions.
    virtual void reset() {}
};

// Builds a classifier for a sample rate, or throws if it cannot.
using ClassifierFactory = std::function<std::unique_ptr<SpeechClassifier>(int sample_rate)>;

} // namespace livescribe
