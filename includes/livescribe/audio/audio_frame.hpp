#pragma once
#include <cstddef>
#include <vector>

namespace livescribe {

// One capture callback's worth of mono float PCM in [-1, 1].
struct AudioFrame {
    std::vector<float> samples;
    bool input_overflow = false;   // the device dropped input before this block
};

// A contiguous span judged to be one utterance. Handed to a backend by copy.
struct SpeechSegment {
    std::vector<float> samples;
    int sample_rate = 16000;

    double duration_sec() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
    bool empty() const { return samples.empty(); }
};

} // namespace livescribe
