#include "livescribe/vad/audio_history.hpp"

#include <algorithm>

namespace livescribe {

AudioHistory::AudioHistory(std::size_t capacity) : capacity_(capacity) {
    samples_.reserve(capacity_);
}

const std::vector<float>& AudioHistory::append(const float* samples, std::size_t n) {
    if (!samples || n == 0) return samples_;
    samples_.insert(samples_.end(), samples, samples + n);
    const std::size_t keep = std::max(capacity_, n);
    if (samples_.size() > keep) {
        samples_.erase(samples_.begin(), samples_.end() - static_cast<std::ptrdiff_t>(keep));
    }
    return samples_;
}

} // namespace livescribe
