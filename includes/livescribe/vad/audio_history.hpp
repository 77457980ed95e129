#pragma once
#include <cstddef>
#include <vector>

namespace livescribe {

// Most recent audio in one contiguous block, oldest first. Lets a stateless
// classifier call see the context that preceded the current window.
class AudioHistory {
public:
    explicit AudioHistory(std::size_t capacity);

    // Appends and trims to capacity. A block longer than capacity is kept whole.
    const std::vector<float>& append(const float* samples, std::size_t n);

    const std::vector<float>& samples() const { return samples_; }
    std::size_t size() const { return samples_.size(); }
    std::size_t capacity() const { return capacity_; }
    void clear() { samples_.clear(); }

private:
    std::size_t capacity_;
    std::vector<float> samples_;
};

} // namespace livescribe
