#pragma once
#include <algorithm>
#include <cstddef>
#include <vector>

namespace livescribe {

// Fixed-size rolling window; the oldest value is overwritten once full.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t n) : data_(n), n_(n) {}

    void push(T v) {
        data_[idx_] = v;
        idx_ = (idx_ + 1) % n_;
        filled_ = filled_ || idx_ == 0;
    }

    std::size_t size() const { return filled_ ? n_ : idx_; }
    std::size_t capacity() const { return n_; }
    bool full() const { return filled_; }

    void clear() {
        idx_ = 0;
        filled_ = false;
    }

    T average() const {
        if (size() == 0) return T{};
        T sum{};
        for (std::size_t i = 0; i < size(); ++i) sum += data_[i];
        return sum / static_cast<T>(size());
    }

    // Nearest-rank percentile, p in [0, 1].
    T percentile(double p) const {
        if (size() == 0) return T{};
        std::vector<T> sorted(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(size()));
        std::sort(sorted.begin(), sorted.end());
        p = std::clamp(p, 0.0, 1.0);
        auto idx = static_cast<std::size_t>(p * static_cast<double>(sorted.size()));
        return sorted[std::min(idx, sorted.size() - 1)];
    }

private:
    std::vector<T> data_;
    std::size_t n_{};
    std::size_t idx_{};
    bool filled_{};
};

} // namespace livescribe
