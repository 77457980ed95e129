#pragma once
#include <atomic>

namespace livescribe {

// Cooperative stop flag shared between the host and a worker. The worker
// polls it once per loop iteration; nothing is interrupted mid-call.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace livescribe
