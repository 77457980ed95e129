#pragma once
#include "livescribe/output/status_message.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace livescribe {

// Drains the integration queue on its own thread and hands each payload to
// `transport`. A failing transport drops the payload; nothing is retried.
class IntegrationWorker {
public:
    // Returns false if the payload could not be delivered.
    using Transport = std::function<bool(const std::string& payload)>;

    IntegrationWorker(IntegrationQueue& queue, Transport transport);
    ~IntegrationWorker();

    IntegrationWorker(const IntegrationWorker&) = delete;
    IntegrationWorker& operator=(const IntegrationWorker&) = delete;

    void start();
    // Stops after the payload in flight; anything still queued stays queued.
    void stop();

    bool running() const { return running_; }
    std::size_t delivered() const { return delivered_; }
    std::size_t failed() const { return failed_; }

private:
    void run();

    IntegrationQueue& queue_;
    Transport transport_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_{0};
    std::thread thread_;
};

} // namespace livescribe
