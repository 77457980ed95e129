#include "livescribe/output/integration_worker.hpp"
#include "livescribe/core/log.hpp"

#include <chrono>

namespace livescribe {

IntegrationWorker::IntegrationWorker(IntegrationQueue& queue, Transport transport)
    : queue_(queue), transport_(std::move(transport)) {
}

IntegrationWorker::~IntegrationWorker() {
    stop();
}

void IntegrationWorker::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread([this] { run(); });
}

void IntegrationWorker::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void IntegrationWorker::run() {
    log::debug("Integration worker started");
    std::string payload;
    while (running_) {
        if (!queue_.pop_for(payload, std::chrono::milliseconds(200))) {
            continue;
        }
        bool ok = false;
        try {
            ok = transport_ && transport_(payload);
        } catch (const std::exception& e) {
            log::error(std::string("Integration transport error: ") + e.what());
        }
        if (ok) {
            ++delivered_;
        } else {
            ++failed_;
            log::warn("Integration payload dropped");
        }
    }
    log::debug("Integration worker stopped");
}

} // namespace livescribe
