#pragma once
#include "livescribe/core/config.hpp"
#include "livescribe/output/status_message.hpp"

#include <cstddef>
#include <string>

namespace livescribe {

// Routes accepted text to the display (status queue), the output file and
// the remote-integration queue. No sink failure is fatal.
class OutputFanout {
public:
    struct Config {
        std::string output_path;
        OutputFormat format = OutputFormat::Text;
        bool integration_enabled = false;
        std::string integration_prefix;
    };

    OutputFanout(Config config, StatusQueue& status, IntegrationQueue* integration);

    void publish(const std::string& text);
    void publish(const std::string& text, const std::string& timestamp);

    std::size_t integration_dropped() const { return integration_dropped_; }
    std::size_t file_failures() const { return file_failures_; }

    // Local time as "YYYY-MM-DD HH:MM:SS".
    static std::string timestamp_now();

private:
    void write_file(const std::string& text, const std::string& timestamp);
    void enqueue_integration(const std::string& text);
    void file_failed(const std::string& reason);
    void emit(StatusMessage::Kind kind, std::string text);

    Config config_;
    StatusQueue& status_;
    IntegrationQueue* integration_;
    std::size_t integration_dropped_ = 0;
    std::size_t file_failures_ = 0;
};

// {"source":"stt","text":"<prefix><text>"}
std::string integration_payload(const std::string& prefix, const std::string& text);

} // namespace livescribe
