#pragma once
#include "livescribe/core/message_queue.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace livescribe {

enum class ControlCommand { ToggleRecord, Ping, Quit };

// "TOGGLE_RECORD", "PING", "QUIT" (surrounding whitespace ignored, case-insensitive).
std::optional<ControlCommand> parse_control_command(const std::string& line);

// Reads command lines from a file descriptor on its own thread and queues
// them for the host loop. PING is answered directly with "PONG"; unknown
// lines get an error reply.
class ControlChannel {
public:
    using Reply = std::function<void(const std::string&)>;

    ControlChannel(int fd, MessageQueue<ControlCommand>& commands, Reply reply);
    ~ControlChannel();

    ControlChannel(const ControlChannel&) = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    void start();
    void stop();

    // Handles one complete line. Exposed so the reader logic can be driven directly.
    void handle_line(const std::string& line);

private:
    void run();

    int fd_;
    MessageQueue<ControlCommand>& commands_;
    Reply reply_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace livescribe
