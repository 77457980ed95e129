#include "livescribe/control/control_channel.hpp"
#include "livescribe/core/log.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>

namespace livescribe {

std::optional<ControlCommand> parse_control_command(const std::string& line) {
    std::string s;
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    if (s == "TOGGLE_RECORD") return ControlCommand::ToggleRecord;
    if (s == "PING") return ControlCommand::Ping;
    if (s == "QUIT") return ControlCommand::Quit;
    return std::nullopt;
}

ControlChannel::ControlChannel(int fd, MessageQueue<ControlCommand>& commands, Reply reply)
    : fd_(fd), commands_(commands), reply_(std::move(reply)) {
}

ControlChannel::~ControlChannel() {
    stop();
}

void ControlChannel::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread([this] { run(); });
}

void ControlChannel::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ControlChannel::handle_line(const std::string& line) {
    if (std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); })) {
        return;
    }
    auto cmd = parse_control_command(line);
    if (!cmd) {
        log::warn("Unknown control command: " + line);
        if (reply_) reply_("ERROR: unknown command");
        return;
    }
    if (*cmd == ControlCommand::Ping) {
        if (reply_) reply_("PONG");
        return;
    }
    log::debug("Control command: " + line);
    if (!commands_.push(*cmd)) {
        log::warn("Control queue full, command dropped");
    }
}

void ControlChannel::run() {
    std::string line;
    char buf[256];
    while (running_) {
        pollfd pfd{fd_, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, 200);
        if (rc <= 0) continue;
        const ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n <= 0) {
            // EOF: nothing more will arrive on this channel.
            log::debug("Control channel closed");
            break;
        }
        for (ssize_t i = 0; i < n; ++i) {
            if (buf[i] == '\n') {
                handle_line(line);
                line.clear();
            } else if (buf[i] != '\r') {
                line.push_back(buf[i]);
            }
        }
    }
    running_ = false;
}

} // namespace livescribe
