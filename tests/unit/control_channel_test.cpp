#undef NDEBUG
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "livescribe/control/control_channel.hpp"

using namespace livescribe;

int main() {
    assert(parse_control_command("TOGGLE_RECORD") == ControlCommand::ToggleRecord);
    assert(parse_control_command("  toggle_record\r") == ControlCommand::ToggleRecord);
    assert(parse_control_command("PING") == ControlCommand::Ping);
    assert(parse_control_command("quit") == ControlCommand::Quit);
    assert(!parse_control_command("START"));

    // Lines handled directly
    {
        MessageQueue<ControlCommand> commands;
        std::vector<std::string> replies;
        ControlChannel channel(-1, commands, [&](const std::string& r) { replies.push_back(r); });

        channel.handle_line("PING");
        assert(replies.size() == 1 && replies[0] == "PONG");
        assert(commands.empty());

        channel.handle_line("DANCE");
        assert(replies.size() == 2 && replies[1].rfind("ERROR", 0) == 0);

        channel.handle_line("   ");
        assert(replies.size() == 2);

        channel.handle_line("TOGGLE_RECORD");
        ControlCommand cmd;
        assert(commands.try_pop(cmd) && cmd == ControlCommand::ToggleRecord);
    }

    // Reader thread over a pipe
    {
        int fds[2];
        assert(::pipe(fds) == 0);
        MessageQueue<ControlCommand> commands;
        ControlChannel channel(fds[0], commands, nullptr);
        channel.start();

        const std::string input = "TOGGLE_RECORD\nQU";
        assert(::write(fds[1], input.data(), input.size()) == static_cast<ssize_t>(input.size()));
        const std::string rest = "IT\n";
        assert(::write(fds[1], rest.data(), rest.size()) == static_cast<ssize_t>(rest.size()));

        ControlCommand cmd;
        assert(commands.pop_for(cmd, std::chrono::seconds(5)) && cmd == ControlCommand::ToggleRecord);
        assert(commands.pop_for(cmd, std::chrono::seconds(5)) && cmd == ControlCommand::Quit);

        ::close(fds[1]);
        channel.stop();
        ::close(fds[0]);
    }
    return 0;
}
