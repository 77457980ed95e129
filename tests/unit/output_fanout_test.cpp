#undef NDEBUG
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "livescribe/output/integration_worker.hpp"
#include "livescribe/output/output_fanout.hpp"

using namespace livescribe;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> read_lines(const fs::path& p) {
    std::vector<std::string> out;
    std::ifstream in(p);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

std::vector<StatusMessage> drain(StatusQueue& q) {
    std::vector<StatusMessage> out;
    StatusMessage m;
    while (q.try_pop(m)) out.push_back(m);
    return out;
}

} // namespace

int main() {
    auto dir = fs::temp_directory_path() / "livescribe_output_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    // Display + text file
    {
        StatusQueue status;
        OutputFanout::Config c;
        c.output_path = (dir / "out.txt").string();
        OutputFanout out(c, status, nullptr);
        out.publish("hello", "2024-01-01 10:00:00");
        out.publish("again", "2024-01-01 10:00:05");

        auto msgs = drain(status);
        assert(msgs.size() == 2);
        assert(msgs[0].kind == StatusMessage::Kind::Transcription);
        assert(msgs[0].text == "2024-01-01 10:00:00 - hello");

        auto lines = read_lines(dir / "out.txt");
        assert(lines.size() == 2);
        assert(lines[0] == "2024-01-01 10:00:00 - hello");
        assert(lines[1] == "2024-01-01 10:00:05 - again");
    }

    // JSON lines keep non-ASCII text as is
    {
        StatusQueue status;
        OutputFanout::Config c;
        c.output_path = (dir / "out.jsonl").string();
        c.format = OutputFormat::Json;
        OutputFanout out(c, status, nullptr);
        out.publish("Grüße", "2024-01-01 10:00:00");

        auto lines = read_lines(dir / "out.jsonl");
        assert(lines.size() == 1);
        assert(lines[0].find("Grüße") != std::string::npos);
        auto j = nlohmann::json::parse(lines[0]);
        assert(j["timestamp"] == "2024-01-01 10:00:00");
        assert(j["text"] == "Grüße");
    }

    // A split multibyte sequence is replaced, not fatal
    {
        StatusQueue status;
        IntegrationQueue integration(4);
        OutputFanout::Config c;
        c.output_path = (dir / "split.jsonl").string();
        c.format = OutputFormat::Json;
        c.integration_enabled = true;
        OutputFanout out(c, status, &integration);
        out.publish("caf\xC3", "2024-01-01 10:00:00");

        assert(out.file_failures() == 0);
        assert(out.integration_dropped() == 0);
        auto lines = read_lines(dir / "split.jsonl");
        assert(lines.size() == 1);
        assert(nlohmann::json::parse(lines[0])["text"] == "caf\xEF\xBF\xBD");

        std::string payload;
        assert(integration.try_pop(payload));
        assert(nlohmann::json::parse(payload)["text"] == "caf\xEF\xBF\xBD");
        assert(integration_payload("", "\xFF") == "{\"source\":\"stt\",\"text\":\"\xEF\xBF\xBD\"}");
    }

    // Integration queue overflow drops with a warning
    {
        StatusQueue status;
        IntegrationQueue integration(2);
        OutputFanout::Config c;
        c.integration_enabled = true;
        c.integration_prefix = "P: ";
        OutputFanout out(c, status, &integration);
        out.publish("one", "t");
        out.publish("two", "t");
        out.publish("three", "t");
        assert(integration.size() == 2);
        assert(out.integration_dropped() == 1);

        std::string payload;
        assert(integration.try_pop(payload));
        auto j = nlohmann::json::parse(payload);
        assert(j["source"] == "stt");
        assert(j["text"] == "P: one");

        bool warned = false;
        for (const auto& m : drain(status)) warned = warned || m.kind == StatusMessage::Kind::Warning;
        assert(warned);
    }

    // A failing file sink only warns
    {
        StatusQueue status;
        OutputFanout::Config c;
        c.output_path = (dir / "missing_dir" / "out.txt").string();
        OutputFanout out(c, status, nullptr);
        out.publish("hello", "t");
        assert(out.file_failures() == 1);
        auto msgs = drain(status);
        assert(msgs.size() == 2);
        assert(msgs[1].kind == StatusMessage::Kind::Warning);
    }

    assert(OutputFanout::timestamp_now().size() == 19);
    assert(integration_payload("", "x") == R"({"source":"stt","text":"x"})");

    // Worker drains the queue through the transport
    {
        IntegrationQueue q(kIntegrationQueueCapacity);
        std::mutex m;
        std::vector<std::string> sent;
        IntegrationWorker worker(q, [&](const std::string& p) {
            std::lock_guard<std::mutex> lock(m);
            sent.push_back(p);
            return p != "bad";
        });
        q.push("a");
        q.push("bad");
        q.push("c");
        worker.start();
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (worker.delivered() + worker.failed() < 3 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        worker.stop();
        assert(!worker.running());
        assert(worker.delivered() == 2);
        assert(worker.failed() == 1);
        assert(sent.size() == 3 && sent[0] == "a" && sent[2] == "c");
    }

    fs::remove_all(dir);
    return 0;
}
