#include "livescribe/output/output_fanout.hpp"
#include "livescribe/core/log.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <exception>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace livescribe {

namespace {

// Invalid UTF-8 (a split multibyte token) becomes U+FFFD instead of throwing.
std::string dump_lenient(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

const char* to_string(StatusMessage::Kind kind) {
    switch (kind) {
    case StatusMessage::Kind::Status: return "status";
    case StatusMessage::Kind::Error: return "error";
    case StatusMessage::Kind::Warning: return "warning";
    case StatusMessage::Kind::Transcription: return "transcription";
    case StatusMessage::Kind::Finished: return "finished";
    }
    return "status";
}

std::string integration_payload(const std::string& prefix, const std::string& text) {
    nlohmann::json j;
    j["source"] = "stt";
    j["text"] = prefix + text;
    return dump_lenient(j);
}

OutputFanout::OutputFanout(Config config, StatusQueue& status, IntegrationQueue* integration)
    : config_(std::move(config)), status_(status), integration_(integration) {
}

std::string OutputFanout::timestamp_now() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void OutputFanout::emit(StatusMessage::Kind kind, std::string text) {
    if (!status_.push(StatusMessage{kind, std::move(text)})) {
        log::warn("Status queue full, message dropped");
    }
}

void OutputFanout::publish(const std::string& text) {
    publish(text, timestamp_now());
}

void OutputFanout::publish(const std::string& text, const std::string& timestamp) {
    emit(StatusMessage::Kind::Transcription, timestamp + " - " + text);
    if (!config_.output_path.empty()) {
        try {
            write_file(text, timestamp);
        } catch (const std::exception& e) {
            file_failed(e.what());
        }
    }
    if (config_.integration_enabled) {
        try {
            enqueue_integration(text);
        } catch (const std::exception& e) {
            ++integration_dropped_;
            log::error(std::string("Integration message dropped: ") + e.what());
            emit(StatusMessage::Kind::Warning, "Integration message dropped");
        }
    }
}

void OutputFanout::file_failed(const std::string& reason) {
    ++file_failures_;
    log::error("Failed to write output file " + config_.output_path + ": " + reason);
    emit(StatusMessage::Kind::Warning, "Could not write to " + config_.output_path);
}

void OutputFanout::write_file(const std::string& text, const std::string& timestamp) {
    std::ofstream out(config_.output_path, std::ios::app);
    if (out) {
        if (config_.format == OutputFormat::Json) {
            nlohmann::json j;
            j["timestamp"] = timestamp;
            j["text"] = text;
            out << dump_lenient(j) << "\n";
        } else {
            out << timestamp << " - " << text << "\n";
        }
        out.flush();
    }
    if (!out) {
        file_failed("stream error");
    }
}

void OutputFanout::enqueue_integration(const std::string& text) {
    if (!integration_) return;
    if (!integration_->push(integration_payload(config_.integration_prefix, text))) {
        ++integration_dropped_;
        log::warn("Integration queue full, message dropped");
        emit(StatusMessage::Kind::Warning, "Integration queue full, message dropped");
    }
}

} // namespace livescribe
