#include "livescribe/core/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace livescribe::log {

namespace {

std::mutex g_mutex;
Level g_level = Level::Info;
std::ofstream g_file;

std::string timestamp(const char* fmt) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

const char* level_name(Level l) {
    switch (l) {
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO ";
        case Level::Warning: return "WARN ";
        case Level::Error:   return "ERROR";
    }
    return "?    ";
}

void write(Level l, const std::string& msg) {
    const std::string line = timestamp("%Y-%m-%d %H:%M:%S") + " [" + level_name(l) + "] " + msg;
    std::lock_guard<std::mutex> lock(g_mutex);
    if (l >= g_level) {
        std::cerr << line << std::endl;
    }
    if (g_file.is_open()) {
        g_file << line << '\n';
        g_file.flush();
    }
}

} // namespace

void set_level(Level level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
}

Level level() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_level;
}

Level parse_level(const std::string& name) {
    std::string up = name;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "DEBUG") return Level::Debug;
    if (up == "WARNING" || up == "WARN") return Level::Warning;
    if (up == "ERROR" || up == "CRITICAL") return Level::Error;
    return Level::Info;
}

std::string init_file(const std::string& dir) {
    namespace fs = std::filesystem;
    fs::path base(dir);
    std::error_code ec;
    if (!dir.empty()) {
        fs::create_directories(base, ec);
        if (ec) {
            std::cerr << "Failed to create log directory " << dir << ": " << ec.message()
                      << " (logging to current directory)\n";
            base = ".";
        }
    } else {
        base = ".";
    }

    const fs::path path = base / ("livescribe_" + timestamp("%Y-%m-%d_%H-%M-%S") + ".log");
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file.is_open()) g_file.close();
    g_file.open(path, std::ios::app);
    if (!g_file.is_open()) {
        std::cerr << "Failed to open log file " << path << "\n";
        return {};
    }
    return path.string();
}

void close_file() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file.is_open()) g_file.close();
}

void debug(const std::string& msg) { write(Level::Debug, msg); }
void info(const std::string& msg)  { write(Level::Info, msg); }
void warn(const std::string& msg)  { write(Level::Warning, msg); }
void error(const std::string& msg) { write(Level::Error, msg); }

} // namespace livescribe::log
