#pragma once
#include <string>

namespace livescribe::log {

enum class Level { Debug = 0, Info, Warning, Error };

// Console threshold. The log file (if any) always receives everything.
void set_level(Level level);
Level level();

// Parses "DEBUG", "INFO", "WARNING"/"WARN", "ERROR" (case-insensitive).
// Unknown names return Level::Info.
Level parse_level(const std::string& name);

// Opens <dir>/livescribe_<timestamp>.log for appending. If the directory
// cannot be created the file is opened in the current directory instead.
// Returns the path actually used, or an empty string if no file could be opened.
std::string init_file(const std::string& dir);
void close_file();

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace livescribe::log
