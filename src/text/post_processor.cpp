#include "livescribe/text/post_processor.hpp"
#include "livescribe/core/log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace livescribe::text {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

std::string strip_inline_icase(const std::string& p) {
    return p.rfind("(?i)", 0) == 0 ? p.substr(4) : p;
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string preview(const std::string& s) {
    return s.size() > 100 ? s.substr(0, 100) + "..." : s;
}

void ensure_parent_dir(const std::string& path) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
}

} // namespace

FilterRules compile_filters(const std::vector<std::string>& patterns) {
    FilterRules out;
    for (const auto& p : patterns) {
        try {
            out.push_back({p, std::regex(strip_inline_icase(p), kFlags)});
        } catch (const std::regex_error& e) {
            log::warn("Invalid filter pattern '" + p + "': " + e.what());
        }
    }
    return out;
}

ReplacementRules compile_replacements(const std::vector<std::pair<std::string, std::string>>& rules) {
    ReplacementRules out;
    for (const auto& [pattern, replacement] : rules) {
        try {
            out.push_back({pattern, replacement, std::regex(strip_inline_icase(pattern), kFlags)});
        } catch (const std::regex_error& e) {
            log::warn("Invalid replacement rule '" + pattern + "' -> '" + replacement + "': " + e.what());
        }
    }
    return out;
}

std::string apply_replacements(const std::string& text, const ReplacementRules& rules) {
    if (text.empty() || rules.empty()) return text;

    std::string modified = text;
    for (const auto& rule : rules) {
        try {
            modified = std::regex_replace(modified, rule.re, rule.replacement);
        } catch (const std::regex_error& e) {
            log::warn("Replacement rule '" + rule.pattern + "' failed: " + e.what());
        }
    }
    if (modified != text) {
        log::debug("Replacements applied: " + preview(modified));
    }
    return modified;
}

std::string filter(const std::string& text, const FilterRules& patterns, bool drop_parenthetical) {
    if (text.empty()) return {};

    std::string cleaned = text;
    if (drop_parenthetical) {
        static const std::regex round(R"(\([^)]*\))");
        static const std::regex square(R"(\[[^\]]*\])");
        cleaned = trim(std::regex_replace(cleaned, round, ""));
        cleaned = trim(std::regex_replace(cleaned, square, ""));
    }

    std::istringstream lines(cleaned);
    std::string line;
    std::string result;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.empty()) continue;

        bool unwanted = false;
        for (const auto& p : patterns) {
            try {
                if (std::regex_search(line, p.re)) { unwanted = true; break; }
            } catch (const std::regex_error& e) {
                log::warn("Filter pattern '" + p.source + "' failed: " + e.what());
            }
        }
        if (unwanted) {
            log::debug("Line filtered: '" + line + "'");
            continue;
        }
        if (!result.empty()) result += '\n';
        result += line;
    }
    return result;
}

std::vector<std::string> default_filter_patterns(bool remote_a) {
    if (!remote_a) {
        return {R"(^\.+$)"};
    }
    return {
        R"(^\.+$)",
        "subtitles by", "subs by", "transcription by", R"(amara\.org)",
        R"(www\.zeoranger\.co\.uk)", "ESO", R"(googleusercontent\.com)",
        "new thinking allowed foundation", "touhou project",
        "transcription outsourcing, llc", "learn english for free",
        R"(engvid\.com)", "Stille und Hintergrundgeräusche",
        R"(^\s*bye-bye\.?\s*$)", R"(^\s*\[.*musik.*\]\s*$)", R"(^\s*\(.*applaus.*\)\s*$)",
    };
}

std::vector<std::pair<std::string, std::string>> default_replacements() {
    return {
        {R"((?i)\bBotname\s*X\s*Y\b)", "BotnameXY"},
        {R"((?i)\bBot name\s*Ex\s*Why\b)", "BotnameXY"},
        {R"((?i)\bBot homee\s*ix\s*why\b)", "BotnameXY"},
    };
}

FilterRules load_filter_patterns(const std::string& path, const std::vector<std::string>& defaults) {
    if (!std::filesystem::exists(path)) {
        log::info("Filter file not found, creating " + path);
        ensure_parent_dir(path);
        std::ofstream out(path);
        if (!out) {
            log::error("Could not create filter file " + path + ", using built-in defaults");
            return compile_filters(defaults);
        }
        for (const auto& p : defaults) out << p << '\n';
    }

    std::ifstream in(path);
    if (!in) {
        log::error("Could not read filter file " + path);
        return {};
    }

    std::vector<std::string> raw;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        raw.push_back(line);
    }
    auto rules = compile_filters(raw);
    log::info("Loaded " + std::to_string(rules.size()) + " filter patterns from "
              + std::filesystem::path(path).filename().string());
    return rules;
}

ReplacementRules load_replacements(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        log::info("Replacements file not found, creating " + path);
        ensure_parent_dir(path);
        nlohmann::ordered_json defaults = nlohmann::ordered_json::object();
        for (const auto& [pattern, replacement] : default_replacements()) {
            defaults[pattern] = replacement;
        }
        std::ofstream out(path);
        if (out) {
            out << defaults.dump(4) << '\n';
        } else {
            log::error("Could not create replacements file " + path);
        }
        return compile_replacements(default_replacements());
    }

    try {
        std::ifstream in(path);
        auto json = nlohmann::ordered_json::parse(in);
        if (!json.is_object()) {
            log::error("Replacements file " + path + " is not a JSON object");
            return {};
        }
        std::vector<std::pair<std::string, std::string>> rules;
        for (const auto& [pattern, replacement] : json.items()) {
            if (!replacement.is_string()) {
                log::warn("Skipping replacement for '" + pattern + "': value is not a string");
                continue;
            }
            rules.emplace_back(pattern, replacement.get<std::string>());
        }
        auto compiled = compile_replacements(rules);
        log::info("Loaded " + std::to_string(compiled.size()) + " replacement rules from " + path);
        return compiled;
    } catch (const nlohmann::json::exception& e) {
        log::error("Could not parse replacements file " + path + ": " + e.what());
        return {};
    }
}

} // namespace livescribe::text
