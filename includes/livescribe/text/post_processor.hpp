#pragma once
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace livescribe::text {

// One compiled, case-insensitive line filter.
struct FilterPattern {
    std::string source;
    std::regex re;
};
using FilterRules = std::vector<FilterPattern>;

// pattern -> replacement, ECMAScript syntax ($1 for groups), case-insensitive.
struct Replacement {
    std::string pattern;
    std::string replacement;
    std::regex re;
};
using ReplacementRules = std::vector<Replacement>;

// Invalid patterns are logged and skipped. A leading "(?i)" is accepted and
// dropped since every rule is case-insensitive anyway.
FilterRules compile_filters(const std::vector<std::string>& patterns);
ReplacementRules compile_replacements(const std::vector<std::pair<std::string, std::string>>& rules);

// Applies every rule in order. Empty text or no rules returns the input.
std::string apply_replacements(const std::string& text, const ReplacementRules& rules);

// Optionally removes "(...)" and "[...]" spans, then drops each line that any
// pattern matches and joins the surviving non-empty lines with '\n'.
std::string filter(const std::string& text, const FilterRules& patterns, bool drop_parenthetical);

// Default line filters. The remote-A set also catches the subtitle credits and
// stock phrases that engine tends to hallucinate on silence.
std::vector<std::string> default_filter_patterns(bool remote_a);
std::vector<std::pair<std::string, std::string>> default_replacements();

// Loads one pattern per line ('#' comments). A missing file is created with
// `defaults`; if that fails the defaults are compiled directly.
FilterRules load_filter_patterns(const std::string& path, const std::vector<std::string>& defaults);

// Loads a JSON object {pattern: replacement}, keeping file order. A missing
// file is created with default_replacements(). Unreadable or non-object
// content yields no rules.
ReplacementRules load_replacements(const std::string& path);

} // namespace livescribe::text
