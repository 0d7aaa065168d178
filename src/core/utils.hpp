#pragma once

#include <string>
#include <vector>
#include <optional>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Replace every {{KEY}} placeholder in text.
std::string substitute(const std::string& text, const std::string& key,
                       const std::string& value);

// Single-quote a value for POSIX shells when it contains anything other
// than [A-Za-z0-9_./:@%+=,-]. Plain values are returned unchanged.
std::string shell_quote(const std::string& value);

// Inverse of shell_quote for a single word ('...' segments and '\'' escapes).
std::string shell_unquote(const std::string& word);

// Parse KEY=value lines. Blank lines, comments and lines without '=' are
// skipped; an optional leading "export " is accepted.
std::vector<std::pair<std::string, std::string>> parse_env_lines(const std::string& text);

// True if text contains ASCII control characters (newline, tab, DEL, ...).
bool has_control_chars(const std::string& text);

// Parse a decimal process id; rejects signs, garbage and values <= 0.
std::optional<int> parse_pid(const std::string& text);
