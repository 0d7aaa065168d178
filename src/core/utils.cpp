#include "utils.hpp"
#include <sstream>
#include <climits>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (...) {
        return fallback;
    }
}

std::string substitute(const std::string& text, const std::string& key,
                       const std::string& value) {
    std::string result = text;
    const std::string placeholder = "{{" + key + "}}";
    std::string::size_type pos = 0;
    while ((pos = result.find(placeholder, pos)) != std::string::npos) {
        result.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
    return result;
}

static bool is_shell_safe(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))
        return true;
    switch (c) {
        case '_': case '.': case '/': case ':': case '@': case '%':
        case '+': case '=': case ',': case '-':
            return true;
        default:
            return false;
    }
}

std::string shell_quote(const std::string& value) {
    if (value.empty()) return "''";

    bool safe = true;
    for (char c : value) {
        if (!is_shell_safe(c)) { safe = false; break; }
    }
    if (safe) return value;

    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string shell_unquote(const std::string& word) {
    std::string out;
    bool in_quote = false;
    for (size_t i = 0; i < word.size(); i++) {
        char c = word[i];
        if (in_quote) {
            if (c == '\'') in_quote = false;
            else out += c;
        } else if (c == '\'') {
            in_quote = true;
        } else if (c == '\\' && i + 1 < word.size()) {
            out += word[++i];
        } else {
            out += c;
        }
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> parse_env_lines(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> vars;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line.erase(0, 7);
            trim(line);
        }
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        vars.emplace_back(line.substr(0, eq), shell_unquote(line.substr(eq + 1)));
    }
    return vars;
}

std::optional<int> parse_pid(const std::string& text) {
    std::string s = text;
    trim(s);
    if (s.empty() || s.size() > 10) return std::nullopt;
    long long v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + (c - '0');
    }
    if (v <= 0 || v > INT_MAX) return std::nullopt;
    return static_cast<int>(v);
}

bool has_control_chars(const std::string& text) {
    for (unsigned char c : text) {
        if (c < 0x20 || c == 0x7f) return true;
    }
    return false;
}
