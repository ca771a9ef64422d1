#include "utils.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() == 1) return platform::home_dir().string();
    if (path[1] != '/') return path;  // ~user is not supported
    return (platform::home_dir() / path.substr(2)).string();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_args(const std::string& line) {
    std::vector<std::string> words;
    std::string current;
    bool quoted = false;
    bool has_word = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            has_word = true;
        } else if (!quoted && std::isspace(static_cast<unsigned char>(c))) {
            if (has_word) words.push_back(current);
            current.clear();
            has_word = false;
        } else {
            current += c;
            has_word = true;
        }
    }
    if (has_word) words.push_back(current);
    return words;
}
