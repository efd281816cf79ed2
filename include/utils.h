#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace parley {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Check if transcript text is blank (empty/whitespace, blank sentinel, or a noise tag)
 * @param text Raw transcript text
 * @param blank_sentinel String to treat as blank (e.g. "[BLANK_AUDIO]"); compared after trim
 * @return True if the text carries no user speech
 */
inline bool is_blank_transcript(const std::string& text, const std::string& blank_sentinel = "[BLANK_AUDIO]") {
    std::string t = trim_copy(text);
    if (t.empty()) return true;
    if (!blank_sentinel.empty() && t == blank_sentinel) return true;

    // Whisper renders non-speech as bracketed or parenthesized tags, e.g. "(static)" or "[Music]"
    bool bracketed = (t.front() == '[' && t.back() == ']') || (t.front() == '(' && t.back() == ')');
    if (bracketed) return true;

    std::string cleaned;
    for (char c : normalize_copy(t)) {
        if (std::isalnum(static_cast<unsigned char>(c)) || std::isspace(static_cast<unsigned char>(c))) {
            cleaned += c;
        }
    }
    cleaned = trim_copy(cleaned);

    static const std::vector<std::string> noise_patterns = {
        "static", "silence", "noise", "inaudible", "blank", "background noise"
    };
    for (const auto& pattern : noise_patterns) {
        if (cleaned == pattern) {
            return true;
        }
    }

    return cleaned.empty();
}

} // namespace utils

} // namespace parley
