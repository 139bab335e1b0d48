#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace voice_os {

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

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase
 * @param str String to normalize (modified in place)
 * @return Reference to the normalized string
 */
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

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Remove leading characters from the set ".,!?-" and whitespace
 */
inline std::string strip_leading_punctuation(const std::string& str) {
    size_t start = str.find_first_not_of(".,!?- \t\n\r");
    if (start == std::string::npos) return "";
    return str.substr(start);
}

/**
 * @brief Letter or digit, counting every non-ASCII (UTF-8) byte as a letter
 */
inline bool is_word_byte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c);
}

/**
 * @brief Drop every character that is not a letter, digit or whitespace
 *
 * UTF-8 sequences are kept intact ("Café" stays "Café").
 */
inline std::string strip_punctuation(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (is_word_byte(uc) || std::isspace(uc)) {
            result += c;
        }
    }
    return result;
}

/**
 * @brief Split on whitespace, dropping empty tokens
 */
inline std::vector<std::string> split_words(const std::string& str) {
    std::vector<std::string> words;
    std::istringstream iss(str);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

/**
 * @brief Collapse runs of whitespace to a single space and trim
 */
inline std::string collapse_whitespace(const std::string& str) {
    std::string result;
    for (const auto& word : split_words(str)) {
        if (!result.empty()) result += ' ';
        result += word;
    }
    return result;
}

/**
 * @brief Application name as it is handed to the launch/quit commands
 *
 * Punctuation is removed (no quotes inside an argv template, no leading
 * option dash) and whitespace collapsed. Empty when nothing usable is left.
 */
inline std::string clean_app_name(const std::string& name) {
    return collapse_whitespace(strip_punctuation(name));
}

/**
 * @brief Lowercase, strip leading punctuation, trim
 *
 * The form every command is matched in.
 */
inline std::string normalize_command(const std::string& str) {
    return trim_copy(strip_leading_punctuation(normalize_copy(str)));
}

/**
 * @brief Remove a leading echo word (e.g. the assistant's own "Listening" prompt)
 *
 * Case-insensitive; only strips a whole word, so "listeningx" is untouched.
 * Returns the text with leading punctuation and whitespace removed.
 */
inline std::string strip_echo_prefix(const std::string& text, const std::string& prefix) {
    std::string t = trim_copy(text);
    if (!prefix.empty()) {
        std::string lower = normalize_copy(t);
        std::string p = normalize_copy(prefix);
        if (lower.compare(0, p.size(), p) == 0 &&
            (lower.size() == p.size() ||
             !is_word_byte(static_cast<unsigned char>(lower[p.size()])))) {
            t = t.substr(p.size());
        }
    }
    return trim_copy(strip_leading_punctuation(t));
}

/**
 * @brief Match a wake word at the start of an utterance
 *
 * The utterance is lowercased and stripped of punctuation before comparison.
 * @param text Raw transcript
 * @param wake_words Accepted wake words (already lowercase)
 * @param[out] remainder Command text following the wake word (normalized)
 * @return True if the utterance starts with one of the wake words
 */
inline bool match_wake_word(const std::string& text,
                            const std::vector<std::string>& wake_words,
                            std::string& remainder) {
    std::string cleaned = collapse_whitespace(strip_punctuation(normalize_copy(text)));
    for (const auto& word : wake_words) {
        std::string w = collapse_whitespace(normalize_copy(word));
        if (w.empty() || cleaned.compare(0, w.size(), w) != 0) continue;
        if (cleaned.size() > w.size() && cleaned[w.size()] != ' ') continue;
        remainder = trim_copy(cleaned.substr(w.size()));
        return true;
    }
    return false;
}

/**
 * @brief Prepare model output for text-to-speech
 *
 * Markdown links keep their label, fenced code blocks are dropped, and
 * anything outside letters, digits and " .,!?-" becomes a space. Leading
 * dashes and punctuation are removed so the text never reads as an option
 * when it is the first argument of the speech command.
 */
inline std::string clean_for_speech(const std::string& text) {
    std::string no_code;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t fence = text.find("```", pos);
        if (fence == std::string::npos) {
            no_code += text.substr(pos);
            break;
        }
        no_code += text.substr(pos, fence - pos);
        size_t close = text.find("```", fence + 3);
        if (close == std::string::npos) break;
        pos = close + 3;
    }

    std::string no_links;
    for (size_t i = 0; i < no_code.size(); ++i) {
        if (no_code[i] == '[') {
            size_t close = no_code.find(']', i);
            if (close != std::string::npos && close + 1 < no_code.size() &&
                no_code[close + 1] == '(') {
                size_t paren = no_code.find(')', close);
                if (paren != std::string::npos) {
                    no_links += no_code.substr(i + 1, close - i - 1);
                    i = paren;
                    continue;
                }
            }
        }
        no_links += no_code[i];
    }

    std::string result;
    result.reserve(no_links.size());
    for (char c : no_links) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (is_word_byte(uc) || c == ' ' || c == '.' || c == ',' ||
            c == '!' || c == '?' || c == '-') {
            result += c;
        } else {
            result += ' ';
        }
    }
    return collapse_whitespace(strip_leading_punctuation(result));
}

/**
 * @brief Replace every occurrence of a placeholder
 */
inline std::string replace_all(std::string str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }
    return str;
}

} // namespace utils

} // namespace voice_os
