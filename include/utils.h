#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace coop_assist {

/**
 * @brief String utility functions
 *
 * All text in the engine is UTF-8 in std::string. Functions that reason
 * about characters (length, edit distance, n-grams) decode to code points
 * first; everything else works on bytes.
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
 * @brief Lower-case ASCII letters; multi-byte sequences pass through untouched
 */
inline std::string to_lower_ascii(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return !needle.empty() && haystack.find(needle) != std::string::npos;
}

// =============================================================================
// UTF-8
// =============================================================================

/// Decode UTF-8 into code points; invalid bytes become U+FFFD
std::u32string utf8_decode(const std::string& text);

/// Encode code points as UTF-8
std::string utf8_encode(const std::u32string& text);
std::string utf8_encode(char32_t cp);

/// Number of code points
size_t utf8_length(const std::string& text);

/// Wide conversion for std::wregex (wchar_t holds a full code point on Linux)
std::wstring to_wide(const std::string& text);

// =============================================================================
// Normalization
// =============================================================================

/// True for ASCII and CJK punctuation, full-width symbols and whitespace
bool is_punct_or_space(char32_t cp);

/**
 * @brief Normalize an utterance for rule matching
 *
 * Folds full-width ASCII to half-width, maps 。 and 、 to '.' and ',',
 * lower-cases ASCII letters, collapses whitespace runs to one space and
 * trims both ends.
 */
std::string normalize_utterance(const std::string& text);

/// Remove every punctuation and whitespace code point (after normalize_utterance)
std::string strip_punctuation(const std::string& text);

/// Code-point Levenshtein distance (unit costs)
size_t levenshtein(const std::u32string& a, const std::u32string& b);

/**
 * @brief Character unigrams and bigrams of a string, punctuation removed
 *
 * Bigrams never span a removed character. Used by the intent model and
 * the TF-IDF index so both see the same features.
 */
std::vector<std::string> char_ngrams(const std::string& text);

} // namespace utils

} // namespace coop_assist
