#include "utils.h"

namespace coop_assist {
namespace utils {

std::u32string utf8_decode(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }
        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            if (i + k >= n) {
                valid = false;
                break;
            }
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

std::string utf8_encode(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

std::string utf8_encode(const std::u32string& text) {
    std::string out;
    out.reserve(text.size() * 3);
    for (char32_t cp : text) {
        out += utf8_encode(cp);
    }
    return out;
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::wstring to_wide(const std::string& text) {
    std::u32string decoded = utf8_decode(text);
    return std::wstring(decoded.begin(), decoded.end());
}

bool is_punct_or_space(char32_t cp) {
    if (cp < 0x80) {
        return std::isspace(static_cast<int>(cp)) || std::ispunct(static_cast<int>(cp));
    }
    if (cp >= 0x2000 && cp <= 0x206F) return true;   // general punctuation
    if (cp >= 0x3000 && cp <= 0x303F) return true;   // CJK symbols and punctuation
    if (cp >= 0xFF01 && cp <= 0xFF0F) return true;   // full-width !"#$%&'()*+,-./
    if (cp >= 0xFF1A && cp <= 0xFF20) return true;   // full-width :;<=>?@
    if (cp >= 0xFF3B && cp <= 0xFF40) return true;
    if (cp >= 0xFF5B && cp <= 0xFF65) return true;
    if (cp == 0x00A0 || cp == 0xFEFF) return true;
    return false;
}

std::string normalize_utterance(const std::string& text) {
    std::u32string folded;
    for (char32_t cp : utf8_decode(text)) {
        if (cp >= 0xFF01 && cp <= 0xFF5E) {
            cp -= 0xFEE0;
        } else if (cp == 0x3000 || cp == 0x00A0) {
            cp = U' ';
        } else if (cp == 0x3002) {
            cp = U'.';
        } else if (cp == 0x3001) {
            cp = U',';
        }
        if (cp < 0x80) {
            cp = static_cast<char32_t>(std::tolower(static_cast<int>(cp)));
            if (std::isspace(static_cast<int>(cp))) {
                cp = U' ';
            }
        }
        if (cp == U' ' && (folded.empty() || folded.back() == U' ')) {
            continue;
        }
        folded.push_back(cp);
    }
    while (!folded.empty() && folded.back() == U' ') {
        folded.pop_back();
    }
    return utf8_encode(folded);
}

std::string strip_punctuation(const std::string& text) {
    std::u32string kept;
    for (char32_t cp : utf8_decode(text)) {
        if (!is_punct_or_space(cp)) {
            kept.push_back(cp);
        }
    }
    return utf8_encode(kept);
}

size_t levenshtein(const std::u32string& a, const std::u32string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

std::vector<std::string> char_ngrams(const std::string& text) {
    std::vector<std::string> grams;
    std::u32string run;

    auto flush = [&grams](const std::u32string& segment) {
        for (size_t i = 0; i < segment.size(); ++i) {
            grams.push_back(utf8_encode(segment[i]));
        }
        for (size_t i = 0; i + 1 < segment.size(); ++i) {
            grams.push_back(utf8_encode(segment.substr(i, 2)));
        }
    };

    for (char32_t cp : utf8_decode(normalize_utterance(text))) {
        if (is_punct_or_space(cp)) {
            flush(run);
            run.clear();
        } else {
            run.push_back(cp);
        }
    }
    flush(run);
    return grams;
}

} // namespace utils
} // namespace coop_assist
