#include "text_utils.hpp"
#include <cctype>
#include <sstream>

namespace code_intelligence {

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

std::string sanitize_utf8(const std::string& str) {
    std::string safe_str;
    safe_str.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t seq_len = 0;
        if (c < 0x80) seq_len = 1;
        else if ((c & 0xE0) == 0xC0) seq_len = 2;
        else if ((c & 0xF0) == 0xE0) seq_len = 3;
        else if ((c & 0xF8) == 0xF0) seq_len = 4;

        bool valid = seq_len > 0 && i + seq_len <= str.size();
        for (size_t k = 1; valid && k < seq_len; ++k) {
            unsigned char cont = static_cast<unsigned char>(str[i + k]);
            if ((cont & 0xC0) != 0x80) valid = false;
        }

        if (valid) {
            safe_str.append(str, i, seq_len);
            i += seq_len;
        } else {
            safe_str += '?';
            ++i;
        }
    }
    return safe_str;
}

std::string collapse_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += ch;
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::stringstream ss(content);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : s) {
        if (ch == delim) {
            parts.push_back(current);
            current.clear();
        } else {
            current += ch;
        }
    }
    parts.push_back(current);
    return parts;
}

uint64_t fnv1a_64(std::string_view data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::vector<std::string> identifier_tokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::string word;

    auto flush = [&]() {
        if (word.empty()) return;
        // Split camelCase: a lower->upper transition starts a new sub-token.
        std::string part;
        for (size_t i = 0; i < word.size(); ++i) {
            char c = word[i];
            bool boundary = i > 0 && std::isupper(static_cast<unsigned char>(c)) &&
                            std::islower(static_cast<unsigned char>(word[i - 1]));
            if (boundary && !part.empty()) {
                tokens.push_back(part);
                part.clear();
            }
            part += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (!part.empty()) tokens.push_back(part);
        word.clear();
    };

    for (char ch : text) {
        if (std::isalnum(static_cast<unsigned char>(ch))) {
            word += ch;
        } else {
            flush(); // '_' and punctuation both end a sub-token
        }
    }
    flush();
    return tokens;
}

bool glob_match(std::string_view pattern, std::string_view text) {
    size_t p = 0, t = 0;
    size_t star = std::string_view::npos, mark = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

} // namespace code_intelligence
