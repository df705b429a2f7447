#include "text_match.hpp"
#include <cctype>

static inline char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool match_icase_at(const std::string& haystack, size_t pos, const std::string& needle) {
    if (pos > haystack.size() || haystack.size() - pos < needle.size()) return false;
    for (size_t i = 0; i < needle.size(); ++i) {
        if (lower(haystack[pos + i]) != lower(needle[i])) return false;
    }
    return true;
}

size_t find_icase(const std::string& haystack, const std::string& needle, size_t from) {
    if (needle.empty()) return from <= haystack.size() ? from : std::string::npos;
    if (haystack.size() < needle.size()) return std::string::npos;
    const char first = lower(needle[0]);
    const size_t last = haystack.size() - needle.size();
    for (size_t i = from; i <= last; ++i) {
        if (lower(haystack[i]) == first && match_icase_at(haystack, i, needle)) return i;
    }
    return std::string::npos;
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
    return find_icase(haystack, needle) != std::string::npos;
}

size_t count_icase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return 0;
    size_t count = 0;
    size_t pos = find_icase(haystack, needle);
    while (pos != std::string::npos) {
        ++count;
        pos = find_icase(haystack, needle, pos + needle.size());
    }
    return count;
}

bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

size_t skip_spaces(const std::string& s, size_t pos) {
    while (pos < s.size() && is_space(s[pos])) ++pos;
    return pos;
}

bool contains_call(const std::string& content, const std::string& name) {
    size_t pos = find_icase(content, name);
    while (pos != std::string::npos) {
        bool boundary = pos == 0 || !is_word_char(content[pos - 1]);
        size_t after = pos + name.size();
        if (boundary && (after >= content.size() || !is_word_char(content[after]))) {
            after = skip_spaces(content, after);
            if (after < content.size() && content[after] == '(') return true;
        }
        pos = find_icase(content, name, pos + 1);
    }
    return false;
}

bool contains_tag(const std::string& content, const std::string& name) {
    const std::string opener = "<" + name;
    size_t pos = find_icase(content, opener);
    while (pos != std::string::npos) {
        size_t after = pos + opener.size();
        if (after < content.size()) {
            char c = content[after];
            if (is_space(c) || c == '>' || c == '/') return true;
        }
        pos = find_icase(content, opener, pos + 1);
    }
    return false;
}

bool contains_attribute(const std::string& content, const std::string& name) {
    size_t pos = find_icase(content, name);
    while (pos != std::string::npos) {
        bool boundary = pos == 0 ||
            (!is_word_char(content[pos - 1]) && content[pos - 1] != '-' && content[pos - 1] != ':');
        size_t after = pos + name.size();
        if (boundary && (after >= content.size() || !is_word_char(content[after]))) {
            after = skip_spaces(content, after);
            if (after < content.size() && content[after] == '=') return true;
        }
        pos = find_icase(content, name, pos + 1);
    }
    return false;
}
