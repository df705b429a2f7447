#pragma once
#include <string>
#include <cstddef>

// Case-insensitive substring search over raw content. Content may contain
// arbitrary bytes including NULs.
size_t find_icase(const std::string& haystack, const std::string& needle, size_t from = 0);
bool contains_icase(const std::string& haystack, const std::string& needle);
bool match_icase_at(const std::string& haystack, size_t pos, const std::string& needle);
size_t count_icase(const std::string& haystack, const std::string& needle);

bool is_word_char(char c);
bool is_space(char c);

// NAME followed by optional whitespace and '(' with no word character
// directly before NAME.
bool contains_call(const std::string& content, const std::string& name);

// `<name` followed by whitespace, '>' or '/'.
bool contains_tag(const std::string& content, const std::string& name);

// NAME followed by optional whitespace and '=' with no word, '-' or ':'
// character directly before NAME.
bool contains_attribute(const std::string& content, const std::string& name);

size_t skip_spaces(const std::string& s, size_t pos);
