#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Whole file. Throws std::runtime_error when the file cannot be opened.
std::vector<uint8_t> readFile(const std::string& path);

// At most maxBytes from the start of the file; empty if it cannot be opened.
std::vector<uint8_t> readFilePrefix(const std::string& path, size_t maxBytes);

std::string readFileText(const std::string& path);
