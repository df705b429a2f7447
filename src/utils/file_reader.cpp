#include "file_reader.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file " + path);
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                 std::istreambuf_iterator<char>());
}

std::vector<uint8_t> readFilePrefix(const std::string& path, size_t maxBytes) {
    std::vector<uint8_t> buffer;
    std::ifstream file(path, std::ios::binary);
    if (!file) return buffer;

    buffer.resize(maxBytes);
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(maxBytes));
    buffer.resize(static_cast<size_t>(file.gcount()));
    return buffer;
}

std::string readFileText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file " + path);
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
}
