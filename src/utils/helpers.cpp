#include "helpers.hpp"
#include <cstdint>
#include <vector>
#include <string>
#include <charconv>
#include <array>
#include <algorithm>
#include <cmath>
#include <cctype>
#include <sstream>
#include <iomanip>
//
// Big-endian readers
//
uint16_t read_be16(const std::vector<uint8_t>& blob, size_t offset) {
    return (blob[offset] << 8) |
           (blob[offset + 1]);
}

uint32_t read_be32(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint32_t>(blob[offset]) << 24) |
           (blob[offset + 1] << 16) |
           (blob[offset + 2] << 8) |
           (blob[offset + 3]);
}

//
// Little-endian readers
//
uint16_t read_le16(const std::vector<uint8_t>& blob, size_t offset) {
    return (blob[offset + 1] << 8) |
           (blob[offset]);
}

uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset) {
    return (static_cast<uint32_t>(blob[offset + 3]) << 24) |
           (blob[offset + 2] << 16) |
           (blob[offset + 1] << 8) |
           (blob[offset]);
}

std::string to_hex(int value)
{
   std::array<char, 16> buffer;
   auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                              value, 16);  // base 16

   std::string hex(buffer.data(), result.ptr);
   return hex;
}

std::string to_hex_bytes(const uint8_t* data, size_t len)
{
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex += digits[data[i] >> 4];
        hex += digits[data[i] & 0x0F];
    }
    return hex;
}

bool parse_hex(const std::string& hex, std::vector<uint8_t>& out)
{
    if (hex.size() % 2 != 0) return false;
    out.clear();
    for (size_t i = 0; i < hex.size(); i += 2) {
        uint8_t byte = 0;
        auto res = std::from_chars(hex.data() + i, hex.data() + i + 2, byte, 16);
        if (res.ec != std::errc() || res.ptr != hex.data() + i + 2) return false;
        out.push_back(byte);
    }
    return true;
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string file_extension(const std::string& name)
{
    size_t slash = name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
    size_t dot = base.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == base.size()) return "";
    return to_lower(base.substr(dot + 1));
}

std::string format_ratio(double ratio)
{
    double rounded = std::round(ratio * 10.0) / 10.0;
    std::ostringstream oss;
    if (rounded == std::floor(rounded)) {
        oss << std::fixed << std::setprecision(0) << rounded;
    } else {
        oss << std::fixed << std::setprecision(1) << rounded;
    }
    return oss.str();
}
