#pragma once
#include <cstdint>
#include <vector>
#include <string>

#define DEFAULT_MAX_SCAN_BYTES 100ULL*1024*1024
#define MIB(n) (static_cast<uint64_t>(n)*1024*1024)
//
// Big-endian readers
//
uint16_t read_be16(const std::vector<uint8_t>& blob, size_t offset);
uint32_t read_be32(const std::vector<uint8_t>& blob, size_t offset);

//
// Little-endian readers
//
uint16_t read_le16(const std::vector<uint8_t>& blob, size_t offset);
uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset);

std::string to_hex(int value);
std::string to_hex_bytes(const uint8_t* data, size_t len);
// Returns false if the string has an odd length or a non-hex digit.
bool parse_hex(const std::string& hex, std::vector<uint8_t>& out);

std::string to_lower(std::string s);
bool ends_with(const std::string& s, const std::string& suffix);
bool starts_with(const std::string& s, const std::string& prefix);

// Lowercased extension after the last dot of the final path component,
// empty when there is none.
std::string file_extension(const std::string& name);

// "150" for whole ratios, "150.5" otherwise.
std::string format_ratio(double ratio);
