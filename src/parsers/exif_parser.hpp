#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct ExifData {
    std::vector<std::pair<std::string, std::string>> fields;  // tag name -> text value
    std::vector<std::string> gpsTags;
    uint32_t width = 0;
    uint32_t height = 0;

    bool hasGps() const { return !gpsTags.empty(); }
};

// Walks a TIFF structure (byte-order mark, IFD0, Exif and GPS sub-IFDs)
// stored at blob[base, base + length). Returns false when the header is
// not a TIFF header; malformed entries are skipped.
bool parseExif(const std::vector<uint8_t>& blob, size_t base, size_t length, ExifData& out);
