#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

enum class ImageFormat {
    Unknown,
    JPEG,
    PNG,
    GIF,
    WEBP,
    TIFF
};

struct ImageInfo {
    ImageFormat format = ImageFormat::Unknown;
    bool valid = false;
    std::string error;
    uint32_t width = 0;
    uint32_t height = 0;
    // first byte after the structural end marker; meaningful if foundEnd
    size_t endOffset = 0;
    bool foundEnd = false;
    std::vector<std::pair<std::string, std::string>> fields;
    std::vector<std::string> gpsTags;

    bool hasGps() const { return !gpsTags.empty(); }
};

std::string imageFormatName(ImageFormat format);
ImageFormat detectImageFormat(const std::vector<uint8_t>& blob);

// Structural walk of the image: dimensions, end marker, metadata text
// fields (EXIF, XMP, comments, PNG text chunks) and GPS tags.
ImageInfo parseImage(const std::vector<uint8_t>& blob);
