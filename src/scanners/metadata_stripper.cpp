#include "metadata_stripper.hpp"
#include "image_parser.hpp"
#include "file_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <cstring>
#include <fstream>
#include <system_error>

namespace {

bool keepJpegSegment(uint8_t marker) {
    if (marker == 0xFE) return false;
    if (marker >= 0xE1 && marker <= 0xEF) return marker == 0xE2;
    return true;
}

bool stripJpeg(const std::vector<uint8_t>& in, const ImageInfo& info, std::vector<uint8_t>& out, std::string& error) {
    const size_t end = info.foundEnd ? info.endOffset : in.size();
    out.assign(in.begin(), in.begin() + 2);

    size_t pos = 2;
    while (pos + 1 < end) {
        if (in[pos] != 0xFF) {
            error = "unexpected byte in JPEG header at offset " + std::to_string(pos);
            return false;
        }
        uint8_t marker = in[pos + 1];
        if (marker == 0xFF) {
            ++pos;
            continue;
        }
        // entropy coded data runs to EOI and is copied as is
        if (marker == 0xDA || marker == 0xD9) {
            out.insert(out.end(), in.begin() + pos, in.begin() + end);
            return true;
        }
        if (pos + 4 > end) break;
        uint16_t length = read_be16(in, pos + 2);
        if (length < 2 || pos + 2 + length > end) break;

        if (keepJpegSegment(marker)) {
            out.insert(out.end(), in.begin() + pos, in.begin() + pos + 2 + length);
        } else {
            Logger::debug("Strip: dropping JPEG marker " + to_hex(marker));
        }
        pos += 2 + length;
    }
    error = "truncated JPEG segment";
    return false;
}

bool stripPng(const std::vector<uint8_t>& in, std::vector<uint8_t>& out, std::string& error) {
    static const char* dropped[] = {"tEXt", "zTXt", "iTXt", "eXIf", "tIME"};
    out.assign(in.begin(), in.begin() + 8);

    size_t pos = 8;
    while (pos + 12 <= in.size()) {
        uint32_t len = read_be32(in, pos);
        size_t next = pos + 12 + len;
        if (len > in.size() || next > in.size()) break;

        const char* type = reinterpret_cast<const char*>(&in[pos + 4]);
        bool drop = false;
        for (const char* name : dropped) {
            drop |= std::memcmp(type, name, 4) == 0;
        }
        if (!drop) {
            out.insert(out.end(), in.begin() + pos, in.begin() + next);
        } else {
            Logger::debug("Strip: dropping PNG chunk " + std::string(type, 4));
        }
        if (std::memcmp(type, "IEND", 4) == 0) return true;
        pos = next;
    }
    error = "missing IEND";
    return false;
}

} // namespace

bool stripMetadata(const std::vector<uint8_t>& in, std::vector<uint8_t>& out, std::string& error) {
    ImageInfo info = parseImage(in);
    if (!info.valid) {
        error = "Not a valid image file";
        return false;
    }
    switch (info.format) {
        case ImageFormat::JPEG: return stripJpeg(in, info, out, error);
        case ImageFormat::PNG:  return stripPng(in, out, error);
        default:
            error = "Metadata stripping is not supported for " + imageFormatName(info.format);
            return false;
    }
}

bool stripMetadataFile(const AccessValidator& access, const std::string& inPath, const std::string& outPath,
                       const ScanPolicy& policy, std::string& error) {
    AccessDecision decision = access.validate(inPath, policy);
    if (!decision.allowed) {
        error = decision.reason.value_or("File access denied");
        return false;
    }
    std::error_code ec;
    uintmax_t size = fs::file_size(inPath, ec);
    if (ec || size > policy.maxScanBytes) {
        error = ec ? "File cannot be read" : "File too large to strip (" + std::to_string(size) + " bytes)";
        return false;
    }

    std::vector<uint8_t> stripped;
    if (!stripMetadata(readFile(inPath), stripped, error)) return false;

    std::ofstream file(outPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        error = "Cannot open output file " + outPath;
        return false;
    }
    file.write(reinterpret_cast<const char*>(stripped.data()), static_cast<std::streamsize>(stripped.size()));
    if (!file) {
        error = "Failed to write " + outPath;
        return false;
    }
    Logger::info("Stripped metadata: " + std::to_string(size) + " -> " + std::to_string(stripped.size()) + " bytes");
    return true;
}
