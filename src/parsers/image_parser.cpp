#include "image_parser.hpp"
#include "exif_parser.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <zlib.h>
#include <cstring>

namespace {

constexpr size_t MAX_TEXT_INFLATE = 1024 * 1024;
const char XMP_NAMESPACE[] = "http://ns.adobe.com/xap/1.0/";

void addExif(ImageInfo& info, const std::vector<uint8_t>& blob, size_t base, size_t length) {
    ExifData exif;
    if (!parseExif(blob, base, length, exif)) {
        Logger::debug("Image: EXIF block without TIFF header");
        return;
    }
    info.fields.insert(info.fields.end(), exif.fields.begin(), exif.fields.end());
    info.gpsTags.insert(info.gpsTags.end(), exif.gpsTags.begin(), exif.gpsTags.end());
    if (info.width == 0) info.width = exif.width;
    if (info.height == 0) info.height = exif.height;
}

void addXmp(ImageInfo& info, const std::string& packet) {
    info.fields.emplace_back("XMP", packet);
    for (const char* tag : {"GPSLatitude", "GPSLongitude", "GPSAltitude"}) {
        if (packet.find(tag) != std::string::npos) {
            info.gpsTags.push_back(std::string("XMP:") + tag);
        }
    }
}

// Bounded zlib inflate for compressed PNG text chunks.
bool inflateText(const uint8_t* data, size_t size, std::string& out) {
    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    if (inflateInit(&strm) != Z_OK) {
        Logger::debug("PNG: inflateInit failed");
        return false;
    }

    const size_t CHUNK = 16384;
    std::vector<uint8_t> buffer(CHUNK);
    int ret;
    do {
        strm.next_out = buffer.data();
        strm.avail_out = static_cast<uInt>(buffer.size());
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return false;
        }
        size_t have = buffer.size() - strm.avail_out;
        out.append(reinterpret_cast<const char*>(buffer.data()), have);
        if (out.size() > MAX_TEXT_INFLATE) {
            out.resize(MAX_TEXT_INFLATE);
            break;
        }
        if (have == 0 && strm.avail_in == 0) break;
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

void parseJpeg(const std::vector<uint8_t>& blob, ImageInfo& info) {
    size_t i = 2;
    bool inScan = false;

    while (i + 1 < blob.size()) {
        if (blob[i] != 0xFF) {
            ++i;
            continue;
        }
        uint8_t marker = blob[i + 1];

        if (marker == 0xD9) {
            info.endOffset = i + 2;
            info.foundEnd = true;
            break;
        }
        // fill bytes, byte stuffing and restart markers inside entropy data
        if (marker == 0xFF) {
            ++i;
            continue;
        }
        if (marker == 0x00 || (marker >= 0xD0 && marker <= 0xD7)) {
            i += 2;
            continue;
        }
        if (inScan && marker != 0xDA && marker != 0xC4 && marker != 0xDD &&
            !(marker >= 0xE0 && marker <= 0xEF) && marker != 0xFE && marker != 0xDB) {
            i += 2;
            continue;
        }

        if (i + 4 > blob.size()) break;
        uint16_t segmentLength = read_be16(blob, i + 2);
        if (segmentLength < 2 || i + 2 + segmentLength > blob.size()) {
            info.error = "truncated JPEG segment";
            return;
        }
        size_t payload = i + 4;
        size_t payloadLen = segmentLength - 2;

        if (marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC) {
            if (payloadLen >= 5 && info.width == 0) {
                info.height = read_be16(blob, payload + 1);
                info.width = read_be16(blob, payload + 3);
            }
        } else if (marker == 0xE1) {
            if (payloadLen >= 6 && std::memcmp(&blob[payload], "Exif\0\0", 6) == 0) {
                addExif(info, blob, payload + 6, payloadLen - 6);
            } else if (payloadLen > sizeof(XMP_NAMESPACE) &&
                       std::memcmp(&blob[payload], XMP_NAMESPACE, sizeof(XMP_NAMESPACE)) == 0) {
                addXmp(info, std::string(blob.begin() + payload + sizeof(XMP_NAMESPACE),
                                         blob.begin() + payload + payloadLen));
            }
        } else if (marker == 0xFE) {
            info.fields.emplace_back("Comment", std::string(blob.begin() + payload,
                                                            blob.begin() + payload + payloadLen));
        } else if (marker == 0xDA) {
            inScan = true;
        }

        i += 2 + segmentLength;
    }
    info.valid = true;
}

void parsePng(const std::vector<uint8_t>& blob, ImageInfo& info) {
    size_t pos = 8;
    bool sawHeader = false;

    while (pos + 12 <= blob.size()) {
        uint32_t len = read_be32(blob, pos);
        const uint8_t* type = &blob[pos + 4];
        size_t data = pos + 8;

        if (len > blob.size() || data + len + 4 > blob.size()) {
            info.error = "chunk exceeds file bounds";
            return;
        }

        uint32_t stored = read_be32(blob, data + len);
        uint32_t crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type, 4 + len);
        if (crc != stored) {
            info.error = "chunk CRC mismatch";
            return;
        }

        std::string chunk(reinterpret_cast<const char*>(type), 4);
        if (!sawHeader) {
            if (chunk != "IHDR" || len != 13) {
                info.error = "missing IHDR";
                return;
            }
            info.width = read_be32(blob, data);
            info.height = read_be32(blob, data + 4);
            sawHeader = true;
        } else if (chunk == "tEXt" || chunk == "zTXt" || chunk == "iTXt") {
            std::string body(blob.begin() + data, blob.begin() + data + len);
            size_t nul = body.find('\0');
            if (nul != std::string::npos) {
                std::string keyword = body.substr(0, nul);
                std::string text;
                if (chunk == "tEXt") {
                    text = body.substr(nul + 1);
                } else if (chunk == "zTXt") {
                    if (nul + 2 <= body.size() &&
                        !inflateText(&blob[data + nul + 2], len - nul - 2, text)) {
                        text = body.substr(nul + 2);
                    }
                } else {
                    // keyword\0 flag method language\0 translated\0 text
                    bool compressed = nul + 1 < body.size() && body[nul + 1] != 0;
                    size_t lang = body.find('\0', nul + 3);
                    size_t trans = lang == std::string::npos ? lang : body.find('\0', lang + 1);
                    if (trans != std::string::npos) {
                        if (compressed) {
                            if (!inflateText(&blob[data + trans + 1], len - trans - 1, text)) {
                                text = body.substr(trans + 1);
                            }
                        } else {
                            text = body.substr(trans + 1);
                        }
                    }
                }
                if (keyword == "XML:com.adobe.xmp") {
                    addXmp(info, text);
                } else {
                    info.fields.emplace_back(keyword, text);
                }
            }
        } else if (chunk == "eXIf") {
            addExif(info, blob, data, len);
        } else if (chunk == "IEND") {
            info.endOffset = data + len + 4;
            info.foundEnd = true;
            info.valid = true;
            return;
        }

        pos = data + len + 4;
    }
    info.error = "missing IEND";
}

bool skipSubBlocks(const std::vector<uint8_t>& blob, size_t& pos, std::string* collect) {
    while (pos < blob.size()) {
        uint8_t size = blob[pos++];
        if (size == 0) return true;
        if (pos + size > blob.size()) return false;
        if (collect) collect->append(reinterpret_cast<const char*>(&blob[pos]), size);
        pos += size;
    }
    return false;
}

void parseGif(const std::vector<uint8_t>& blob, ImageInfo& info) {
    if (blob.size() < 13) {
        info.error = "truncated GIF header";
        return;
    }
    info.width = read_le16(blob, 6);
    info.height = read_le16(blob, 8);
    uint8_t packed = blob[10];
    size_t pos = 13;
    if (packed & 0x80) pos += 3 * (1u << ((packed & 0x07) + 1));

    while (pos < blob.size()) {
        uint8_t introducer = blob[pos++];
        if (introducer == 0x3B) {
            info.endOffset = pos;
            info.foundEnd = true;
            info.valid = true;
            return;
        }
        if (introducer == 0x21) {
            if (pos >= blob.size()) break;
            uint8_t label = blob[pos++];
            std::string text;
            if (!skipSubBlocks(blob, pos, label == 0xFE ? &text : nullptr)) break;
            if (label == 0xFE) info.fields.emplace_back("Comment", text);
        } else if (introducer == 0x2C) {
            if (pos + 9 > blob.size()) break;
            uint8_t imgPacked = blob[pos + 8];
            pos += 9;
            if (imgPacked & 0x80) pos += 3 * (1u << ((imgPacked & 0x07) + 1));
            pos += 1;  // LZW minimum code size
            if (!skipSubBlocks(blob, pos, nullptr)) break;
        } else {
            info.error = "unexpected GIF block";
            return;
        }
    }
    info.error = "missing GIF trailer";
}

void parseWebp(const std::vector<uint8_t>& blob, ImageInfo& info) {
    if (blob.size() < 12) {
        info.error = "truncated RIFF header";
        return;
    }
    uint64_t riffEnd = 8 + static_cast<uint64_t>(read_le32(blob, 4));
    if (riffEnd > blob.size()) {
        info.error = "RIFF size exceeds file";
        return;
    }

    size_t pos = 12;
    while (pos + 8 <= riffEnd) {
        std::string fourcc(blob.begin() + pos, blob.begin() + pos + 4);
        uint32_t size = read_le32(blob, pos + 4);
        size_t data = pos + 8;
        if (data + size > riffEnd) {
            info.error = "chunk exceeds RIFF bounds";
            return;
        }
        if (fourcc == "VP8X" && size >= 10) {
            info.width = 1 + (blob[data + 4] | (blob[data + 5] << 8) | (blob[data + 6] << 16));
            info.height = 1 + (blob[data + 7] | (blob[data + 8] << 8) | (blob[data + 9] << 16));
        } else if (fourcc == "VP8 " && size >= 10 && info.width == 0) {
            info.width = read_le16(blob, data + 6) & 0x3FFF;
            info.height = read_le16(blob, data + 8) & 0x3FFF;
        } else if (fourcc == "VP8L" && size >= 5 && info.width == 0) {
            uint32_t bits = read_le32(blob, data + 1);
            info.width = (bits & 0x3FFF) + 1;
            info.height = ((bits >> 14) & 0x3FFF) + 1;
        } else if (fourcc == "EXIF") {
            size_t base = data;
            size_t len = size;
            if (len >= 6 && std::memcmp(&blob[data], "Exif\0\0", 6) == 0) {
                base += 6;
                len -= 6;
            }
            addExif(info, blob, base, len);
        } else if (fourcc == "XMP ") {
            addXmp(info, std::string(blob.begin() + data, blob.begin() + data + size));
        }
        pos = data + size + (size & 1);
    }

    info.endOffset = static_cast<size_t>(riffEnd);
    info.foundEnd = true;
    info.valid = true;
}

void parseTiff(const std::vector<uint8_t>& blob, ImageInfo& info) {
    ExifData exif;
    if (!parseExif(blob, 0, blob.size(), exif)) {
        info.error = "invalid TIFF header";
        return;
    }
    info.fields = exif.fields;
    info.gpsTags = exif.gpsTags;
    info.width = exif.width;
    info.height = exif.height;
    info.valid = true;
}

} // namespace

std::string imageFormatName(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return "JPEG";
        case ImageFormat::PNG:  return "PNG";
        case ImageFormat::GIF:  return "GIF";
        case ImageFormat::WEBP: return "WEBP";
        case ImageFormat::TIFF: return "TIFF";
        case ImageFormat::Unknown: break;
    }
    return "unknown";
}

ImageFormat detectImageFormat(const std::vector<uint8_t>& blob) {
    static const uint8_t png[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (blob.size() >= 3 && blob[0] == 0xFF && blob[1] == 0xD8 && blob[2] == 0xFF) return ImageFormat::JPEG;
    if (blob.size() >= 8 && std::memcmp(blob.data(), png, 8) == 0) return ImageFormat::PNG;
    if (blob.size() >= 6 && (std::memcmp(blob.data(), "GIF87a", 6) == 0 ||
                             std::memcmp(blob.data(), "GIF89a", 6) == 0)) return ImageFormat::GIF;
    if (blob.size() >= 12 && std::memcmp(blob.data(), "RIFF", 4) == 0 &&
        std::memcmp(blob.data() + 8, "WEBP", 4) == 0) return ImageFormat::WEBP;
    if (blob.size() >= 4 && (std::memcmp(blob.data(), "II*\0", 4) == 0 ||
                             std::memcmp(blob.data(), "MM\0*", 4) == 0)) return ImageFormat::TIFF;
    return ImageFormat::Unknown;
}

ImageInfo parseImage(const std::vector<uint8_t>& blob) {
    ImageInfo info;
    info.format = detectImageFormat(blob);
    switch (info.format) {
        case ImageFormat::JPEG: parseJpeg(blob, info); break;
        case ImageFormat::PNG:  parsePng(blob, info); break;
        case ImageFormat::GIF:  parseGif(blob, info); break;
        case ImageFormat::WEBP: parseWebp(blob, info); break;
        case ImageFormat::TIFF: parseTiff(blob, info); break;
        case ImageFormat::Unknown:
            info.error = "unrecognised image signature";
            break;
    }
    if (!info.valid) {
        Logger::debug("Image: " + imageFormatName(info.format) + " parse failed: " + info.error);
    }
    return info;
}
