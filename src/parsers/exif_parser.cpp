#include "exif_parser.hpp"
#include "logger.hpp"
#include <set>

namespace {

constexpr size_t MAX_IFD_ENTRIES = 1024;
constexpr size_t MAX_IFDS = 8;
constexpr size_t MAX_FIELD_BYTES = 64 * 1024;

struct TagName {
    uint16_t tag;
    const char* name;
};

const TagName kTextTags[] = {
    {0x000B, "ProcessingSoftware"},
    {0x010D, "DocumentName"},
    {0x010E, "ImageDescription"},
    {0x010F, "Make"},
    {0x0110, "Model"},
    {0x0131, "Software"},
    {0x0132, "DateTime"},
    {0x013B, "Artist"},
    {0x013C, "HostComputer"},
    {0x8298, "Copyright"},
    {0x9286, "UserComment"},
    {0x9C9B, "XPTitle"},
    {0x9C9C, "XPComment"},
    {0x9C9D, "XPAuthor"},
    {0x9C9E, "XPKeywords"},
    {0x9C9F, "XPSubject"},
};

const TagName kGpsTags[] = {
    {0x0001, "GPSLatitudeRef"},
    {0x0002, "GPSLatitude"},
    {0x0003, "GPSLongitudeRef"},
    {0x0004, "GPSLongitude"},
    {0x0005, "GPSAltitudeRef"},
    {0x0006, "GPSAltitude"},
    {0x0007, "GPSTimeStamp"},
    {0x001D, "GPSDateStamp"},
};

const char* lookup(const TagName* table, size_t n, uint16_t tag) {
    for (size_t i = 0; i < n; ++i) {
        if (table[i].tag == tag) return table[i].name;
    }
    return nullptr;
}

size_t typeSize(uint16_t type) {
    switch (type) {
        case 1: case 2: case 6: case 7: return 1;
        case 3: case 8: return 2;
        case 4: case 9: case 11: return 4;
        case 5: case 10: case 12: return 8;
        default: return 0;
    }
}

class TiffReader {
public:
    TiffReader(const std::vector<uint8_t>& blob, size_t base, size_t length, bool littleEndian)
        : blob(blob), base(base), length(length), le(littleEndian) {}

    bool inRange(size_t off, size_t n) const { return off <= length && n <= length - off; }

    uint16_t u16(size_t off) const {
        const uint8_t* p = &blob[base + off];
        return le ? static_cast<uint16_t>(p[0] | (p[1] << 8))
                  : static_cast<uint16_t>((p[0] << 8) | p[1]);
    }

    uint32_t u32(size_t off) const {
        const uint8_t* p = &blob[base + off];
        return le ? (static_cast<uint32_t>(p[3]) << 24) | (p[2] << 16) | (p[1] << 8) | p[0]
                  : (static_cast<uint32_t>(p[0]) << 24) | (p[1] << 16) | (p[2] << 8) | p[3];
    }

    const uint8_t* at(size_t off) const { return &blob[base + off]; }
    bool littleEndian() const { return le; }

private:
    const std::vector<uint8_t>& blob;
    size_t base;
    size_t length;
    bool le;
};

std::string asciiValue(const uint8_t* p, size_t n) {
    std::string s(reinterpret_cast<const char*>(p), n);
    while (!s.empty() && (s.back() == '\0' || s.back() == ' ')) s.pop_back();
    return s;
}

// XP* tags are UTF-16LE regardless of the TIFF byte order.
std::string utf16Value(const uint8_t* p, size_t n, bool littleEndian = true) {
    std::string s;
    for (size_t i = 0; i + 1 < n; i += 2) {
        uint16_t ch = littleEndian ? static_cast<uint16_t>(p[i] | (p[i + 1] << 8))
                                   : static_cast<uint16_t>((p[i] << 8) | p[i + 1]);
        if (ch == 0) break;
        s += ch < 0x80 ? static_cast<char>(ch) : '?';
    }
    return s;
}

// UserComment carries an 8-byte character code before the text. UNICODE
// text follows the TIFF byte order.
std::string userCommentValue(const uint8_t* p, size_t n, bool littleEndian) {
    if (n <= 8) return "";
    std::string code(reinterpret_cast<const char*>(p), 8);
    if (code.compare(0, 7, "UNICODE") == 0) return utf16Value(p + 8, n - 8, littleEndian);
    return asciiValue(p + 8, n - 8);
}

struct Walker {
    const TiffReader& tiff;
    ExifData& out;
    std::set<uint32_t> visited;

    void walk(uint32_t ifdOffset, bool gpsIfd) {
        size_t chained = 0;
        while (ifdOffset != 0 && chained++ < MAX_IFDS) {
            if (visited.size() >= MAX_IFDS || !visited.insert(ifdOffset).second) {
                Logger::debug("EXIF: IFD loop or limit at offset " + std::to_string(ifdOffset));
                return;
            }
            if (!tiff.inRange(ifdOffset, 2)) return;
            size_t count = tiff.u16(ifdOffset);
            if (count > MAX_IFD_ENTRIES) return;
            size_t entryBase = ifdOffset + 2;
            if (!tiff.inRange(entryBase, count * 12 + 4)) return;

            for (size_t i = 0; i < count; ++i) {
                entry(entryBase + i * 12, gpsIfd);
            }
            ifdOffset = gpsIfd ? 0 : tiff.u32(entryBase + count * 12);
        }
    }

    void entry(size_t off, bool gpsIfd) {
        uint16_t tag = tiff.u16(off);
        uint16_t type = tiff.u16(off + 2);
        uint32_t count = tiff.u32(off + 4);
        size_t unit = typeSize(type);
        if (unit == 0) return;
        size_t total = static_cast<size_t>(count) * unit;
        if (count != 0 && total / count != unit) return;
        size_t valueOff = total <= 4 ? off + 8 : tiff.u32(off + 8);

        if (gpsIfd) {
            if (const char* name = lookup(kGpsTags, sizeof(kGpsTags) / sizeof(kGpsTags[0]), tag)) {
                out.gpsTags.push_back(name);
            }
            return;
        }

        switch (tag) {
            case 0x8769:  // Exif IFD
                if (type == 4 || type == 13) walk(tiff.u32(off + 8), false);
                return;
            case 0x8825:  // GPS IFD
                if (type == 4 || type == 13) walk(tiff.u32(off + 8), true);
                return;
            case 0x0100: case 0xA002:
                if (count == 1) out.width = type == 3 ? tiff.u16(off + 8) : tiff.u32(off + 8);
                return;
            case 0x0101: case 0xA003:
                if (count == 1) out.height = type == 3 ? tiff.u16(off + 8) : tiff.u32(off + 8);
                return;
            default:
                break;
        }

        const char* name = lookup(kTextTags, sizeof(kTextTags) / sizeof(kTextTags[0]), tag);
        if (!name) return;
        if (total > MAX_FIELD_BYTES || !tiff.inRange(valueOff, total)) return;

        std::string value;
        if (tag >= 0x9C9B && tag <= 0x9C9F) {
            value = utf16Value(tiff.at(valueOff), total);
        } else if (tag == 0x9286) {
            value = userCommentValue(tiff.at(valueOff), total, tiff.littleEndian());
        } else {
            value = asciiValue(tiff.at(valueOff), total);
        }
        out.fields.emplace_back(name, value);
    }
};

} // namespace

bool parseExif(const std::vector<uint8_t>& blob, size_t base, size_t length, ExifData& out) {
    if (base > blob.size() || length > blob.size() - base || length < 8) return false;

    bool le;
    if (blob[base] == 'I' && blob[base + 1] == 'I') {
        le = true;
    } else if (blob[base] == 'M' && blob[base + 1] == 'M') {
        le = false;
    } else {
        return false;
    }

    TiffReader tiff(blob, base, length, le);
    if (tiff.u16(2) != 42) return false;

    Walker walker{tiff, out, {}};
    walker.walk(tiff.u32(4), false);
    return true;
}
