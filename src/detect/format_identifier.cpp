#include "format_identifier.hpp"
#include "media_types.hpp"
#include "file_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <magic.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <type_traits>

namespace {

struct RawSignature {
    size_t offset;
    const char* hex;
    const char* mediaType;
    Refinement refinement;
};

const RawSignature kSignatures[] = {
    // images
    {0, "ffd8ff",           "image/jpeg",   Refinement::None},
    {0, "89504e470d0a1a0a", "image/png",    Refinement::None},
    {0, "474946383761",     "image/gif",    Refinement::None},
    {0, "474946383961",     "image/gif",    Refinement::None},
    {0, "424d",             "image/bmp",    Refinement::None},
    {0, "49492a00",         "image/tiff",   Refinement::None},
    {0, "4d4d002a",         "image/tiff",   Refinement::None},
    {0, "52494646",         "application/octet-stream", Refinement::Riff},
    {0, "00000100",         "image/x-icon", Refinement::None},
    {0, "00000200",         "image/x-icon", Refinement::None},
    // documents
    {0, "25504446",         "application/pdf",  Refinement::None},
    {0, "504b0304",         "application/zip",  Refinement::Zip},
    {0, "504b0506",         "application/zip",  Refinement::Zip},
    {0, "504b0708",         "application/zip",  Refinement::Zip},
    {0, "d0cf11e0a1b11ae1", "application/msword", Refinement::None},
    {0, "0d444f43",         "application/msword", Refinement::None},
    // text
    {0, "efbbbf",           "text/plain", Refinement::Xml},
    {0, "fffe",             "text/plain", Refinement::None},
    {0, "feff",             "text/plain", Refinement::None},
    // archives
    {0, "1f8b",             "application/gzip",             Refinement::None},
    {0, "1f9d",             "application/x-compress",       Refinement::None},
    {0, "1fa0",             "application/x-lzh",            Refinement::None},
    {0, "526172211a0700",   "application/x-rar-compressed", Refinement::None},
    {0, "526172211a0701",   "application/x-rar-compressed", Refinement::None},
    {0, "377abcaf271c",     "application/x-7z-compressed",  Refinement::None},
    {0, "213c617263683e0a6465626961", "application/x-debian-package", Refinement::None},
    {0, "213c617263683e0a", "application/x-archive",        Refinement::None},
    {0, "425a68",           "application/x-bzip2",          Refinement::None},
    {0, "fd377a585a00",     "application/x-xz",             Refinement::None},
    {257, "7573746172",     "application/x-tar",            Refinement::None},
    // video
    {0, "000001ba",         "video/mpeg",     Refinement::None},
    {0, "000001b3",         "video/mpeg",     Refinement::None},
    {4, "66747970",         "video/mp4",      Refinement::Ftyp},
    {0, "1a45dfa3",         "video/webm",     Refinement::None},
    {0, "3026b2758e66cf11", "video/x-ms-asf", Refinement::None},
    {0, "464c5601",         "video/x-flv",    Refinement::None},
    {0, "4f676753",         "video/ogg",      Refinement::None},
    // audio
    {0, "494433",           "audio/mpeg",     Refinement::None},
    {0, "fffb",             "audio/mpeg",     Refinement::None},
    {0, "fff3",             "audio/mpeg",     Refinement::None},
    {0, "664c6143",         "audio/flac",     Refinement::None},
    {0, "4d546864",         "audio/midi",     Refinement::None},
    {0, "2321414d52",       "audio/amr",      Refinement::None},
    // executables
    {0, "4d5a9000",         "application/x-dosexec",      Refinement::None},
    {0, "4d5a",             "application/x-msdownload",   Refinement::None},
    {0, "7f454c46",         "application/x-executable",   Refinement::None},
    {0, "feedface",         "application/x-mach-binary",  Refinement::None},
    {0, "feedfacf",         "application/x-mach-binary",  Refinement::None},
    {0, "cefaedfe",         "application/x-mach-binary",  Refinement::None},
    {0, "cffaedfe",         "application/x-mach-binary",  Refinement::None},
    {0, "cafebabe",         "application/java-vm",        Refinement::None},
    {0, "23212f",           "text/x-shellscript",         Refinement::None},
    // scripts
    {0, "3c3f706870",       "application/x-php",          Refinement::None},
    {0, "3c3f3d",           "application/x-php",          Refinement::None},
    {0, "3c25",             "text/x-jsp",                 Refinement::None},
    // markup
    {0, "3c3f786d6c",       "text/xml",      Refinement::Xml},
    {0, "3c737667",         "image/svg+xml", Refinement::None},
    {0, "3c21444f43545950", "text/html",     Refinement::Xml},
    {0, "3c68746d6c",       "text/html",     Refinement::None},
    {0, "3c686561643e",     "text/html",     Refinement::None},
    {0, "3c626f64793e",     "text/html",     Refinement::None},
};

struct MagicCloser {
    void operator()(magic_t cookie) const { magic_close(cookie); }
};
using MagicCookie = std::unique_ptr<std::remove_pointer<magic_t>::type, MagicCloser>;

bool isNameChar(uint8_t c) {
    return std::isalnum(c) || c == '_' || c == '-' || c == '.';
}

// Marker found at the start of a path component.
bool containsEntryPath(const std::string& window, const std::string& marker) {
    size_t pos = window.find(marker);
    while (pos != std::string::npos) {
        if (pos == 0 || !isNameChar(static_cast<uint8_t>(window[pos - 1]))) return true;
        pos = window.find(marker, pos + 1);
    }
    return false;
}

size_t skipWhitespace(const std::string& s, size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
    return pos;
}

// Position of the first element after the XML prolog (declaration,
// processing instructions, comments, doctype), or npos.
size_t firstElement(const std::string& text) {
    size_t pos = 0;
    if (starts_with(text, "\xEF\xBB\xBF")) pos = 3;
    while (true) {
        pos = skipWhitespace(text, pos);
        if (pos >= text.size() || text[pos] != '<') return std::string::npos;
        if (text.compare(pos, 2, "<?") == 0) {
            size_t end = text.find("?>", pos + 2);
            if (end == std::string::npos) return std::string::npos;
            pos = end + 2;
        } else if (text.compare(pos, 4, "<!--") == 0) {
            size_t end = text.find("-->", pos + 4);
            if (end == std::string::npos) return std::string::npos;
            pos = end + 3;
        } else if (text.compare(pos, 2, "<!") == 0) {
            int depth = 0;
            size_t i = pos + 2;
            for (; i < text.size(); ++i) {
                if (text[i] == '[') ++depth;
                else if (text[i] == ']') --depth;
                else if (text[i] == '>' && depth <= 0) break;
            }
            if (i >= text.size()) return std::string::npos;
            pos = i + 1;
        } else {
            return pos;
        }
    }
}

} // namespace

const std::vector<SignatureEntry>& FormatIdentifier::builtinSignatures() {
    static const std::vector<SignatureEntry> table = [] {
        std::vector<SignatureEntry> entries;
        for (const auto& raw : kSignatures) {
            SignatureEntry e{raw.offset, {}, raw.mediaType, raw.refinement};
            parse_hex(raw.hex, e.bytes);
            entries.push_back(std::move(e));
        }
        // longer patterns shadow shorter ones sharing their prefix
        std::stable_sort(entries.begin(), entries.end(),
                         [](const SignatureEntry& a, const SignatureEntry& b) {
                             return a.offset + a.bytes.size() > b.offset + b.bytes.size();
                         });
        return entries;
    }();
    return table;
}

bool FormatIdentifier::matchesAt(const std::vector<uint8_t>& prefix, const SignatureEntry& entry) {
    if (entry.bytes.empty()) return false;
    if (entry.offset + entry.bytes.size() > prefix.size()) return false;
    return std::memcmp(prefix.data() + entry.offset, entry.bytes.data(), entry.bytes.size()) == 0;
}

std::string FormatIdentifier::identify(const std::vector<uint8_t>& prefix, const ScanPolicy& policy) const {
    if (prefix.empty()) return mime::unknown;

    for (const auto& custom : policy.mime.customSignatures) {
        SignatureEntry entry{0, {}, custom.second, Refinement::None};
        if (!parse_hex(custom.first, entry.bytes)) {
            Logger::debug("FormatIdentifier: ignoring malformed custom signature " + custom.first);
            continue;
        }
        if (matchesAt(prefix, entry)) {
            Logger::debug("FormatIdentifier: custom signature " + custom.first + " -> " + custom.second);
            return custom.second;
        }
    }

    for (const auto& entry : builtinSignatures()) {
        if (matchesAt(prefix, entry)) {
            std::string type = refine(prefix, entry);
            Logger::debug("FormatIdentifier: matched " + to_hex_bytes(entry.bytes.data(), entry.bytes.size()) +
                          " -> " + type);
            return type;
        }
    }

    if (!policy.mime.useHostSniffer) return mime::unknown;
    return sniff(prefix);
}

std::string FormatIdentifier::identifyFile(const std::string& path, const ScanPolicy& policy) const {
    return identify(readFilePrefix(path, PREFIX_SIZE), policy);
}

std::string FormatIdentifier::refine(const std::vector<uint8_t>& prefix, const SignatureEntry& entry) const {
    switch (entry.refinement) {
        case Refinement::Zip:  return refineZip(prefix);
        case Refinement::Riff: return refineRiff(prefix, entry.mediaType);
        case Refinement::Ftyp: return refineFtyp(prefix);
        case Refinement::Xml:  return refineXml(prefix, entry.mediaType);
        case Refinement::None: break;
    }
    return entry.mediaType;
}

std::string FormatIdentifier::refineZip(const std::vector<uint8_t>& prefix) const {
    // OpenDocument stores an uncompressed "mimetype" entry first
    if (prefix.size() >= 38 && read_le32(prefix, 0) == 0x04034b50) {
        uint16_t nameLen = read_le16(prefix, 26);
        uint16_t extraLen = read_le16(prefix, 28);
        if (nameLen == 8 && 30 + nameLen <= prefix.size() &&
            std::memcmp(prefix.data() + 30, "mimetype", 8) == 0) {
            uint16_t method = read_le16(prefix, 8);
            uint32_t storedSize = read_le32(prefix, 18);
            size_t dataStart = 30 + nameLen + extraLen;
            if (method == 0 && storedSize <= 128 && dataStart + storedSize <= prefix.size()) {
                std::string content(prefix.begin() + dataStart, prefix.begin() + dataStart + storedSize);
                if (starts_with(content, "application/vnd.oasis.opendocument.")) return content;
            }
        }
    }

    const std::string window(prefix.begin(), prefix.end());
    if (containsEntryPath(window, "word/")) return mime::docx;
    if (containsEntryPath(window, "xl/")) return mime::xlsx;
    if (containsEntryPath(window, "ppt/")) return mime::pptx;
    if (window.find("META-INF/MANIFEST.MF") != std::string::npos) return mime::jar;
    return mime::zip;
}

std::string FormatIdentifier::refineRiff(const std::vector<uint8_t>& prefix, const std::string& fallback) const {
    if (prefix.size() < 12) return fallback;
    std::string form(prefix.begin() + 8, prefix.begin() + 12);
    if (form == "WEBP") return mime::webp;
    if (form == "AVI ") return "video/x-msvideo";
    if (form == "WAVE") return "audio/wav";
    return fallback;
}

std::string FormatIdentifier::refineFtyp(const std::vector<uint8_t>& prefix) const {
    if (prefix.size() < 12) return "video/mp4";
    std::string brand(prefix.begin() + 8, prefix.begin() + 12);
    if (brand == "isom" || brand == "iso2" || brand == "mp41" || brand == "mp42" || brand == "avc1") {
        return "video/mp4";
    }
    if (brand == "qt  ") return "video/quicktime";
    if (brand == "M4A " || brand == "M4B ") return "audio/mp4";
    if (brand == "heic" || brand == "heix") return "image/heic";
    if (brand == "avif") return "image/avif";
    return "video/mp4";
}

std::string FormatIdentifier::refineXml(const std::vector<uint8_t>& prefix, const std::string& fallback) const {
    const std::string text(prefix.begin(), prefix.end());
    size_t pos = firstElement(text);
    if (pos != std::string::npos && text.compare(pos, 4, "<svg") == 0 && pos + 4 < text.size()) {
        char next = text[pos + 4];
        if (std::isspace(static_cast<unsigned char>(next)) || next == '>' || next == '/') return mime::svg;
    }
    return fallback;
}

std::string FormatIdentifier::sniff(const std::vector<uint8_t>& prefix) const {
    MagicCookie cookie(magic_open(MAGIC_MIME_TYPE));
    if (!cookie) {
        Logger::warn("FormatIdentifier: magic_open failed");
        return mime::unknown;
    }
    if (magic_load(cookie.get(), nullptr) != 0) {
        const char* err = magic_error(cookie.get());
        Logger::warn(std::string("FormatIdentifier: magic_load failed: ") + (err ? err : "unknown error"));
        return mime::unknown;
    }
    const char* type = magic_buffer(cookie.get(), prefix.data(), prefix.size());
    if (!type || *type == '\0') {
        const char* err = magic_error(cookie.get());
        Logger::debug(std::string("FormatIdentifier: magic_buffer gave no type: ") + (err ? err : ""));
        return mime::unknown;
    }
    Logger::debug(std::string("FormatIdentifier: libmagic -> ") + type);
    return type;
}

bool FormatIdentifier::isDangerous(const std::string& mediaType, const ScanPolicy& policy) const {
    const std::string t = to_lower(mediaType);
    for (const auto& d : policy.mime.dangerousTypes) {
        if (to_lower(d) == t) return true;
    }
    return false;
}

bool FormatIdentifier::isBinaryMedia(const std::string& mediaType) {
    if (mediaType == mime::svg) return false;
    if (starts_with(mediaType, "image/") || starts_with(mediaType, "video/") || starts_with(mediaType, "audio/")) {
        return true;
    }
    return isArchiveType(mediaType);
}
