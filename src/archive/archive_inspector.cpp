#include "archive_inspector.hpp"
#include "scanner_registration.hpp"
#include "byte_stream.hpp"
#include "file_reader.hpp"
#include "media_types.hpp"
#include "sevenzip_reader.hpp"
#include "tar_reader.hpp"
#include "zip_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const uint8_t ZIP_LOCAL[]   = {'P', 'K', 0x03, 0x04};
const uint8_t ZIP_EMPTY[]   = {'P', 'K', 0x05, 0x06};
const uint8_t GZIP_MAGIC[]  = {0x1f, 0x8b};
const uint8_t XZ_MAGIC[]    = {0xfd, '7', 'z', 'X', 'Z', 0x00};
const uint8_t BZIP2_MAGIC[] = {'B', 'Z', 'h'};
const uint8_t RAR_MAGIC[]   = {'R', 'a', 'r', '!', 0x1a, 0x07};
const uint8_t SEVENZ_MAGIC[] = {'7', 'z', 0xbc, 0xaf, 0x27, 0x1c};

template <size_t N>
bool has_magic(const std::vector<uint8_t>& head, size_t offset, const uint8_t (&magic)[N]) {
    return head.size() >= offset + N && std::memcmp(head.data() + offset, magic, N) == 0;
}

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

// "../", "..\" or a bare ".." path component.
bool has_traversal(const std::string& name) {
    for (size_t pos = name.find(".."); pos != std::string::npos; pos = name.find("..", pos + 1)) {
        bool startsComponent = pos == 0 || is_separator(name[pos - 1]);
        size_t after = pos + 2;
        if (after < name.size() && is_separator(name[after])) return true;
        if (startsComponent && after == name.size()) return true;
    }
    return false;
}

bool is_absolute(const std::string& name) {
    if (!name.empty() && is_separator(name[0])) return true;
    return name.size() >= 2 && std::isalpha(static_cast<unsigned char>(name[0])) && name[1] == ':';
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_digit(s[i + 1]);
            int lo = hex_digit(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

std::string printable(const std::string& name) {
    std::string out;
    for (char c : name) {
        if (c == '\0') {
            out += "\\0";
        } else {
            out += c;
        }
    }
    return out;
}

std::string base_name(const std::string& name) {
    size_t slash = name.find_last_of("/\\");
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

bool listed(const std::vector<std::string>& list, const std::string& value) {
    return std::any_of(list.begin(), list.end(),
                       [&](const std::string& item) { return to_lower(item) == value; });
}

bool is_archive_name(const std::string& name, const std::vector<std::string>& extensions) {
    const std::string base = to_lower(base_name(name));
    return std::any_of(extensions.begin(), extensions.end(),
                       [&](const std::string& ext) { return ends_with(base, "." + to_lower(ext)); });
}

// Members the inspector can open from memory.
bool is_in_memory_family(const std::string& name) {
    static const std::vector<std::string> family = {
        "zip", "tar", "gz", "tgz", "tar.gz", "xz", "txz", "tar.xz",
    };
    return is_archive_name(name, family);
}

bool exceeds_ratio(uint64_t total, uint64_t compressed, uint64_t ratio) {
    if (compressed == 0 || ratio == 0) return false;
    if (compressed > UINT64_MAX / ratio) return false;
    return total > ratio * compressed;
}

std::string strip_compression_suffix(const std::string& name) {
    std::string base = base_name(name);
    std::string lowered = to_lower(base);
    if (ends_with(lowered, ".tgz") || ends_with(lowered, ".txz")) return base.substr(0, base.size() - 4) + ".tar";
    if (ends_with(lowered, ".gz") || ends_with(lowered, ".xz")) return base.substr(0, base.size() - 3);
    return base;
}

std::string media_type_for(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip:      return mime::zip;
        case ArchiveFormat::Tar:      return mime::tar;
        case ArchiveFormat::Gzip:     return mime::gzip;
        case ArchiveFormat::Xz:       return mime::xz;
        case ArchiveFormat::Bzip2:    return mime::bzip2;
        case ArchiveFormat::Rar:      return mime::rar;
        case ArchiveFormat::SevenZip: return mime::sevenZip;
        case ArchiveFormat::Unknown:  break;
    }
    return mime::unknown;
}

} // namespace

bool ArchiveInspector::match(const std::string& mediaType, const std::string&) const {
    return isArchiveType(mediaType) || isZipContainer(mediaType);
}

ArchiveFormat ArchiveInspector::sniff(const std::vector<uint8_t>& head) {
    if (has_magic(head, 0, ZIP_LOCAL) || has_magic(head, 0, ZIP_EMPTY)) return ArchiveFormat::Zip;
    if (has_magic(head, 0, GZIP_MAGIC)) return ArchiveFormat::Gzip;
    if (has_magic(head, 0, XZ_MAGIC)) return ArchiveFormat::Xz;
    if ((head.size() >= 262 && std::memcmp(head.data() + 257, "ustar", 5) == 0) ||
        (head.size() >= TarReader::BLOCK && TarReader::isTarHeader(head.data()))) {
        return ArchiveFormat::Tar;
    }
    if (has_magic(head, 0, BZIP2_MAGIC)) return ArchiveFormat::Bzip2;
    if (has_magic(head, 0, RAR_MAGIC)) return ArchiveFormat::Rar;
    if (has_magic(head, 0, SEVENZ_MAGIC)) return ArchiveFormat::SevenZip;
    return ArchiveFormat::Unknown;
}

std::string ArchiveInspector::formatName(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip:      return "ZIP";
        case ArchiveFormat::Tar:      return "TAR";
        case ArchiveFormat::Gzip:     return "GZIP";
        case ArchiveFormat::Xz:       return "XZ";
        case ArchiveFormat::Bzip2:    return "BZIP2";
        case ArchiveFormat::Rar:      return "RAR";
        case ArchiveFormat::SevenZip: return "7Z";
        case ArchiveFormat::Unknown:  break;
    }
    return "UNKNOWN";
}

bool ArchiveInspector::needsBackend(ArchiveFormat format) {
    return format == ArchiveFormat::Bzip2 || format == ArchiveFormat::Rar || format == ArchiveFormat::SevenZip;
}

std::vector<std::string> ArchiveInspector::nameFindings(const std::string& entryName) {
    std::vector<std::string> findings;
    const std::string shown = printable(entryName);

    if (entryName.find('\0') != std::string::npos) {
        findings.push_back("Null byte in filename detected: " + shown);
    }
    if (has_traversal(entryName)) {
        findings.push_back("Path traversal detected: " + shown);
    }
    if (is_absolute(entryName)) {
        findings.push_back("Absolute path detected in archive: " + shown);
    }

    std::string once = percent_decode(entryName);
    std::string twice = percent_decode(once);
    if ((once != entryName && (has_traversal(once) || is_absolute(once))) ||
        (twice != once && (has_traversal(twice) || is_absolute(twice)))) {
        findings.push_back("URL-encoded path traversal detected: " + shown);
    }
    return findings;
}

ScanResult ArchiveInspector::inspect(const std::string& path, const std::string&,
                                     const ScanPolicy& policy) const {
    return inspectFile(path, policy, 0);
}

ScanResult ArchiveInspector::scanAtDepth(const std::string& path, const ScanPolicy& policy, int depth) const {
    AccessDecision decision = access.validate(path, policy);
    if (!decision.allowed) {
        return unsafeResult(name(), decision.reason.value_or("File access denied"), decision.event());
    }
    try {
        ScanResult result = inspectFile(path, policy, depth);
        result.scanner = name();
        return result;
    } catch (const std::exception& e) {
        Logger::error(name() + ": scan of " + path + " failed: " + e.what());
        return unsafeResult(name(), std::string("Scan failed: ") + e.what(), eventType());
    }
}

ScanResult ArchiveInspector::inspectFile(const std::string& path, const ScanPolicy& policy, int depth) const {
    ScanResult result;
    result.scanner = name();
    if (depth >= policy.archive.maxNestingDepth) {
        result.addThreat("Archive nesting depth exceeds limit", eventType());
        return result;
    }

    ArchiveFormat format = sniff(readFilePrefix(path, SNIFF_SIZE));
    if (format == ArchiveFormat::Unknown) {
        result.addThreat("Unsupported archive format", eventType());
        return result;
    }

    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        result.addThreat("File cannot be read", eventType());
        return result;
    }

    if (needsBackend(format)) {
        inspectWithBackend(path, format, size, policy, depth, result);
        return result;
    }

    if (size > policy.maxScanBytes) {
        result.addThreat("File too large to scan (" + std::to_string(size) + " bytes)", eventType());
        return result;
    }
    std::vector<uint8_t> data = readFile(path);
    inspectData(data, format, base_name(path), policy, depth, result);
    return result;
}

ScanResult ArchiveInspector::scanBuffer(const std::vector<uint8_t>& data, const std::string& archiveName,
                                        const ScanPolicy& policy, int depth) const {
    ScanResult result;
    result.scanner = name();
    if (depth >= policy.archive.maxNestingDepth) {
        result.addThreat("Archive nesting depth exceeds limit", eventType());
        return result;
    }

    ArchiveFormat format = sniff(data);
    if (format == ArchiveFormat::Unknown || needsBackend(format)) {
        result.addThreat("Unsupported archive format", eventType());
        return result;
    }
    inspectData(data, format, archiveName, policy, depth, result);
    return result;
}

void ArchiveInspector::inspectData(const std::vector<uint8_t>& data, ArchiveFormat format,
                                   const std::string& archiveName, const ScanPolicy& policy,
                                   int depth, ScanResult& result) const {
    const ArchivePolicy& cfg = policy.archive;
    result.mediaType = media_type_for(format);
    result.setMeta("format", formatName(format));
    Logger::debug(name() + ": " + formatName(format) + " " + archiveName + " at depth " + std::to_string(depth));

    if (format == ArchiveFormat::Zip) {
        std::string error;
        std::unique_ptr<ZipFile> zip = ZipFile::fromBuffer(data, error);
        if (!zip) {
            Logger::debug(name() + ": " + error);
            result.addThreat("Failed to open ZIP archive", eventType());
            return;
        }
        ZipReader reader(*zip);
        enumerate(reader, data.size(), policy, depth, result);
        return;
    }

    StreamCodec codec = format == ArchiveFormat::Gzip ? StreamCodec::Gzip
                      : format == ArchiveFormat::Xz   ? StreamCodec::Xz
                                                      : StreamCodec::Raw;

    // A plain compressed stream is counted no further than the first limit
    // that would reject it.
    uint64_t streamLimit = cfg.maxUncompressedSize;
    if (cfg.maxCompressionRatio > 0 && !data.empty() && data.size() <= UINT64_MAX / cfg.maxCompressionRatio) {
        streamLimit = std::min<uint64_t>(streamLimit, cfg.maxCompressionRatio * data.size());
    }

    TarReader reader(data, codec, strip_compression_suffix(archiveName), streamLimit);
    enumerate(reader, data.size(), policy, depth, result);
    result.setMeta("format", reader.name());
}

void ArchiveInspector::inspectWithBackend(const std::string& path, ArchiveFormat format, uint64_t fileSize,
                                          const ScanPolicy& policy, int depth, ScanResult& result) const {
    const ArchivePolicy& cfg = policy.archive;
    const std::string label = formatName(format);
    result.mediaType = media_type_for(format);
    result.setMeta("format", label);

    if (!SevenZipReader::available(cfg.sevenZipCommand)) {
        if (cfg.backendFailOpen) {
            Logger::warn(name() + ": " + cfg.sevenZipCommand + " not found, " + label + " archive not inspected");
            result.addNote(label + " scanning skipped: 7z backend not available");
        } else {
            result.addThreat(label + " scanning requires the 7z backend", eventType());
        }
        return;
    }

    SevenZipReader reader(path, cfg.sevenZipCommand, label);
    enumerate(reader, fileSize, policy, depth, result);
}

void ArchiveInspector::enumerate(ArchiveReader& reader, uint64_t compressedSize, const ScanPolicy& policy,
                                 int depth, ScanResult& result) const {
    const ArchivePolicy& cfg = policy.archive;

    int64_t declared = reader.entryCount();
    if (declared >= 0 && static_cast<uint64_t>(declared) > cfg.maxFilesCount) {
        result.addThreat("Archive contains too many files (" + std::to_string(declared) + " > " +
                         std::to_string(cfg.maxFilesCount) + ")", eventType());
        return;
    }

    size_t count = 0;
    uint64_t total = 0;
    bool aborted = false;

    auto visit = [&](const ArchiveEntry& entry, const EntryLoader& load) {
        if (++count > cfg.maxFilesCount) {
            result.addThreat("Archive contains too many files (" + std::to_string(count) + " > " +
                             std::to_string(cfg.maxFilesCount) + ")", eventType());
            aborted = true;
            return false;
        }

        total = entry.uncompressedSize > UINT64_MAX - total ? UINT64_MAX : total + entry.uncompressedSize;
        if (exceeds_ratio(total, compressedSize, cfg.maxCompressionRatio)) {
            double ratio = static_cast<double>(total) / static_cast<double>(compressedSize);
            result.addThreat("Potential zip bomb detected: compression ratio " + format_ratio(ratio) + ":1",
                             EventType::DecompressionBomb);
            aborted = true;
            return false;
        }
        if (total > cfg.maxUncompressedSize) {
            result.addThreat("Archive uncompressed size exceeds limit", EventType::DecompressionBomb);
            aborted = true;
            return false;
        }

        checkEntry(entry, cfg, result);
        if (!entry.isDirectory && is_archive_name(entry.name, cfg.archiveExtensions)) {
            checkNested(entry, load, policy, depth, result);
        }
        return true;
    };

    std::string error;
    if (!reader.forEach(visit, error)) {
        Logger::debug(name() + ": " + reader.name() + ": " + error);
        result.addThreat("Failed to read " + reader.name() + " archive: " + error, eventType());
    }

    result.flags.filesCount = count;
    result.flags.uncompressedSize = total;

    if (!aborted && exceeds_ratio(total, compressedSize, cfg.maxCompressionRatio)) {
        double ratio = static_cast<double>(total) / static_cast<double>(compressedSize);
        result.addThreat("Potential zip bomb detected: compression ratio " + format_ratio(ratio) + ":1",
                         EventType::DecompressionBomb);
    }
}

void ArchiveInspector::checkEntry(const ArchiveEntry& entry, const ArchivePolicy& policy,
                                  ScanResult& result) const {
    for (const auto& finding : nameFindings(entry.name)) {
        result.addThreat(finding, eventType());
    }

    if (entry.isLink && (is_absolute(entry.linkTarget) || has_traversal(entry.linkTarget))) {
        result.addThreat("Unsafe link target detected: " + printable(entry.name) + " -> " +
                         printable(entry.linkTarget), eventType());
    }

    if (entry.isDirectory) return;

    const std::string base = base_name(entry.name);
    const std::string ext = file_extension(base);
    if (!ext.empty() && listed(policy.blockedExtensions, ext)) {
        result.addThreat("Dangerous file detected in archive: " + printable(entry.name), eventType());
    }

    size_t dot = base.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        const std::string hidden = file_extension(base.substr(0, dot));
        if (!hidden.empty() && listed(policy.blockedExtensions, hidden)) {
            result.addThreat("Hidden dangerous extension detected: " + printable(entry.name), eventType());
        }
    }
}

void ArchiveInspector::checkNested(const ArchiveEntry& entry, const EntryLoader& load, const ScanPolicy& policy,
                                   int depth, ScanResult& result) const {
    const ArchivePolicy& cfg = policy.archive;

    if (is_in_memory_family(entry.name) && entry.uncompressedSize <= cfg.maxNestedArchiveBytes) {
        std::vector<uint8_t> member;
        if (load(cfg.maxNestedArchiveBytes, member)) {
            ScanResult child = scanBuffer(member, entry.name, policy, depth + 1);
            for (const auto& finding : child.threats) {
                result.addThreat(printable(entry.name) + ": " + finding.message, finding.event);
            }
            for (const auto& note : child.notes) {
                result.addNote(printable(entry.name) + ": " + note);
            }
            child.scanner = name() + ":" + entry.name;
            result.children.push_back(child);
            return;
        }
        Logger::debug(name() + ": cannot materialise nested member " + entry.name);
    }
    result.addThreat("Nested archive detected: " + printable(entry.name), eventType());
}

REGISTER_SCANNER(ArchiveInspector, 60)
