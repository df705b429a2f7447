#include "macro_scanner.hpp"
#include "scanner_registration.hpp"
#include "zip_reader.hpp"
#include "file_reader.hpp"
#include "media_types.hpp"
#include "text_match.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const uint8_t OLE_MAGIC[] = {0xd0, 0xcf, 0x11, 0xe0, 0xa1, 0xb1, 0x1a, 0xe1};

// Compound file directory entries are 128 bytes, sector aligned.
constexpr size_t OLE_DIR_ENTRY = 128;

// DIR/STEM<digits>.EXT anywhere in an already lowercased name.
bool has_part(const std::string& lower, const std::string& dir, const std::string& stem,
              const std::vector<std::string>& exts) {
    for (size_t pos = lower.find(dir); pos != std::string::npos; pos = lower.find(dir, pos + 1)) {
        size_t p = pos + dir.size();
        if (p >= lower.size() || (lower[p] != '/' && lower[p] != '\\')) continue;
        ++p;
        if (lower.compare(p, stem.size(), stem) != 0) continue;
        p += stem.size();
        while (p < lower.size() && std::isdigit(static_cast<unsigned char>(lower[p]))) ++p;
        if (p >= lower.size() || lower[p] != '.') continue;
        ++p;
        for (const auto& ext : exts) {
            if (lower.compare(p, ext.size(), ext) == 0) return true;
        }
    }
    return false;
}

std::string utf16le(const std::string& ascii) {
    std::string out;
    for (char c : ascii) {
        out += c;
        out += '\0';
    }
    return out;
}

// Storage name at the start of a directory entry, NUL terminated.
bool has_storage(const std::string& content, const std::string& storage) {
    const std::string needle = utf16le(storage) + std::string(2, '\0');
    for (size_t pos = content.find(needle); pos != std::string::npos; pos = content.find(needle, pos + 1)) {
        if (pos % OLE_DIR_ENTRY == 0) return true;
    }
    return false;
}

bool is_office_extension(const std::string& ext) {
    static const std::vector<std::string> office = {
        "docx", "xlsx", "pptx", "docm", "xlsm", "pptm",
        "dotx", "dotm", "xltx", "xltm", "potx", "potm",
    };
    return std::find(office.begin(), office.end(), ext) != office.end();
}

} // namespace

const std::vector<std::string>& MacroScanner::macroContentTypes() {
    static const std::vector<std::string> types = {
        "application/vnd.ms-office.vbaProject",
        "application/vnd.ms-word.document.macroEnabled",
        "application/vnd.ms-excel.sheet.macroEnabled",
        "application/vnd.ms-powerpoint.presentation.macroEnabled",
        "application/vnd.ms-excel.sheet.macroEnabled.main+xml",
        "application/vnd.ms-word.document.macroEnabled.main+xml",
        "application/vnd.ms-powerpoint.presentation.macroEnabled.main+xml",
    };
    return types;
}

const std::vector<std::string>& MacroScanner::macroExtensions() {
    static const std::vector<std::string> extensions = {"docm", "xlsm", "pptm", "dotm", "xltm", "potm"};
    return extensions;
}

bool MacroScanner::isControlPart(const std::string& entryName) {
    const std::string lower = to_lower(entryName);
    return has_part(lower, "activex", "activex", {"xml", "bin"}) ||
           has_part(lower, "embeddings", "oleobject", {"bin"});
}

bool MacroScanner::isOleHeader(const std::vector<uint8_t>& head) {
    return head.size() >= sizeof(OLE_MAGIC) && std::equal(std::begin(OLE_MAGIC), std::end(OLE_MAGIC), head.begin());
}

bool MacroScanner::match(const std::string& mediaType, const std::string& extension) const {
    if (isOfficeOpenXml(mediaType) || mediaType == mime::msword) return true;
    return mediaType == mime::zip && is_office_extension(extension);
}

ScanResult MacroScanner::inspect(const std::string& path, const std::string& declaredName,
                                 const ScanPolicy& policy) const {
    ScanResult result;

    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        result.addThreat("File cannot be read", eventType());
        return result;
    }
    if (size > policy.maxScanBytes) {
        result.addThreat("File too large to scan (" + std::to_string(size) + " bytes)", eventType());
        return result;
    }

    if (isOleHeader(readFilePrefix(path, sizeof(OLE_MAGIC)))) {
        result.mediaType = mime::msword;
        inspectLegacy(path, policy, result);
    } else {
        std::string error;
        std::unique_ptr<ZipFile> zip = ZipFile::open(path, error);
        if (!zip) {
            Logger::debug(name() + ": " + error);
            result.addThreat("File is not a valid Office document", eventType());
            return result;
        }
        inspectOpenXml(*zip, policy.macro, result);
        if (!result.safe() && result.hasThreat("not a valid Office document")) return result;
    }

    checkSpoofing(declaredName.empty() ? fs::path(path).filename().string() : declaredName, policy.macro, result);
    return result;
}

void MacroScanner::inspectOpenXml(const ZipFile& zip, const MacroPolicy& policy, ScanResult& result) const {
    std::vector<std::string> names;
    bool hasManifest = false;
    bool hasPart = false;

    const uint64_t count = zip.size();
    for (uint64_t i = 0; i < count; ++i) {
        ArchiveEntry entry;
        if (!zip.entry(i, entry)) continue;
        hasManifest |= entry.name == "[Content_Types].xml";
        hasPart |= starts_with(entry.name, "word/") || starts_with(entry.name, "xl/") ||
                   starts_with(entry.name, "ppt/");
        names.push_back(entry.name);
    }
    if (!hasManifest || !hasPart) {
        result.addThreat("File is not a valid Office document", eventType());
        return;
    }
    result.setMeta("parts", std::to_string(names.size()));

    // VBA project storage: well-known locations first, then anywhere
    std::string location;
    for (const char* candidate : {"word/vbaProject.bin", "xl/vbaProject.bin", "ppt/vbaProject.bin", "vbaProject.bin"}) {
        if (std::find(names.begin(), names.end(), candidate) != names.end()) {
            location = candidate;
            break;
        }
    }
    if (location.empty()) {
        auto it = std::find_if(names.begin(), names.end(),
                               [](const std::string& n) { return ends_with(to_lower(n), "vbaproject.bin"); });
        if (it != names.end()) location = *it;
    }
    if (!location.empty()) {
        result.flags.hasMacros = true;
        result.setMeta("vbaProject", location);
        if (policy.blockMacros) result.addThreat("VBA macro detected: " + location, eventType());
    }

    uint64_t index = 0;
    if (zip.locate("[Content_Types].xml", index)) {
        std::vector<uint8_t> data;
        bool truncated = false;
        std::string error;
        if (zip.read(index, MAX_MANIFEST_BYTES, data, truncated, error)) {
            if (truncated) result.addNote("Content types manifest truncated at 4 MiB");
            const std::string manifest(data.begin(), data.end());
            for (const auto& type : macroContentTypes()) {
                if (!contains_icase(manifest, type)) continue;
                result.flags.hasMacros = true;
                if (policy.blockMacros) result.addThreat("Macro content type detected: " + type, eventType());
            }
        } else {
            Logger::warn(name() + ": " + error);
            result.addNote("Content types manifest could not be read");
        }
    }

    size_t controls = static_cast<size_t>(std::count_if(names.begin(), names.end(), isControlPart));
    if (controls > 0) {
        result.flags.hasActiveX = true;
        result.setMeta("controls", std::to_string(controls));
        if (policy.blockActiveX) {
            result.addThreat("ActiveX control detected: " + std::to_string(controls) + " control(s)", eventType());
        }
    }
}

void MacroScanner::inspectLegacy(const std::string& path, const ScanPolicy& policy, ScanResult& result) const {
    std::string content;
    if (!loadContent(path, policy, content, result)) return;

    std::string storage;
    if (content.find(utf16le("_VBA_PROJECT")) != std::string::npos) {
        storage = "_VBA_PROJECT";
    } else if (has_storage(content, "VBA")) {
        storage = "VBA";
    } else if (has_storage(content, "Macros")) {
        storage = "Macros";
    }

    if (!storage.empty()) {
        result.flags.hasMacros = true;
        result.setMeta("vbaProject", storage);
        if (policy.macro.blockMacros) result.addThreat("VBA macro detected: " + storage, eventType());
    }
}

void MacroScanner::checkSpoofing(const std::string& declaredName, const MacroPolicy& policy,
                                 ScanResult& result) const {
    if (!result.flags.hasMacros) return;
    const std::string ext = file_extension(declaredName);
    const auto plain = effectiveList(policy.nonMacroExtensions, {}, policy.allowedMacroExtensions);
    if (!ext.empty() && std::find(plain.begin(), plain.end(), ext) != plain.end()) {
        result.addThreat("Macro-enabled document disguised as ." + ext, eventType());
    }
}

REGISTER_SCANNER(MacroScanner, 40)
