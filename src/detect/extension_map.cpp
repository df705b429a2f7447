#include "extension_map.hpp"
#include "media_types.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <map>

static const std::map<std::string, std::vector<std::string>>& extensionTable() {
    static const std::map<std::string, std::vector<std::string>> table = {
        // images
        {"jpg",  {"image/jpeg"}},
        {"jpeg", {"image/jpeg"}},
        {"jpe",  {"image/jpeg"}},
        {"png",  {"image/png"}},
        {"gif",  {"image/gif"}},
        {"bmp",  {"image/bmp", "image/x-ms-bmp"}},
        {"ico",  {"image/x-icon", "image/vnd.microsoft.icon"}},
        {"tiff", {"image/tiff"}},
        {"tif",  {"image/tiff"}},
        {"svg",  {"image/svg+xml"}},
        {"svgz", {"image/svg+xml", "application/gzip"}},
        {"webp", {"image/webp"}},
        {"avif", {"image/avif"}},
        {"heic", {"image/heic"}},
        {"heif", {"image/heif", "image/heic"}},
        // documents
        {"pdf",  {"application/pdf"}},
        {"doc",  {"application/msword"}},
        {"dot",  {"application/msword"}},
        {"xls",  {"application/vnd.ms-excel", "application/msword"}},
        {"xlt",  {"application/vnd.ms-excel", "application/msword"}},
        {"ppt",  {"application/vnd.ms-powerpoint", "application/msword"}},
        {"pot",  {"application/vnd.ms-powerpoint", "application/msword"}},
        {"pps",  {"application/vnd.ms-powerpoint", "application/msword"}},
        {"docx", {"application/vnd.openxmlformats-officedocument.wordprocessingml.document"}},
        {"dotx", {"application/vnd.openxmlformats-officedocument.wordprocessingml.template",
                  "application/vnd.openxmlformats-officedocument.wordprocessingml.document"}},
        {"docm", {"application/vnd.ms-word.document.macroEnabled.12",
                  "application/vnd.openxmlformats-officedocument.wordprocessingml.document"}},
        {"xlsx", {"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"}},
        {"xltx", {"application/vnd.openxmlformats-officedocument.spreadsheetml.template",
                  "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"}},
        {"xlsm", {"application/vnd.ms-excel.sheet.macroEnabled.12",
                  "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"}},
        {"pptx", {"application/vnd.openxmlformats-officedocument.presentationml.presentation"}},
        {"potx", {"application/vnd.openxmlformats-officedocument.presentationml.template",
                  "application/vnd.openxmlformats-officedocument.presentationml.presentation"}},
        {"ppsx", {"application/vnd.openxmlformats-officedocument.presentationml.slideshow",
                  "application/vnd.openxmlformats-officedocument.presentationml.presentation"}},
        {"pptm", {"application/vnd.ms-powerpoint.presentation.macroEnabled.12",
                  "application/vnd.openxmlformats-officedocument.presentationml.presentation"}},
        {"odt",  {"application/vnd.oasis.opendocument.text"}},
        {"ods",  {"application/vnd.oasis.opendocument.spreadsheet"}},
        {"odp",  {"application/vnd.oasis.opendocument.presentation"}},
        {"odg",  {"application/vnd.oasis.opendocument.graphics"}},
        {"txt",  {"text/plain"}},
        {"csv",  {"text/csv", "text/plain", "application/csv"}},
        {"rtf",  {"application/rtf", "text/rtf"}},
        // archives
        {"zip",  {"application/zip", "application/x-zip-compressed"}},
        {"rar",  {"application/x-rar-compressed", "application/vnd.rar"}},
        {"7z",   {"application/x-7z-compressed"}},
        {"tar",  {"application/x-tar"}},
        {"gz",   {"application/gzip", "application/x-gzip"}},
        {"tgz",  {"application/gzip", "application/x-gzip"}},
        {"bz2",  {"application/x-bzip2"}},
        {"xz",   {"application/x-xz"}},
        // audio
        {"mp3",  {"audio/mpeg", "audio/mp3"}},
        {"wav",  {"audio/wav", "audio/x-wav"}},
        {"ogg",  {"audio/ogg", "application/ogg", "video/ogg"}},
        {"flac", {"audio/flac"}},
        {"aac",  {"audio/aac"}},
        {"m4a",  {"audio/mp4", "audio/x-m4a"}},
        {"wma",  {"audio/x-ms-wma", "video/x-ms-asf"}},
        // video
        {"mp4",  {"video/mp4"}},
        {"avi",  {"video/x-msvideo"}},
        {"wmv",  {"video/x-ms-wmv", "video/x-ms-asf"}},
        {"mov",  {"video/quicktime"}},
        {"mkv",  {"video/x-matroska", "video/webm"}},
        {"webm", {"video/webm"}},
        {"flv",  {"video/x-flv"}},
        {"m4v",  {"video/x-m4v", "video/mp4"}},
        {"mpeg", {"video/mpeg"}},
        {"mpg",  {"video/mpeg"}},
        // web
        {"html", {"text/html"}},
        {"htm",  {"text/html"}},
        {"css",  {"text/css", "text/plain"}},
        {"js",   {"application/javascript", "text/javascript"}},
        {"json", {"application/json", "text/plain"}},
        {"xml",  {"application/xml", "text/xml"}},
        // fonts
        {"ttf",  {"font/ttf", "application/x-font-ttf"}},
        {"otf",  {"font/otf", "application/x-font-otf"}},
        {"woff", {"font/woff", "application/font-woff"}},
        {"woff2",{"font/woff2"}},
        {"eot",  {"application/vnd.ms-fontobject"}},
    };
    return table;
}

static const std::vector<std::pair<std::string, std::vector<std::string>>>& equivalenceTable() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
        {"image/jpeg", {"image/jpg", "image/pjpeg"}},
        {"application/zip", {"application/x-zip-compressed", mime::docx, mime::xlsx, mime::pptx}},
        {mime::docx, {"application/zip", "application/x-zip-compressed", "application/octet-stream"}},
        {mime::xlsx, {"application/zip", "application/x-zip-compressed", "application/octet-stream"}},
        {mime::pptx, {"application/zip", "application/x-zip-compressed", "application/octet-stream"}},
        {"text/xml", {"application/xml"}},
        {"application/gzip", {"application/x-gzip"}},
    };
    return table;
}

const std::vector<std::string>& ExtensionMap::mediaTypes(const std::string& extension) {
    static const std::vector<std::string> none;
    std::string key = to_lower(extension);
    while (!key.empty() && key.front() == '.') key.erase(0, 1);
    auto it = extensionTable().find(key);
    return it != extensionTable().end() ? it->second : none;
}

bool ExtensionMap::isKnownExtension(const std::string& extension) {
    return !mediaTypes(extension).empty();
}

bool ExtensionMap::equivalent(const std::string& a, const std::string& b) {
    if (a == b) return true;
    for (const auto& entry : equivalenceTable()) {
        const auto& alts = entry.second;
        if (entry.first == a && std::find(alts.begin(), alts.end(), b) != alts.end()) return true;
        if (entry.first == b && std::find(alts.begin(), alts.end(), a) != alts.end()) return true;
    }
    return false;
}

bool ExtensionMap::matches(const std::string& extension, const std::string& detected) {
    const auto& types = mediaTypes(extension);
    const std::string d = to_lower(detected);
    for (const auto& t : types) {
        if (equivalent(t, d)) return true;
    }
    // plain-text family: a sniffer may name the dialect (text/x-c, text/csv)
    if (starts_with(d, "text/") && !types.empty() &&
        std::all_of(types.begin(), types.end(), [](const std::string& t) { return starts_with(t, "text/"); })) {
        return true;
    }
    return false;
}

bool ExtensionMap::allowedBy(const std::vector<std::string>& allowed, const std::string& detected) {
    if (allowed.empty()) return true;
    const std::string d = to_lower(detected);
    for (const auto& raw : allowed) {
        const std::string a = to_lower(raw);
        if (a == d) return true;
        if (ends_with(a, "/*") && starts_with(d, a.substr(0, a.size() - 1))) return true;
        if (a == mime::zip && isOfficeOpenXml(d)) return true;
    }
    return false;
}

bool isOfficeOpenXml(const std::string& mediaType) {
    return starts_with(mediaType, "application/vnd.openxmlformats-officedocument.") ||
           (starts_with(mediaType, "application/vnd.ms-") && mediaType.find("macroEnabled") != std::string::npos);
}

bool isArchiveType(const std::string& mediaType) {
    static const std::vector<std::string> archives = {
        mime::zip, "application/x-zip-compressed", mime::gzip, "application/x-gzip",
        mime::bzip2, mime::xz, mime::tar, mime::rar, "application/vnd.rar", mime::sevenZip,
    };
    return std::find(archives.begin(), archives.end(), mediaType) != archives.end();
}

bool isZipContainer(const std::string& mediaType) {
    return mediaType == mime::zip || mediaType == "application/x-zip-compressed" || mediaType == mime::jar ||
           isOfficeOpenXml(mediaType) || starts_with(mediaType, "application/vnd.oasis.opendocument.");
}

bool isRasterImage(const std::string& mediaType) {
    return mediaType == mime::jpeg || mediaType == mime::png || mediaType == mime::gif ||
           mediaType == mime::webp || mediaType == mime::tiff;
}
