#include "metadata_scanner.hpp"
#include "scanner_registration.hpp"
#include "media_types.hpp"
#include "text_match.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <algorithm>

namespace {

const std::vector<std::string> SCRIPT_MARKERS = {"<?php", "<?="};
const std::vector<std::string> SCRIPT_CALLS = {"eval", "exec", "system", "shell_exec", "passthru", "base64_decode"};
// Bytes after the end marker are never image data, so bare names count.
const std::vector<std::string> TRAILING_FRAGMENTS = {"eval", "exec", "system"};
const std::vector<std::string> URI_SCHEMES = {"javascript:", "vbscript:", "data:text/html"};

bool has_script(const std::string& text) {
    for (const auto& marker : SCRIPT_MARKERS) {
        if (contains_icase(text, marker)) return true;
    }
    for (const auto& call : SCRIPT_CALLS) {
        if (contains_call(text, call)) return true;
    }
    return false;
}

bool has_trailing_script(const std::string& trailing) {
    for (const auto& marker : SCRIPT_MARKERS) {
        if (contains_icase(trailing, marker)) return true;
    }
    return std::any_of(TRAILING_FRAGMENTS.begin(), TRAILING_FRAGMENTS.end(),
                       [&](const std::string& fragment) { return contains_icase(trailing, fragment); });
}

// bash, cmd.exe, or "sh -c"
bool has_shell(const std::string& text) {
    if (contains_icase(text, "bash") || contains_icase(text, "cmd.exe")) return true;
    for (size_t pos = find_icase(text, "sh"); pos != std::string::npos; pos = find_icase(text, "sh", pos + 1)) {
        size_t after = pos + 2;
        if (after >= text.size() || !is_space(text[after])) continue;
        after = skip_spaces(text, after);
        if (match_icase_at(text, after, "-c")) return true;
    }
    return false;
}

bool has_scheme(const std::string& text) {
    return std::any_of(URI_SCHEMES.begin(), URI_SCHEMES.end(),
                       [&](const std::string& scheme) { return contains_icase(text, scheme); });
}

std::string media_type_for(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return mime::jpeg;
        case ImageFormat::PNG:  return mime::png;
        case ImageFormat::GIF:  return mime::gif;
        case ImageFormat::WEBP: return mime::webp;
        case ImageFormat::TIFF: return mime::tiff;
        case ImageFormat::Unknown: break;
    }
    return mime::unknown;
}

} // namespace

const std::vector<std::string>& MetadataScanner::summaryFields() {
    static const std::vector<std::string> fields = {
        "Make", "Model", "Software", "DateTime", "Artist", "Copyright", "ImageDescription",
    };
    return fields;
}

bool MetadataScanner::match(const std::string& mediaType, const std::string&) const {
    return isRasterImage(mediaType);
}

ScanResult MetadataScanner::inspect(const std::string& path, const std::string&, const ScanPolicy& policy) const {
    ScanResult result;
    std::string content;
    if (!loadContent(path, policy, content, result)) return result;

    scanImage(std::vector<uint8_t>(content.begin(), content.end()), policy.metadata, result);
    return result;
}

void MetadataScanner::scanImage(const std::vector<uint8_t>& blob, const MetadataPolicy& policy,
                                ScanResult& result) const {
    ImageInfo info = parseImage(blob);
    if (!info.valid) {
        result.addThreat("Not a valid image file", eventType());
        return;
    }
    result.mediaType = media_type_for(info.format);
    Logger::debug(name() + ": " + imageFormatName(info.format) + " " + std::to_string(info.width) + "x" +
                  std::to_string(info.height) + ", " + std::to_string(info.fields.size()) + " metadata field(s)");

    const std::string content(blob.begin(), blob.end());
    scanContent(content, result);
    scanFields(info, policy, result);

    if (info.hasGps()) {
        result.flags.hasGps = true;
        if (policy.blockGps) result.addThreat("GPS location data detected in image", EventType::GpsDetected);
    }

    scanTrailing(content, info, policy, result);
    checkDimensions(info, policy, result);

    for (const auto& field : summaryFields()) {
        auto it = std::find_if(info.fields.begin(), info.fields.end(),
                               [&](const std::pair<std::string, std::string>& f) { return f.first == field; });
        if (it != info.fields.end()) result.setMeta(field, it->second);
    }
    if (info.width > 0) result.setMeta("width", std::to_string(info.width));
    if (info.height > 0) result.setMeta("height", std::to_string(info.height));
}

void MetadataScanner::scanContent(const std::string& content, ScanResult& result) const {
    if (contains_icase(content, "<?php")) {
        result.addThreat("PHP opening tag (<?php) found in image data", eventType());
    }
    if (contains_icase(content, "<?=")) {
        result.addThreat("PHP short echo tag (<?=) found in image data", eventType());
    }
}

void MetadataScanner::scanFields(const ImageInfo& info, const MetadataPolicy& policy, ScanResult& result) const {
    for (const auto& field : info.fields) {
        const std::string& tag = field.first;
        bool scanned = std::any_of(policy.scannedFields.begin(), policy.scannedFields.end(),
                                   [&](const std::string& f) { return to_lower(f) == to_lower(tag); });
        if (!scanned) continue;

        if (has_script(field.second)) {
            result.addThreat("Suspicious PHP code found in metadata field: " + tag, eventType());
        }
        if (has_shell(field.second)) {
            result.addThreat("Suspicious shell command found in metadata field: " + tag, eventType());
        }
        if (has_scheme(field.second)) {
            result.addThreat("Suspicious URL protocol found in metadata field: " + tag, eventType());
        }
    }
}

void MetadataScanner::scanTrailing(const std::string& content, const ImageInfo& info,
                                   const MetadataPolicy& policy, ScanResult& result) const {
    if (!info.foundEnd || info.endOffset >= content.size()) return;

    const std::string trailing = content.substr(info.endOffset);
    result.setMeta("trailingBytes", std::to_string(trailing.size()));
    if (trailing.size() > policy.maxTrailingBytes) {
        result.addThreat("Suspicious trailing data found after image end marker", eventType());
    }
    if (has_trailing_script(trailing)) {
        result.addThreat("PHP code detected in trailing bytes", eventType());
    }
}

void MetadataScanner::checkDimensions(const ImageInfo& info, const MetadataPolicy& policy,
                                      ScanResult& result) const {
    bool limited = policy.minWidth || policy.minHeight || policy.maxWidth || policy.maxHeight;
    if (!limited) return;
    if (info.width == 0 || info.height == 0) {
        result.addThreat("Image dimensions cannot be determined", eventType());
        return;
    }

    const std::string w = std::to_string(info.width);
    const std::string h = std::to_string(info.height);
    if (policy.maxWidth && info.width > policy.maxWidth) {
        result.addThreat("Image width must not exceed " + std::to_string(policy.maxWidth) +
                         " pixels (current: " + w + "px)", eventType());
    }
    if (policy.maxHeight && info.height > policy.maxHeight) {
        result.addThreat("Image height must not exceed " + std::to_string(policy.maxHeight) +
                         " pixels (current: " + h + "px)", eventType());
    }
    if (policy.minWidth && info.width < policy.minWidth) {
        result.addThreat("Image width must be at least " + std::to_string(policy.minWidth) +
                         " pixels (current: " + w + "px)", eventType());
    }
    if (policy.minHeight && info.height < policy.minHeight) {
        result.addThreat("Image height must be at least " + std::to_string(policy.minHeight) +
                         " pixels (current: " + h + "px)", eventType());
    }
}

REGISTER_SCANNER(MetadataScanner, 50)
