#include "engine.hpp"
#include "scanner_registry.hpp"
#include "extension_map.hpp"
#include "media_types.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <filesystem>
#include <system_error>

ScanEngine::ScanEngine() {
    registered = ScannerRegistry::instance().createAll(access, identifier);
}

ScanResult ScanEngine::scanFile(const std::string& path, const std::string& declaredName,
                                const ScanPolicy& policy, SecurityEventSink* sink) const {
    FileSummary summary;
    summary.path = path;
    summary.declaredName = declaredName;

    ScanResult result;
    try {
        result = run(path, declaredName, policy, summary);
    } catch (const std::exception& e) {
        Logger::error("ScanEngine: scan of " + path + " failed: " + e.what());
        result = unsafeResult("Engine", std::string("Scan failed: ") + e.what(), EventType::DangerousFile);
    }
    result.scanner = "Engine";
    if (result.mediaType.empty()) result.mediaType = summary.mediaType;

    if (sink) emit(result, summary, *sink);
    return result;
}

ScanResult ScanEngine::run(const std::string& path, const std::string& declaredName, const ScanPolicy& policy,
                           FileSummary& summary) const {
    ScanResult result;

    AccessDecision decision = access.validate(path, policy);
    if (!decision.allowed) {
        result.addThreat(decision.reason.value_or("File access denied"), decision.event());
        return result;
    }

    std::error_code ec;
    uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        result.addThreat("File cannot be read", EventType::DangerousFile);
        return result;
    }
    summary.size = size;
    if (size > policy.maxScanBytes) {
        result.addThreat("File too large to scan (" + std::to_string(size) + " bytes)", EventType::DangerousFile);
        return result;
    }

    summary.mediaType = identifier.identifyFile(path, policy);
    result.mediaType = summary.mediaType;
    const std::string extension = file_extension(declaredName.empty() ? path : declaredName);
    Logger::debug("ScanEngine: " + path + " identified as " + summary.mediaType +
                  (extension.empty() ? "" : " (declared ." + extension + ")"));

    if (!checkType(summary.mediaType, extension, policy, result)) return result;

    for (const auto& scanner : registered) {
        if (!scanner->enabled(policy)) continue;
        if (!scanner->match(summary.mediaType, extension)) continue;

        Logger::debug("ScanEngine: running " + scanner->name());
        ScanResult child = scanner->scan(path, declaredName, policy);
        if (child.mediaType.empty()) child.mediaType = summary.mediaType;
        result.merge(child);
    }
    return result;
}

bool ScanEngine::checkType(const std::string& mediaType, const std::string& extension, const ScanPolicy& policy,
                           ScanResult& result) const {
    if (policy.mime.blockDangerous && identifier.isDangerous(mediaType, policy)) {
        result.addThreat("File type " + mediaType + " is not allowed for security reasons", EventType::DangerousFile);
        return false;
    }
    if (!ExtensionMap::allowedBy(policy.mime.allowedTypes, mediaType)) {
        result.addThreat("File type " + mediaType + " is not in the allowed list", EventType::MimeMismatch);
        return false;
    }
    // unknown content and unmapped extensions cannot be compared
    if (policy.mime.strictExtensionCheck && mediaType != mime::unknown &&
        ExtensionMap::isKnownExtension(extension) && !ExtensionMap::matches(extension, mediaType)) {
        result.addThreat("File extension ." + extension + " does not match detected type " + mediaType,
                         EventType::MimeMismatch);
        return false;
    }
    return true;
}

void ScanEngine::emit(const ScanResult& result, const FileSummary& summary, SecurityEventSink& sink) const {
    const std::vector<std::string> messages = result.threatMessages();
    bool gpsReported = false;

    for (const auto& finding : result.threats) {
        SecurityEvent event{finding.event, severityFor(finding.event), finding.message, summary, messages};
        gpsReported |= finding.event == EventType::GpsDetected;
        sink.record(event);
    }
    if (result.flags.hasGps && !gpsReported) {
        sink.record(SecurityEvent{EventType::GpsDetected, severityFor(EventType::GpsDetected),
                                  "GPS location data present in image", summary, messages});
    }
}
