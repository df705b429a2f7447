#include "base_scanner.hpp"
#include "file_reader.hpp"
#include "logger.hpp"
#include <filesystem>
#include <system_error>

ScanResult BaseScanner::scan(const std::string& path, const std::string& declaredName,
                             const ScanPolicy& policy) const {
    AccessDecision decision = access.validate(path, policy);
    if (!decision.allowed) {
        Logger::debug(name() + ": access denied for " + path);
        return unsafeResult(name(), decision.reason.value_or("File access denied"), decision.event());
    }

    try {
        ScanResult result = inspect(path, declaredName, policy);
        result.scanner = name();
        return result;
    } catch (const std::exception& e) {
        Logger::error(name() + ": scan of " + path + " failed: " + e.what());
        return unsafeResult(name(), std::string("Scan failed: ") + e.what(), eventType());
    }
}

bool BaseScanner::loadContent(const std::string& path, const ScanPolicy& policy,
                              std::string& content, ScanResult& result) const {
    std::error_code ec;
    uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        result.addThreat("File cannot be read", eventType());
        return false;
    }
    if (size > policy.maxScanBytes) {
        result.addThreat("File too large to scan (" + std::to_string(size) + " bytes)", eventType());
        return false;
    }
    content = readFileText(path);
    return true;
}
