#pragma once
#include <memory>
#include <string>
#include <vector>
#include "access_validator.hpp"
#include "base_scanner.hpp"
#include "format_identifier.hpp"
#include "scan_policy.hpp"
#include "scanresult.hpp"
#include "security_events.hpp"

// Entry point: identifies the file, applies the type-level policy and runs
// every registered scanner that matches, in registry order.
class ScanEngine {
public:
    ScanEngine();

    // Never throws. The aggregated result carries one child per scanner
    // that ran. When a sink is given it receives one event per finding.
    ScanResult scanFile(const std::string& path, const std::string& declaredName, const ScanPolicy& policy,
                        SecurityEventSink* sink = nullptr) const;

    const AccessValidator& accessValidator() const { return access; }
    const FormatIdentifier& formatIdentifier() const { return identifier; }
    const std::vector<std::unique_ptr<BaseScanner>>& scanners() const { return registered; }

private:
    ScanResult run(const std::string& path, const std::string& declaredName, const ScanPolicy& policy,
                   FileSummary& summary) const;
    bool checkType(const std::string& mediaType, const std::string& extension, const ScanPolicy& policy,
                   ScanResult& result) const;
    void emit(const ScanResult& result, const FileSummary& summary, SecurityEventSink& sink) const;

    AccessValidator access;
    FormatIdentifier identifier;
    std::vector<std::unique_ptr<BaseScanner>> registered;
};
