#pragma once
#include <string>
#include "access_validator.hpp"
#include "format_identifier.hpp"
#include "scan_policy.hpp"
#include "scanresult.hpp"

class BaseScanner {
public:
    BaseScanner(const AccessValidator& access, const FormatIdentifier& identifier)
        : access(access), identifier(identifier) {}
    virtual ~BaseScanner() = default;

    virtual std::string name() const = 0;
    virtual EventType eventType() const = 0;
    virtual bool enabled(const ScanPolicy& policy) const = 0;

    // Whether the engine dispatches a file with this detected type and
    // declared extension to the scanner.
    virtual bool match(const std::string& mediaType, const std::string& extension) const = 0;

    // Access check, then inspect(). Exceptions never leave this call: they
    // become an unsafe result.
    ScanResult scan(const std::string& path, const std::string& declaredName, const ScanPolicy& policy) const;

protected:
    virtual ScanResult inspect(const std::string& path, const std::string& declaredName,
                               const ScanPolicy& policy) const = 0;

    // Reads the whole file unless it exceeds policy.maxScanBytes, in which
    // case a finding is added and false returned.
    bool loadContent(const std::string& path, const ScanPolicy& policy,
                     std::string& content, ScanResult& result) const;

    const AccessValidator& access;
    const FormatIdentifier& identifier;
};
