#pragma once
#include <string>
#include <vector>
#include "base_scanner.hpp"

// SVG and other XML vector markup: script-capable elements, event handler
// attributes, script URI schemes, obfuscation and XML entity attacks.
class MarkupInjectionScanner : public BaseScanner {
public:
    using BaseScanner::BaseScanner;

    std::string name() const override { return "MarkupInjection"; }
    EventType eventType() const override { return EventType::MarkupInjection; }
    bool enabled(const ScanPolicy& policy) const override { return policy.markup.enabled; }
    bool match(const std::string& mediaType, const std::string& extension) const override;

    static const std::vector<std::string>& builtinTags();
    static const std::vector<std::string>& builtinAttributes();
    static const std::vector<std::string>& dangerousProtocols();

    void scanText(const std::string& content, const ScanPolicy& policy, ScanResult& result) const;

protected:
    ScanResult inspect(const std::string& path, const std::string& declaredName,
                       const ScanPolicy& policy) const override;

private:
    bool hasRootElement(const std::string& content) const;
    // True when the document must be rejected before any further pass.
    bool scanEntities(const std::string& content, ScanResult& result) const;
    void scanTags(const std::string& content, const MarkupPolicy& policy, ScanResult& result) const;
    void scanAttributes(const std::string& content, const MarkupPolicy& policy, ScanResult& result) const;
    void scanProtocols(const std::string& content, ScanResult& result) const;
    void scanObfuscation(const std::string& content, ScanResult& result) const;
};
