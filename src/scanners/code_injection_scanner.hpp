#pragma once
#include <string>
#include <vector>
#include "base_scanner.hpp"

// Embedded server-side script: opening tags, dangerous function calls and
// known obfuscation / web-shell fragments.
class CodeInjectionScanner : public BaseScanner {
public:
    using BaseScanner::BaseScanner;

    std::string name() const override { return "CodeInjection"; }
    EventType eventType() const override { return EventType::CodeInjection; }
    bool enabled(const ScanPolicy& policy) const override { return policy.codeInjection.enabled; }
    bool match(const std::string& mediaType, const std::string& extension) const override;

    static const std::vector<std::string>& builtinFunctions();
    static const std::vector<std::string>& strictFunctions();
    static std::vector<std::string> functionList(const CodeInjectionPolicy& policy);

    // Scans already-loaded text; used for archive members and tests.
    void scanText(const std::string& content, const ScanPolicy& policy, ScanResult& result) const;

protected:
    ScanResult inspect(const std::string& path, const std::string& declaredName,
                       const ScanPolicy& policy) const override;

private:
    void scanTags(const std::string& content, const CodeInjectionPolicy& policy, ScanResult& result) const;
    void scanFunctions(const std::string& content, const CodeInjectionPolicy& policy, ScanResult& result) const;
    void scanPatterns(const std::string& content, const CodeInjectionPolicy& policy, ScanResult& result) const;
};
