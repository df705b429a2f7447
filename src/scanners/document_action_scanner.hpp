#pragma once
#include <string>
#include <vector>
#include "base_scanner.hpp"

// PDF: auto-executing actions, embedded JavaScript, dangerous link targets,
// obfuscation indicators and embedded files, read from the raw bytes.
class DocumentActionScanner : public BaseScanner {
public:
    using BaseScanner::BaseScanner;

    std::string name() const override { return "DocumentAction"; }
    EventType eventType() const override { return EventType::DocumentThreat; }
    bool enabled(const ScanPolicy& policy) const override { return policy.document.enabled; }
    bool match(const std::string& mediaType, const std::string& extension) const override;

    static const std::vector<std::string>& builtinActions();
    static const std::vector<std::string>& scriptFunctions();
    static const std::vector<std::string>& linkProtocols();
    static std::vector<std::string> actionList(const DocumentPolicy& policy);

    void scanText(const std::string& content, const ScanPolicy& policy, ScanResult& result) const;

protected:
    ScanResult inspect(const std::string& path, const std::string& declaredName,
                       const ScanPolicy& policy) const override;

private:
    void scanActions(const std::string& content, const DocumentPolicy& policy, ScanResult& result) const;
    void scanJavascript(const std::string& content, ScanResult& result) const;
    void scanLinks(const std::string& content, const DocumentPolicy& policy, ScanResult& result) const;
    void scanObfuscation(const std::string& content, const DocumentPolicy& policy, ScanResult& result) const;
    void scanEmbeddedFiles(const std::string& content, ScanResult& result) const;
    void checkStructure(const std::string& content, const DocumentPolicy& policy, ScanResult& result) const;
};
