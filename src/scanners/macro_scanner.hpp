#pragma once
#include <string>
#include <vector>
#include "base_scanner.hpp"

class ZipFile;

// Office documents: VBA projects, macro-enabled content types and ActiveX /
// OLE controls in OOXML containers, VBA storages in legacy OLE files, and
// macro-enabled documents renamed to a macro-free extension.
class MacroScanner : public BaseScanner {
public:
    static constexpr uint64_t MAX_MANIFEST_BYTES = 4 * 1024 * 1024;

    using BaseScanner::BaseScanner;

    std::string name() const override { return "Macro"; }
    EventType eventType() const override { return EventType::MacroDetected; }
    bool enabled(const ScanPolicy& policy) const override { return policy.macro.enabled; }
    bool match(const std::string& mediaType, const std::string& extension) const override;

    static const std::vector<std::string>& macroContentTypes();
    static const std::vector<std::string>& macroExtensions();

    // activeX/activeX<n>.xml|bin and embeddings/oleObject<n>.bin
    static bool isControlPart(const std::string& entryName);

    static bool isOleHeader(const std::vector<uint8_t>& head);

protected:
    ScanResult inspect(const std::string& path, const std::string& declaredName,
                       const ScanPolicy& policy) const override;

private:
    void inspectOpenXml(const ZipFile& zip, const MacroPolicy& policy, ScanResult& result) const;
    void inspectLegacy(const std::string& path, const ScanPolicy& policy, ScanResult& result) const;
    void checkSpoofing(const std::string& declaredName, const MacroPolicy& policy, ScanResult& result) const;
};
