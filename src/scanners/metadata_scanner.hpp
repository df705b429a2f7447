#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "base_scanner.hpp"
#include "image_parser.hpp"

// Raster images: script text hidden in metadata fields or appended after
// the image end marker, location tags and dimension limits.
class MetadataScanner : public BaseScanner {
public:
    using BaseScanner::BaseScanner;

    std::string name() const override { return "Metadata"; }
    EventType eventType() const override { return EventType::MetadataThreat; }
    bool enabled(const ScanPolicy& policy) const override { return policy.metadata.enabled; }
    bool match(const std::string& mediaType, const std::string& extension) const override;

    static const std::vector<std::string>& summaryFields();

    // Scans an in-memory image.
    void scanImage(const std::vector<uint8_t>& blob, const MetadataPolicy& policy, ScanResult& result) const;

protected:
    ScanResult inspect(const std::string& path, const std::string& declaredName,
                       const ScanPolicy& policy) const override;

private:
    void scanContent(const std::string& content, ScanResult& result) const;
    void scanFields(const ImageInfo& info, const MetadataPolicy& policy, ScanResult& result) const;
    void scanTrailing(const std::string& content, const ImageInfo& info, const MetadataPolicy& policy,
                      ScanResult& result) const;
    void checkDimensions(const ImageInfo& info, const MetadataPolicy& policy, ScanResult& result) const;
};
