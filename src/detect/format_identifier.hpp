#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "scan_policy.hpp"

enum class Refinement {
    None,
    Zip,    // office / OpenDocument / Java archive markers in the first entries
    Riff,   // form type at offset 8
    Ftyp,   // ISO-BMFF major brand at offset 8
    Xml     // svg root element after prolog
};

struct SignatureEntry {
    size_t offset;
    std::vector<uint8_t> bytes;
    std::string mediaType;
    Refinement refinement;
};

// Classifies content by magic bytes. Custom policy signatures are tried
// first, then the built-in table (longest patterns first), then libmagic.
class FormatIdentifier {
public:
    static constexpr size_t PREFIX_SIZE = 4096;

    std::string identify(const std::vector<uint8_t>& prefix, const ScanPolicy& policy) const;
    std::string identifyFile(const std::string& path, const ScanPolicy& policy) const;

    bool isDangerous(const std::string& mediaType, const ScanPolicy& policy) const;

    // Types that cannot host interpretable script text.
    static bool isBinaryMedia(const std::string& mediaType);

    static const std::vector<SignatureEntry>& builtinSignatures();

    static bool matchesAt(const std::vector<uint8_t>& prefix, const SignatureEntry& entry);

private:
    std::string refine(const std::vector<uint8_t>& prefix, const SignatureEntry& entry) const;
    std::string refineZip(const std::vector<uint8_t>& prefix) const;
    std::string refineRiff(const std::vector<uint8_t>& prefix, const std::string& fallback) const;
    std::string refineFtyp(const std::vector<uint8_t>& prefix) const;
    std::string refineXml(const std::vector<uint8_t>& prefix, const std::string& fallback) const;
    std::string sniff(const std::vector<uint8_t>& prefix) const;
};
