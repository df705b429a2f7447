#pragma once
#include <string>
#include <vector>

// Media types a file extension may legitimately carry.
class ExtensionMap {
public:
    static const std::vector<std::string>& mediaTypes(const std::string& extension);
    static bool isKnownExtension(const std::string& extension);

    // True when `detected` is listed for `extension` or is a known
    // equivalent of one of its types (jpeg aliases, zip vs OOXML).
    static bool matches(const std::string& extension, const std::string& detected);

    static bool equivalent(const std::string& a, const std::string& b);

    // Exact, "type/*" wildcard, or zip accepting OOXML types.
    static bool allowedBy(const std::vector<std::string>& allowed, const std::string& detected);
};
