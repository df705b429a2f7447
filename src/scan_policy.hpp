#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "helpers.hpp"

enum class FunctionScanMode {
    Default,   // built-in list + customFunctions - excludeFunctions
    Strict,    // most dangerous functions only
    Custom     // scanFunctions only
};

std::vector<std::string> defaultDangerousTypes();
std::vector<std::string> defaultBlockedExtensions();
std::vector<std::string> defaultArchiveExtensions();
std::vector<std::string> defaultNonMacroExtensions();
std::vector<std::string> defaultMetadataFields();

struct MimePolicy {
    bool strictExtensionCheck = true;
    bool blockDangerous = true;
    bool useHostSniffer = true;
    std::vector<std::string> allowedTypes;   // empty accepts every type; "image/*" wildcards
    std::vector<std::string> dangerousTypes = defaultDangerousTypes();
    // hex byte pattern -> media type, checked before the built-in table
    std::vector<std::pair<std::string, std::string>> customSignatures;
};

struct CodeInjectionPolicy {
    bool enabled = true;
    FunctionScanMode mode = FunctionScanMode::Default;
    std::vector<std::string> customFunctions;
    std::vector<std::string> excludeFunctions;
    std::vector<std::string> scanFunctions;
    std::vector<std::string> customPatterns;
    std::vector<std::string> excludePatterns;
};

struct MarkupPolicy {
    bool enabled = true;
    std::vector<std::string> customTags;
    std::vector<std::string> allowedTags;
    std::vector<std::string> customAttributes;
    std::vector<std::string> allowedAttributes;
};

struct DocumentPolicy {
    bool enabled = true;
    bool blockJavascript = false;
    bool blockExternalLinks = false;
    std::vector<std::string> customActions;
    std::vector<std::string> allowedActions;
    size_t maxCompressedStreams = 50;
    size_t maxHexRun = 500;
    size_t minPages = 0;
    size_t maxPages = 0;
};

struct MacroPolicy {
    bool enabled = true;
    bool blockMacros = true;
    bool blockActiveX = true;
    std::vector<std::string> nonMacroExtensions = defaultNonMacroExtensions();
    std::vector<std::string> allowedMacroExtensions;
};

struct MetadataPolicy {
    bool enabled = true;
    bool blockGps = false;
    bool stripMetadata = false;
    std::vector<std::string> scannedFields = defaultMetadataFields();
    size_t maxTrailingBytes = 100;
    uint32_t minWidth = 0;
    uint32_t minHeight = 0;
    uint32_t maxWidth = 0;
    uint32_t maxHeight = 0;
};

struct ArchivePolicy {
    bool enabled = true;
    uint64_t maxCompressionRatio = 100;
    uint64_t maxUncompressedSize = MIB(500);
    size_t maxFilesCount = 10000;
    int maxNestingDepth = 3;
    uint64_t maxNestedArchiveBytes = MIB(64);
    std::vector<std::string> blockedExtensions = defaultBlockedExtensions();
    std::vector<std::string> archiveExtensions = defaultArchiveExtensions();
    bool backendFailOpen = false;
    std::string sevenZipCommand = "7z";
};

struct AccessPolicy {
    bool checkSymlinks = true;
    std::vector<std::string> allowedRoots;   // empty: system temp dir + storageRoot
    std::string storageRoot;
};

// Immutable per-call configuration. Default construction yields the
// built-in defaults.
struct ScanPolicy {
    MimePolicy mime;
    CodeInjectionPolicy codeInjection;
    MarkupPolicy markup;
    DocumentPolicy document;
    MacroPolicy macro;
    MetadataPolicy metadata;
    ArchivePolicy archive;
    AccessPolicy access;
    uint64_t maxScanBytes = DEFAULT_MAX_SCAN_BYTES;
};

// Applies additions then exclusions, case-insensitively, preserving order.
std::vector<std::string> effectiveList(const std::vector<std::string>& builtin,
                                       const std::vector<std::string>& additions,
                                       const std::vector<std::string>& exclusions);
