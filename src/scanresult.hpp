#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "security_events.hpp"

struct Finding {
    std::string message;
    EventType event;
};

struct ScanFlags {
    bool hasJavascript = false;
    bool hasExternalLinks = false;
    bool hasGps = false;
    bool hasMacros = false;
    bool hasActiveX = false;
    bool hasEntityDeclarations = false;
    size_t filesCount = 0;
    uint64_t uncompressedSize = 0;
};

struct ScanResult {
    std::string scanner;
    std::string mediaType;
    std::vector<Finding> threats;        // insertion order, no duplicate messages
    std::vector<std::string> notes;      // informational, never affect safe()
    ScanFlags flags;
    std::vector<std::pair<std::string, std::string>> metadata;
    std::vector<ScanResult> children;    // per-scanner results when aggregated

    bool safe() const { return threats.empty(); }

    void addThreat(const std::string& message, EventType event);
    void addNote(const std::string& note);
    void setMeta(const std::string& key, const std::string& value);
    std::string meta(const std::string& key) const;

    // Appends the child's threats and notes, ORs its flags and keeps the
    // child itself under children.
    void merge(const ScanResult& child);

    bool hasThreat(const std::string& fragment) const;
    std::vector<std::string> threatMessages() const;
};

ScanResult unsafeResult(const std::string& scanner, const std::string& message, EventType event);
