#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// One archive member as described by the container metadata.
struct ArchiveEntry {
    std::string name;
    uint64_t compressedSize = 0;
    uint64_t uncompressedSize = 0;
    bool isDirectory = false;
    bool isLink = false;
    std::string linkTarget;
};

// Materialises the current member, at most limit bytes. Only valid inside
// the visitor call that received it. False when the member is larger than
// limit or cannot be read.
using EntryLoader = std::function<bool(uint64_t limit, std::vector<uint8_t>& out)>;

// Return false to stop the enumeration.
using EntryVisitor = std::function<bool(const ArchiveEntry& entry, const EntryLoader& load)>;

class ArchiveReader {
public:
    virtual ~ArchiveReader() = default;

    virtual std::string name() const = 0;

    // Number of entries known before enumeration, -1 when the format only
    // reveals it while streaming.
    virtual int64_t entryCount() const { return -1; }

    // Walks the entries in archive order. Returns false with error set when
    // the container is corrupt or the backend fails.
    virtual bool forEach(const EntryVisitor& visit, std::string& error) = 0;
};
