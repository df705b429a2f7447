#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "base_scanner.hpp"
#include "archive_reader.hpp"

enum class ArchiveFormat {
    Unknown,
    Zip,
    Tar,
    Gzip,
    Xz,
    Bzip2,
    Rar,
    SevenZip
};

// Enumerates archive entries from container metadata and checks them
// against the archive policy: entry count, total size, compression ratio,
// entry names, blocked extensions and nested archives. ZIP and the tar
// family are read in-process; RAR, 7z and bzip2 go through the 7z backend.
class ArchiveInspector : public BaseScanner {
public:
    // Covers the ustar magic at 257 and a full v7 header for its checksum.
    static constexpr size_t SNIFF_SIZE = 512;

    using BaseScanner::BaseScanner;

    std::string name() const override { return "Archive"; }
    EventType eventType() const override { return EventType::ArchiveThreat; }
    bool enabled(const ScanPolicy& policy) const override { return policy.archive.enabled; }
    bool match(const std::string& mediaType, const std::string& extension) const override;

    static ArchiveFormat sniff(const std::vector<uint8_t>& head);
    static std::string formatName(ArchiveFormat format);
    static bool needsBackend(ArchiveFormat format);

    // scan() at an explicit nesting depth.
    ScanResult scanAtDepth(const std::string& path, const ScanPolicy& policy, int depth) const;

    // Archive held in memory, used for nested members.
    ScanResult scanBuffer(const std::vector<uint8_t>& data, const std::string& archiveName,
                          const ScanPolicy& policy, int depth) const;

    // Findings for a single entry name: NUL bytes, traversal, absolute and
    // percent-encoded paths.
    static std::vector<std::string> nameFindings(const std::string& entryName);

protected:
    ScanResult inspect(const std::string& path, const std::string& declaredName,
                       const ScanPolicy& policy) const override;

private:
    ScanResult inspectFile(const std::string& path, const ScanPolicy& policy, int depth) const;
    void inspectData(const std::vector<uint8_t>& data, ArchiveFormat format, const std::string& archiveName,
                     const ScanPolicy& policy, int depth, ScanResult& result) const;
    void inspectWithBackend(const std::string& path, ArchiveFormat format, uint64_t fileSize,
                            const ScanPolicy& policy, int depth, ScanResult& result) const;
    void enumerate(ArchiveReader& reader, uint64_t compressedSize, const ScanPolicy& policy,
                   int depth, ScanResult& result) const;

    void checkEntry(const ArchiveEntry& entry, const ArchivePolicy& policy, ScanResult& result) const;
    void checkNested(const ArchiveEntry& entry, const EntryLoader& load, const ScanPolicy& policy,
                     int depth, ScanResult& result) const;
};
