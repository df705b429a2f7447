#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <zip.h>
#include "archive_reader.hpp"

// Read-only libzip archive handle. Only the central directory is consulted
// until a member is explicitly read.
class ZipFile {
public:
    static std::unique_ptr<ZipFile> open(const std::string& path, std::string& error);
    // The buffer must outlive the returned archive.
    static std::unique_ptr<ZipFile> fromBuffer(const std::vector<uint8_t>& data, std::string& error);

    ~ZipFile();
    ZipFile(const ZipFile&) = delete;
    ZipFile& operator=(const ZipFile&) = delete;

    uint64_t size() const;
    bool entry(uint64_t index, ArchiveEntry& out) const;
    bool locate(const std::string& name, uint64_t& index) const;

    // Reads at most limit bytes of a member. truncated reports whether the
    // member had more data.
    bool read(uint64_t index, uint64_t limit, std::vector<uint8_t>& out,
              bool& truncated, std::string& error) const;

private:
    explicit ZipFile(zip_t* archive) : archive(archive) {}
    zip_t* archive;
};

class ZipReader : public ArchiveReader {
public:
    explicit ZipReader(const ZipFile& zip) : zip(zip) {}

    std::string name() const override { return "ZIP"; }
    int64_t entryCount() const override { return static_cast<int64_t>(zip.size()); }
    bool forEach(const EntryVisitor& visit, std::string& error) override;

private:
    const ZipFile& zip;
};
