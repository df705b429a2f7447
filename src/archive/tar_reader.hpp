#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "archive_reader.hpp"
#include "byte_stream.hpp"

// tar, tar.gz and tar.xz, read as a stream of 512-byte headers. A gzip or xz
// stream that does not hold a tar is reported as a single entry whose size
// is counted while decoding; counting stops past streamLimit and the size is
// then reported as streamLimit + 1.
class TarReader : public ArchiveReader {
public:
    static constexpr size_t BLOCK = 512;

    TarReader(const std::vector<uint8_t>& data, StreamCodec codec,
              const std::string& streamName, uint64_t streamLimit);

    std::string name() const override;
    bool forEach(const EntryVisitor& visit, std::string& error) override;

    // Header checksum matches (unsigned or historic signed sum).
    static bool isTarHeader(const uint8_t* block);

private:
    bool walkTar(ByteStream& stream, const uint8_t* first, const EntryVisitor& visit, std::string& error);
    bool singleEntry(ByteStream& stream, uint64_t already, const EntryVisitor& visit, std::string& error);

    const std::vector<uint8_t>& data;
    StreamCodec codec;
    std::string streamName;
    uint64_t streamLimit;
    bool plainStream = false;
};
