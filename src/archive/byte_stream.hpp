#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <zlib.h>
#include <lzma.h>

enum class StreamCodec {
    Raw,
    Gzip,
    Xz
};

// Sequential reader over an in-memory buffer. Gzip and xz input is decoded
// incrementally in CHUNK-sized steps so the decompressed data is never held
// whole. Corrupt input puts the stream into a failed state.
class ByteStream {
public:
    static constexpr size_t CHUNK = 16384;

    ByteStream(const std::vector<uint8_t>& source, StreamCodec codec);
    ~ByteStream();
    ByteStream(const ByteStream&) = delete;
    ByteStream& operator=(const ByteStream&) = delete;

    // Up to len bytes; 0 at the end of the stream or on failure.
    size_t read(uint8_t* out, size_t len);
    // False when the stream ends before len bytes.
    bool readExact(uint8_t* out, size_t len);
    // Discards n bytes; false when the stream ends first.
    bool skip(uint64_t n);

    bool failed() const { return !error.empty(); }
    const std::string& errorMessage() const { return error; }
    uint64_t produced() const { return total; }

    // FNAME from the gzip header, available after the first read.
    std::string gzipName() const;

private:
    size_t readRaw(uint8_t* out, size_t len);
    size_t readGzip(uint8_t* out, size_t len);
    size_t readXz(uint8_t* out, size_t len);

    const std::vector<uint8_t>& source;
    StreamCodec codec;
    size_t rawPos = 0;
    bool finished = false;
    bool initialised = false;
    uint64_t total = 0;
    std::string error;

    z_stream zs{};
    gz_header gzHeader{};
    unsigned char gzName[256] = {};
    lzma_stream xs = LZMA_STREAM_INIT;
};

// Inflates a complete gzip buffer. False when the data is corrupt or the
// output would exceed limit.
bool gunzipBuffer(const std::vector<uint8_t>& in, uint64_t limit, std::vector<uint8_t>& out);
