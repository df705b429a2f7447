#include "byte_stream.hpp"
#include "logger.hpp"
#include <algorithm>
#include <climits>
#include <cstring>

ByteStream::ByteStream(const std::vector<uint8_t>& source, StreamCodec codec)
    : source(source), codec(codec) {
    if (codec == StreamCodec::Gzip) {
        // 16+MAX_WBITS tells zlib to expect GZIP header
        if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
            error = "inflateInit2 failed";
            return;
        }
        initialised = true;
        gzHeader.name = gzName;
        gzHeader.name_max = sizeof(gzName) - 1;
        if (inflateGetHeader(&zs, &gzHeader) != Z_OK) {
            error = "inflateGetHeader failed";
        }
    } else if (codec == StreamCodec::Xz) {
        lzma_ret ret = lzma_stream_decoder(&xs, UINT64_MAX, LZMA_CONCATENATED);
        if (ret != LZMA_OK) {
            error = "lzma_stream_decoder failed (" + std::to_string(ret) + ")";
            return;
        }
        initialised = true;
    }
}

ByteStream::~ByteStream() {
    if (!initialised) return;
    if (codec == StreamCodec::Gzip) {
        inflateEnd(&zs);
    } else if (codec == StreamCodec::Xz) {
        lzma_end(&xs);
    }
}

size_t ByteStream::read(uint8_t* out, size_t len) {
    if (finished || failed() || len == 0) return 0;
    len = std::min<size_t>(len, UINT_MAX);

    size_t n = 0;
    switch (codec) {
        case StreamCodec::Raw:  n = readRaw(out, len); break;
        case StreamCodec::Gzip: n = readGzip(out, len); break;
        case StreamCodec::Xz:   n = readXz(out, len); break;
    }
    total += n;
    return n;
}

bool ByteStream::readExact(uint8_t* out, size_t len) {
    size_t done = 0;
    while (done < len) {
        size_t n = read(out + done, len - done);
        if (n == 0) return false;
        done += n;
    }
    return true;
}

bool ByteStream::skip(uint64_t n) {
    std::vector<uint8_t> scratch(CHUNK);
    while (n > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(n, scratch.size()));
        size_t got = read(scratch.data(), want);
        if (got == 0) return false;
        n -= got;
    }
    return true;
}

std::string ByteStream::gzipName() const {
    if (codec != StreamCodec::Gzip || gzHeader.done != 1 || gzHeader.name == Z_NULL) return "";
    return std::string(reinterpret_cast<const char*>(gzName),
                       strnlen(reinterpret_cast<const char*>(gzName), sizeof(gzName) - 1));
}

size_t ByteStream::readRaw(uint8_t* out, size_t len) {
    size_t n = std::min(len, source.size() - rawPos);
    std::memcpy(out, source.data() + rawPos, n);
    rawPos += n;
    if (rawPos >= source.size()) finished = true;
    return n;
}

size_t ByteStream::readGzip(uint8_t* out, size_t len) {
    zs.next_out = out;
    zs.avail_out = static_cast<uInt>(len);

    while (zs.avail_out > 0 && !finished) {
        if (zs.avail_in == 0) {
            if (rawPos >= source.size()) {
                error = "gzip stream truncated";
                break;
            }
            size_t chunk = std::min(CHUNK, source.size() - rawPos);
            zs.next_in = const_cast<Bytef*>(source.data() + rawPos);
            zs.avail_in = static_cast<uInt>(chunk);
            rawPos += chunk;
        }

        int ret = inflate(&zs, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            // Concatenated members continue with another gzip header.
            bool more = zs.avail_in > 0 ? zs.next_in[0] == 0x1f
                                        : rawPos < source.size() && source[rawPos] == 0x1f;
            if (more && inflateReset(&zs) == Z_OK) continue;
            finished = true;
        } else if (ret == Z_BUF_ERROR) {
            if (zs.avail_in != 0) {
                error = "gzip inflate made no progress";
                break;
            }
        } else if (ret != Z_OK) {
            error = std::string("gzip inflate error: ") + (zs.msg ? zs.msg : std::to_string(ret));
            break;
        }
    }
    return len - zs.avail_out;
}

size_t ByteStream::readXz(uint8_t* out, size_t len) {
    xs.next_out = out;
    xs.avail_out = len;

    while (xs.avail_out > 0 && !finished) {
        if (xs.avail_in == 0 && rawPos < source.size()) {
            size_t chunk = std::min(CHUNK, source.size() - rawPos);
            xs.next_in = source.data() + rawPos;
            xs.avail_in = chunk;
            rawPos += chunk;
        }
        lzma_action action = rawPos >= source.size() ? LZMA_FINISH : LZMA_RUN;

        lzma_ret ret = lzma_code(&xs, action);
        if (ret == LZMA_STREAM_END) {
            finished = true;
        } else if (ret == LZMA_BUF_ERROR) {
            error = "xz stream truncated";
            break;
        } else if (ret != LZMA_OK) {
            error = "xz decode error (" + std::to_string(ret) + ")";
            break;
        }
    }
    return len - xs.avail_out;
}

bool gunzipBuffer(const std::vector<uint8_t>& in, uint64_t limit, std::vector<uint8_t>& out) {
    ByteStream stream(in, StreamCodec::Gzip);
    std::vector<uint8_t> buffer(ByteStream::CHUNK);
    out.clear();

    size_t n;
    while ((n = stream.read(buffer.data(), buffer.size())) > 0) {
        if (out.size() + n > limit) {
            Logger::debug("gunzip: output exceeds " + std::to_string(limit) + " bytes");
            return false;
        }
        out.insert(out.end(), buffer.begin(), buffer.begin() + n);
    }
    if (stream.failed()) {
        Logger::debug("gunzip: " + stream.errorMessage());
        return false;
    }
    return true;
}
