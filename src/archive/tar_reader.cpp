#include "tar_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace {

constexpr uint64_t MAX_META_RECORD = 1024 * 1024;

std::string read_field(const uint8_t* buf, size_t len) {
    size_t n = 0;
    while (n < len && buf[n] != 0) n++;
    return std::string(reinterpret_cast<const char*>(buf), n);
}

uint64_t read_octal(const uint8_t* buf, size_t len) {
    size_t i = 0;
    while (i < len && (buf[i] == ' ' || buf[i] == 0)) i++;
    uint64_t value = 0;
    for (; i < len && buf[i] >= '0' && buf[i] <= '7'; ++i) {
        value = (value << 3) | static_cast<uint64_t>(buf[i] - '0');
    }
    return value;
}

// Octal, or GNU base-256 when the high bit of the first byte is set.
uint64_t read_size(const uint8_t* field) {
    if (!(field[0] & 0x80)) return read_octal(field, 12);
    uint64_t value = field[0] & 0x7f;
    for (size_t i = 1; i < 12; ++i) {
        if (value > (UINT64_MAX >> 8)) return UINT64_MAX;
        value = (value << 8) | field[i];
    }
    return value;
}

bool all_zero(const uint8_t* block) {
    return std::all_of(block, block + TarReader::BLOCK, [](uint8_t b) { return b == 0; });
}

std::string ustar_name(const uint8_t* header) {
    std::string name = read_field(header, 100);
    if (std::memcmp(header + 257, "ustar", 5) == 0) {
        std::string prefix = read_field(header + 345, 155);
        if (!prefix.empty()) return prefix + "/" + name;
    }
    return name;
}

struct PaxRecords {
    std::string path;
    std::string linkPath;
    bool hasSize = false;
    uint64_t size = 0;
};

// "<len> <key>=<value>\n" records
void parse_pax(const std::vector<uint8_t>& meta, PaxRecords& pax) {
    size_t pos = 0;
    while (pos < meta.size()) {
        size_t space = pos;
        uint64_t len = 0;
        while (space < meta.size() && meta[space] >= '0' && meta[space] <= '9') {
            len = len * 10 + (meta[space] - '0');
            ++space;
        }
        if (space >= meta.size() || meta[space] != ' ' || len == 0 || pos + len > meta.size()) break;

        std::string record(meta.begin() + space + 1, meta.begin() + pos + len);
        if (!record.empty() && record.back() == '\n') record.pop_back();
        size_t eq = record.find('=');
        if (eq != std::string::npos) {
            std::string key = record.substr(0, eq);
            std::string value = record.substr(eq + 1);
            if (key == "path") {
                pax.path = value;
            } else if (key == "linkpath") {
                pax.linkPath = value;
            } else if (key == "size") {
                pax.hasSize = true;
                pax.size = std::strtoull(value.c_str(), nullptr, 10);
            }
        }
        pos += len;
    }
}

} // namespace

TarReader::TarReader(const std::vector<uint8_t>& data, StreamCodec codec,
                     const std::string& streamName, uint64_t streamLimit)
    : data(data), codec(codec), streamName(streamName), streamLimit(streamLimit) {}

std::string TarReader::name() const {
    switch (codec) {
        case StreamCodec::Gzip: return plainStream ? "GZIP" : "TAR.GZ";
        case StreamCodec::Xz:   return plainStream ? "XZ" : "TAR.XZ";
        case StreamCodec::Raw:  break;
    }
    return "TAR";
}

bool TarReader::isTarHeader(const uint8_t* block) {
    uint64_t stored = read_octal(block + 148, 8);
    uint64_t unsignedSum = 0;
    int64_t signedSum = 0;
    for (size_t i = 0; i < BLOCK; ++i) {
        uint8_t b = (i >= 148 && i < 156) ? ' ' : block[i];
        unsignedSum += b;
        signedSum += static_cast<int8_t>(b);
    }
    return stored == unsignedSum || (signedSum >= 0 && stored == static_cast<uint64_t>(signedSum));
}

bool TarReader::forEach(const EntryVisitor& visit, std::string& error) {
    ByteStream stream(data, codec);
    if (stream.failed()) {
        error = stream.errorMessage();
        return false;
    }

    uint8_t first[BLOCK] = {};
    size_t got = 0;
    while (got < BLOCK) {
        size_t n = stream.read(first + got, BLOCK - got);
        if (n == 0) break;
        got += n;
    }
    if (stream.failed()) {
        error = stream.errorMessage();
        return false;
    }

    if (got == BLOCK && all_zero(first)) return true;
    if (got == BLOCK && isTarHeader(first)) return walkTar(stream, first, visit, error);

    if (codec == StreamCodec::Raw) {
        error = "Not a valid TAR archive";
        return false;
    }
    return singleEntry(stream, got, visit, error);
}

bool TarReader::walkTar(ByteStream& stream, const uint8_t* first, const EntryVisitor& visit,
                        std::string& error) {
    std::vector<uint8_t> header(first, first + BLOCK);
    std::string longName;
    std::string longLink;
    PaxRecords pax;

    while (true) {
        const uint8_t* h = header.data();
        if (all_zero(h)) return true;
        if (!isTarHeader(h)) {
            error = "Invalid TAR header checksum";
            return false;
        }

        uint64_t size = pax.hasSize ? pax.size : read_size(h + 124);
        const char type = static_cast<char>(h[156]);
        const uint64_t padded = size > UINT64_MAX - (BLOCK - 1) ? UINT64_MAX : (size + BLOCK - 1) / BLOCK * BLOCK;

        if (type == 'L' || type == 'K' || type == 'x' || type == 'g') {
            if (size > MAX_META_RECORD) {
                error = "TAR metadata record too large";
                return false;
            }
            std::vector<uint8_t> meta(size);
            if (!stream.readExact(meta.data(), meta.size()) || !stream.skip(padded - size) ||
                !stream.readExact(header.data(), BLOCK)) {
                error = stream.failed() ? stream.errorMessage() : "Truncated TAR archive";
                return false;
            }
            if (type == 'L') {
                longName = read_field(meta.data(), meta.size());
            } else if (type == 'K') {
                longLink = read_field(meta.data(), meta.size());
            } else if (type == 'x') {
                parse_pax(meta, pax);
            }
            continue;
        }

        ArchiveEntry entry;
        entry.name = !pax.path.empty() ? pax.path : !longName.empty() ? longName : ustar_name(h);
        entry.uncompressedSize = size;
        entry.compressedSize = codec == StreamCodec::Raw ? size : 0;
        entry.isDirectory = type == '5' || ends_with(entry.name, "/");
        entry.isLink = type == '1' || type == '2';
        if (entry.isLink) {
            entry.linkTarget = !pax.linkPath.empty() ? pax.linkPath
                             : !longLink.empty() ? longLink : read_field(h + 157, 100);
        }
        longName.clear();
        longLink.clear();
        pax = PaxRecords{};

        uint64_t consumed = 0;
        EntryLoader load = [&](uint64_t limit, std::vector<uint8_t>& out) {
            if (consumed > 0 || size > limit) return false;
            out.resize(static_cast<size_t>(size));
            if (!stream.readExact(out.data(), out.size())) {
                out.clear();
                return false;
            }
            consumed = size;
            return true;
        };
        if (!visit(entry, load)) return true;

        if (!stream.skip(padded - consumed)) {
            error = stream.failed() ? stream.errorMessage() : "Truncated TAR archive";
            return false;
        }
        if (!stream.readExact(header.data(), BLOCK)) {
            if (stream.failed()) {
                error = stream.errorMessage();
                return false;
            }
            Logger::debug(name() + ": archive ends without end-of-archive blocks");
            return true;
        }
    }
}

bool TarReader::singleEntry(ByteStream& stream, uint64_t already, const EntryVisitor& visit,
                            std::string& error) {
    plainStream = true;

    uint64_t total = already;
    std::vector<uint8_t> buffer(ByteStream::CHUNK);
    while (total <= streamLimit) {
        size_t n = stream.read(buffer.data(), buffer.size());
        if (n == 0) break;
        total += n;
    }
    if (stream.failed()) {
        error = stream.errorMessage();
        return false;
    }

    ArchiveEntry entry;
    entry.name = stream.gzipName();
    if (entry.name.empty()) entry.name = streamName;
    entry.compressedSize = data.size();
    entry.uncompressedSize = std::min<uint64_t>(total, streamLimit + 1);

    EntryLoader load = [this](uint64_t limit, std::vector<uint8_t>& out) {
        ByteStream again(data, codec);
        std::vector<uint8_t> chunk(ByteStream::CHUNK);
        out.clear();
        size_t n;
        while ((n = again.read(chunk.data(), chunk.size())) > 0) {
            if (out.size() + n > limit) return false;
            out.insert(out.end(), chunk.begin(), chunk.begin() + n);
        }
        return !again.failed();
    };
    visit(entry, load);
    return true;
}
