#include "zip_reader.hpp"
#include "byte_stream.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <algorithm>
#include <sys/stat.h>

namespace {

std::string zipErrorMessage(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

} // namespace

std::unique_ptr<ZipFile> ZipFile::open(const std::string& path, std::string& error) {
    int code = 0;
    zip_t* archive = zip_open(path.c_str(), ZIP_RDONLY, &code);
    if (!archive) {
        error = "Failed to open zip archive: " + zipErrorMessage(code);
        return nullptr;
    }
    return std::unique_ptr<ZipFile>(new ZipFile(archive));
}

std::unique_ptr<ZipFile> ZipFile::fromBuffer(const std::vector<uint8_t>& data, std::string& error) {
    zip_error_t zerror;
    zip_error_init(&zerror);

    zip_source_t* src = zip_source_buffer_create(data.data(), data.size(), 0, &zerror);
    if (!src) {
        error = std::string("Failed to create zip source: ") + zip_error_strerror(&zerror);
        zip_error_fini(&zerror);
        return nullptr;
    }

    zip_t* archive = zip_open_from_source(src, ZIP_RDONLY, &zerror);
    if (!archive) {
        error = std::string("Failed to open zip archive: ") + zip_error_strerror(&zerror);
        zip_source_free(src);
        zip_error_fini(&zerror);
        return nullptr;
    }

    zip_error_fini(&zerror);
    return std::unique_ptr<ZipFile>(new ZipFile(archive));
}

ZipFile::~ZipFile() {
    // read-only: nothing to write back
    zip_discard(archive);
}

uint64_t ZipFile::size() const {
    zip_int64_t n = zip_get_num_entries(archive, 0);
    return n < 0 ? 0 : static_cast<uint64_t>(n);
}

bool ZipFile::entry(uint64_t index, ArchiveEntry& out) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(archive, index, 0, &st) != 0 || !(st.valid & ZIP_STAT_NAME)) {
        return false;
    }

    out = ArchiveEntry{};
    out.name = st.name;
    out.uncompressedSize = (st.valid & ZIP_STAT_SIZE) ? st.size : 0;
    out.compressedSize = (st.valid & ZIP_STAT_COMP_SIZE) ? st.comp_size : 0;
    out.isDirectory = ends_with(out.name, "/");

    zip_uint8_t opsys = 0;
    zip_uint32_t attributes = 0;
    if (zip_file_get_external_attributes(archive, index, 0, &opsys, &attributes) == 0 &&
        opsys == ZIP_OPSYS_UNIX && ((attributes >> 16) & S_IFMT) == S_IFLNK) {
        out.isLink = true;
        std::vector<uint8_t> target;
        bool truncated = false;
        std::string error;
        if (read(index, 4096, target, truncated, error)) {
            out.linkTarget.assign(target.begin(), target.end());
        } else {
            Logger::debug("ZIP: cannot read link target of " + out.name + ": " + error);
        }
    }
    return true;
}

bool ZipFile::locate(const std::string& name, uint64_t& index) const {
    zip_int64_t i = zip_name_locate(archive, name.c_str(), 0);
    if (i < 0) return false;
    index = static_cast<uint64_t>(i);
    return true;
}

bool ZipFile::read(uint64_t index, uint64_t limit, std::vector<uint8_t>& out,
                   bool& truncated, std::string& error) const {
    out.clear();
    truncated = false;

    zip_file_t* zf = zip_fopen_index(archive, index, 0);
    if (!zf) {
        error = std::string("Failed to open zip member: ") + zip_strerror(archive);
        return false;
    }

    std::vector<uint8_t> buffer(ByteStream::CHUNK);
    while (true) {
        zip_int64_t n = zip_fread(zf, buffer.data(), buffer.size());
        if (n < 0) {
            error = std::string("Failed to read zip member: ") + zip_file_strerror(zf);
            zip_fclose(zf);
            return false;
        }
        if (n == 0) break;
        uint64_t room = limit - out.size();
        if (static_cast<uint64_t>(n) > room) {
            out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<size_t>(room));
            truncated = true;
            break;
        }
        out.insert(out.end(), buffer.begin(), buffer.begin() + n);
    }

    zip_fclose(zf);
    return true;
}

bool ZipReader::forEach(const EntryVisitor& visit, std::string& error) {
    const uint64_t count = zip.size();
    for (uint64_t i = 0; i < count; ++i) {
        ArchiveEntry entry;
        if (!zip.entry(i, entry)) {
            error = "Unable to read ZIP entry " + std::to_string(i);
            return false;
        }

        EntryLoader load = [this, i](uint64_t limit, std::vector<uint8_t>& out) {
            bool truncated = false;
            std::string readError;
            if (!zip.read(i, limit, out, truncated, readError)) {
                Logger::debug("ZIP: " + readError);
                return false;
            }
            return !truncated;
        };
        if (!visit(entry, load)) break;
    }
    return true;
}
