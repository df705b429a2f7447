#pragma once
#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "scan_policy.hpp"

namespace fs = std::filesystem;

std::vector<uint8_t> bytes(const std::string& s);

// Fixture owning a fresh directory under the system temp dir, which the
// default access policy accepts.
class TempDirTest : public ::testing::Test {
protected:
    fs::path dir;
    ScanPolicy policy;

    void SetUp() override;
    void TearDown() override;

    std::string write(const std::string& name, const std::string& content) const;
    std::string write(const std::string& name, const std::vector<uint8_t>& content) const;
};

// Hand-built ZIP archives, deflated with zlib. Declared sizes can be
// overridden to describe entries the data does not back.
class ZipBuilder {
public:
    ZipBuilder& add(const std::string& name, const std::string& data);
    ZipBuilder& addWithSize(const std::string& name, const std::string& data, uint32_t declaredSize);
    ZipBuilder& addDirectory(const std::string& name);
    ZipBuilder& addSymlink(const std::string& name, const std::string& target);
    std::vector<uint8_t> build() const;

private:
    struct Entry {
        std::string name;
        std::string data;
        uint32_t declaredSize;
        bool symlink;
    };
    std::vector<Entry> entries;
};

// ustar archives.
class TarBuilder {
public:
    TarBuilder& add(const std::string& name, const std::string& data);
    TarBuilder& addDirectory(const std::string& name);
    TarBuilder& addSymlink(const std::string& name, const std::string& target);
    std::vector<uint8_t> build() const;

private:
    struct Entry {
        std::string name;
        std::string data;
        char type;
        std::string link;
    };
    std::vector<Entry> entries;
};

std::vector<uint8_t> gzipBytes(const std::vector<uint8_t>& data);

// Little-endian TIFF block with ASCII text tags and optionally a GPS IFD.
std::vector<uint8_t> buildExif(const std::vector<std::pair<uint16_t, std::string>>& textTags, bool withGps);

struct JpegSpec {
    uint16_t width = 64;
    uint16_t height = 48;
    std::vector<uint8_t> exif;
    std::string comment;
    std::string trailing;
};
std::vector<uint8_t> buildJpeg(const JpegSpec& spec);

struct PngSpec {
    uint32_t width = 32;
    uint32_t height = 16;
    std::vector<std::pair<std::string, std::string>> text;  // tEXt keyword -> text
    std::string trailing;
};
std::vector<uint8_t> buildPng(const PngSpec& spec);

// Minimal OOXML package; extra parts are added verbatim.
std::vector<uint8_t> buildOfficeDocument(const std::string& contentTypes,
                                         const std::vector<std::pair<std::string, std::string>>& parts);
