#include <gtest/gtest.h>
#include "exif_parser.hpp"
#include <string>
#include <vector>

namespace {

void put16(std::vector<uint8_t>& out, uint16_t v, bool le) {
    if (le) {
        out.push_back(v & 0xFF);
        out.push_back(v >> 8);
    } else {
        out.push_back(v >> 8);
        out.push_back(v & 0xFF);
    }
}

void put32(std::vector<uint8_t>& out, uint32_t v, bool le) {
    if (le) {
        put16(out, v & 0xFFFF, le);
        put16(out, v >> 16, le);
    } else {
        put16(out, v >> 16, le);
        put16(out, v & 0xFFFF, le);
    }
}

// TIFF block whose IFD0 holds a single UNDEFINED UserComment entry.
std::vector<uint8_t> tiffWithUserComment(const std::vector<uint8_t>& comment, bool le) {
    std::vector<uint8_t> out;
    out.push_back(le ? 'I' : 'M');
    out.push_back(le ? 'I' : 'M');
    put16(out, 42, le);
    put32(out, 8, le);

    put16(out, 1, le);
    put16(out, 0x9286, le);
    put16(out, 7, le);
    put32(out, static_cast<uint32_t>(comment.size()), le);
    put32(out, 26, le);
    put32(out, 0, le);

    out.insert(out.end(), comment.begin(), comment.end());
    return out;
}

std::vector<uint8_t> unicodeComment(const std::string& text, bool le) {
    std::vector<uint8_t> comment = {'U', 'N', 'I', 'C', 'O', 'D', 'E', 0};
    for (char c : text) put16(comment, static_cast<uint8_t>(c), le);
    return comment;
}

std::string field(const ExifData& data, const std::string& name) {
    for (const auto& f : data.fields) {
        if (f.first == name) return f.second;
    }
    return "";
}

} // namespace

TEST(ExifParserTest, UnicodeUserCommentBigEndian) {
    std::vector<uint8_t> blob = tiffWithUserComment(unicodeComment("<?php eval($x); ?>", false), false);
    ExifData data;
    ASSERT_TRUE(parseExif(blob, 0, blob.size(), data));
    EXPECT_EQ(field(data, "UserComment"), "<?php eval($x); ?>");
}

TEST(ExifParserTest, UnicodeUserCommentLittleEndian) {
    std::vector<uint8_t> blob = tiffWithUserComment(unicodeComment("holiday", true), true);
    ExifData data;
    ASSERT_TRUE(parseExif(blob, 0, blob.size(), data));
    EXPECT_EQ(field(data, "UserComment"), "holiday");
}

TEST(ExifParserTest, AsciiUserComment) {
    std::string text = std::string("ASCII\0\0\0", 8) + "shot on film";
    std::vector<uint8_t> blob = tiffWithUserComment(std::vector<uint8_t>(text.begin(), text.end()), false);
    ExifData data;
    ASSERT_TRUE(parseExif(blob, 0, blob.size(), data));
    EXPECT_EQ(field(data, "UserComment"), "shot on film");
}

TEST(ExifParserTest, RejectsNonTiffHeader) {
    std::vector<uint8_t> blob = {'X', 'X', 0, 42, 0, 0, 0, 8, 0, 0};
    ExifData data;
    EXPECT_FALSE(parseExif(blob, 0, blob.size(), data));
    EXPECT_TRUE(data.fields.empty());
}
