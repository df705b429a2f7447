#include <gtest/gtest.h>
#include "extension_map.hpp"
#include "media_types.hpp"

TEST(ExtensionMapTest, LookupIgnoresCaseAndDot) {
    ASSERT_FALSE(ExtensionMap::mediaTypes(".JPG").empty());
    EXPECT_EQ(ExtensionMap::mediaTypes(".JPG").front(), mime::jpeg);
    EXPECT_TRUE(ExtensionMap::isKnownExtension("pdf"));
    EXPECT_FALSE(ExtensionMap::isKnownExtension("xyz"));
    EXPECT_TRUE(ExtensionMap::mediaTypes("").empty());
}

TEST(ExtensionMapTest, MatchesDirectAndEquivalentTypes) {
    EXPECT_TRUE(ExtensionMap::matches("png", mime::png));
    EXPECT_TRUE(ExtensionMap::matches("jpg", "image/pjpeg"));
    EXPECT_TRUE(ExtensionMap::matches("docx", mime::zip));
    EXPECT_TRUE(ExtensionMap::matches("zip", mime::docx));
    EXPECT_TRUE(ExtensionMap::matches("gz", "application/x-gzip"));
    EXPECT_FALSE(ExtensionMap::matches("jpg", mime::png));
    EXPECT_FALSE(ExtensionMap::matches("pdf", "application/x-php"));
}

TEST(ExtensionMapTest, PlainTextDialects) {
    EXPECT_TRUE(ExtensionMap::matches("txt", "text/x-c"));
    EXPECT_FALSE(ExtensionMap::matches("csv", "text/x-c"));
    EXPECT_FALSE(ExtensionMap::matches("txt", "application/x-php"));
}

TEST(ExtensionMapTest, EquivalenceIsSymmetric) {
    EXPECT_TRUE(ExtensionMap::equivalent("image/jpg", mime::jpeg));
    EXPECT_TRUE(ExtensionMap::equivalent(mime::jpeg, "image/jpg"));
    EXPECT_TRUE(ExtensionMap::equivalent("application/xml", mime::textXml));
    EXPECT_FALSE(ExtensionMap::equivalent(mime::png, mime::jpeg));
}

TEST(ExtensionMapTest, AllowedTypes) {
    EXPECT_TRUE(ExtensionMap::allowedBy({}, "application/x-anything"));
    EXPECT_TRUE(ExtensionMap::allowedBy({"image/*"}, mime::png));
    EXPECT_FALSE(ExtensionMap::allowedBy({"image/*"}, mime::pdf));
    EXPECT_TRUE(ExtensionMap::allowedBy({"Application/PDF"}, mime::pdf));
    EXPECT_TRUE(ExtensionMap::allowedBy({mime::zip}, mime::xlsx));
    EXPECT_FALSE(ExtensionMap::allowedBy({mime::docx}, mime::zip));
}

TEST(ExtensionMapTest, MediaTypeFamilies) {
    EXPECT_TRUE(isOfficeOpenXml(mime::pptx));
    EXPECT_TRUE(isOfficeOpenXml("application/vnd.ms-excel.sheet.macroEnabled.12"));
    EXPECT_FALSE(isOfficeOpenXml(mime::msword));
    EXPECT_TRUE(isArchiveType(mime::sevenZip));
    EXPECT_FALSE(isArchiveType(mime::docx));
    EXPECT_TRUE(isZipContainer(mime::zip));
    EXPECT_TRUE(isZipContainer(mime::docx));
    EXPECT_TRUE(isZipContainer("application/vnd.ms-word.document.macroEnabled.12"));
    EXPECT_TRUE(isZipContainer("application/vnd.oasis.opendocument.text"));
    EXPECT_TRUE(isZipContainer(mime::jar));
    EXPECT_FALSE(isZipContainer(mime::gzip));
    EXPECT_FALSE(isZipContainer(mime::msword));
    EXPECT_TRUE(isRasterImage(mime::webp));
    EXPECT_FALSE(isRasterImage(mime::svg));
    EXPECT_FALSE(isRasterImage(mime::bmp));
}
