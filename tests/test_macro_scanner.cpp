#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "test_helpers.hpp"
#include "macro_scanner.hpp"
#include "media_types.hpp"

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Not;

namespace {

const char* PLAIN_TYPES =
    "<?xml version=\"1.0\"?><Types>"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
    "<Override PartName=\"/word/document.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
    "</Types>";

const char* VBA_TYPES =
    "<?xml version=\"1.0\"?><Types>"
    "<Default Extension=\"bin\" ContentType=\"application/vnd.ms-office.vbaProject\"/>"
    "</Types>";

std::string utf16(const std::string& ascii) {
    std::string out;
    for (char c : ascii) {
        out += c;
        out += '\0';
    }
    return out;
}

// Compound file header followed by one directory sector.
std::vector<uint8_t> oleFile(const std::string& storage) {
    std::string data(1024, '\0');
    const char magic[] = "\xd0\xcf\x11\xe0\xa1\xb1\x1a\xe1";
    data.replace(0, 8, magic, 8);
    data.replace(512, 20, utf16("Root Entry"));
    if (!storage.empty()) data.replace(640, storage.size() * 2, utf16(storage));
    return std::vector<uint8_t>(data.begin(), data.end());
}

} // namespace

class MacroScannerTest : public TempDirTest {
protected:
    AccessValidator access;
    FormatIdentifier identifier;
    MacroScanner scanner{access, identifier};

    ScanResult scanDocument(const std::string& declaredName, const std::vector<uint8_t>& data) const {
        std::string path = write("upload.bin", data);
        return scanner.scan(path, declaredName, policy);
    }
};

TEST_F(MacroScannerTest, PlainDocumentIsSafe) {
    ScanResult result = scanDocument("letter.docx",
                                     buildOfficeDocument(PLAIN_TYPES, {{"word/document.xml", "<w:document/>"}}));
    EXPECT_TRUE(result.safe());
    EXPECT_FALSE(result.flags.hasMacros);
    EXPECT_EQ(result.meta("parts"), "2");
}

TEST_F(MacroScannerTest, VbaProjectInDisguisedDocument) {
    ScanResult result = scanDocument("invoice.docx", buildOfficeDocument(VBA_TYPES, {
        {"word/document.xml", "<w:document/>"},
        {"word/vbaProject.bin", "Attribute VB_Name = \"ThisDocument\""},
    }));
    EXPECT_TRUE(result.flags.hasMacros);
    EXPECT_EQ(result.meta("vbaProject"), "word/vbaProject.bin");
    auto messages = result.threatMessages();
    EXPECT_THAT(messages, Contains("VBA macro detected: word/vbaProject.bin"));
    EXPECT_THAT(messages, Contains("Macro content type detected: application/vnd.ms-office.vbaProject"));
    EXPECT_THAT(messages, Contains("Macro-enabled document disguised as .docx"));
    EXPECT_EQ(result.threats.front().event, EventType::MacroDetected);
}

TEST_F(MacroScannerTest, VbaProjectOutsideWellKnownLocation) {
    ScanResult result = scanDocument("book.xlsm", buildOfficeDocument(PLAIN_TYPES, {
        {"xl/workbook.xml", "<workbook/>"},
        {"custom/VBAProject.bin", "x"},
    }));
    EXPECT_THAT(result.threatMessages(), ElementsAre("VBA macro detected: custom/VBAProject.bin"));
}

TEST_F(MacroScannerTest, MacroExtensionIsNotSpoofing) {
    ScanResult result = scanDocument("invoice.docm", buildOfficeDocument(PLAIN_TYPES, {
        {"word/document.xml", "<w:document/>"},
        {"word/vbaProject.bin", "x"},
    }));
    EXPECT_THAT(result.threatMessages(), Not(Contains("Macro-enabled document disguised as .docm")));
    EXPECT_THAT(result.threatMessages(), Contains("VBA macro detected: word/vbaProject.bin"));
}

TEST_F(MacroScannerTest, SpoofingReportedWhenMacrosAllowed) {
    policy.macro.blockMacros = false;
    ScanResult result = scanDocument("invoice.docx", buildOfficeDocument(VBA_TYPES, {
        {"word/document.xml", "<w:document/>"},
        {"word/vbaProject.bin", "x"},
    }));
    EXPECT_TRUE(result.flags.hasMacros);
    EXPECT_THAT(result.threatMessages(), ElementsAre("Macro-enabled document disguised as .docx"));
}

TEST_F(MacroScannerTest, AllowedMacroExtensionSkipsSpoofing) {
    policy.macro.blockMacros = false;
    policy.macro.allowedMacroExtensions = {"DOCX"};
    ScanResult result = scanDocument("invoice.docx", buildOfficeDocument(PLAIN_TYPES, {
        {"word/document.xml", "<w:document/>"},
        {"word/vbaProject.bin", "x"},
    }));
    EXPECT_TRUE(result.safe());
    EXPECT_TRUE(result.flags.hasMacros);
}

TEST_F(MacroScannerTest, ActiveXControls) {
    auto doc = buildOfficeDocument(PLAIN_TYPES, {
        {"word/document.xml", "<w:document/>"},
        {"word/activeX/activeX1.xml", "<ax:ocx/>"},
        {"word/activeX/activeX1.bin", "ocx"},
        {"word/activeX/_rels/activeX1.xml.rels", "<Relationships/>"},
    });
    ScanResult result = scanDocument("form.docx", doc);
    EXPECT_TRUE(result.flags.hasActiveX);
    EXPECT_EQ(result.meta("controls"), "2");
    EXPECT_THAT(result.threatMessages(), ElementsAre("ActiveX control detected: 2 control(s)"));

    policy.macro.blockActiveX = false;
    result = scanDocument("form.docx", doc);
    EXPECT_TRUE(result.safe());
    EXPECT_TRUE(result.flags.hasActiveX);
}

TEST_F(MacroScannerTest, ControlPartNames) {
    EXPECT_TRUE(MacroScanner::isControlPart("word/activeX/activeX12.xml"));
    EXPECT_TRUE(MacroScanner::isControlPart("xl/embeddings/oleObject3.bin"));
    EXPECT_TRUE(MacroScanner::isControlPart("ppt\\activeX\\activeX.bin"));
    EXPECT_FALSE(MacroScanner::isControlPart("word/activeX/_rels/activeX1.xml.rels"));
    EXPECT_FALSE(MacroScanner::isControlPart("word/embeddings/image1.png"));
}

TEST_F(MacroScannerTest, ZipWithoutOfficeParts) {
    ScanResult result = scanDocument("report.docx", ZipBuilder().add("readme.txt", "hello").build());
    EXPECT_THAT(result.threatMessages(), ElementsAre("File is not a valid Office document"));
}

TEST_F(MacroScannerTest, GarbageIsNotAnOfficeDocument) {
    ScanResult result = scanDocument("report.docx", bytes("definitely not a zip file"));
    EXPECT_THAT(result.threatMessages(), ElementsAre("File is not a valid Office document"));
}

TEST_F(MacroScannerTest, LegacyVbaStorage) {
    ScanResult result = scanDocument("budget.doc", oleFile("VBA"));
    EXPECT_EQ(result.mediaType, mime::msword);
    EXPECT_EQ(result.meta("vbaProject"), "VBA");
    EXPECT_THAT(result.threatMessages(), ElementsAre("VBA macro detected: VBA"));

    result = scanDocument("budget.docx", oleFile("_VBA_PROJECT"));
    EXPECT_THAT(result.threatMessages(), Contains("VBA macro detected: _VBA_PROJECT"));
    EXPECT_THAT(result.threatMessages(), Contains("Macro-enabled document disguised as .docx"));
}

TEST_F(MacroScannerTest, LegacyWithoutMacrosIsSafe) {
    ScanResult result = scanDocument("budget.doc", oleFile(""));
    EXPECT_TRUE(result.safe());
    EXPECT_FALSE(result.flags.hasMacros);
}

TEST_F(MacroScannerTest, OversizedDocument) {
    policy.maxScanBytes = 16;
    ScanResult result = scanDocument("budget.doc", oleFile("VBA"));
    EXPECT_THAT(result.threatMessages(), ElementsAre("File too large to scan (1024 bytes)"));
}

TEST_F(MacroScannerTest, Matching) {
    EXPECT_TRUE(scanner.match(mime::docx, "docx"));
    EXPECT_TRUE(scanner.match("application/vnd.ms-excel.sheet.macroEnabled.12", "xlsm"));
    EXPECT_TRUE(scanner.match(mime::msword, "doc"));
    EXPECT_TRUE(scanner.match(mime::zip, "pptm"));
    EXPECT_FALSE(scanner.match(mime::zip, "zip"));
    EXPECT_FALSE(scanner.match(mime::pdf, "pdf"));
}

TEST_F(MacroScannerTest, OleHeader) {
    EXPECT_TRUE(MacroScanner::isOleHeader(oleFile("")));
    EXPECT_FALSE(MacroScanner::isOleHeader(bytes("PK\x03\x04")));
    EXPECT_FALSE(MacroScanner::isOleHeader({}));
}
