#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "test_helpers.hpp"
#include "document_action_scanner.hpp"

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Not;

namespace {

// Single-page document; `extra` lands in its own object before the trailer.
std::string pdf(const std::string& extra = "") {
    std::string doc =
        "%PDF-1.7\n"
        "1 0 obj << /Type /Catalog /Pages 2 0 R >> endobj\n"
        "2 0 obj << /Type /Pages /Kids [3 0 R] /Count 1 >> endobj\n"
        "3 0 obj << /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] >> endobj\n"
        "4 0 obj << /Title (Quarterly report) /Producer (pdfgen) >> endobj\n";
    if (!extra.empty()) doc += "5 0 obj " + extra + " endobj\n";
    doc += "trailer << /Root 1 0 R /Info 4 0 R >>\n%%EOF\n";
    return doc;
}

} // namespace

class DocumentActionScannerTest : public TempDirTest {
protected:
    AccessValidator access;
    FormatIdentifier identifier;
    DocumentActionScanner scanner{access, identifier};

    ScanResult scanText(const std::string& content) const {
        ScanResult result;
        scanner.scanText(content, policy, result);
        return result;
    }
};

TEST_F(DocumentActionScannerTest, PlainDocumentIsSafe) {
    ScanResult result = scanText(pdf());
    EXPECT_TRUE(result.safe());
    EXPECT_EQ(result.mediaType, "application/pdf");
    EXPECT_EQ(result.meta("version"), "1.7");
    EXPECT_EQ(result.meta("Title"), "Quarterly report");
    EXPECT_EQ(result.meta("pages"), "1");
    EXPECT_FALSE(result.flags.hasJavascript);
    EXPECT_FALSE(result.flags.hasExternalLinks);
}

TEST_F(DocumentActionScannerTest, MissingHeader) {
    ScanResult result = scanText("1 0 obj << >> endobj");
    EXPECT_THAT(result.threatMessages(), ElementsAre("Not a valid PDF file"));
}

TEST_F(DocumentActionScannerTest, OpenActionJavascript) {
    ScanResult result = scanText(pdf("<< /S /JavaScript /JS (app.alert('hi'); eval(x)) >>"));
    EXPECT_TRUE(result.flags.hasJavascript);
    auto messages = result.threatMessages();
    EXPECT_THAT(messages, Contains("Dangerous PDF action detected: JavaScript"));
    EXPECT_THAT(messages, Contains("Dangerous PDF action detected: JS"));
    EXPECT_THAT(messages, Contains("JavaScript code detected in PDF"));
    EXPECT_THAT(messages, Contains("Suspicious JavaScript function detected: app.alert"));
    EXPECT_THAT(messages, Contains("Suspicious JavaScript function detected: eval("));
    EXPECT_THAT(messages, Not(Contains("JavaScript blocked by policy")));
    EXPECT_EQ(result.threats.front().event, EventType::DocumentThreat);
}

TEST_F(DocumentActionScannerTest, BlockJavascriptAddsPolicyFinding) {
    policy.document.blockJavascript = true;
    ScanResult result = scanText(pdf("<< /S /JavaScript /JS (1) >>"));
    EXPECT_THAT(result.threatMessages(), Contains("JavaScript blocked by policy"));
}

TEST_F(DocumentActionScannerTest, ActionNamesMatchWholeTokens) {
    EXPECT_TRUE(scanText(pdf("<< /S /Launch /Win << /F (calc) >> >>"))
                    .hasThreat("Dangerous PDF action detected: Launch"));
    EXPECT_TRUE(scanText(pdf("<< /Launcher 1 /JSON 2 >>")).safe());
}

TEST_F(DocumentActionScannerTest, CustomAndAllowedActions) {
    policy.document.allowedActions = {"Launch"};
    policy.document.customActions = {"AA"};
    ScanResult result = scanText(pdf("<< /AA << /O 6 0 R >> /S /Launch >>"));
    EXPECT_THAT(result.threatMessages(), ElementsAre("Dangerous PDF action detected: AA"));
}

TEST_F(DocumentActionScannerTest, ActionListNormalisesNames) {
    DocumentPolicy cfg;
    cfg.customActions = {"Rendition"};
    cfg.allowedActions = {"/sound"};
    auto list = DocumentActionScanner::actionList(cfg);
    EXPECT_THAT(list, Contains("/Rendition"));
    EXPECT_THAT(list, Not(Contains("/Sound")));
    EXPECT_THAT(list, Not(Contains("/URI")));
}

TEST_F(DocumentActionScannerTest, ExternalLinksAreFlagged) {
    ScanResult result = scanText(pdf("<< /S /URI /URI (https://example.com/report) >>"));
    EXPECT_TRUE(result.safe());
    EXPECT_TRUE(result.flags.hasExternalLinks);

    policy.document.blockExternalLinks = true;
    result = scanText(pdf("<< /S /URI /URI (https://example.com/report) >>"));
    EXPECT_THAT(result.threatMessages(), ElementsAre("External URL link detected in PDF"));
}

TEST_F(DocumentActionScannerTest, DangerousLinkProtocols) {
    ScanResult result = scanText(pdf("<< /S /URI /URI (javascript:alert(1)) >>"));
    EXPECT_THAT(result.threatMessages(), Contains("Dangerous URL protocol detected: javascript:"));

    result = scanText(pdf("<< /Type /Filespec /F (file://server/share/x) >>"));
    EXPECT_THAT(result.threatMessages(), ElementsAre("Dangerous URL protocol detected: file://"));
}

TEST_F(DocumentActionScannerTest, RemoteGotoCountsAsExternal) {
    policy.document.allowedActions = {"GoToR"};
    ScanResult result = scanText(pdf("<< /S /GoToR /D [0 /Fit] >>"));
    EXPECT_TRUE(result.flags.hasExternalLinks);
    EXPECT_TRUE(result.safe());
}

TEST_F(DocumentActionScannerTest, FormSubmissionToExternalUrl) {
    policy.document.blockExternalLinks = true;
    ScanResult result = scanText(pdf("<< /S /SubmitForm (http://collector.example/) >>"));
    EXPECT_THAT(result.threatMessages(), Contains("Form submission to external URL detected"));
    EXPECT_TRUE(result.flags.hasExternalLinks);
}

TEST_F(DocumentActionScannerTest, CompressedStreamCount) {
    policy.document.maxCompressedStreams = 2;
    std::string streams = "<< /Filter /FlateDecode >> << /Filter /FlateDecode >> << /Filter  /FlateDecode >>";
    EXPECT_TRUE(scanText(pdf(streams)).hasThreat("Suspicious amount of compressed streams detected (3)"));
    policy.document.maxCompressedStreams = 3;
    EXPECT_TRUE(scanText(pdf(streams)).safe());
}

TEST_F(DocumentActionScannerTest, LongHexString) {
    policy.document.maxHexRun = 10;
    ScanResult result = scanText(pdf("<< /Data <48656c6c6f20576f726c64> >>"));
    EXPECT_THAT(result.threatMessages(), ElementsAre("Suspicious hex-encoded content detected"));
}

TEST_F(DocumentActionScannerTest, MultipleEncryptionDictionaries) {
    EXPECT_TRUE(scanText(pdf("<< /Encrypt 6 0 R >>")).safe());
    EXPECT_TRUE(scanText(pdf("<< /Encrypt 6 0 R /Next << /Encrypt 7 0 R >> >>"))
                    .hasThreat("Multiple encryption layers detected"));
}

TEST_F(DocumentActionScannerTest, EmbeddedExecutable) {
    ScanResult result = scanText(pdf("<< /Type /Filespec /F (invoice.exe) /EF << /F 6 0 R >> "
                                     "/Sub << /Type /EmbeddedFile >> >>"));
    auto messages = result.threatMessages();
    EXPECT_THAT(messages, Contains("Dangerous PDF action detected: EmbeddedFile"));
    EXPECT_THAT(messages, Contains("Embedded file detected in PDF"));
    EXPECT_THAT(messages, Contains("Suspicious executable file embedded in PDF"));
}

TEST_F(DocumentActionScannerTest, FileAttachmentAnnotation) {
    policy.document.allowedActions = {"FileAttachment"};
    ScanResult result = scanText(pdf("<< /Subtype /FileAttachment >>"));
    EXPECT_THAT(result.threatMessages(), ElementsAre("File attachment detected in PDF"));
}

TEST_F(DocumentActionScannerTest, PageLimits) {
    policy.document.minPages = 2;
    EXPECT_THAT(scanText(pdf()).threatMessages(), ElementsAre("PDF has too few pages (1 < 2)"));
    policy.document.minPages = 0;
    policy.document.maxPages = 1;
    EXPECT_TRUE(scanText(pdf()).safe());
}

TEST_F(DocumentActionScannerTest, MatchesPdfTypeOrExtension) {
    EXPECT_TRUE(scanner.match("application/pdf", ""));
    EXPECT_TRUE(scanner.match("application/octet-stream", "pdf"));
    EXPECT_FALSE(scanner.match("image/png", "png"));
}

TEST_F(DocumentActionScannerTest, ScansFile) {
    std::string path = write("form.pdf", pdf("<< /OpenAction << /S /JavaScript /JS (app.launchURL\\(u\\)) >> >>"));
    ScanResult result = scanner.scan(path, "form.pdf", policy);
    EXPECT_EQ(result.scanner, "DocumentAction");
    EXPECT_FALSE(result.safe());
    EXPECT_TRUE(result.flags.hasJavascript);
    EXPECT_TRUE(result.hasThreat("app.launchURL"));
}
