#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "test_helpers.hpp"
#include "code_injection_scanner.hpp"

using ::testing::Contains;
using ::testing::Not;

class CodeInjectionScannerTest : public TempDirTest {
protected:
    AccessValidator access;
    FormatIdentifier identifier;
    CodeInjectionScanner scanner{access, identifier};

    ScanResult scanText(const std::string& content) const {
        ScanResult result;
        scanner.scanText(content, policy, result);
        return result;
    }
};

TEST_F(CodeInjectionScannerTest, PlainTextIsSafe) {
    ScanResult result = scanText("Quarterly report\nRevenue grew by 4% <3 everyone\n");
    EXPECT_TRUE(result.safe());
}

TEST_F(CodeInjectionScannerTest, DetectsOpeningTagAndFunctions) {
    ScanResult result = scanText("<?php system($_GET['c']); ?>");
    EXPECT_FALSE(result.safe());
    EXPECT_THAT(result.threatMessages(), Contains("PHP opening tag (<?php) detected"));
    EXPECT_THAT(result.threatMessages(), Contains("Dangerous function detected: system()"));
}

TEST_F(CodeInjectionScannerTest, OpeningTagAtEndOfContent) {
    EXPECT_TRUE(scanText("trailer <?php").hasThreat("PHP opening tag"));
}

TEST_F(CodeInjectionScannerTest, ShortEchoTagNeedsStatement) {
    EXPECT_TRUE(scanText("<?= $secret ?>").hasThreat("PHP short echo tag"));
    EXPECT_FALSE(scanText("a <?= 5 b").hasThreat("PHP short echo tag"));
}

TEST_F(CodeInjectionScannerTest, XmlDeclarationIsNotAShortTag) {
    ScanResult result = scanText("<?xml version=\"1.0\"?><root/>");
    EXPECT_TRUE(result.safe());
}

TEST_F(CodeInjectionScannerTest, ShortTagFollowedByStatement) {
    EXPECT_TRUE(scanText("<? echo $x; ?>").hasThreat("PHP short tag (<?) detected"));
    EXPECT_FALSE(scanText("what<?really").hasThreat("PHP short tag"));
}

TEST_F(CodeInjectionScannerTest, FunctionNeedsWordBoundaryAndParenthesis) {
    EXPECT_TRUE(scanText("the ecosystem( is fine").safe());
    EXPECT_TRUE(scanText("evaluation of the system").safe());
    EXPECT_TRUE(scanText("x = EVAL ($y)").hasThreat("Dangerous function detected: eval()"));
}

TEST_F(CodeInjectionScannerTest, CompositePatterns) {
    ScanResult result = scanText("eval( base64_decode('ZWNobyAx'))");
    EXPECT_THAT(result.threatMessages(), Contains("Suspicious code pattern detected: eval(base64_decode(...))"));

    result = scanText("preg_replace('/.*/e', $code, '')");
    EXPECT_TRUE(result.hasThreat("preg_replace with /e modifier"));

    result = scanText("<title>c99 shell v1</title>");
    EXPECT_TRUE(result.hasThreat("c99 shell"));

    result = scanText("$s = \"\\x3c\\x3fphp\";");
    EXPECT_TRUE(result.hasThreat("hex-encoded PHP tag"));
}

TEST_F(CodeInjectionScannerTest, ScriptLanguageAndAspBlocks) {
    EXPECT_TRUE(scanText("<script language=\"php\">echo 1;</script>").hasThreat("PHP script tag"));
    EXPECT_TRUE(scanText("<% Response.Write(1) %>").hasThreat("ASP/JSP code block"));
}

TEST_F(CodeInjectionScannerTest, StrictModeUsesReducedList) {
    policy.codeInjection.mode = FunctionScanMode::Strict;
    EXPECT_TRUE(scanText("unlink($f);").safe());
    EXPECT_FALSE(scanText("passthru($c);").safe());
}

TEST_F(CodeInjectionScannerTest, CustomModeUsesExactList) {
    policy.codeInjection.mode = FunctionScanMode::Custom;
    policy.codeInjection.scanFunctions = {"dangerous_thing"};
    EXPECT_FALSE(scanText("exec($c);").hasThreat("Dangerous function"));
    EXPECT_TRUE(scanText("dangerous_thing(1);").hasThreat("Dangerous function detected: dangerous_thing()"));
}

TEST_F(CodeInjectionScannerTest, DefaultModeAdditionsAndExclusions) {
    policy.codeInjection.customFunctions = {"my_loader"};
    policy.codeInjection.excludeFunctions = {"copy"};
    EXPECT_TRUE(scanText("my_loader($x)").hasThreat("my_loader()"));
    EXPECT_TRUE(scanText("copy($a, $b)").safe());
}

TEST_F(CodeInjectionScannerTest, ExcludedAndCustomPatterns) {
    policy.codeInjection.excludePatterns = {"asp_tags"};
    policy.codeInjection.customPatterns = {"backdoor_marker"};
    ScanResult result = scanText("<% x %> BACKDOOR_MARKER");
    EXPECT_THAT(result.threatMessages(), Not(Contains("ASP/JSP code block (<% %>) detected")));
    EXPECT_TRUE(result.hasThreat("Suspicious code pattern detected: backdoor_marker"));
}

TEST_F(CodeInjectionScannerTest, FunctionListModes) {
    CodeInjectionPolicy cfg;
    EXPECT_EQ(CodeInjectionScanner::functionList(cfg), CodeInjectionScanner::builtinFunctions());
    cfg.mode = FunctionScanMode::Strict;
    EXPECT_EQ(CodeInjectionScanner::functionList(cfg), CodeInjectionScanner::strictFunctions());
}

TEST_F(CodeInjectionScannerTest, ScansFileContent) {
    std::string path = write("upload.txt", "hello <?php passthru('id'); ?>");
    ScanResult result = scanner.scan(path, "upload.txt", policy);
    EXPECT_EQ(result.scanner, "CodeInjection");
    EXPECT_TRUE(result.hasThreat("passthru()"));
}

TEST_F(CodeInjectionScannerTest, SkipsBinaryMedia) {
    JpegSpec spec;
    spec.comment = "<?php system('id'); ?>";
    std::string path = write("photo.jpg", buildJpeg(spec));
    ScanResult result = scanner.scan(path, "photo.jpg", policy);
    EXPECT_TRUE(result.safe());
    EXPECT_EQ(result.mediaType, "image/jpeg");
    ASSERT_EQ(result.notes.size(), 1u);
}

TEST_F(CodeInjectionScannerTest, RejectsFileOutsideAllowedRoots) {
    std::string path = write("note.txt", "hello");
    policy.access.allowedRoots = {(dir / "elsewhere").string()};
    fs::create_directories(dir / "elsewhere");
    ScanResult result = scanner.scan(path, "note.txt", policy);
    EXPECT_FALSE(result.safe());
    EXPECT_THAT(result.threatMessages(), Contains("File path outside allowed directories"));
}

TEST_F(CodeInjectionScannerTest, TooLargeFileIsRejected) {
    policy.maxScanBytes = 4;
    std::string path = write("big.txt", "hello world");
    ScanResult result = scanner.scan(path, "big.txt", policy);
    EXPECT_TRUE(result.hasThreat("File too large to scan (11 bytes)"));
}
