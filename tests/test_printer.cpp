#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "printer.hpp"
#include "cJSON.h"
#include <fstream>
#include <iterator>

class PrinterTest : public TempDirTest {
protected:
    static ScanResult sample() {
        ScanResult child;
        child.scanner = "Archive";
        child.mediaType = "application/zip";
        child.addThreat("Potential zip bomb detected: compression ratio 100:1", EventType::DecompressionBomb);
        child.flags.filesCount = 3;
        child.flags.uncompressedSize = 4096;
        child.setMeta("format", "ZIP");

        ScanResult root;
        root.scanner = "Engine";
        root.mediaType = "application/zip";
        root.merge(child);
        root.addNote("Archive scanned to depth 1");
        return root;
    }
};

TEST_F(PrinterTest, BuildsTree) {
    cJSON* json = buildJson(sample());
    ASSERT_NE(json, nullptr);

    EXPECT_STREQ(cJSON_GetObjectItem(json, "scanner")->valuestring, "Engine");
    EXPECT_TRUE(cJSON_IsFalse(cJSON_GetObjectItem(json, "safe")));
    EXPECT_STREQ(cJSON_GetObjectItem(json, "media_type")->valuestring, "application/zip");

    cJSON* threats = cJSON_GetObjectItem(json, "threats");
    ASSERT_EQ(cJSON_GetArraySize(threats), 1);
    cJSON* threat = cJSON_GetArrayItem(threats, 0);
    EXPECT_STREQ(cJSON_GetObjectItem(threat, "event")->valuestring, "decompression-bomb");
    EXPECT_STREQ(cJSON_GetObjectItem(threat, "severity")->valuestring, "critical");

    cJSON* flags = cJSON_GetObjectItem(json, "flags");
    EXPECT_EQ(cJSON_GetObjectItem(flags, "files_count")->valueint, 3);
    EXPECT_EQ(cJSON_GetObjectItem(flags, "uncompressed_size")->valueint, 4096);
    EXPECT_TRUE(cJSON_IsFalse(cJSON_GetObjectItem(flags, "has_gps")));

    EXPECT_EQ(cJSON_GetArraySize(cJSON_GetObjectItem(json, "notes")), 1);
    EXPECT_EQ(cJSON_GetObjectItem(json, "metadata"), nullptr);

    cJSON* children = cJSON_GetObjectItem(json, "children");
    ASSERT_EQ(cJSON_GetArraySize(children), 1);
    cJSON* archive = cJSON_GetArrayItem(children, 0);
    EXPECT_STREQ(cJSON_GetObjectItem(archive, "scanner")->valuestring, "Archive");
    EXPECT_STREQ(cJSON_GetObjectItem(cJSON_GetObjectItem(archive, "metadata"), "format")->valuestring, "ZIP");

    cJSON_Delete(json);
}

TEST_F(PrinterTest, SafeResultHasEmptyThreats) {
    ScanResult result;
    result.scanner = "Metadata";
    cJSON* json = buildJson(result);
    EXPECT_TRUE(cJSON_IsTrue(cJSON_GetObjectItem(json, "safe")));
    EXPECT_EQ(cJSON_GetArraySize(cJSON_GetObjectItem(json, "threats")), 0);
    EXPECT_EQ(cJSON_GetObjectItem(json, "children"), nullptr);
    cJSON_Delete(json);
}

TEST_F(PrinterTest, DumpWritesParsableJson) {
    const std::string path = (dir / "report.json").string();
    ASSERT_TRUE(dumpJson(sample(), path));

    std::ifstream in(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text, toJson(sample()));

    cJSON* parsed = cJSON_Parse(text.c_str());
    ASSERT_NE(parsed, nullptr);
    EXPECT_NE(cJSON_GetObjectItem(parsed, "children"), nullptr);
    cJSON_Delete(parsed);
}

TEST_F(PrinterTest, DumpFailsForUnwritablePath) {
    EXPECT_FALSE(dumpJson(sample(), (dir / "missing" / "report.json").string()));
}
