#include "policy_loader.hpp"
#include "file_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "cJSON.h"
#include <cmath>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace {

using Handler = std::function<void(const cJSON*, const std::string&)>;
using Section = std::vector<std::pair<std::string, Handler>>;

struct JsonDeleter {
    void operator()(cJSON* json) const { cJSON_Delete(json); }
};

Handler boolean(bool& target) {
    return [&target](const cJSON* item, const std::string& key) {
        if (!cJSON_IsBool(item)) throw PolicyError(key + ": expected a boolean");
        target = cJSON_IsTrue(item);
    };
}

Handler text(std::string& target) {
    return [&target](const cJSON* item, const std::string& key) {
        if (!cJSON_IsString(item)) throw PolicyError(key + ": expected a string");
        target = item->valuestring;
    };
}

double non_negative(const cJSON* item, const std::string& key) {
    if (!cJSON_IsNumber(item) || item->valuedouble < 0 || std::floor(item->valuedouble) != item->valuedouble) {
        throw PolicyError(key + ": expected a non-negative integer");
    }
    return item->valuedouble;
}

template <typename T>
Handler number(T& target) {
    return [&target](const cJSON* item, const std::string& key) {
        target = static_cast<T>(non_negative(item, key));
    };
}

Handler list(std::vector<std::string>& target) {
    return [&target](const cJSON* item, const std::string& key) {
        if (!cJSON_IsArray(item)) throw PolicyError(key + ": expected an array of strings");
        std::vector<std::string> values;
        const cJSON* element = nullptr;
        cJSON_ArrayForEach(element, item) {
            if (!cJSON_IsString(element)) throw PolicyError(key + ": expected an array of strings");
            values.push_back(element->valuestring);
        }
        target = values;
    };
}

Handler signatures(std::vector<std::pair<std::string, std::string>>& target) {
    return [&target](const cJSON* item, const std::string& key) {
        if (!cJSON_IsObject(item)) throw PolicyError(key + ": expected an object of hex pattern to media type");
        std::vector<std::pair<std::string, std::string>> values;
        const cJSON* element = nullptr;
        cJSON_ArrayForEach(element, item) {
            std::vector<uint8_t> bytes;
            if (!cJSON_IsString(element) || !parse_hex(element->string, bytes) || bytes.empty()) {
                throw PolicyError(key + ": invalid signature entry " + std::string(element->string));
            }
            values.emplace_back(element->string, element->valuestring);
        }
        target = values;
    };
}

Handler scanMode(FunctionScanMode& target) {
    return [&target](const cJSON* item, const std::string& key) {
        const std::string mode = cJSON_IsString(item) ? to_lower(item->valuestring) : "";
        if (mode == "default") {
            target = FunctionScanMode::Default;
        } else if (mode == "strict") {
            target = FunctionScanMode::Strict;
        } else if (mode == "custom") {
            target = FunctionScanMode::Custom;
        } else {
            throw PolicyError(key + ": expected one of default, strict, custom");
        }
    };
}

void apply(const cJSON* object, const std::string& path, const Section& handlers) {
    if (!cJSON_IsObject(object)) throw PolicyError(path + ": expected an object");
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, object) {
        const std::string key = item->string;
        bool known = false;
        for (const auto& h : handlers) {
            if (h.first != key) continue;
            h.second(item, path.empty() ? key : path + "." + key);
            known = true;
            break;
        }
        if (!known) Logger::debug("Policy: ignoring unknown key " + (path.empty() ? key : path + "." + key));
    }
}

Handler section(const Section& handlers) {
    return [handlers](const cJSON* item, const std::string& key) { apply(item, key, handlers); };
}

} // namespace

void loadPolicyJson(const std::string& text, ScanPolicy& policy) {
    std::unique_ptr<cJSON, JsonDeleter> root(cJSON_Parse(text.c_str()));
    if (!root) {
        const char* where = cJSON_GetErrorPtr();
        throw PolicyError(std::string("Malformed policy JSON") + (where ? " near: " + std::string(where).substr(0, 32) : ""));
    }

    Section mime = {
        {"strict_extension_check", boolean(policy.mime.strictExtensionCheck)},
        {"block_dangerous", boolean(policy.mime.blockDangerous)},
        {"use_host_sniffer", boolean(policy.mime.useHostSniffer)},
        {"allowed_types", list(policy.mime.allowedTypes)},
        {"dangerous_types", list(policy.mime.dangerousTypes)},
        {"custom_signatures", signatures(policy.mime.customSignatures)},
    };
    Section codeInjection = {
        {"enabled", boolean(policy.codeInjection.enabled)},
        {"mode", scanMode(policy.codeInjection.mode)},
        {"custom_functions", list(policy.codeInjection.customFunctions)},
        {"exclude_functions", list(policy.codeInjection.excludeFunctions)},
        {"scan_functions", list(policy.codeInjection.scanFunctions)},
        {"custom_patterns", list(policy.codeInjection.customPatterns)},
        {"exclude_patterns", list(policy.codeInjection.excludePatterns)},
    };
    Section markup = {
        {"enabled", boolean(policy.markup.enabled)},
        {"custom_tags", list(policy.markup.customTags)},
        {"allowed_tags", list(policy.markup.allowedTags)},
        {"custom_attributes", list(policy.markup.customAttributes)},
        {"allowed_attributes", list(policy.markup.allowedAttributes)},
    };
    Section document = {
        {"enabled", boolean(policy.document.enabled)},
        {"block_javascript", boolean(policy.document.blockJavascript)},
        {"block_external_links", boolean(policy.document.blockExternalLinks)},
        {"custom_actions", list(policy.document.customActions)},
        {"allowed_actions", list(policy.document.allowedActions)},
        {"max_compressed_streams", number(policy.document.maxCompressedStreams)},
        {"max_hex_run", number(policy.document.maxHexRun)},
        {"min_pages", number(policy.document.minPages)},
        {"max_pages", number(policy.document.maxPages)},
    };
    Section macro = {
        {"enabled", boolean(policy.macro.enabled)},
        {"block_macros", boolean(policy.macro.blockMacros)},
        {"block_activex", boolean(policy.macro.blockActiveX)},
        {"non_macro_extensions", list(policy.macro.nonMacroExtensions)},
        {"allowed_macro_extensions", list(policy.macro.allowedMacroExtensions)},
    };
    Section metadata = {
        {"enabled", boolean(policy.metadata.enabled)},
        {"block_gps", boolean(policy.metadata.blockGps)},
        {"strip_metadata", boolean(policy.metadata.stripMetadata)},
        {"scanned_fields", list(policy.metadata.scannedFields)},
        {"max_trailing_bytes", number(policy.metadata.maxTrailingBytes)},
        {"min_width", number(policy.metadata.minWidth)},
        {"min_height", number(policy.metadata.minHeight)},
        {"max_width", number(policy.metadata.maxWidth)},
        {"max_height", number(policy.metadata.maxHeight)},
    };
    Section archive = {
        {"enabled", boolean(policy.archive.enabled)},
        {"max_compression_ratio", number(policy.archive.maxCompressionRatio)},
        {"max_uncompressed_size", number(policy.archive.maxUncompressedSize)},
        {"max_files_count", number(policy.archive.maxFilesCount)},
        {"max_nesting_depth", number(policy.archive.maxNestingDepth)},
        {"max_nested_archive_bytes", number(policy.archive.maxNestedArchiveBytes)},
        {"blocked_extensions", list(policy.archive.blockedExtensions)},
        {"archive_extensions", list(policy.archive.archiveExtensions)},
        {"backend_fail_open", boolean(policy.archive.backendFailOpen)},
        {"sevenzip_command", text(policy.archive.sevenZipCommand)},
    };
    Section access = {
        {"check_symlinks", boolean(policy.access.checkSymlinks)},
        {"allowed_roots", list(policy.access.allowedRoots)},
        {"storage_root", text(policy.access.storageRoot)},
    };

    apply(root.get(), "", {
        {"mime", section(mime)},
        {"code_injection", section(codeInjection)},
        {"markup", section(markup)},
        {"document", section(document)},
        {"macro", section(macro)},
        {"metadata", section(metadata)},
        {"archive", section(archive)},
        {"access", section(access)},
        {"max_scan_bytes", number(policy.maxScanBytes)},
    });
}

void loadPolicyFile(const std::string& path, ScanPolicy& policy) {
    std::vector<uint8_t> data;
    try {
        data = readFile(path);
    } catch (const std::runtime_error& e) {
        throw PolicyError("Cannot read policy file " + path + ": " + e.what());
    }
    Logger::debug("Loading policy from " + path);
    loadPolicyJson(std::string(data.begin(), data.end()), policy);
}
