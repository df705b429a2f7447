#include "document_action_scanner.hpp"
#include "scanner_registration.hpp"
#include "media_types.hpp"
#include "pdf_parser.hpp"
#include "text_match.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace {

bool isPdfDelimiter(char c) {
    return is_space(c) || c == '\0' || std::strchr("()<>[]{}/%", c) != nullptr;
}

// "/Name" as a complete PDF name token, case-insensitive.
size_t findName(const std::string& content, const std::string& token, size_t from = 0) {
    size_t pos = find_icase(content, token, from);
    while (pos != std::string::npos) {
        size_t after = pos + token.size();
        if (after >= content.size() || isPdfDelimiter(content[after])) return pos;
        pos = find_icase(content, token, pos + 1);
    }
    return std::string::npos;
}

size_t countNames(const std::string& content, const std::string& token) {
    size_t count = 0;
    for (size_t pos = findName(content, token); pos != std::string::npos;
         pos = findName(content, token, pos + token.size())) {
        ++count;
    }
    return count;
}

std::string asName(const std::string& action) {
    return !action.empty() && action[0] == '/' ? action : "/" + action;
}

std::string lineAfter(const std::string& content, size_t pos) {
    size_t end = content.find_first_of("\r\n", pos);
    return content.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

const std::vector<std::string>& executableExtensions() {
    static const std::vector<std::string> extensions = {
        "exe", "bat", "cmd", "scr", "vbs", "com", "pif", "msi", "hta", "js", "jar", "ps1", "dll",
    };
    return extensions;
}

} // namespace

const std::vector<std::string>& DocumentActionScanner::builtinActions() {
    // /URI is tracked as an external link, not an action.
    static const std::vector<std::string> actions = {
        "/JavaScript", "/JS", "/Launch", "/GoToR", "/GoToE", "/SubmitForm",
        "/ImportData", "/EmbeddedFile", "/FileAttachment", "/RichMedia", "/Sound", "/Movie",
    };
    return actions;
}

const std::vector<std::string>& DocumentActionScanner::scriptFunctions() {
    static const std::vector<std::string> functions = {
        "app.alert", "app.launchURL", "app.openDoc", "app.execMenuItem", "util.printf",
        "getURL", "submitForm", "importDataObject", "exportDataObject",
        "eval(", "unescape(", "String.fromCharCode",
    };
    return functions;
}

const std::vector<std::string>& DocumentActionScanner::linkProtocols() {
    static const std::vector<std::string> protocols = {
        "javascript:", "file://", "vbscript:", "data:",
    };
    return protocols;
}

std::vector<std::string> DocumentActionScanner::actionList(const DocumentPolicy& policy) {
    std::vector<std::string> custom;
    std::vector<std::string> allowed;
    for (const auto& a : policy.customActions) custom.push_back(asName(a));
    for (const auto& a : policy.allowedActions) allowed.push_back(asName(a));
    return effectiveList(builtinActions(), custom, allowed);
}

bool DocumentActionScanner::match(const std::string& mediaType, const std::string& extension) const {
    return mediaType == mime::pdf || extension == "pdf";
}

ScanResult DocumentActionScanner::inspect(const std::string& path, const std::string&,
                                          const ScanPolicy& policy) const {
    ScanResult result;
    std::string content;
    if (!loadContent(path, policy, content, result)) return result;
    scanText(content, policy, result);
    return result;
}

void DocumentActionScanner::scanText(const std::string& content, const ScanPolicy& policy,
                                     ScanResult& result) const {
    if (!isPdfHeader(content)) {
        result.addThreat("Not a valid PDF file", eventType());
        return;
    }
    result.mediaType = mime::pdf;

    const DocumentPolicy& cfg = policy.document;
    scanActions(content, cfg, result);
    scanJavascript(content, result);
    scanLinks(content, cfg, result);
    scanObfuscation(content, cfg, result);
    scanEmbeddedFiles(content, result);
    checkStructure(content, cfg, result);

    if (cfg.blockJavascript && result.flags.hasJavascript) {
        result.addThreat("JavaScript blocked by policy", eventType());
    }
}

void DocumentActionScanner::scanActions(const std::string& content, const DocumentPolicy& policy,
                                        ScanResult& result) const {
    for (const auto& action : actionList(policy)) {
        if (findName(content, action) != std::string::npos) {
            result.addThreat("Dangerous PDF action detected: " + action.substr(1), eventType());
        }
    }
}

void DocumentActionScanner::scanJavascript(const std::string& content, ScanResult& result) const {
    bool script = findName(content, "/JavaScript") != std::string::npos;
    for (size_t pos = findName(content, "/JS"); !script && pos != std::string::npos;
         pos = findName(content, "/JS", pos + 3)) {
        size_t p = skip_spaces(content, pos + 3);
        script = match_icase_at(content, p, "<<") || match_icase_at(content, p, "[") ||
                 match_icase_at(content, p, "(");
    }
    if (!script) return;

    result.flags.hasJavascript = true;
    result.addThreat("JavaScript code detected in PDF", eventType());
    for (const auto& fn : scriptFunctions()) {
        if (contains_icase(content, fn)) {
            result.addThreat("Suspicious JavaScript function detected: " + fn, eventType());
        }
    }
}

void DocumentActionScanner::scanLinks(const std::string& content, const DocumentPolicy& policy,
                                      ScanResult& result) const {
    for (const std::string token : {"/URI", "/F"}) {
        for (size_t pos = findName(content, token); pos != std::string::npos;
             pos = findName(content, token, pos + token.size())) {
            size_t p = skip_spaces(content, pos + token.size());
            std::string target;
            if (p >= content.size() || (content[p] != '(' && content[p] != '<') ||
                (content[p] == '<' && p + 1 < content.size() && content[p + 1] == '<') ||
                !readPdfString(content, p, target)) {
                continue;
            }
            target.erase(0, target.find_first_not_of(" \t\r\n"));
            for (const auto& protocol : linkProtocols()) {
                if (match_icase_at(target, 0, protocol)) {
                    result.addThreat("Dangerous URL protocol detected: " + protocol, eventType());
                }
            }
            if (token == "/URI" && content[p] == '(') {
                result.flags.hasExternalLinks = true;
                if (policy.blockExternalLinks) {
                    result.addThreat("External URL link detected in PDF", eventType());
                }
            }
        }
    }

    if (findName(content, "/GoToR") != std::string::npos) {
        result.flags.hasExternalLinks = true;
        if (policy.blockExternalLinks) {
            result.addThreat("External URL link detected in PDF", eventType());
        }
    }

    for (size_t pos = findName(content, "/SubmitForm"); pos != std::string::npos;
         pos = findName(content, "/SubmitForm", pos + 11)) {
        if (contains_icase(lineAfter(content, pos + 11), "http")) {
            result.flags.hasExternalLinks = true;
            if (policy.blockExternalLinks) {
                result.addThreat("Form submission to external URL detected", eventType());
            }
            break;
        }
    }
}

void DocumentActionScanner::scanObfuscation(const std::string& content, const DocumentPolicy& policy,
                                            ScanResult& result) const {
    size_t flate = 0;
    for (size_t pos = findName(content, "/Filter"); pos != std::string::npos;
         pos = findName(content, "/Filter", pos + 7)) {
        size_t p = skip_spaces(content, pos + 7);
        if (match_icase_at(content, p, "/FlateDecode")) ++flate;
    }
    if (flate > policy.maxCompressedStreams) {
        result.addThreat("Suspicious amount of compressed streams detected (" + std::to_string(flate) + ")",
                         eventType());
    }

    // <hex digits and whitespace> strings, brackets included in the length
    size_t pos = content.find('<');
    while (pos != std::string::npos) {
        size_t j = pos + 1;
        while (j < content.size() &&
               (std::isxdigit(static_cast<unsigned char>(content[j])) || is_space(content[j]))) {
            ++j;
        }
        if (j < content.size() && content[j] == '>' && j > pos + 1 && j - pos + 1 > policy.maxHexRun) {
            result.addThreat("Suspicious hex-encoded content detected", eventType());
            break;
        }
        pos = content.find('<', std::max(j, pos + 1));
    }

    if (countNames(content, "/Encrypt") > 1) {
        result.addThreat("Multiple encryption layers detected", eventType());
    }
}

void DocumentActionScanner::scanEmbeddedFiles(const std::string& content, ScanResult& result) const {
    if (findName(content, "/EmbeddedFile") != std::string::npos) {
        result.addThreat("Embedded file detected in PDF", eventType());

        // file specification names: /F (name) and /UF (name)
        for (const std::string token : {"/F", "/UF"}) {
            for (size_t pos = findName(content, token); pos != std::string::npos;
                 pos = findName(content, token, pos + token.size())) {
                std::string fileName;
                size_t p = skip_spaces(content, pos + token.size());
                if (p < content.size() && content[p] == '(' && readPdfString(content, p, fileName, 1024)) {
                    const std::string ext = file_extension(fileName);
                    const auto& bad = executableExtensions();
                    if (std::find(bad.begin(), bad.end(), ext) != bad.end()) {
                        Logger::debug(name() + ": executable attachment " + fileName);
                        result.addThreat("Suspicious executable file embedded in PDF", eventType());
                    }
                }
            }
        }
    }

    if (findName(content, "/FileAttachment") != std::string::npos) {
        result.addThreat("File attachment detected in PDF", eventType());
    }
}

void DocumentActionScanner::checkStructure(const std::string& content, const DocumentPolicy& policy,
                                           ScanResult& result) const {
    PdfInfo info = parsePdf(content);
    if (!info.version.empty()) result.setMeta("version", info.version);
    for (const auto& field : info.fields) {
        result.setMeta(field.first, field.second);
    }
    result.setMeta("pages", std::to_string(info.pageCount));

    if (policy.minPages > 0 && info.pageCount < policy.minPages) {
        result.addThreat("PDF has too few pages (" + std::to_string(info.pageCount) + " < " +
                         std::to_string(policy.minPages) + ")", eventType());
    }
    if (policy.maxPages > 0 && info.pageCount > policy.maxPages) {
        result.addThreat("PDF has too many pages (" + std::to_string(info.pageCount) + " > " +
                         std::to_string(policy.maxPages) + ")", eventType());
    }
}

REGISTER_SCANNER(DocumentActionScanner, 30)
