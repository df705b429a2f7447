#include "markup_injection_scanner.hpp"
#include "scanner_registration.hpp"
#include "byte_stream.hpp"
#include "media_types.hpp"
#include "text_match.hpp"
#include "logger.hpp"
#include <cctype>

namespace {

// End of a <!DOCTYPE ...> declaration, honouring the [...] internal subset
// and quoted literals. npos when unterminated.
size_t declarationEnd(const std::string& content, size_t start) {
    int depth = 0;
    char quote = 0;
    for (size_t i = start; i < content.size(); ++i) {
        char c = content[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            if (depth > 0) --depth;
        } else if (c == '>' && depth == 0) {
            return i;
        }
    }
    return std::string::npos;
}

bool containsKeyword(const std::string& text, const std::string& keyword) {
    size_t pos = find_icase(text, keyword);
    while (pos != std::string::npos) {
        size_t after = pos + keyword.size();
        if ((pos == 0 || !is_word_char(text[pos - 1])) &&
            (after >= text.size() || !is_word_char(text[after]))) {
            return true;
        }
        pos = find_icase(text, keyword, pos + 1);
    }
    return false;
}

bool isHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// &#NNN; or &#xHH; followed by "script" later on the same line.
bool entityObfuscation(const std::string& content) {
    size_t pos = content.find("&#");
    while (pos != std::string::npos) {
        size_t p = pos + 2;
        if (p < content.size() && (content[p] == 'x' || content[p] == 'X')) ++p;
        size_t digits = p;
        while (p < content.size() && isHexDigit(content[p])) ++p;
        if (p > digits && p < content.size() && content[p] == ';') {
            size_t lineEnd = content.find('\n', p);
            std::string rest = content.substr(p + 1, lineEnd == std::string::npos ? std::string::npos : lineEnd - p - 1);
            if (contains_icase(rest, "script")) return true;
        }
        pos = content.find("&#", pos + 2);
    }
    return false;
}

} // namespace

const std::vector<std::string>& MarkupInjectionScanner::builtinTags() {
    static const std::vector<std::string> tags = {
        "script", "iframe", "embed", "object",
        "use",            // loads external resources
        "foreignObject",  // embeds HTML
        "animate", "animateTransform", "set",
    };
    return tags;
}

const std::vector<std::string>& MarkupInjectionScanner::builtinAttributes() {
    static const std::vector<std::string> attributes = {
        "onload", "onclick", "onmouseover", "onmouseout", "onmousemove",
        "onmouseenter", "onmouseleave", "onfocus", "onblur", "onchange",
        "oninput", "onsubmit", "onkeydown", "onkeyup", "onkeypress",
        "onerror", "onabort", "onresize", "onscroll", "onbegin",
        "onend", "onrepeat",
    };
    return attributes;
}

const std::vector<std::string>& MarkupInjectionScanner::dangerousProtocols() {
    static const std::vector<std::string> protocols = {
        "javascript:", "data:text/html", "vbscript:",
    };
    return protocols;
}

bool MarkupInjectionScanner::match(const std::string& mediaType, const std::string& extension) const {
    return mediaType == mime::svg || extension == "svg" || extension == "svgz";
}

ScanResult MarkupInjectionScanner::inspect(const std::string& path, const std::string&,
                                           const ScanPolicy& policy) const {
    ScanResult result;
    std::string content;
    if (!loadContent(path, policy, content, result)) return result;

    if (content.size() >= 2 && static_cast<uint8_t>(content[0]) == 0x1f &&
        static_cast<uint8_t>(content[1]) == 0x8b) {
        std::vector<uint8_t> packed(content.begin(), content.end());
        std::vector<uint8_t> plain;
        if (!gunzipBuffer(packed, policy.maxScanBytes, plain)) {
            result.addThreat("Unable to decompress SVGZ content", eventType());
            return result;
        }
        content.assign(plain.begin(), plain.end());
        result.addNote("Decompressed SVGZ content (" + std::to_string(plain.size()) + " bytes)");
    }

    scanText(content, policy, result);
    return result;
}

void MarkupInjectionScanner::scanText(const std::string& content, const ScanPolicy& policy,
                                      ScanResult& result) const {
    if (!hasRootElement(content)) {
        result.addThreat("Not a valid SVG file", eventType());
        return;
    }
    result.mediaType = mime::svg;

    if (scanEntities(content, result)) return;

    scanTags(content, policy.markup, result);
    scanAttributes(content, policy.markup, result);
    scanProtocols(content, result);
    scanObfuscation(content, result);
}

bool MarkupInjectionScanner::hasRootElement(const std::string& content) const {
    size_t pos = find_icase(content, "<svg");
    return pos != std::string::npos && content.find('>', pos) != std::string::npos;
}

bool MarkupInjectionScanner::scanEntities(const std::string& content, ScanResult& result) const {
    bool reject = false;
    size_t pos = find_icase(content, "<!DOCTYPE");
    while (pos != std::string::npos) {
        size_t end = declarationEnd(content, pos + 9);
        std::string decl = content.substr(pos, end == std::string::npos ? std::string::npos : end - pos + 1);

        if (containsKeyword(decl, "SYSTEM")) {
            result.addThreat("External entity reference (SYSTEM) in DOCTYPE detected", EventType::EntityAttack);
            reject = true;
        }
        if (containsKeyword(decl, "PUBLIC")) {
            result.addThreat("External entity reference (PUBLIC) in DOCTYPE detected", EventType::EntityAttack);
            reject = true;
        }

        size_t entity = find_icase(decl, "<!ENTITY");
        while (entity != std::string::npos) {
            result.flags.hasEntityDeclarations = true;
            size_t p = skip_spaces(decl, entity + 8);
            if (p < decl.size() && decl[p] == '%') {
                result.addThreat("Parameter entity declaration in DOCTYPE detected", EventType::EntityAttack);
                reject = true;
            }
            entity = find_icase(decl, "<!ENTITY", entity + 8);
        }

        if (end == std::string::npos) break;
        pos = find_icase(content, "<!DOCTYPE", end + 1);
    }

    if (reject) {
        result.flags.hasEntityDeclarations = true;
        Logger::debug(name() + ": entity declarations rejected before further passes");
    } else if (result.flags.hasEntityDeclarations) {
        result.addNote("Internal entity declarations present");
    }
    return reject;
}

void MarkupInjectionScanner::scanTags(const std::string& content, const MarkupPolicy& policy,
                                      ScanResult& result) const {
    for (const auto& tag : effectiveList(builtinTags(), policy.customTags, policy.allowedTags)) {
        if (contains_tag(content, tag)) {
            result.addThreat("Dangerous tag detected: <" + tag + ">", eventType());
        }
    }
}

void MarkupInjectionScanner::scanAttributes(const std::string& content, const MarkupPolicy& policy,
                                            ScanResult& result) const {
    for (const auto& attribute : effectiveList(builtinAttributes(), policy.customAttributes,
                                               policy.allowedAttributes)) {
        if (contains_attribute(content, attribute)) {
            result.addThreat("Event handler detected: " + attribute, eventType());
        }
    }
}

void MarkupInjectionScanner::scanProtocols(const std::string& content, ScanResult& result) const {
    for (const auto& protocol : dangerousProtocols()) {
        size_t pos = find_icase(content, "href");
        while (pos != std::string::npos) {
            bool boundary = pos == 0 || !is_word_char(content[pos - 1]);
            size_t p = skip_spaces(content, pos + 4);
            if (boundary && p < content.size() && content[p] == '=') {
                p = skip_spaces(content, p + 1);
                if (p < content.size() && (content[p] == '"' || content[p] == '\'')) {
                    p = skip_spaces(content, p + 1);
                    if (match_icase_at(content, p, protocol)) {
                        result.addThreat("Dangerous protocol detected: " + protocol, eventType());
                        break;
                    }
                }
            }
            pos = find_icase(content, "href", pos + 4);
        }
    }
}

void MarkupInjectionScanner::scanObfuscation(const std::string& content, ScanResult& result) const {
    if (contains_icase(content, "data:image/svg+xml;base64,")) {
        result.addThreat("Base64 encoded SVG content detected", eventType());
    }
    if (contains_icase(content, "%6F%6E") || contains_icase(content, "%3Cscript")) {
        result.addThreat("URL encoded suspicious content detected", eventType());
    }
    if (entityObfuscation(content)) {
        result.addThreat("HTML entity obfuscation detected", eventType());
    }
    size_t cdata = content.find("<![CDATA[");
    if (cdata != std::string::npos && find_icase(content, "script", cdata) != std::string::npos) {
        result.addThreat("CDATA section with script detected", eventType());
    }
}

REGISTER_SCANNER(MarkupInjectionScanner, 20)
