#include "code_injection_scanner.hpp"
#include "scanner_registration.hpp"
#include "text_match.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <functional>

namespace {

struct CompositePattern {
    const char* id;
    const char* label;
    std::function<bool(const std::string&)> matches;
};

// OUTER ( INNER with optional whitespace around the parenthesis.
bool wrapsCall(const std::string& content, const std::string& outer, const std::string& inner) {
    size_t pos = find_icase(content, outer);
    while (pos != std::string::npos) {
        bool boundary = pos == 0 || !is_word_char(content[pos - 1]);
        size_t p = skip_spaces(content, pos + outer.size());
        if (boundary && p < content.size() && content[p] == '(') {
            p = skip_spaces(content, p + 1);
            if (match_icase_at(content, p, inner)) return true;
        }
        pos = find_icase(content, outer, pos + 1);
    }
    return false;
}

// Words separated by at least one whitespace, with word boundaries at
// both ends.
bool containsPhrase(const std::string& content, const std::vector<std::string>& words) {
    size_t pos = find_icase(content, words.front());
    while (pos != std::string::npos) {
        bool ok = pos == 0 || !is_word_char(content[pos - 1]);
        size_t p = pos + words.front().size();
        for (size_t w = 1; ok && w < words.size(); ++w) {
            size_t next = skip_spaces(content, p);
            ok = next > p && match_icase_at(content, next, words[w]);
            p = next + words[w].size();
        }
        if (ok && (p >= content.size() || !is_word_char(content[p]))) return true;
        pos = find_icase(content, words.front(), pos + 1);
    }
    return false;
}

// preg_replace( ... /pattern/e ... ) : a delimiter followed by modifiers
// containing 'e' and then a quote or the closing parenthesis.
bool pregReplaceEval(const std::string& content) {
    size_t pos = find_icase(content, "preg_replace");
    while (pos != std::string::npos) {
        size_t open = skip_spaces(content, pos + 12);
        if (open < content.size() && content[open] == '(') {
            size_t close = content.find(')', open);
            size_t end = close == std::string::npos ? content.size() : close + 1;
            for (size_t i = open + 1; i < end; ++i) {
                if (content[i] != '/') continue;
                size_t j = i + 1;
                bool hasE = false;
                while (j < end && std::isalpha(static_cast<unsigned char>(content[j]))) {
                    if (std::tolower(static_cast<unsigned char>(content[j])) == 'e') hasE = true;
                    ++j;
                }
                if (hasE && j < end && (content[j] == '"' || content[j] == '\'' || content[j] == ')')) return true;
            }
        }
        pos = find_icase(content, "preg_replace", pos + 1);
    }
    return false;
}

bool scriptLanguagePhp(const std::string& content) {
    size_t pos = find_icase(content, "<script");
    while (pos != std::string::npos) {
        size_t end = content.find('>', pos);
        if (end == std::string::npos) return false;
        std::string tag = content.substr(pos, end - pos);
        size_t lang = find_icase(tag, "language");
        if (lang != std::string::npos) {
            size_t p = skip_spaces(tag, lang + 8);
            if (p < tag.size() && tag[p] == '=') {
                p = skip_spaces(tag, p + 1);
                if (p < tag.size() && (tag[p] == '"' || tag[p] == '\'')) ++p;
                if (match_icase_at(tag, p, "php")) return true;
            }
        }
        pos = find_icase(content, "<script", end);
    }
    return false;
}

bool aspBlock(const std::string& content) {
    size_t open = content.find("<%");
    return open != std::string::npos && content.find("%>", open + 2) != std::string::npos;
}

const std::vector<CompositePattern>& compositePatterns() {
    static const std::vector<CompositePattern> patterns = {
        {"eval_base64", "eval(base64_decode(...))",
         [](const std::string& c) { return wrapsCall(c, "eval", "base64_decode"); }},
        {"eval_gzinflate", "eval(gzinflate(...))",
         [](const std::string& c) { return wrapsCall(c, "eval", "gzinflate"); }},
        {"assert_base64", "assert(base64_decode(...))",
         [](const std::string& c) { return wrapsCall(c, "assert", "base64_decode"); }},
        {"assert_gzinflate", "assert(gzinflate(...))",
         [](const std::string& c) { return wrapsCall(c, "assert", "gzinflate"); }},
        {"preg_replace_eval", "preg_replace with /e modifier", pregReplaceEval},
        {"hex_php_tag", "hex-encoded PHP tag (\\x3c\\x3f)",
         [](const std::string& c) { return contains_icase(c, "\\x3c\\x3f"); }},
        {"c99_shell", "c99 shell",
         [](const std::string& c) { return containsPhrase(c, {"c99", "shell"}); }},
        {"r57_shell", "r57 shell",
         [](const std::string& c) { return containsPhrase(c, {"r57", "shell"}); }},
        {"b374k", "b374k",
         [](const std::string& c) { return containsPhrase(c, {"b374k"}); }},
        {"wso_shell", "wso shell",
         [](const std::string& c) { return containsPhrase(c, {"wso", "shell"}); }},
        {"filesman", "FilesMan",
         [](const std::string& c) { return containsPhrase(c, {"FilesMan"}); }},
        {"safe0ver", "Safe0ver",
         [](const std::string& c) { return containsPhrase(c, {"Safe0ver"}); }},
        {"tryag", "Tryag File Manager",
         [](const std::string& c) { return containsPhrase(c, {"Tryag", "File", "Manager"}); }},
        {"angel_shell", "Angel Shell",
         [](const std::string& c) { return containsPhrase(c, {"Angel", "Shell"}); }},
    };
    return patterns;
}

bool excluded(const std::vector<std::string>& exclusions, const std::string& id) {
    return std::any_of(exclusions.begin(), exclusions.end(),
                       [&](const std::string& e) { return to_lower(e) == id; });
}

// Identifier start after a PHP tag: letter, underscore or '$'.
bool startsStatement(const std::string& content, size_t p) {
    if (p >= content.size()) return false;
    unsigned char c = static_cast<unsigned char>(content[p]);
    return std::isalpha(c) || c == '_' || c == '$';
}

} // namespace

const std::vector<std::string>& CodeInjectionScanner::builtinFunctions() {
    static const std::vector<std::string> functions = {
        // code execution
        "eval", "assert", "create_function", "call_user_func", "call_user_func_array",
        // command execution
        "exec", "shell_exec", "system", "passthru", "popen", "proc_open", "pcntl_exec",
        // file access
        "file_put_contents", "file_get_contents", "fopen", "fwrite", "fputs",
        // decoding, frequently wraps payloads
        "base64_decode", "gzinflate", "gzuncompress", "str_rot13", "convert_uudecode",
        // inclusion
        "include", "include_once", "require", "require_once",
        // variable injection
        "extract", "parse_str",
        "preg_replace", "mb_ereg_replace",
        // filesystem changes
        "move_uploaded_file", "copy", "rename", "unlink", "chmod", "chown", "chgrp",
    };
    return functions;
}

const std::vector<std::string>& CodeInjectionScanner::strictFunctions() {
    static const std::vector<std::string> functions = {
        "eval", "assert", "exec", "shell_exec", "system", "passthru", "proc_open",
    };
    return functions;
}

std::vector<std::string> CodeInjectionScanner::functionList(const CodeInjectionPolicy& policy) {
    switch (policy.mode) {
        case FunctionScanMode::Strict:
            return effectiveList(strictFunctions(), {}, policy.excludeFunctions);
        case FunctionScanMode::Custom:
            return effectiveList(policy.scanFunctions, {}, policy.excludeFunctions);
        case FunctionScanMode::Default:
            break;
    }
    return effectiveList(builtinFunctions(), policy.customFunctions, policy.excludeFunctions);
}

bool CodeInjectionScanner::match(const std::string&, const std::string&) const {
    return true;
}

ScanResult CodeInjectionScanner::inspect(const std::string& path, const std::string&,
                                         const ScanPolicy& policy) const {
    ScanResult result;
    result.mediaType = identifier.identifyFile(path, policy);
    if (FormatIdentifier::isBinaryMedia(result.mediaType)) {
        Logger::debug(name() + ": skipping binary media " + result.mediaType);
        result.addNote("Binary media type " + result.mediaType + " skipped by code scan");
        return result;
    }

    std::string content;
    if (!loadContent(path, policy, content, result)) return result;
    scanText(content, policy, result);
    return result;
}

void CodeInjectionScanner::scanText(const std::string& content, const ScanPolicy& policy,
                                    ScanResult& result) const {
    const CodeInjectionPolicy& cfg = policy.codeInjection;
    scanTags(content, cfg, result);
    scanFunctions(content, cfg, result);
    scanPatterns(content, cfg, result);
}

void CodeInjectionScanner::scanTags(const std::string& content, const CodeInjectionPolicy& cfg,
                                    ScanResult& result) const {
    bool openTag = false;
    bool echoTag = false;
    bool shortTag = false;

    size_t pos = content.find("<?");
    while (pos != std::string::npos && !(openTag && echoTag && shortTag)) {
        size_t after = pos + 2;
        if (match_icase_at(content, after, "php") && (after + 3 >= content.size() || is_space(content[after + 3]))) {
            openTag = true;
        } else if (after < content.size() && content[after] == '=') {
            size_t p = skip_spaces(content, after + 1);
            if (startsStatement(content, p)) echoTag = true;
        } else if (!(match_icase_at(content, after, "xml") && after + 3 < content.size() &&
                     (is_space(content[after + 3]) || content[after + 3] == '?'))) {
            size_t p = skip_spaces(content, after);
            if (p > after && startsStatement(content, p)) shortTag = true;
        }
        pos = content.find("<?", pos + 2);
    }

    if (openTag) result.addThreat("PHP opening tag (<?php) detected", eventType());
    if (echoTag) result.addThreat("PHP short echo tag (<?=) detected", eventType());
    if (shortTag) result.addThreat("PHP short tag (<?) detected", eventType());

    if (!excluded(cfg.excludePatterns, "script_language_php") && scriptLanguagePhp(content)) {
        result.addThreat("PHP script tag (<script language=\"php\">) detected", eventType());
    }
    if (!excluded(cfg.excludePatterns, "asp_tags") && aspBlock(content)) {
        result.addThreat("ASP/JSP code block (<% %>) detected", eventType());
    }
}

void CodeInjectionScanner::scanFunctions(const std::string& content, const CodeInjectionPolicy& cfg,
                                         ScanResult& result) const {
    for (const auto& fn : functionList(cfg)) {
        if (contains_call(content, fn)) {
            result.addThreat("Dangerous function detected: " + fn + "()", eventType());
        }
    }
}

void CodeInjectionScanner::scanPatterns(const std::string& content, const CodeInjectionPolicy& cfg,
                                        ScanResult& result) const {
    for (const auto& pattern : compositePatterns()) {
        if (excluded(cfg.excludePatterns, pattern.id)) continue;
        if (pattern.matches(content)) {
            result.addThreat(std::string("Suspicious code pattern detected: ") + pattern.label, eventType());
        }
    }
    for (const auto& fragment : cfg.customPatterns) {
        if (excluded(cfg.excludePatterns, to_lower(fragment))) continue;
        if (!fragment.empty() && contains_icase(content, fragment)) {
            result.addThreat("Suspicious code pattern detected: " + fragment, eventType());
        }
    }
}

REGISTER_SCANNER(CodeInjectionScanner, 10)
