#include "pdf_parser.hpp"
#include "text_match.hpp"
#include <cctype>
#include <cstdlib>

bool isPdfHeader(const std::string& content) {
    return content.compare(0, 5, "%PDF-") == 0;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool readPdfString(const std::string& content, size_t pos, std::string& out, size_t maxLength) {
    out.clear();
    if (pos >= content.size()) return false;

    if (content[pos] == '(') {
        int depth = 1;
        for (size_t i = pos + 1; i < content.size() && out.size() < maxLength; ++i) {
            char c = content[i];
            if (c == '\\' && i + 1 < content.size()) {
                char n = content[++i];
                switch (n) {
                    case 'n': out += '\n'; break;
                    case 'r': out += '\r'; break;
                    case 't': out += '\t'; break;
                    case 'b': out += '\b'; break;
                    case 'f': out += '\f'; break;
                    default:
                        if (n >= '0' && n <= '7') {
                            int value = n - '0';
                            for (int k = 0; k < 2 && i + 1 < content.size() &&
                                            content[i + 1] >= '0' && content[i + 1] <= '7'; ++k) {
                                value = value * 8 + (content[++i] - '0');
                            }
                            out += static_cast<char>(value);
                        } else {
                            out += n;
                        }
                }
                continue;
            }
            if (c == '(') ++depth;
            if (c == ')' && --depth == 0) return true;
            out += c;
        }
        return true;
    }

    if (content[pos] == '<' && (pos + 1 >= content.size() || content[pos + 1] != '<')) {
        int high = -1;
        for (size_t i = pos + 1; i < content.size() && out.size() < maxLength; ++i) {
            char c = content[i];
            if (c == '>') break;
            int v = hexValue(c);
            if (v < 0) continue;
            if (high < 0) {
                high = v;
            } else {
                out += static_cast<char>(high * 16 + v);
                high = -1;
            }
        }
        if (high >= 0) out += static_cast<char>(high * 16);
        return true;
    }
    return false;
}

// UTF-16BE strings (with BOM) reduced to their ASCII subset.
static std::string plainText(const std::string& raw) {
    if (raw.size() >= 2 && static_cast<unsigned char>(raw[0]) == 0xFE &&
        static_cast<unsigned char>(raw[1]) == 0xFF) {
        std::string s;
        for (size_t i = 2; i + 1 < raw.size(); i += 2) {
            if (raw[i] == 0 && raw[i + 1] != 0) s += raw[i + 1];
        }
        return s;
    }
    return raw;
}

size_t countPdfPages(const std::string& content) {
    // /Type /Page objects, excluding the /Pages tree nodes
    size_t count = 0;
    size_t pos = content.find("/Type");
    while (pos != std::string::npos) {
        size_t p = skip_spaces(content, pos + 5);
        if (content.compare(p, 5, "/Page") == 0) {
            size_t after = p + 5;
            if (after >= content.size() || !(std::isalnum(static_cast<unsigned char>(content[after])))) {
                ++count;
            }
        }
        pos = content.find("/Type", pos + 5);
    }
    if (count > 0) return count;

    size_t best = 0;
    pos = content.find("/Count");
    while (pos != std::string::npos) {
        size_t p = skip_spaces(content, pos + 6);
        if (p < content.size() && std::isdigit(static_cast<unsigned char>(content[p]))) {
            size_t n = std::strtoul(content.c_str() + p, nullptr, 10);
            if (n > best) best = n;
        }
        pos = content.find("/Count", pos + 6);
    }
    return best;
}

PdfInfo parsePdf(const std::string& content) {
    PdfInfo info;
    if (!isPdfHeader(content)) return info;
    info.valid = true;

    size_t end = 5;
    while (end < content.size() && end < 16 &&
           (std::isdigit(static_cast<unsigned char>(content[end])) || content[end] == '.')) {
        ++end;
    }
    info.version = content.substr(5, end - 5);

    for (const char* key : {"Title", "Author", "Creator", "Producer"}) {
        const std::string token = std::string("/") + key;
        size_t pos = content.find(token);
        while (pos != std::string::npos) {
            size_t p = skip_spaces(content, pos + token.size());
            std::string value;
            if (readPdfString(content, p, value, 1024)) {
                info.fields.emplace_back(key, plainText(value));
                break;
            }
            pos = content.find(token, pos + token.size());
        }
    }

    info.pageCount = countPdfPages(content);
    return info;
}
