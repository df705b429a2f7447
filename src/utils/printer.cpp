#include <iostream>
#include "printer.hpp"
#include "security_events.hpp"
#include "logger.hpp"
#include "cJSON.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

cJSON* buildJson(const ScanResult& r) {
    cJSON* item = cJSON_CreateObject();
    if (!r.scanner.empty()) cJSON_AddStringToObject(item, "scanner", r.scanner.c_str());
    cJSON_AddBoolToObject(item, "safe", r.safe());
    cJSON_AddStringToObject(item, "media_type", r.mediaType.c_str());

    cJSON* threats = cJSON_CreateArray();
    for (const auto& f : r.threats) {
        cJSON* threat = cJSON_CreateObject();
        cJSON_AddStringToObject(threat, "message", f.message.c_str());
        cJSON_AddStringToObject(threat, "event", eventName(f.event).c_str());
        cJSON_AddStringToObject(threat, "severity", severityName(severityFor(f.event)).c_str());
        cJSON_AddItemToArray(threats, threat);
    }
    cJSON_AddItemToObject(item, "threats", threats);

    if (!r.notes.empty()) {
        cJSON* notes = cJSON_CreateArray();
        for (const auto& n : r.notes) {
            cJSON_AddItemToArray(notes, cJSON_CreateString(n.c_str()));
        }
        cJSON_AddItemToObject(item, "notes", notes);
    }

    cJSON* flags = cJSON_CreateObject();
    cJSON_AddBoolToObject(flags, "has_javascript", r.flags.hasJavascript);
    cJSON_AddBoolToObject(flags, "has_external_links", r.flags.hasExternalLinks);
    cJSON_AddBoolToObject(flags, "has_gps", r.flags.hasGps);
    cJSON_AddBoolToObject(flags, "has_macros", r.flags.hasMacros);
    cJSON_AddBoolToObject(flags, "has_activex", r.flags.hasActiveX);
    cJSON_AddBoolToObject(flags, "has_entity_declarations", r.flags.hasEntityDeclarations);
    cJSON_AddNumberToObject(flags, "files_count", static_cast<double>(r.flags.filesCount));
    cJSON_AddNumberToObject(flags, "uncompressed_size", static_cast<double>(r.flags.uncompressedSize));
    cJSON_AddItemToObject(item, "flags", flags);

    if (!r.metadata.empty()) {
        cJSON* meta = cJSON_CreateObject();
        for (const auto& kv : r.metadata) {
            cJSON_AddStringToObject(meta, kv.first.c_str(), kv.second.c_str());
        }
        cJSON_AddItemToObject(item, "metadata", meta);
    }

    if (!r.children.empty()) {
        cJSON* childArray = cJSON_CreateArray();
        for (const auto& child : r.children) {
            cJSON_AddItemToArray(childArray, buildJson(child));
        }
        cJSON_AddItemToObject(item, "children", childArray);
    }

    return item;
}

std::string toJson(const ScanResult& result) {
    cJSON* root = buildJson(result);
    char* jsonStr = cJSON_Print(root);
    std::string out = jsonStr ? jsonStr : "";
    cJSON_Delete(root);
    free(jsonStr);
    return out;
}

bool dumpJson(const ScanResult& result, const std::string& filename) {
    std::ofstream outFile(filename, std::ios::binary);
    if (!outFile.is_open()) {
        Logger::error("Cannot open " + filename + " for writing");
        return false;
    }
    const std::string json = toJson(result);
    outFile.write(json.data(), static_cast<std::streamsize>(json.size()));
    return static_cast<bool>(outFile);
}

// ANSI color codes
namespace ansi {
    const std::string reset   = "\033[0m";
    const std::string bold    = "\033[1m";
    const std::string red     = "\033[31m";
    const std::string cyan    = "\033[36m";
    const std::string yellow  = "\033[33m";
    const std::string green   = "\033[32m";
    const std::string magenta = "\033[35m";
    const std::string gray    = "\033[90m";
}

// Wrap long text into multiple lines with indentation
static std::vector<std::string> wrapText(const std::string& text, size_t width) {
    std::vector<std::string> lines;
    std::istringstream words(text);
    std::string word, line;
    while (words >> word) {
        if (!line.empty() && line.size() + word.size() + 1 > width) {
            lines.push_back(line);
            line.clear();
        }
        if (!line.empty()) line += " ";
        line += word;
    }
    if (!line.empty()) lines.push_back(line);
    return lines;
}

static void printWrapped(const std::string& prefix, const std::string& color, const std::string& label,
                         const std::string& text) {
    auto lines = wrapText(text, 70);
    if (lines.empty()) return;
    std::string pad(label.size(), ' ');
    std::cout << prefix << color << label << lines[0] << ansi::reset << "\n";
    for (size_t i = 1; i < lines.size(); ++i) {
        std::cout << prefix << color << pad << lines[i] << ansi::reset << "\n";
    }
}

static void printNode(const ScanResult& sr, bool verbose, const std::string& prefix, bool last) {
    std::ostringstream oss;
    oss << ansi::bold << ansi::yellow << (sr.scanner.empty() ? "?" : sr.scanner) << ansi::reset << " "
        << (sr.safe() ? ansi::green + "[safe]" : ansi::red + "[unsafe]") << ansi::reset;
    if (!sr.mediaType.empty()) oss << " " << ansi::cyan << sr.mediaType << ansi::reset;

    std::cout << prefix << (last ? "└── " : "├── ") << oss.str() << "\n";
    std::string childPrefix = prefix + (last ? "    " : "│   ");

    for (const auto& f : sr.threats) {
        printWrapped(childPrefix, ansi::red, "! ", f.message + " [" + eventName(f.event) + "]");
    }
    if (verbose) {
        for (const auto& n : sr.notes) {
            printWrapped(childPrefix, ansi::gray, "- ", n);
        }
        for (const auto& kv : sr.metadata) {
            printWrapped(childPrefix, ansi::magenta, kv.first + ": ", kv.second);
        }
    }

    for (size_t i = 0; i < sr.children.size(); ++i) {
        printNode(sr.children[i], verbose, childPrefix, i == sr.children.size() - 1);
    }
}

void printScanResult(const ScanResult& result, const std::string& inputFile, bool verbose) {
    std::cout << "* " << inputFile << std::endl;
    printNode(result, verbose, "", true);
}
