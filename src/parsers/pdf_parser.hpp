#pragma once
#include <string>
#include <utility>
#include <vector>

struct PdfInfo {
    bool valid = false;
    std::string version;
    std::vector<std::pair<std::string, std::string>> fields;  // Title, Author, Creator, Producer
    size_t pageCount = 0;
};

bool isPdfHeader(const std::string& content);

// Header version, document information strings and page count, read from
// the raw bytes without building an object model.
PdfInfo parsePdf(const std::string& content);

// Decoded literal "(...)" or hex "<...>" string starting at pos.
bool readPdfString(const std::string& content, size_t pos, std::string& out, size_t maxLength = 4096);

size_t countPdfPages(const std::string& content);
