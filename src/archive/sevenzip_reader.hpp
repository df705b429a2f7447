#pragma once
#include <string>
#include "archive_reader.hpp"

// RAR, 7z and bzip2 listings through the external 7z executable
// (`7z l -slt`). Entries carry sizes only; payloads are never extracted.
class SevenZipReader : public ArchiveReader {
public:
    SevenZipReader(const std::string& path, const std::string& command, const std::string& format)
        : path(path), command(command), format(format) {}

    std::string name() const override { return format; }
    bool forEach(const EntryVisitor& visit, std::string& error) override;

    // Whether command resolves to an executable, directly or through PATH.
    static bool available(const std::string& command);

    static std::string shellQuote(const std::string& arg);

private:
    std::string path;
    std::string command;
    std::string format;
};
