#include "sevenzip_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace {

bool read_line(FILE* pipe, std::string& line) {
    line.clear();
    char buf[4096];
    while (std::fgets(buf, sizeof(buf), pipe)) {
        line += buf;
        if (!line.empty() && line.back() == '\n') break;
    }
    if (line.empty()) return false;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    return true;
}

} // namespace

std::string SevenZipReader::shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

bool SevenZipReader::available(const std::string& command) {
    if (command.empty()) return false;
    if (command.find('/') != std::string::npos) {
        return access(command.c_str(), X_OK) == 0;
    }
    const char* env = std::getenv("PATH");
    if (!env) return false;

    std::stringstream dirs(env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + command;
        if (access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

bool SevenZipReader::forEach(const EntryVisitor& visit, std::string& error) {
    const std::string cmd = shellQuote(command) + " l -slt -- " + shellQuote(path) + " 2>/dev/null";
    Logger::debug("Running: " + cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        error = format + " listing failed: unable to start " + command;
        return false;
    }

    // Entries are "Key = Value" blocks after the "----------" separator.
    // Payloads are never requested from the backend.
    EntryLoader noPayload = [](uint64_t, std::vector<uint8_t>&) { return false; };

    bool inEntries = false;
    bool stopped = false;
    bool havePath = false;
    ArchiveEntry entry;
    std::string line;

    auto flush = [&]() {
        if (havePath && !stopped && !visit(entry, noPayload)) stopped = true;
        entry = ArchiveEntry{};
        havePath = false;
    };

    while (!stopped && read_line(pipe, line)) {
        if (!inEntries) {
            inEntries = line == "----------";
            continue;
        }
        if (line.empty()) {
            flush();
            continue;
        }
        size_t eq = line.find(" = ");
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 3);

        if (key == "Path") {
            if (havePath) flush();
            entry.name = value;
            havePath = true;
        } else if (key == "Size") {
            entry.uncompressedSize = std::strtoull(value.c_str(), nullptr, 10);
        } else if (key == "Packed Size") {
            entry.compressedSize = std::strtoull(value.c_str(), nullptr, 10);
        } else if (key == "Folder") {
            entry.isDirectory = value == "+";
        } else if (key == "Attributes") {
            if (!value.empty() && value[0] == 'D') entry.isDirectory = true;
        } else if (key == "Symbolic Link") {
            entry.isLink = !value.empty();
            entry.linkTarget = value;
        }
    }
    flush();

    int status = pclose(pipe);
    if (stopped) return true;
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        error = format + " listing failed with code " + std::to_string(code) +
                ", please check that the 7z executable is installed and available on PATH";
        return false;
    }
    if (!inEntries) {
        Logger::debug(format + ": listing contained no entries");
    }
    return true;
}
