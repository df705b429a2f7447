#include "scanresult.hpp"
#include <algorithm>

void ScanResult::addThreat(const std::string& message, EventType event) {
    auto it = std::find_if(threats.begin(), threats.end(),
                           [&](const Finding& f) { return f.message == message; });
    if (it == threats.end()) {
        threats.push_back({message, event});
    }
}

void ScanResult::addNote(const std::string& note) {
    if (std::find(notes.begin(), notes.end(), note) == notes.end()) {
        notes.push_back(note);
    }
}

void ScanResult::setMeta(const std::string& key, const std::string& value) {
    for (auto& kv : metadata) {
        if (kv.first == key) {
            kv.second = value;
            return;
        }
    }
    metadata.emplace_back(key, value);
}

std::string ScanResult::meta(const std::string& key) const {
    for (const auto& kv : metadata) {
        if (kv.first == key) return kv.second;
    }
    return "";
}

void ScanResult::merge(const ScanResult& child) {
    for (const auto& f : child.threats) {
        addThreat(f.message, f.event);
    }
    for (const auto& n : child.notes) {
        addNote(n);
    }
    flags.hasJavascript |= child.flags.hasJavascript;
    flags.hasExternalLinks |= child.flags.hasExternalLinks;
    flags.hasGps |= child.flags.hasGps;
    flags.hasMacros |= child.flags.hasMacros;
    flags.hasActiveX |= child.flags.hasActiveX;
    flags.hasEntityDeclarations |= child.flags.hasEntityDeclarations;
    flags.filesCount += child.flags.filesCount;
    flags.uncompressedSize += child.flags.uncompressedSize;
    children.push_back(child);
}

bool ScanResult::hasThreat(const std::string& fragment) const {
    return std::any_of(threats.begin(), threats.end(),
                       [&](const Finding& f) { return f.message.find(fragment) != std::string::npos; });
}

std::vector<std::string> ScanResult::threatMessages() const {
    std::vector<std::string> out;
    out.reserve(threats.size());
    for (const auto& f : threats) out.push_back(f.message);
    return out;
}

ScanResult unsafeResult(const std::string& scanner, const std::string& message, EventType event) {
    ScanResult result;
    result.scanner = scanner;
    result.addThreat(message, event);
    return result;
}
