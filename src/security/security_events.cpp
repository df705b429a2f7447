#include "security_events.hpp"
#include "logger.hpp"
#include <sstream>

std::string eventName(EventType type) {
    switch (type) {
        case EventType::MimeMismatch:      return "mime-mismatch";
        case EventType::DangerousFile:     return "dangerous-file";
        case EventType::CodeInjection:     return "code-injection";
        case EventType::MarkupInjection:   return "markup-injection";
        case EventType::MetadataThreat:    return "metadata-threat";
        case EventType::DocumentThreat:    return "document-threat";
        case EventType::GpsDetected:       return "gps-detected";
        case EventType::EntityAttack:      return "entity-attack";
        case EventType::ArchiveThreat:     return "archive-threat";
        case EventType::MacroDetected:     return "macro-detected";
        case EventType::SymlinkDetected:   return "symlink-detected";
        case EventType::DecompressionBomb: return "decompression-bomb";
    }
    return "unknown";
}

std::string severityName(Severity severity) {
    switch (severity) {
        case Severity::Low:      return "low";
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

Severity severityFor(EventType type) {
    switch (type) {
        case EventType::GpsDetected:
            return Severity::Low;
        case EventType::MimeMismatch:
            return Severity::Medium;
        case EventType::DangerousFile:
        case EventType::MarkupInjection:
        case EventType::MetadataThreat:
        case EventType::DocumentThreat:
        case EventType::ArchiveThreat:
        case EventType::MacroDetected:
            return Severity::High;
        case EventType::CodeInjection:
        case EventType::EntityAttack:
        case EventType::SymlinkDetected:
        case EventType::DecompressionBomb:
            return Severity::Critical;
    }
    return Severity::High;
}

void LoggerEventSink::record(const SecurityEvent& event) {
    std::ostringstream line;
    line << "[" << eventName(event.type) << "/" << severityName(event.severity) << "] "
         << event.message << " (file=" << event.file.path;
    if (!event.file.declaredName.empty()) {
        line << ", name=" << event.file.declaredName;
    }
    line << ", type=" << event.file.mediaType << ", size=" << event.file.size << ")";

    switch (event.severity) {
        case Severity::Low:
            Logger::info(line.str());
            break;
        case Severity::Medium:
            Logger::warn(line.str());
            break;
        case Severity::High:
        case Severity::Critical:
            Logger::error(line.str());
            break;
    }
}
