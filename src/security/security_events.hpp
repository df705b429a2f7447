#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class EventType {
    MimeMismatch,
    DangerousFile,
    CodeInjection,
    MarkupInjection,
    MetadataThreat,
    DocumentThreat,
    GpsDetected,
    EntityAttack,
    ArchiveThreat,
    MacroDetected,
    SymlinkDetected,
    DecompressionBomb
};

enum class Severity {
    Low,
    Medium,
    High,
    Critical
};

std::string eventName(EventType type);
std::string severityName(Severity severity);
Severity severityFor(EventType type);

struct FileSummary {
    std::string path;
    std::string declaredName;
    std::string mediaType;
    uint64_t size = 0;
};

struct SecurityEvent {
    EventType type;
    Severity severity;
    std::string message;
    FileSummary file;
    std::vector<std::string> threats;
};

// Receives one event per finding from ScanEngine. Implementations own
// formatting and persistence.
class SecurityEventSink {
public:
    virtual ~SecurityEventSink() = default;
    virtual void record(const SecurityEvent& event) = 0;
};

class LoggerEventSink : public SecurityEventSink {
public:
    void record(const SecurityEvent& event) override;
};
