#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "scan_policy.hpp"
#include "security_events.hpp"

namespace fs = std::filesystem;

enum class AccessFault {
    None,
    NullByte,
    Symlink,
    Unresolved,
    OutsideRoots
};

struct AccessDecision {
    bool allowed = false;
    std::optional<std::string> reason;
    AccessFault fault = AccessFault::None;

    EventType event() const {
        return fault == AccessFault::Symlink ? EventType::SymlinkDetected : EventType::DangerousFile;
    }
};

// Decides whether a path may be opened: no embedded NUL, not a symbolic
// link, and the canonical path lies inside one of the allowed roots.
class AccessValidator {
public:
    AccessDecision validate(const std::string& path, const ScanPolicy& policy) const;

    // Canonical roots the policy resolves to. Unresolvable roots are dropped.
    std::vector<fs::path> allowedRoots(const ScanPolicy& policy) const;

    static bool isWithin(const fs::path& candidate, const fs::path& root);
};
