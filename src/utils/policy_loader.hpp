#pragma once
#include <stdexcept>
#include <string>
#include "scan_policy.hpp"

class PolicyError : public std::runtime_error {
public:
    explicit PolicyError(const std::string& message) : std::runtime_error(message) {}
};

// Overlays a JSON policy document on `policy`. Keys that are absent keep
// their current value; unknown keys are logged and ignored. Throws
// PolicyError on unreadable files, malformed JSON or mistyped values.
void loadPolicyFile(const std::string& path, ScanPolicy& policy);
void loadPolicyJson(const std::string& text, ScanPolicy& policy);
