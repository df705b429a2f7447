#include "access_validator.hpp"
#include "logger.hpp"
#include <system_error>

static AccessDecision deny(AccessFault fault, const std::string& reason) {
    AccessDecision d;
    d.allowed = false;
    d.fault = fault;
    d.reason = reason;
    return d;
}

std::vector<fs::path> AccessValidator::allowedRoots(const ScanPolicy& policy) const {
    std::vector<std::string> configured = policy.access.allowedRoots;
    if (configured.empty()) {
        std::error_code ec;
        fs::path tmp = fs::temp_directory_path(ec);
        if (!ec) configured.push_back(tmp.string());
        if (!policy.access.storageRoot.empty()) configured.push_back(policy.access.storageRoot);
    }

    std::vector<fs::path> roots;
    for (const auto& root : configured) {
        std::error_code ec;
        fs::path canonical = fs::canonical(root, ec);
        if (ec) {
            Logger::debug("AccessValidator: skipping unresolvable root " + root);
            continue;
        }
        roots.push_back(canonical);
    }
    return roots;
}

bool AccessValidator::isWithin(const fs::path& candidate, const fs::path& root) {
    auto c = candidate.begin();
    for (auto r = root.begin(); r != root.end(); ++r, ++c) {
        // a trailing separator on the root shows up as an empty component
        if (r->empty()) continue;
        if (c == candidate.end() || *c != *r) return false;
    }
    return true;
}

AccessDecision AccessValidator::validate(const std::string& path, const ScanPolicy& policy) const {
    if (path.find('\0') != std::string::npos) {
        return deny(AccessFault::NullByte, "Invalid path: null byte detected");
    }

    std::error_code ec;
    if (policy.access.checkSymlinks) {
        fs::file_status st = fs::symlink_status(path, ec);
        if (!ec && fs::is_symlink(st)) {
            return deny(AccessFault::Symlink, "Symbolic link detected");
        }
    }

    fs::path canonical = fs::canonical(path, ec);
    if (ec) {
        return deny(AccessFault::Unresolved, "Unable to resolve file path");
    }

    std::vector<fs::path> roots = allowedRoots(policy);
    if (roots.empty()) {
        Logger::warn("AccessValidator: no allowed roots configured; path allow-list disabled");
        AccessDecision d;
        d.allowed = true;
        return d;
    }

    for (const auto& root : roots) {
        if (isWithin(canonical, root)) {
            AccessDecision d;
            d.allowed = true;
            return d;
        }
    }
    return deny(AccessFault::OutsideRoots, "File path outside allowed directories");
}
