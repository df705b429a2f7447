// scanner_registry.hpp
#pragma once
#include "base_scanner.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <vector>

class ScannerRegistry {
public:
    using Creator = std::function<std::unique_ptr<BaseScanner>(const AccessValidator&, const FormatIdentifier&)>;

    static ScannerRegistry& instance() {
        static ScannerRegistry registry;
        return registry;
    }

    // Lower order runs first; static initialisation order across
    // translation units is unspecified.
    void registerScanner(int order, Creator creator) {
        creators.push_back({order, std::move(creator)});
        std::stable_sort(creators.begin(), creators.end(),
                         [](const Entry& a, const Entry& b) { return a.order < b.order; });
    }

    std::vector<std::unique_ptr<BaseScanner>> createAll(const AccessValidator& access,
                                                        const FormatIdentifier& identifier) const {
        std::vector<std::unique_ptr<BaseScanner>> result;
        for (const auto& entry : creators) {
            result.push_back(entry.creator(access, identifier));
        }
        return result;
    }

private:
    struct Entry {
        int order;
        Creator creator;
    };
    std::vector<Entry> creators;
};
