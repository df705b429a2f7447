#include "scan_policy.hpp"
#include <algorithm>

std::vector<std::string> defaultDangerousTypes() {
    return {
        // executables
        "application/x-msdownload",
        "application/x-msdos-program",
        "application/x-executable",
        "application/x-elf",
        "application/x-sharedlib",
        "application/x-mach-binary",
        "application/x-dosexec",
        // scripts
        "application/x-php",
        "text/x-php",
        "application/x-httpd-php",
        "application/x-httpd-php-source",
        "text/x-shellscript",
        "application/x-sh",
        "application/x-csh",
        "application/x-perl",
        "text/x-perl",
        "application/x-python",
        "text/x-python",
        "application/x-ruby",
        "text/x-ruby",
        "text/x-jsp",
        "application/javascript",
        "text/javascript",
        "application/x-javascript",
        // other
        "application/x-bat",
        "application/x-msi",
        "application/java-archive",
        "application/java-vm",
    };
}

std::vector<std::string> defaultBlockedExtensions() {
    return {
        "php", "phtml", "php3", "php4", "php5", "php7", "phps", "phar",
        "exe", "com", "bat", "cmd", "ps1", "vbs", "vbe", "js", "jse",
        "wsf", "wsh", "msc", "scr", "pif", "hta", "cpl",
        "sh", "bash", "zsh", "csh", "ksh",
        "jar", "war", "ear",
        "dll", "so", "dylib",
        "asp", "aspx", "jsp", "jspx", "cfm",
    };
}

std::vector<std::string> defaultArchiveExtensions() {
    return {
        "zip", "tar", "gz", "tgz", "tar.gz", "bz2", "tbz2", "tar.bz2",
        "xz", "txz", "tar.xz", "7z", "rar", "cab", "iso",
    };
}

std::vector<std::string> defaultNonMacroExtensions() {
    return {"docx", "xlsx", "pptx", "dotx", "xltx", "potx"};
}

std::vector<std::string> defaultMetadataFields() {
    return {
        "Comment", "UserComment", "ImageDescription", "Artist", "Copyright",
        "Software", "ProcessingSoftware", "DocumentName", "HostComputer",
        "XPComment", "XPAuthor", "XPTitle", "XPSubject",
        "Author", "Description", "Title",
    };
}

std::vector<std::string> effectiveList(const std::vector<std::string>& builtin,
                                       const std::vector<std::string>& additions,
                                       const std::vector<std::string>& exclusions) {
    auto containsName = [](const std::vector<std::string>& list, const std::string& name) {
        const std::string key = to_lower(name);
        return std::any_of(list.begin(), list.end(),
                           [&](const std::string& s) { return to_lower(s) == key; });
    };

    std::vector<std::string> result;
    for (const auto* source : {&builtin, &additions}) {
        for (const auto& name : *source) {
            if (name.empty() || containsName(result, name) || containsName(exclusions, name)) continue;
            result.push_back(name);
        }
    }
    return result;
}
