#include "engine.hpp"
#include "metadata_stripper.hpp"
#include "utils/policy_loader.hpp"
#include "utils/printer.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "logger.hpp"
#include <chrono>

namespace {

constexpr int EXIT_SAFE = 0;
constexpr int EXIT_UNSAFE = 1;
constexpr int EXIT_ERROR = 2;

struct Config {
    std::string policyFile;
    std::string declaredName;
    std::string jsonFile;
    std::string stripOutput;
    std::vector<std::string> roots;
    bool noSymlinkCheck = false;
    bool verbose = false;
    bool help = false;
    std::string inputFile;
};

class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::vector<std::string>> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical) {
        optionDefs[name] = {takesValue, canonical};
    }

    void parse(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (optionDefs.count(arg)) {
                const auto& info = optionDefs[arg];

                if (info.takesValue) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Missing value for option: " + arg);
                    }
                    parsedOptions[info.canonicalName].push_back(argv[++i]);
                } else {
                    parsedOptions[info.canonicalName].push_back("true");
                }
            } else if (arg.size() > 1 && arg[0] == '-') {
                throw std::runtime_error("Unknown option: " + arg);
            } else {
                positional.push_back(arg);
            }
        }
    }

    bool has(const std::string& canonical) const {
        return parsedOptions.count(canonical);
    }

    // Last occurrence wins.
    std::string get(const std::string& canonical, const std::string& def = "") const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second.back() : def;
    }

    std::vector<std::string> all(const std::string& canonical) const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second : std::vector<std::string>{};
    }
};

void printUsage() {
    std::cout << "Usage: contentguard [options] <input_file>\n"
              << "  -p FILE    JSON scan policy\n"
              << "  -n NAME    Declared (client supplied) file name\n"
              << "  -O FILE    Write the JSON report to FILE\n"
              << "  -s FILE    Write a metadata-stripped copy of a safe image to FILE\n"
              << "  -r DIR     Allowed root directory (repeatable)\n"
              << "  --no-symlink-check  Accept symbolic links\n"
              << "  -d         Enable Debug mode\n"
              << "  -v         Verbose output\n"
              << "  -h         Show this help message\n"
              << "Exit status: 0 safe, 1 unsafe, 2 error\n";
}

Config parseArgs(int argc, char* argv[]) {
    Config config;
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-v", false, "verbose");
    args.addOption("--verbose", false, "verbose");

    args.addOption("-p", true, "policy");
    args.addOption("--policy", true, "policy");

    args.addOption("-n", true, "name");
    args.addOption("--name", true, "name");

    args.addOption("-O", true, "jsonPath");
    args.addOption("--jsonPath", true, "jsonPath");

    args.addOption("-s", true, "strip");
    args.addOption("--strip", true, "strip");

    args.addOption("-r", true, "root");
    args.addOption("--root", true, "root");

    args.addOption("--no-symlink-check", false, "noSymlinkCheck");

    args.parse(argc, argv);

    if (args.has("debug")) {
        Logger::info("Enabling Debug Mode");
        Logger::setLevel(LogLevel::DEBUG);
    }

    config.verbose = args.has("verbose");
    config.noSymlinkCheck = args.has("noSymlinkCheck");
    config.policyFile = args.get("policy");
    config.declaredName = args.get("name");
    config.jsonFile = args.get("jsonPath");
    config.stripOutput = args.get("strip");
    config.roots = args.all("root");

    if (args.has("help")) {
        config.help = true;
        return config;
    }
    if (args.positional.empty()) {
        throw std::runtime_error("No input file given");
    }
    config.inputFile = args.positional.back();
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::INFO);
    Logger::info("contentguard v0.1");

    Config config;
    ScanPolicy policy;
    try {
        config = parseArgs(argc, argv);
        if (config.help) {
            printUsage();
            return EXIT_SAFE;
        }
        if (!config.policyFile.empty()) loadPolicyFile(config.policyFile, policy);
    } catch (const PolicyError& e) {
        Logger::error(e.what());
        return EXIT_ERROR;
    } catch (const std::runtime_error& e) {
        Logger::error(e.what());
        printUsage();
        return EXIT_ERROR;
    }

    if (!config.roots.empty()) policy.access.allowedRoots = config.roots;
    if (config.noSymlinkCheck) policy.access.checkSymlinks = false;

    ScanEngine engine;
    LoggerEventSink sink;
    Logger::info("Scanning " + config.inputFile + "...");

    auto start = std::chrono::high_resolution_clock::now();
    ScanResult result = engine.scanFile(config.inputFile, config.declaredName, policy, &sink);
    printScanResult(result, config.inputFile, config.verbose);

    int status = result.safe() ? EXIT_SAFE : EXIT_UNSAFE;
    if (!config.jsonFile.empty() && !dumpJson(result, config.jsonFile)) status = EXIT_ERROR;

    if (!config.stripOutput.empty() || policy.metadata.stripMetadata) {
        if (!result.safe()) {
            Logger::warn("Skipping metadata stripping of an unsafe file");
        } else if (config.stripOutput.empty()) {
            Logger::warn("Metadata stripping enabled by policy but no output file given (-s)");
        } else {
            std::string error;
            if (stripMetadataFile(engine.accessValidator(), config.inputFile, config.stripOutput, policy, error)) {
                Logger::info("Stripped copy written to " + config.stripOutput);
            } else {
                Logger::error("Metadata stripping failed: " + error);
                status = EXIT_ERROR;
            }
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    Logger::info("Total elapsed time: " + std::to_string(elapsed) + "ms");

    return status;
}
