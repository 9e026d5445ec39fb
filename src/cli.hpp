#pragma once
#include "validationresult.hpp"
#include "utils/printer.hpp"
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

class Logger;
class Validator;
struct AppConfig;

enum ExitCode {
    EXIT_OK = 0,
    EXIT_INVALID = 1,
    EXIT_FILE_ERROR = 2,
    EXIT_UNKNOWN_TYPE = 3,
    EXIT_ERROR = 4,
    EXIT_USAGE = 64
};

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
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
        std::vector<std::string> words;
        for (int i = 1; i < argc; ++i)
            words.push_back(argv[i]);
        parse(words);
    }

    // words excludes the program name
    void parse(const std::vector<std::string>& words) {
        for (size_t i = 0; i < words.size(); ++i) {
            const std::string& arg = words[i];

            // Is this a known option?
            if (optionDefs.count(arg)) {
                const auto& info = optionDefs[arg];

                if (info.takesValue) {
                    if (i + 1 >= words.size()) {
                        throw UsageError("Missing value for option: " + arg);
                    }
                    parsedOptions[info.canonicalName].push_back(words[++i]);
                } else {
                    parsedOptions[info.canonicalName].push_back("true");
                }
            }
            else if (arg.size() > 1 && arg[0] == '-') {
                throw UsageError("Unknown option: " + arg);
            }
            else {
                // Not an option → positional argument
                positional.push_back(arg);
            }
        }
    }

    bool has(const std::string& canonical) const {
        return parsedOptions.count(canonical);
    }

    std::string get(const std::string& canonical, const std::string& def = "") const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second.back() : def;
    }

    std::vector<std::string> getAll(const std::string& canonical) const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second : std::vector<std::string>();
    }
};

ArgParser buildParser();
void printUsage(std::ostream& out = std::cout);

int exitCodeFor(const ValidationOutcome& outcome);

// Regular files under dir, sorted. Directories that cannot be listed are
// logged and counted in summary.errors instead of aborting the walk.
std::vector<std::filesystem::path> collectFiles(const std::filesystem::path& dir,
                                                bool recursive,
                                                const std::set<std::string>& extensions,
                                                ScanSummary& summary,
                                                Logger& logger);

// Unknown extensions count as invalid, every other fault as an error.
void scanFiles(Validator& validator, const std::vector<std::filesystem::path>& files,
               bool verbose, ScanSummary& summary);

// Runs args.positional[0] and returns the process exit code. Errors are
// printed and mapped to ExitCode here.
int runCommand(const ArgParser& args, const AppConfig& config, Logger& logger);
