#include "printer.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "store/signature_store.hpp"
#include <map>
#include <sstream>
#include <vector>

// Wrap long text into multiple lines with indentation
static std::vector<std::string> wrapText(const std::string& text, size_t width) {
    std::vector<std::string> lines;
    std::istringstream words(text);
    std::string word, line;
    while (words >> word) {
        if (!line.empty() && line.size() + word.size() + 1 > width) {
            lines.push_back(line);
            line.clear();
        }
        if (!line.empty()) line += " ";
        line += word;
    }
    if (!line.empty()) lines.push_back(line);
    return lines;
}

static const std::vector<std::pair<std::string, std::vector<std::string>>>& categories() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
        {"Documents",   {"pdf", "docx", "xlsx", "pptx", "xml"}},
        {"Images",      {"jpg", "jpeg", "png", "gif", "bmp", "ico", "webp"}},
        {"Archives",    {"zip", "rar", "7z", "tar", "gz"}},
        {"Executables", {"exe", "dll", "elf"}},
        {"Media",       {"mp3", "mp4", "avi", "mkv", "wav", "flac"}},
        {"Databases",   {"sqlite"}},
    };
    return table;
}

std::string categoryOf(const std::string& extension) {
    for (const auto& category : categories()) {
        for (const auto& ext : category.second) {
            if (ext == extension)
                return category.first;
        }
    }
    return "Other";
}

void printValidationResult(const ValidationOutcome& outcome, bool verbose, std::ostream& out) {
    if (outcome.valid()) {
        out << ansi::green << "✓ VALID" << ansi::reset << "  " << outcome.filePath << "\n";
        if (verbose && !outcome.extension.empty())
            out << "    " << ansi::gray << "Type: ." << outcome.extension << ansi::reset << "\n";
        return;
    }

    if (outcome.status == OutcomeStatus::Fault)
        out << ansi::yellow << "! ERROR (" << faultKindName(outcome.fault) << ")" << ansi::reset;
    else
        out << ansi::red << "✗ INVALID" << ansi::reset;
    out << "  " << outcome.filePath << "\n";

    auto lines = wrapText(outcome.message, 70);
    for (const auto& line : lines)
        out << "    " << ansi::gray << line << ansi::reset << "\n";

    if (verbose && !outcome.expectedHex.empty()) {
        out << "    Expected: " << ansi::cyan << outcome.expectedHex << ansi::reset << "\n";
        if (!outcome.actualHex.empty())
            out << "    Found:    " << ansi::magenta << outcome.actualHex << ansi::reset << "\n";
    }
}

void printFileHash(const std::string& filePath, const std::string& digest, std::ostream& out) {
    out << ansi::bold << "SHA-256" << ansi::reset << "  " << digest << "  " << filePath << "\n";
}

void printInfo(const std::string& msg, std::ostream& out) {
    out << ansi::cyan << "* " << ansi::reset << msg << "\n";
}

void printError(const std::string& msg, std::ostream& out) {
    out << ansi::red << "Error: " << ansi::reset << msg << "\n";
}

void printSignatureList(SignatureStore& store, std::ostream& out) {
    auto extensions = store.allExtensions();
    if (extensions.empty()) {
        printInfo("No signatures loaded", out);
        return;
    }

    std::map<std::string, std::vector<std::string>> grouped;
    for (const auto& ext : extensions)
        grouped[categoryOf(ext)].push_back(ext);

    out << "\n" << ansi::bold << "Supported File Types (" << extensions.size() << "):" << ansi::reset << "\n";

    std::vector<std::string> order;
    for (const auto& category : categories())
        order.push_back(category.first);
    order.push_back("Other");

    for (const auto& name : order) {
        auto it = grouped.find(name);
        if (it == grouped.end())
            continue;
        out << "\n" << ansi::bold << ansi::cyan << name << ":" << ansi::reset << "\n";
        for (const auto& ext : it->second) {
            size_t n = store.getSignatures(ext).size();
            out << "  ." << ext << " (" << n << " signature" << (n > 1 ? "s" : "") << ")\n";
        }
    }
    out << "\n";
}

void printStatus(SignatureStore& store, const AppConfig& config, bool verbose, std::ostream& out) {
    out << "\n" << ansi::bold << HEXGUARD_NAME << " Status:" << ansi::reset << "\n\n";
    out << ansi::cyan << "Database:   " << ansi::reset << store.path() << "\n";

    size_t count = store.count();
    out << ansi::cyan << "Signatures: " << ansi::reset << count << "\n";
    if (count == 0)
        out << "  " << ansi::yellow << "Database is empty. Run any scan command to initialize." << ansi::reset << "\n";

    out << ansi::cyan << "Logs:       " << ansi::reset << config.logDir.string() << "\n";
    out << ansi::cyan << "Max size:   " << ansi::reset << config.maxFileSize << " bytes\n";

    if (verbose && count > 0) {
        out << "\n" << ansi::bold << "Supported Extensions:" << ansi::reset << "\n  ";
        auto extensions = store.allExtensions();
        for (size_t i = 0; i < extensions.size(); ++i)
            out << (i ? ", " : "") << extensions[i];
        out << "\n";
    }
    out << "\n";
}

void printScanSummary(const ScanSummary& summary, std::ostream& out) {
    out << "\n" << ansi::bold << "Scan Summary:" << ansi::reset << "\n";
    out << "  " << ansi::green << "Valid:" << ansi::reset << "   " << summary.valid << "\n";
    out << "  " << ansi::red << "Invalid:" << ansi::reset << " " << summary.invalid << "\n";
    if (summary.errors > 0)
        out << "  " << ansi::yellow << "Errors:" << ansi::reset << "  " << summary.errors << "\n";
}
