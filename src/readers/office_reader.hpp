#pragma once
#include "base_reader.hpp"
#include <map>

// ZIP-based office documents. A magic-byte match is only accepted when the
// container also holds the entries its format requires.
class OfficeReader : public BaseReader {
public:
    explicit OfficeReader(Logger& logger) : BaseReader(logger) {}

    std::string name() const override { return "OFFICE"; }
    bool supports(const std::string& extension) const override;

    // false when the file is not a ZIP container or lacks a required entry;
    // throws FileReadError when the container is unreadable or corrupt.
    bool validateStructure(const std::string& filePath, const std::string& extension) override;

    static const std::map<std::string, std::vector<std::string>>& requiredEntries();
};
