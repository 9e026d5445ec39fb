#pragma once
#include "base_reader.hpp"

// Plain ZIP archives: any well-formed container passes, whatever it holds.
class ArchiveReader : public BaseReader {
public:
    explicit ArchiveReader(Logger& logger) : BaseReader(logger) {}

    std::string name() const override { return "ARCHIVE"; }
    bool supports(const std::string& extension) const override;
    bool validateStructure(const std::string& filePath, const std::string& extension) override;
};
