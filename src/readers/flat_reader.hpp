#pragma once
#include "base_reader.hpp"
#include <set>

// Images, media, executables and other formats identified by magic bytes alone.
class FlatReader : public BaseReader {
public:
    explicit FlatReader(Logger& logger) : BaseReader(logger) {}

    std::string name() const override { return "FLAT"; }
    bool supports(const std::string& extension) const override;
    bool validateStructure(const std::string& filePath, const std::string& extension) override;

    static const std::set<std::string>& knownExtensions();
};
