#pragma once
#include "base_reader.hpp"
#include <memory>
#include <vector>

class Logger;

// Fixed, ordered reader list; first reader that supports the extension wins.
// Office documents are ZIP archives too, so OfficeReader must come before
// ArchiveReader. Unknown extensions get the flat reader.
class ReaderSelector {
public:
    explicit ReaderSelector(Logger& logger);

    BaseReader& select(const std::string& extension);
    const std::vector<std::unique_ptr<BaseReader>>& readers() const { return registered; }

private:
    Logger& logger;
    std::vector<std::unique_ptr<BaseReader>> registered;
    BaseReader* fallback = nullptr;
};
