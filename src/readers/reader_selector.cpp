#include "reader_selector.hpp"
#include "archive_reader.hpp"
#include "flat_reader.hpp"
#include "office_reader.hpp"
#include "logger.hpp"
#include "utils/helpers.hpp"

ReaderSelector::ReaderSelector(Logger& logger) : logger(logger) {
    registered.push_back(std::make_unique<OfficeReader>(logger));
    registered.push_back(std::make_unique<ArchiveReader>(logger));
    registered.push_back(std::make_unique<FlatReader>(logger));
    fallback = registered.back().get();
}

BaseReader& ReaderSelector::select(const std::string& extension) {
    std::string ext = normalize_extension(extension);
    for (const auto& reader : registered) {
        if (reader->supports(ext)) {
            logger.debug("Selected " + reader->name() + " reader for '." + ext + "'");
            return *reader;
        }
    }
    logger.debug("No dedicated reader for '." + ext + "', using " + fallback->name());
    return *fallback;
}
