#include <gtest/gtest.h>
#include "errors.hpp"
#include "logger.hpp"
#include "readers/archive_reader.hpp"
#include "readers/flat_reader.hpp"
#include "readers/office_reader.hpp"
#include "readers/zip_container.hpp"
#include "test_support.hpp"

class ReaderTest : public ::testing::Test {
protected:
    TempDir dir;
    Logger logger{LogLevel::NONE};
};

// ============================================================================
// BYTE READS
// ============================================================================
TEST_F(ReaderTest, ReadBytes_AtOffset) {
    writeBytes(dir.path("a.bin"), {0x00, 0x01, 0x02, 0x03, 0x04, 0x05});
    FlatReader reader(logger);

    EXPECT_EQ(reader.readBytes(dir.path("a.bin").string(), 3, 2),
              (std::vector<uint8_t>{0x02, 0x03, 0x04}));
}

TEST_F(ReaderTest, ReadBytes_ShortAtEndOfFile) {
    writeBytes(dir.path("a.bin"), {0xAA, 0xBB, 0xCC});
    FlatReader reader(logger);

    EXPECT_EQ(reader.readBytes(dir.path("a.bin").string(), 8, 1),
              (std::vector<uint8_t>{0xBB, 0xCC}));
    EXPECT_TRUE(reader.readBytes(dir.path("a.bin").string(), 4, 10).empty());
}

TEST_F(ReaderTest, ReadBytes_MissingFileThrows) {
    FlatReader reader(logger);
    EXPECT_THROW(reader.readBytes(dir.path("missing.bin").string(), 4, 0), FileReadError);
}

// ============================================================================
// FLAT READER
// ============================================================================
TEST_F(ReaderTest, FlatReader_SupportsSimpleFormats) {
    FlatReader reader(logger);
    EXPECT_TRUE(reader.supports("pdf"));
    EXPECT_TRUE(reader.supports("PNG"));
    EXPECT_TRUE(reader.supports("7z"));
    EXPECT_FALSE(reader.supports("docx"));
    EXPECT_FALSE(reader.supports("zip"));
}

TEST_F(ReaderTest, FlatReader_StructureAlwaysValid) {
    writeBytes(dir.path("a.pdf"), pngHeader());
    FlatReader reader(logger);
    EXPECT_TRUE(reader.validateStructure(dir.path("a.pdf").string(), "pdf"));
}

// ============================================================================
// ZIP CONTAINER DETECTION
// ============================================================================
TEST_F(ReaderTest, IsZipContainer_DetectsArchives) {
    writeZip(dir.path("a.zip"), {{"readme.txt", "hello"}});
    writeBytes(dir.path("b.zip"), {0x50, 0x4B, 0x03, 0x04, 0x00, 0x00, 0x00});
    writeBytes(dir.path("empty.zip"), {});

    EXPECT_TRUE(isZipContainer(dir.path("a.zip").string()));
    EXPECT_FALSE(isZipContainer(dir.path("b.zip").string()));
    EXPECT_FALSE(isZipContainer(dir.path("empty.zip").string()));
    EXPECT_THROW(isZipContainer(dir.path("none.zip").string()), FileReadError);
}

TEST_F(ReaderTest, HasEndOfCentralDirectory_EmptyArchiveRecord) {
    std::vector<uint8_t> eocd(22, 0x00);
    eocd[0] = 0x50; eocd[1] = 0x4B; eocd[2] = 0x05; eocd[3] = 0x06;
    EXPECT_TRUE(hasEndOfCentralDirectory(eocd));

    // comment length pointing past the end of the buffer
    eocd[20] = 0x10;
    EXPECT_FALSE(hasEndOfCentralDirectory(eocd));
}

// ============================================================================
// OFFICE READER
// ============================================================================
TEST_F(ReaderTest, OfficeReader_SupportsOnlyOfficeFormats) {
    OfficeReader reader(logger);
    EXPECT_TRUE(reader.supports("docx"));
    EXPECT_TRUE(reader.supports("XLSX"));
    EXPECT_TRUE(reader.supports("pptx"));
    EXPECT_FALSE(reader.supports("zip"));
    EXPECT_FALSE(reader.supports("pdf"));
}

TEST_F(ReaderTest, OfficeReader_AcceptsCompleteDocument) {
    writeDocx(dir.path("report.docx"));
    OfficeReader reader(logger);
    EXPECT_TRUE(reader.validateStructure(dir.path("report.docx").string(), "docx"));
}

TEST_F(ReaderTest, OfficeReader_RequiresFormatSpecificEntry) {
    // A Word payload does not satisfy the workbook requirement
    writeDocx(dir.path("book.xlsx"));
    OfficeReader reader(logger);
    EXPECT_FALSE(reader.validateStructure(dir.path("book.xlsx").string(), "xlsx"));
}

TEST_F(ReaderTest, OfficeReader_RejectsArchiveWithoutManifest) {
    writeZip(dir.path("fake.docx"), {{"payload.exe", "MZ"}});
    OfficeReader reader(logger);
    EXPECT_FALSE(reader.validateStructure(dir.path("fake.docx").string(), "docx"));
}

TEST_F(ReaderTest, OfficeReader_NotAContainerReturnsFalse) {
    writeBytes(dir.path("fake.docx"), {0x50, 0x4B, 0x03, 0x04, 0x14, 0x00, 0x00, 0x00});
    OfficeReader reader(logger);
    EXPECT_FALSE(reader.validateStructure(dir.path("fake.docx").string(), "docx"));
}

TEST_F(ReaderTest, OfficeReader_CorruptContainerThrows) {
    writeDocx(dir.path("broken.docx"));
    corruptCentralDirectory(dir.path("broken.docx"));
    OfficeReader reader(logger);
    EXPECT_THROW(reader.validateStructure(dir.path("broken.docx").string(), "docx"), FileReadError);
}

TEST_F(ReaderTest, OfficeReader_UnknownExtensionReturnsFalse) {
    writeDocx(dir.path("report.docx"));
    OfficeReader reader(logger);
    EXPECT_FALSE(reader.validateStructure(dir.path("report.docx").string(), "odt"));
}

// ============================================================================
// ARCHIVE READER
// ============================================================================
TEST_F(ReaderTest, ArchiveReader_SupportsOnlyZip) {
    ArchiveReader reader(logger);
    EXPECT_TRUE(reader.supports("zip"));
    EXPECT_TRUE(reader.supports(".ZIP"));
    EXPECT_FALSE(reader.supports("docx"));
    EXPECT_FALSE(reader.supports("gz"));
}

TEST_F(ReaderTest, ArchiveReader_AnyWellFormedArchivePasses) {
    writeZip(dir.path("a.zip"), {{"anything/at/all.bin", "data"}});
    writeDocx(dir.path("b.zip"));
    ArchiveReader reader(logger);
    EXPECT_TRUE(reader.validateStructure(dir.path("a.zip").string(), "zip"));
    EXPECT_TRUE(reader.validateStructure(dir.path("b.zip").string(), "zip"));
}

TEST_F(ReaderTest, ArchiveReader_MalformedArchiveFails) {
    writeBytes(dir.path("a.zip"), {0x50, 0x4B, 0x03, 0x04, 0xDE, 0xAD});
    writeZip(dir.path("b.zip"), {{"x.txt", "x"}});
    corruptCentralDirectory(dir.path("b.zip"));

    ArchiveReader reader(logger);
    EXPECT_FALSE(reader.validateStructure(dir.path("a.zip").string(), "zip"));
    EXPECT_FALSE(reader.validateStructure(dir.path("b.zip").string(), "zip"));
}
