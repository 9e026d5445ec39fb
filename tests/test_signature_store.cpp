#include <gtest/gtest.h>
#include "errors.hpp"
#include "logger.hpp"
#include "store/signature_store.hpp"
#include "test_support.hpp"

class SignatureStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_unique<SignatureStore>(dir.path("signatures.db").string(), logger);
    }

    TempDir dir;
    Logger logger{LogLevel::NONE};
    std::unique_ptr<SignatureStore> store;
};

// ============================================================================
// REGISTRATION
// ============================================================================
TEST_F(SignatureStoreTest, AddSignature_RoundTrip) {
    store->addSignature("pdf", "25504446", 0, std::string("PDF document"), std::string("application/pdf"));

    auto sigs = store->getSignatures("pdf");
    ASSERT_EQ(sigs.size(), 1u);
    EXPECT_EQ(sigs[0].magicHex, "25504446");
    EXPECT_EQ(sigs[0].offset, 0u);

    auto records = store->getRecords("pdf");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].description.value_or(""), "PDF document");
    EXPECT_EQ(records[0].mimeType.value_or(""), "application/pdf");
}

TEST_F(SignatureStoreTest, AddSignature_NormalizesBeforeStoring) {
    store->addSignature(".PDF", "25 50 44 46");

    auto sigs = store->getSignatures("pdf");
    ASSERT_EQ(sigs.size(), 1u);
    EXPECT_EQ(sigs[0].magicHex, "25504446");
    EXPECT_EQ(store->allExtensions(), std::vector<std::string>{"pdf"});
}

TEST_F(SignatureStoreTest, AddSignature_EquivalentRegistrationIsDuplicate) {
    store->addSignature("PDF", "25 50 44 46");
    EXPECT_THROW(store->addSignature("pdf", "25504446"), DuplicateSignature);
    EXPECT_EQ(store->count(), 1u);
}

TEST_F(SignatureStoreTest, AddSignature_SamePatternDifferentOffsetIsDistinct) {
    store->addSignature("bin", "CAFE", 0);
    store->addSignature("bin", "CAFE", 16);
    store->addSignature("bin", "BABE", 0);

    EXPECT_EQ(store->count(), 3u);
    EXPECT_THROW(store->addSignature("BIN", "cafe", 16), DuplicateSignature);
}

TEST_F(SignatureStoreTest, AddSignature_RejectsInvalidInput) {
    EXPECT_THROW(store->addSignature("", "25504446"), InvalidInput);
    EXPECT_THROW(store->addSignature(".", "25504446"), InvalidInput);
    EXPECT_THROW(store->addSignature("pdf", ""), InvalidInput);
    EXPECT_THROW(store->addSignature("pdf", "   "), InvalidInput);
    EXPECT_THROW(store->addSignature("pdf", "XYZ1"), InvalidInput);
    EXPECT_THROW(store->addSignature("pdf", "255"), InvalidInput);
    EXPECT_THROW(store->addSignature("pdf", "25504446", -1), InvalidInput);
    EXPECT_EQ(store->count(), 0u);
}

// ============================================================================
// QUERIES
// ============================================================================
TEST_F(SignatureStoreTest, GetSignatures_UnknownExtensionThrows) {
    store->addSignature("pdf", "25504446");
    EXPECT_THROW(store->getSignatures("xyz"), SignatureNotFound);
    EXPECT_THROW(store->getRecords("xyz"), SignatureNotFound);
}

TEST_F(SignatureStoreTest, GetSignatures_NormalizesLookup) {
    store->addSignature("png", "89504E47");
    EXPECT_EQ(store->getSignatures(".PNG").size(), 1u);
}

TEST_F(SignatureStoreTest, GetSignatures_KeepsInsertionOrder) {
    store->addSignature("jpg", "FFD8FFE1");
    store->addSignature("jpg", "FFD8FFE0");
    store->addSignature("jpg", "FFD8FFDB");

    auto sigs = store->getSignatures("jpg");
    ASSERT_EQ(sigs.size(), 3u);
    EXPECT_EQ(sigs[0].magicHex, "FFD8FFE1");
    EXPECT_EQ(sigs[1].magicHex, "FFD8FFE0");
    EXPECT_EQ(sigs[2].magicHex, "FFD8FFDB");
}

TEST_F(SignatureStoreTest, AllExtensions_SortedAndDistinct) {
    store->addSignature("zip", "504B0304");
    store->addSignature("jpg", "FFD8FFE0");
    store->addSignature("jpg", "FFD8FFE1");
    store->addSignature("avi", "52494646");

    EXPECT_EQ(store->allExtensions(), (std::vector<std::string>{"avi", "jpg", "zip"}));
}

TEST_F(SignatureStoreTest, Count_CountsRecordsNotExtensions) {
    EXPECT_EQ(store->count(), 0u);
    store->addSignature("jpg", "FFD8FFE0");
    store->addSignature("jpg", "FFD8FFE1");
    store->addSignature("pdf", "25504446");
    EXPECT_EQ(store->count(), 3u);
}

// ============================================================================
// LIFECYCLE
// ============================================================================
TEST_F(SignatureStoreTest, Mutations_PersistAcrossReopen) {
    store->addSignature("pdf", "25504446");
    store->close();

    SignatureStore reopened(dir.path("signatures.db").string(), logger);
    EXPECT_EQ(reopened.count(), 1u);
    EXPECT_THROW(reopened.addSignature("pdf", "25504446"), DuplicateSignature);
}

TEST_F(SignatureStoreTest, Close_IsIdempotent) {
    EXPECT_TRUE(store->isOpen());
    store->close();
    EXPECT_FALSE(store->isOpen());
    EXPECT_NO_THROW(store->close());
    EXPECT_THROW(store->count(), StoreError);
    EXPECT_THROW(store->addSignature("pdf", "25504446"), StoreError);
}

TEST_F(SignatureStoreTest, Constructor_CreatesParentDirectory) {
    fs::path nested = dir.path("a/b/c/signatures.db");
    SignatureStore nestedStore(nested.string(), logger);
    EXPECT_TRUE(fs::exists(nested));
}

TEST(SignatureStoreMemoryTest, InMemoryStoreWorks) {
    Logger logger(LogLevel::NONE);
    SignatureStore store(":memory:", logger);
    store.addSignature("gif", "474946383961");
    EXPECT_EQ(store.count(), 1u);
}
