// ============================================================================
// RAW BLOB STORE UNIT TESTS
// ============================================================================
// Tests for length-prefixed blob persistence and replay
// ============================================================================

#include <gtest/gtest.h>
#include <pumpevents/core/storage/raw_blob_store.hpp>
#include <filesystem>
#include <fstream>

using namespace PumpEvents;

// ============================================================================
// BASIC STORAGE TESTS
// ============================================================================

TEST(RawBlobStore, StoreBlob) {
    std::string tempStoragePath = "unittest/temp_blob_storage.bin";
    std::filesystem::remove(tempStoragePath);
    {
        RawBlobStore store(tempStoragePath);
        store.append({0x10, 0x20, 0x30, 0x40});
        EXPECT_EQ(store.blobsWritten(), 1u);
    }

    // 4-byte length prefix + body
    EXPECT_TRUE(std::filesystem::exists(tempStoragePath));
    EXPECT_EQ(std::filesystem::file_size(tempStoragePath), 8u);

    std::filesystem::remove(tempStoragePath);
}

TEST(RawBlobStore, ReadBackInOrder) {
    std::string tempStoragePath = "unittest/temp_multi_blob_storage.bin";
    std::filesystem::remove(tempStoragePath);
    {
        RawBlobStore store(tempStoragePath);
        for (int i = 0; i < 10; ++i) {
            std::vector<uint8_t> blob(static_cast<size_t>(i) * 26, static_cast<uint8_t>(i));
            store.append(blob);
        }
        store.flush();
    }

    auto blobs = RawBlobStore::readAll(tempStoragePath);
    ASSERT_EQ(blobs.size(), 10u);
    for (size_t i = 0; i < blobs.size(); ++i) {
        EXPECT_EQ(blobs[i].size(), i * 26);
        if (!blobs[i].empty()) EXPECT_EQ(blobs[i].front(), static_cast<uint8_t>(i));
    }

    std::filesystem::remove(tempStoragePath);
}

TEST(RawBlobStore, AppendsAcrossReopen) {
    std::string tempStoragePath = "unittest/temp_reopen_blob_storage.bin";
    std::filesystem::remove(tempStoragePath);
    {
        RawBlobStore store(tempStoragePath);
        store.append({0xAA});
    }
    {
        RawBlobStore store(tempStoragePath);
        store.append({0xBB, 0xCC});
    }

    auto blobs = RawBlobStore::readAll(tempStoragePath);
    ASSERT_EQ(blobs.size(), 2u);
    EXPECT_EQ(blobs[0], std::vector<uint8_t>({0xAA}));
    EXPECT_EQ(blobs[1], std::vector<uint8_t>({0xBB, 0xCC}));

    std::filesystem::remove(tempStoragePath);
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(RawBlobStore, ThrowsOnMissingFile) {
    EXPECT_THROW(RawBlobStore::readAll("unittest/no_such_blob_store.bin"), std::runtime_error);
}

TEST(RawBlobStore, ThrowsOnUnwritablePath) {
    EXPECT_THROW(RawBlobStore("unittest/no_such_dir/blobs.bin"), std::runtime_error);
}

TEST(RawBlobStore, ThrowsOnTruncatedRecord) {
    std::string tempStoragePath = "unittest/temp_truncated_blob_storage.bin";
    {
        std::ofstream out(tempStoragePath, std::ios::binary | std::ios::trunc);
        const char record[] = {0x00, 0x00, 0x00, 0x08, 0x01, 0x02};   // claims 8, has 2
        out.write(record, sizeof(record));
    }
    EXPECT_THROW(RawBlobStore::readAll(tempStoragePath), std::runtime_error);

    {
        std::ofstream out(tempStoragePath, std::ios::binary | std::ios::trunc);
        const char prefix[] = {0x00, 0x00};
        out.write(prefix, sizeof(prefix));
    }
    EXPECT_THROW(RawBlobStore::readAll(tempStoragePath), std::runtime_error);

    std::filesystem::remove(tempStoragePath);
}

TEST(RawBlobStore, CorruptLengthPrefixIsReportedNotAllocated) {
    std::string tempStoragePath = "unittest/temp_corrupt_blob_storage.bin";
    {
        std::ofstream out(tempStoragePath, std::ios::binary | std::ios::trunc);
        const unsigned char record[] = {0xFF, 0xFF, 0xFF, 0xF0, 0x01, 0x02};   // claims ~4 GiB
        out.write(reinterpret_cast<const char*>(record), sizeof(record));
    }

    try {
        RawBlobStore::readAll(tempStoragePath);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("ends inside a record"), std::string::npos);
    }

    std::filesystem::remove(tempStoragePath);
}
