#include <gtest/gtest.h>
#include "chunkvault/storage/blob_store.hpp"
#include "chunkvault/storage/content_address.hpp"
#include "chunkvault/crypto/random.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <thread>

using namespace chunkvault::storage;

class BlobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("chunkvault_blobs_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(test_dir_);
        
        store_ = std::make_unique<FileBlobStore>(test_dir_);
        ASSERT_TRUE(store_->initialize());
    }
    
    void TearDown() override {
        store_.reset();
        std::filesystem::remove_all(test_dir_);
    }
    
    static std::string id_for(const std::string& seed) {
        std::vector<std::uint8_t> bytes(seed.begin(), seed.end());
        return content_address::hash(bytes);
    }
    
    std::filesystem::path test_dir_;
    std::unique_ptr<FileBlobStore> store_;
};

TEST_F(BlobStoreTest, PutGetRoundTrip) {
    auto id = id_for("blob");
    std::vector<std::uint8_t> data = {1, 2, 3, 4, 5};
    
    ASSERT_TRUE(store_->put(id, data));
    EXPECT_TRUE(store_->exists(id));
    
    std::vector<std::uint8_t> read;
    ASSERT_TRUE(store_->get(id, read));
    EXPECT_EQ(read, data);
}

TEST_F(BlobStoreTest, EmptyBlob) {
    auto id = id_for("empty");
    ASSERT_TRUE(store_->put(id, {}));
    
    std::vector<std::uint8_t> read = {9};
    ASSERT_TRUE(store_->get(id, read));
    EXPECT_TRUE(read.empty());
}

TEST_F(BlobStoreTest, ShardedLayout) {
    auto id = id_for("layout");
    ASSERT_TRUE(store_->put(id, std::vector<std::uint8_t>{42}));
    
    auto expected = test_dir_ / id.substr(0, 2) / id;
    EXPECT_EQ(store_->get_blob_path(id), expected);
    EXPECT_TRUE(std::filesystem::is_regular_file(expected));
    EXPECT_EQ(FileBlobStore::shard_of(id), id.substr(0, 2));
}

TEST_F(BlobStoreTest, PutReplacesExistingBlob) {
    auto id = id_for("replace");
    ASSERT_TRUE(store_->put(id, std::vector<std::uint8_t>{1, 1, 1}));
    ASSERT_TRUE(store_->put(id, std::vector<std::uint8_t>{2}));
    
    std::vector<std::uint8_t> read;
    ASSERT_TRUE(store_->get(id, read));
    EXPECT_EQ(read, std::vector<std::uint8_t>{2});
}

TEST_F(BlobStoreTest, NoTemporariesLeftBehind) {
    auto id = id_for("atomic");
    ASSERT_TRUE(store_->put(id, std::vector<std::uint8_t>(4096, 7)));
    
    size_t files = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir_)) {
        if (entry.is_regular_file()) {
            ++files;
            EXPECT_EQ(entry.path().filename().string().find(".tmp-"), std::string::npos);
        }
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(BlobStoreTest, MissingBlobIsNotFound) {
    std::vector<std::uint8_t> read;
    auto result = store_->get(id_for("absent"), read);
    
    EXPECT_EQ(result.error, StorageError::NOT_FOUND);
    EXPECT_NE(result.message.find(id_for("absent")), std::string::npos);
    EXPECT_FALSE(store_->exists(id_for("absent")));
}

TEST_F(BlobStoreTest, RemoveIsIdempotent) {
    auto id = id_for("remove");
    ASSERT_TRUE(store_->put(id, std::vector<std::uint8_t>{1}));
    
    EXPECT_TRUE(store_->remove(id));
    EXPECT_FALSE(store_->exists(id));
    EXPECT_TRUE(store_->remove(id));
    EXPECT_TRUE(store_->remove(id_for("never stored")));
}

TEST_F(BlobStoreTest, RejectsMalformedIds) {
    std::vector<std::uint8_t> data = {1};
    std::vector<std::uint8_t> read;
    
    EXPECT_EQ(store_->put("../escape", data).error, StorageError::INVALID_ARGUMENT);
    EXPECT_EQ(store_->put(std::string(64, 'G'), data).error, StorageError::INVALID_ARGUMENT);
    EXPECT_EQ(store_->get("short", read).error, StorageError::INVALID_ARGUMENT);
    EXPECT_EQ(store_->remove("").error, StorageError::INVALID_ARGUMENT);
    EXPECT_FALSE(store_->exists("short"));
}

TEST_F(BlobStoreTest, ListAndUsage) {
    std::vector<std::string> ids = {id_for("a"), id_for("b"), id_for("c")};
    for (size_t i = 0; i < ids.size(); ++i) {
        ASSERT_TRUE(store_->put(ids[i], std::vector<std::uint8_t>(10 * (i + 1), 0)));
    }
    
    // Stray files are not blobs
    std::ofstream(test_dir_ / "README") << "not a blob";
    std::filesystem::create_directories(test_dir_ / ids[0].substr(0, 2));
    std::ofstream(test_dir_ / ids[0].substr(0, 2) / (ids[0] + ".tmp-0011223344556677")) << "partial";
    
    std::vector<std::string> listed;
    ASSERT_TRUE(store_->list(listed));
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(listed, ids);
    
    std::uint64_t bytes = 0;
    ASSERT_TRUE(store_->usage(bytes));
    EXPECT_EQ(bytes, 60u);
}

TEST_F(BlobStoreTest, EmptyStoreListsNothing) {
    std::vector<std::string> listed = {"stale"};
    ASSERT_TRUE(store_->list(listed));
    EXPECT_TRUE(listed.empty());
    
    std::uint64_t bytes = 1;
    ASSERT_TRUE(store_->usage(bytes));
    EXPECT_EQ(bytes, 0u);
}

TEST_F(BlobStoreTest, ConcurrentWritesToDifferentIds) {
    constexpr int thread_count = 8;
    constexpr int blobs_per_thread = 16;
    
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < blobs_per_thread; ++i) {
                auto id = id_for("t" + std::to_string(t) + "-" + std::to_string(i));
                EXPECT_TRUE(store_->put(id, std::vector<std::uint8_t>(32, static_cast<std::uint8_t>(t))));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    std::vector<std::string> listed;
    ASSERT_TRUE(store_->list(listed));
    EXPECT_EQ(listed.size(), static_cast<size_t>(thread_count * blobs_per_thread));
}

TEST(BlobStoreShardingTest, RandomIdsSpreadOverAllShards) {
    std::map<std::string, size_t> per_shard;
    
    for (int i = 0; i < 10000; ++i) {
        auto bytes = chunkvault::crypto::SecureRandom::generate_bytes(32);
        per_shard[FileBlobStore::shard_of(content_address::hash(bytes.span()))]++;
    }
    
    // 256 shards, about 39 ids each
    EXPECT_EQ(per_shard.size(), 256u);
    for (const auto& [shard, count] : per_shard) {
        EXPECT_GT(count, 5u) << "shard " << shard;
        EXPECT_LT(count, 100u) << "shard " << shard;
    }
}
