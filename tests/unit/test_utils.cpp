#include <gtest/gtest.h>
#include "chunkvault/core/utils.hpp"
#include "chunkvault/core/thread_pool.hpp"
#include "chunkvault/storage/key_lock.hpp"
#include <filesystem>
#include <atomic>
#include <chrono>

using namespace chunkvault::core;
using namespace chunkvault::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("\thello\r\n"), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Hello World"), "hello world");
    EXPECT_EQ(StringUtils::to_lower("TRUE"), "true");
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(0), "0 B");
    EXPECT_EQ(StringUtils::format_bytes(500), "500 B");
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.0 KB");
    EXPECT_EQ(StringUtils::format_bytes(1536), "1.5 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.0 MB");
    EXPECT_EQ(StringUtils::format_bytes(1073741824ULL), "1.0 GB");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() /
                   ("chunkvault_utils_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(test_dir);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }
    
    std::filesystem::path test_dir;
};

TEST_F(FileUtilsTest, WriteAndRead) {
    auto path = test_dir / "data.bin";
    std::vector<std::uint8_t> data = {0x00, 0x01, 0xfe, 0xff, 0x0a};
    
    EXPECT_FALSE(FileUtils::exists(path));
    ASSERT_TRUE(FileUtils::write_file(path, data));
    EXPECT_TRUE(FileUtils::exists(path));
    
    std::vector<std::uint8_t> read_back;
    ASSERT_TRUE(FileUtils::read_file(path, read_back));
    EXPECT_EQ(read_back, data);
}

TEST_F(FileUtilsTest, EmptyFile) {
    auto path = test_dir / "empty.bin";
    ASSERT_TRUE(FileUtils::write_file(path, {}));
    
    std::vector<std::uint8_t> read_back = {1, 2, 3};
    ASSERT_TRUE(FileUtils::read_file(path, read_back));
    EXPECT_TRUE(read_back.empty());
}

TEST_F(FileUtilsTest, MissingFile) {
    std::vector<std::uint8_t> read_back;
    EXPECT_FALSE(FileUtils::read_file(test_dir / "missing.bin", read_back));
    EXPECT_FALSE(FileUtils::write_file(test_dir / "no_such_dir" / "x.bin", {}));
}

TEST(ThreadPoolTest, ReturnsResults) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4u);
    
    std::vector<std::future<int>> results;
    for (int i = 0; i < 32; ++i) {
        results.push_back(pool.enqueue([](int x) { return x * x; }, i));
    }
    
    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, PropagatesExceptions) {
    ThreadPool pool(1);
    auto result = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(result.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ZeroThreadsRejected) {
    EXPECT_THROW(ThreadPool(0), std::invalid_argument);
}

TEST(ThreadPoolTest, DrainsQueueOnDestruction) {
    std::atomic<int> completed{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 50; ++i) {
            pool.enqueue([&completed] {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                completed++;
            });
        }
    }
    EXPECT_EQ(completed.load(), 50);
}

TEST(KeyLockTableTest, EntriesDroppedAfterRelease) {
    chunkvault::storage::KeyLockTable locks;
    {
        auto a = locks.acquire("a");
        auto b = locks.acquire("b");
        EXPECT_EQ(locks.size(), 2u);
    }
    EXPECT_EQ(locks.size(), 0u);
}

TEST(KeyLockTableTest, SerializesSameKey) {
    chunkvault::storage::KeyLockTable locks;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto guard = locks.acquire("same");
                int now = ++inside;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::microseconds(50));
                --inside;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(locks.size(), 0u);
}

TEST(KeyLockTableTest, GuardMovesOwnership) {
    chunkvault::storage::KeyLockTable locks;
    {
        auto first = locks.acquire("k");
        auto moved = std::move(first);
        EXPECT_EQ(locks.size(), 1u);
    }
    EXPECT_EQ(locks.size(), 0u);
}
