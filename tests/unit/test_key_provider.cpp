#include <gtest/gtest.h>
#include "chunkvault/crypto/key_provider.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/crypto/random.hpp"
#include <filesystem>
#include <fstream>

namespace chunkvault::crypto::test {

class KeyProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("chunkvault_keys_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                     "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(test_dir_);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }
    
    std::filesystem::path test_dir_;
};

TEST_F(KeyProviderTest, StaticProviderReturnsSameKey) {
    auto key = SecureRandom::generate_key();
    std::vector<std::uint8_t> expected = key.data;
    
    StaticKeyProvider provider(std::move(key));
    
    EncryptionKey first;
    EncryptionKey second;
    ASSERT_TRUE(provider.key_for("file-a", first));
    ASSERT_TRUE(provider.key_for("file-b", second));
    
    EXPECT_EQ(first.data, expected);
    EXPECT_EQ(second.data, expected);
}

TEST_F(KeyProviderTest, StaticProviderWithoutKey) {
    StaticKeyProvider provider{EncryptionKey()};
    
    EncryptionKey out;
    EXPECT_EQ(provider.key_for("file", out).error, CryptoError::KEY_NOT_FOUND);
}

TEST_F(KeyProviderTest, DerivedKeysArePerFileAndStable) {
    auto master = SecureRandom::generate_key();
    std::vector<std::uint8_t> master_copy = master.data;
    
    DerivedKeyProvider provider(std::move(master));
    DerivedKeyProvider same_master{EncryptionKey(master_copy)};
    
    EncryptionKey a1, a2, b;
    ASSERT_TRUE(provider.key_for("file-a", a1));
    ASSERT_TRUE(same_master.key_for("file-a", a2));
    ASSERT_TRUE(provider.key_for("file-b", b));
    
    EXPECT_EQ(a1.size(), ENCRYPTION_KEY_SIZE);
    EXPECT_EQ(a1.data, a2.data);
    EXPECT_NE(a1.data, b.data);
    EXPECT_NE(a1.data, master_copy);
}

TEST_F(KeyProviderTest, RotatingMasterChangesDerivedKeys) {
    DerivedKeyProvider old_master(SecureRandom::generate_key());
    DerivedKeyProvider new_master(SecureRandom::generate_key());
    
    EncryptionKey old_key, new_key;
    ASSERT_TRUE(old_master.key_for("file", old_key));
    ASSERT_TRUE(new_master.key_for("file", new_key));
    EXPECT_NE(old_key.data, new_key.data);
}

TEST_F(KeyProviderTest, DerivedProviderRejectsShortMaster) {
    DerivedKeyProvider provider{EncryptionKey(std::vector<std::uint8_t>(10, 1))};
    
    EncryptionKey out;
    EXPECT_EQ(provider.key_for("file", out).error, CryptoError::INVALID_KEY_LENGTH);
}

TEST_F(KeyProviderTest, KeyFileGenerateAndLoad) {
    auto path = test_dir_ / "nested" / "master.key";
    
    EncryptionKey generated;
    ASSERT_TRUE(key_file::generate(path, generated));
    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::file_size(path), ENCRYPTION_KEY_SIZE);
    
    auto perms = std::filesystem::status(path).permissions();
    EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
              std::filesystem::perms::none);
    
    EncryptionKey loaded;
    ASSERT_TRUE(key_file::load(path, loaded));
    EXPECT_EQ(loaded.data, generated.data);
}

TEST_F(KeyProviderTest, KeyFileErrors) {
    EncryptionKey out;
    EXPECT_EQ(key_file::load(test_dir_ / "missing.key", out).error, CryptoError::KEY_NOT_FOUND);
    
    std::filesystem::create_directories(test_dir_);
    auto path = test_dir_ / "short.key";
    {
        std::ofstream file(path, std::ios::binary);
        file << "too short";
    }
    EXPECT_EQ(key_file::load(path, out).error, CryptoError::INVALID_KEY_LENGTH);
    
    EncryptionKey bad(std::vector<std::uint8_t>(5, 0));
    EXPECT_EQ(key_file::save(test_dir_ / "bad.key", bad).error, CryptoError::INVALID_KEY_LENGTH);
}

TEST_F(KeyProviderTest, PassphraseKeyIsSha256) {
    auto key = derive_key_from_passphrase("correct horse battery staple");
    auto digest = hash_utils::hash_string("correct horse battery staple");
    
    ASSERT_EQ(key.size(), ENCRYPTION_KEY_SIZE);
    EXPECT_TRUE(std::equal(key.data.begin(), key.data.end(), digest.begin()));
}

}
