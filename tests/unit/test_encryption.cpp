#include <gtest/gtest.h>
#include "chunkvault/crypto/encryption.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/crypto/random.hpp"
#include <memory>
#include <string>

namespace chunkvault::crypto::test {

class EncryptionTest : public ::testing::Test {
protected:
    void SetUp() override {
        encryption_engine_ = std::make_unique<EncryptionEngine>();
        test_key_ = SecureRandom::generate_key();
    }
    
    static std::vector<std::uint8_t> bytes_of(const std::string& text) {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }
    
    std::unique_ptr<EncryptionEngine> encryption_engine_;
    EncryptionKey test_key_;
};

TEST_F(EncryptionTest, SealOpenRoundTrip) {
    auto plaintext = bytes_of("Hello, sealed world!");
    
    std::vector<std::uint8_t> sealed;
    auto result = encryption_engine_->seal(plaintext, test_key_.span(), sealed);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(sealed.size(), plaintext.size() + SEALED_OVERHEAD);
    
    std::vector<std::uint8_t> opened;
    result = encryption_engine_->open(sealed, test_key_.span(), opened);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(opened, plaintext);
}

TEST_F(EncryptionTest, EmptyPlaintextSealsToOverhead) {
    std::vector<std::uint8_t> sealed;
    ASSERT_TRUE(encryption_engine_->seal({}, test_key_.span(), sealed));
    EXPECT_EQ(sealed.size(), SEALED_OVERHEAD);
    
    std::vector<std::uint8_t> opened = bytes_of("stale");
    ASSERT_TRUE(encryption_engine_->open(sealed, test_key_.span(), opened));
    EXPECT_TRUE(opened.empty());
}

TEST_F(EncryptionTest, FreshNonceEverySeal) {
    auto plaintext = bytes_of("same input");
    
    std::vector<std::uint8_t> first;
    std::vector<std::uint8_t> second;
    ASSERT_TRUE(encryption_engine_->seal(plaintext, test_key_.span(), first));
    ASSERT_TRUE(encryption_engine_->seal(plaintext, test_key_.span(), second));
    
    EXPECT_NE(first, second);
    EXPECT_FALSE(std::equal(first.begin(), first.begin() + XCHACHA20_NONCE_SIZE, second.begin()));
}

TEST_F(EncryptionTest, AuthenticationFailsWithWrongKey) {
    std::vector<std::uint8_t> sealed;
    ASSERT_TRUE(encryption_engine_->seal(bytes_of("Secret message"), test_key_.span(), sealed));
    
    auto wrong_key = SecureRandom::generate_key();
    std::vector<std::uint8_t> opened;
    auto result = encryption_engine_->open(sealed, wrong_key.span(), opened);
    
    EXPECT_EQ(result.error, CryptoError::AUTHENTICATION_FAILED);
    EXPECT_TRUE(opened.empty());
}

TEST_F(EncryptionTest, AnyFlippedBitIsDetected) {
    std::vector<std::uint8_t> sealed;
    ASSERT_TRUE(encryption_engine_->seal(bytes_of("integrity"), test_key_.span(), sealed));
    
    // Nonce, ciphertext and tag are all covered.
    for (size_t position : {size_t{0}, XCHACHA20_NONCE_SIZE, sealed.size() - 1}) {
        auto tampered = sealed;
        tampered[position] ^= 0x01;
        
        std::vector<std::uint8_t> opened;
        EXPECT_EQ(encryption_engine_->open(tampered, test_key_.span(), opened).error,
                  CryptoError::AUTHENTICATION_FAILED) << "byte " << position;
    }
}

TEST_F(EncryptionTest, TruncatedBlobIsRejected) {
    std::vector<std::uint8_t> short_blob(SEALED_OVERHEAD - 1, 0);
    std::vector<std::uint8_t> opened;
    
    auto result = encryption_engine_->open(short_blob, test_key_.span(), opened);
    EXPECT_EQ(result.error, CryptoError::AUTHENTICATION_FAILED);
}

TEST_F(EncryptionTest, KeyLengthIsChecked) {
    std::vector<std::uint8_t> short_key(16, 0x42);
    std::vector<std::uint8_t> sealed;
    
    auto result = encryption_engine_->seal(bytes_of("data"), short_key, sealed);
    EXPECT_EQ(result.error, CryptoError::INVALID_KEY_LENGTH);
    EXPECT_NE(result.message.find("got 16"), std::string::npos);
    
    std::vector<std::uint8_t> opened;
    std::vector<std::uint8_t> blob(64, 0);
    EXPECT_EQ(encryption_engine_->open(blob, short_key, opened).error, CryptoError::INVALID_KEY_LENGTH);
}

TEST(HashTest, IncrementalMatchesOneShot) {
    std::string text = "The quick brown fox jumps over the lazy dog";
    std::vector<std::uint8_t> data(text.begin(), text.end());
    
    Sha256Hasher hasher;
    ASSERT_TRUE(hasher.initialize());
    ASSERT_TRUE(hasher.update(std::span(data).first(10)));
    ASSERT_TRUE(hasher.update(std::span(data).subspan(10)));
    
    auto digest = hasher.finalize();
    EXPECT_EQ(digest, Sha256Hasher::hash(data));
    EXPECT_EQ(hash_utils::hash_to_hex(digest),
              "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

TEST(HashTest, HexRoundTripAndVerify) {
    auto digest = hash_utils::hash_string("abc");
    auto hex = hash_utils::hash_to_hex(digest);
    
    auto parsed = hash_utils::hash_from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, digest);
    
    EXPECT_FALSE(hash_utils::hash_from_hex("abc").has_value());
    EXPECT_FALSE(hash_utils::hash_from_hex(std::string(64, 'z')).has_value());
    
    std::vector<std::uint8_t> abc = {'a', 'b', 'c'};
    EXPECT_TRUE(hash_utils::verify_hash(abc, digest));
    abc[0] = 'x';
    EXPECT_FALSE(hash_utils::verify_hash(abc, digest));
}

TEST(SecureRandomTest, GeneratesDistinctKeys) {
    auto first = SecureRandom::generate_key();
    auto second = SecureRandom::generate_key();
    
    EXPECT_EQ(first.size(), ENCRYPTION_KEY_SIZE);
    EXPECT_NE(first.data, second.data);
    
    std::vector<std::uint8_t> empty;
    EXPECT_EQ(SecureRandom::generate_bytes(std::span(empty)).error, CryptoError::BUFFER_TOO_SMALL);
}

TEST(SecureBytesTest, MoveLeavesSourceEmpty) {
    SecureBytes source(std::vector<std::uint8_t>{1, 2, 3});
    SecureBytes target(std::move(source));
    
    EXPECT_EQ(target.size(), 3u);
    EXPECT_TRUE(source.empty());
}

}
