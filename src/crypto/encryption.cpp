#include "chunkvault/crypto/encryption.hpp"
#include "chunkvault/crypto/random.hpp"
#include <sodium.h>
#include <stdexcept>
#include <string>

namespace chunkvault::crypto {

static_assert(ENCRYPTION_KEY_SIZE == crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
static_assert(XCHACHA20_NONCE_SIZE == crypto_aead_xchacha20poly1305_ietf_NPUBBYTES);
static_assert(AEAD_TAG_SIZE == crypto_aead_xchacha20poly1305_ietf_ABYTES);

EncryptionEngine::EncryptionEngine() {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium for encryption");
    }
}

CryptoResult EncryptionEngine::check_key(std::span<const std::uint8_t> key) {
    if (key.size() != ENCRYPTION_KEY_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY_LENGTH,
                            "key must be " + std::to_string(ENCRYPTION_KEY_SIZE) +
                            " bytes, got " + std::to_string(key.size()));
    }
    return CryptoResult();
}

CryptoResult EncryptionEngine::seal(std::span<const std::uint8_t> plaintext,
                                    std::span<const std::uint8_t> key,
                                    std::vector<std::uint8_t>& out_sealed) const {
    auto key_check = check_key(key);
    if (!key_check) {
        return key_check;
    }
    
    out_sealed.resize(sealed_size(plaintext.size()));
    
    std::span<std::uint8_t> nonce(out_sealed.data(), XCHACHA20_NONCE_SIZE);
    auto random_result = SecureRandom::generate_bytes(nonce);
    if (!random_result) {
        out_sealed.clear();
        return CryptoResult(CryptoError::RANDOM_GENERATION_FAILED, random_result.message);
    }
    
    unsigned long long ciphertext_len = 0;
    int result = crypto_aead_xchacha20poly1305_ietf_encrypt(
        out_sealed.data() + XCHACHA20_NONCE_SIZE,
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        nullptr, 0,  // no additional data
        nullptr,     // nsec (not used)
        nonce.data(),
        key.data()
    );
    
    if (result != 0 || ciphertext_len != plaintext.size() + AEAD_TAG_SIZE) {
        out_sealed.clear();
        return CryptoResult(CryptoError::ENCRYPTION_FAILED, "XChaCha20-Poly1305 encryption failed");
    }
    
    return CryptoResult();
}

CryptoResult EncryptionEngine::open(std::span<const std::uint8_t> sealed,
                                    std::span<const std::uint8_t> key,
                                    std::vector<std::uint8_t>& out_plaintext) const {
    out_plaintext.clear();
    
    auto key_check = check_key(key);
    if (!key_check) {
        return key_check;
    }
    
    if (sealed.size() < SEALED_OVERHEAD) {
        return CryptoResult(CryptoError::AUTHENTICATION_FAILED,
                            "sealed blob truncated (" + std::to_string(sealed.size()) + " bytes)");
    }
    
    auto nonce = sealed.first(XCHACHA20_NONCE_SIZE);
    auto ciphertext = sealed.subspan(XCHACHA20_NONCE_SIZE);
    
    std::vector<std::uint8_t> plaintext(ciphertext.size() - AEAD_TAG_SIZE);
    unsigned long long plaintext_len = 0;
    
    int result = crypto_aead_xchacha20poly1305_ietf_decrypt(
        plaintext.data(),
        &plaintext_len,
        nullptr,  // nsec (not used)
        ciphertext.data(),
        ciphertext.size(),
        nullptr, 0,
        nonce.data(),
        key.data()
    );
    
    if (result != 0) {
        sodium_memzero(plaintext.data(), plaintext.size());
        return CryptoResult(CryptoError::AUTHENTICATION_FAILED,
                            "authentication tag mismatch (corrupted blob or wrong key)");
    }
    
    plaintext.resize(static_cast<size_t>(plaintext_len));
    out_plaintext = std::move(plaintext);
    return CryptoResult();
}

}
