#pragma once

#include <array>
#include <vector>
#include <span>
#include <string>
#include <cstdint>

namespace chunkvault::crypto {

// XChaCha20-Poly1305 (IETF) parameters
constexpr size_t ENCRYPTION_KEY_SIZE = 32;
constexpr size_t XCHACHA20_NONCE_SIZE = 24;
constexpr size_t AEAD_TAG_SIZE = 16;

// Smallest well-formed sealed blob: nonce followed by the tag of an empty message
constexpr size_t SEALED_OVERHEAD = XCHACHA20_NONCE_SIZE + AEAD_TAG_SIZE;

constexpr size_t SHA256_HASH_SIZE = 32;

using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;

// Secure memory utilities
struct SecureBytes {
    std::vector<std::uint8_t> data;
    
    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(const std::vector<std::uint8_t>& bytes);
    SecureBytes(std::span<const std::uint8_t> bytes);
    
    ~SecureBytes();
    
    // Disable copy to prevent key material leakage
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;
    
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;
    
    std::uint8_t* data_ptr() { return data.data(); }
    const std::uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
    
    std::span<std::uint8_t> span() { return std::span(data); }
    std::span<const std::uint8_t> span() const { return std::span(data); }
    
    void clear();
    void resize(size_t new_size);
};

// Variable length on purpose: a key of the wrong size is a reportable error, not a type error.
using EncryptionKey = SecureBytes;

enum class CryptoError {
    SUCCESS = 0,
    INVALID_KEY_LENGTH,
    ENCRYPTION_FAILED,
    AUTHENTICATION_FAILED,
    RANDOM_GENERATION_FAILED,
    BUFFER_TOO_SMALL,
    INVALID_STATE,
    KEY_NOT_FOUND
};

const char* to_string(CryptoError error);

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
