#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/crypto/random.hpp"
#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace chunkvault::crypto {

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
};

Sha256Hasher::Sha256Hasher() 
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Sha256Hasher::~Sha256Hasher() {
    sodium_memzero(&impl_->state, sizeof(impl_->state));
}

CryptoResult Sha256Hasher::initialize() {
    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::INVALID_STATE, "libsodium is not available");
    }
    
    if (crypto_hash_sha256_init(&impl_->state) != 0) {
        return CryptoResult(CryptoError::INVALID_STATE, "Failed to initialize SHA-256 hasher");
    }
    
    initialized_ = true;
    return CryptoResult();
}

CryptoResult Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (crypto_hash_sha256_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::INVALID_STATE, "Failed to update hash");
    }
    
    return CryptoResult();
}

CryptoResult Sha256Hasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (output.size() < SHA256_HASH_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer too small");
    }
    
    if (crypto_hash_sha256_final(&impl_->state, output.data()) != 0) {
        return CryptoResult(CryptoError::INVALID_STATE, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

Sha256Hash Sha256Hasher::finalize() {
    Sha256Hash result;
    auto crypto_result = finalize(std::span(result));
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to finalize hash: " + crypto_result.message);
    }
    return result;
}

Sha256Hash Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium is not available");
    }
    
    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

namespace hash_utils {

Sha256Hash hash_string(const std::string& str) {
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
    return Sha256Hasher::hash(data);
}

bool verify_hash(std::span<const std::uint8_t> data, const Sha256Hash& expected_hash) {
    auto computed_hash = Sha256Hasher::hash(data);
    return sodium_memcmp(computed_hash.data(), expected_hash.data(), SHA256_HASH_SIZE) == 0;
}

std::string hash_to_hex(const Sha256Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != SHA256_HASH_SIZE * 2) {
        return std::nullopt;
    }
    
    Sha256Hash hash;
    size_t bin_len = 0;
    if (sodium_hex2bin(hash.data(), hash.size(), hex_string.data(), hex_string.size(),
                       nullptr, &bin_len, nullptr) != 0 || bin_len != SHA256_HASH_SIZE) {
        return std::nullopt;
    }
    
    return hash;
}

}

}
