#include "chunkvault/crypto/random.hpp"
#include "chunkvault/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace chunkvault::crypto {

std::atomic<bool> SecureRandom::initialized_{false};

bool SecureRandom::initialize() {
    if (initialized_.load()) {
        return true;
    }
    
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    if (!initialized_.exchange(true)) {
        LOG_DEBUG("Cryptographic random number generator initialized");
    }
    return true;
}

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return CryptoResult(CryptoError::RANDOM_GENERATION_FAILED, "Random generator not initialized");
    }
    
    if (output.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer is empty");
    }
    
    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

SecureBytes SecureRandom::generate_bytes(size_t count) {
    SecureBytes result(count);
    auto crypto_result = generate_bytes(result.span());
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to generate random bytes: " + crypto_result.message);
    }
    return result;
}

EncryptionKey SecureRandom::generate_key() {
    return generate_bytes(ENCRYPTION_KEY_SIZE);
}

}
