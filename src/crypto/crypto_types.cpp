#include "chunkvault/crypto/crypto_types.hpp"
#include <sodium.h>

namespace chunkvault::crypto {

SecureBytes::SecureBytes(size_t size) : data(size) {
    sodium_memzero(data.data(), data.size());
}

SecureBytes::SecureBytes(const std::vector<std::uint8_t>& bytes) : data(bytes) {}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes) 
    : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept 
    : data(std::move(other.data)) {
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
    }
    return *this;
}

void SecureBytes::clear() {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
        data.clear();
    }
}

void SecureBytes::resize(size_t new_size) {
    if (new_size < data.size()) {
        sodium_memzero(data.data() + new_size, data.size() - new_size);
    }
    
    size_t old_size = data.size();
    data.resize(new_size);
    
    if (new_size > old_size) {
        sodium_memzero(data.data() + old_size, new_size - old_size);
    }
}

const char* to_string(CryptoError error) {
    switch (error) {
        case CryptoError::SUCCESS: return "SUCCESS";
        case CryptoError::INVALID_KEY_LENGTH: return "INVALID_KEY_LENGTH";
        case CryptoError::ENCRYPTION_FAILED: return "ENCRYPTION_FAILED";
        case CryptoError::AUTHENTICATION_FAILED: return "AUTHENTICATION_FAILED";
        case CryptoError::RANDOM_GENERATION_FAILED: return "RANDOM_GENERATION_FAILED";
        case CryptoError::BUFFER_TOO_SMALL: return "BUFFER_TOO_SMALL";
        case CryptoError::INVALID_STATE: return "INVALID_STATE";
        case CryptoError::KEY_NOT_FOUND: return "KEY_NOT_FOUND";
    }
    return "UNKNOWN";
}

}
