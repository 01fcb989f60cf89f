#include "chunkvault/storage/content_address.hpp"
#include "chunkvault/crypto/hash.hpp"
#include <array>
#include <stdexcept>

namespace chunkvault::storage::content_address {

namespace {
    std::span<const std::uint8_t> as_bytes(const std::string& str) {
        return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
    }
    
    std::array<std::uint8_t, 8> encode_u64(std::uint64_t value) {
        std::array<std::uint8_t, 8> encoded;
        for (size_t i = 0; i < encoded.size(); ++i) {
            encoded[i] = static_cast<std::uint8_t>(value >> (56 - 8 * i));
        }
        return encoded;
    }
    
    void update_or_throw(crypto::Sha256Hasher& hasher, std::span<const std::uint8_t> data) {
        auto result = hasher.update(data);
        if (!result) {
            throw std::runtime_error("content address: " + result.message);
        }
    }
}

std::string file_id(const std::string& name, std::span<const std::uint8_t> content) {
    crypto::Sha256Hasher hasher;
    auto result = hasher.initialize();
    if (!result) {
        throw std::runtime_error("content address: " + result.message);
    }
    
    update_or_throw(hasher, encode_u64(name.size()));
    update_or_throw(hasher, as_bytes(name));
    update_or_throw(hasher, content);
    
    return crypto::hash_utils::hash_to_hex(hasher.finalize());
}

std::string chunk_id(const std::string& file_id, std::uint64_t index, std::span<const std::uint8_t> content) {
    crypto::Sha256Hasher hasher;
    auto result = hasher.initialize();
    if (!result) {
        throw std::runtime_error("content address: " + result.message);
    }
    
    update_or_throw(hasher, as_bytes(file_id));
    update_or_throw(hasher, encode_u64(index));
    update_or_throw(hasher, content);
    
    return crypto::hash_utils::hash_to_hex(hasher.finalize());
}

std::string hash(std::span<const std::uint8_t> content) {
    return crypto::hash_utils::hash_to_hex(crypto::Sha256Hasher::hash(content));
}

bool is_valid_id(const std::string& id) {
    if (id.size() != ID_LENGTH) {
        return false;
    }
    
    for (char c : id) {
        bool digit = c >= '0' && c <= '9';
        bool lower_hex = c >= 'a' && c <= 'f';
        if (!digit && !lower_hex) {
            return false;
        }
    }
    return true;
}

}
