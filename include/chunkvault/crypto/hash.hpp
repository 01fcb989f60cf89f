#pragma once

#include "crypto_types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace chunkvault::crypto {

// Incremental SHA-256.
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();
    
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    
    CryptoResult initialize();
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(std::span<std::uint8_t> output);
    
    // Throws if the hasher was never initialized.
    Sha256Hash finalize();
    
    static Sha256Hash hash(std::span<const std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

Sha256Hash hash_string(const std::string& str);

bool verify_hash(std::span<const std::uint8_t> data, const Sha256Hash& expected_hash);

std::string hash_to_hex(const Sha256Hash& hash);

std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string);

}

}
