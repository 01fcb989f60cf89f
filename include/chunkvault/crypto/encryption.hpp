#pragma once

#include "crypto_types.hpp"
#include <vector>

namespace chunkvault::crypto {

// Authenticated encryption of standalone blobs.
//
// Sealed blob layout (no header, no length prefix):
//   [24-byte random nonce][ciphertext][16-byte Poly1305 tag]
//
// A sealed blob carries everything needed to open it except the key, so
// every blob can be decrypted independently of any other.
class EncryptionEngine {
public:
    // Throws std::runtime_error when libsodium cannot be initialized.
    EncryptionEngine();
    
    // A fresh nonce is drawn for every call; sealing the same plaintext twice
    // yields different output.
    CryptoResult seal(std::span<const std::uint8_t> plaintext,
                      std::span<const std::uint8_t> key,
                      std::vector<std::uint8_t>& out_sealed) const;
    
    // On failure out_plaintext is left empty; truncated, corrupted and
    // wrong-key blobs all report AUTHENTICATION_FAILED.
    CryptoResult open(std::span<const std::uint8_t> sealed,
                      std::span<const std::uint8_t> key,
                      std::vector<std::uint8_t>& out_plaintext) const;
    
    static CryptoResult check_key(std::span<const std::uint8_t> key);
    
    static constexpr size_t sealed_size(size_t plaintext_size) {
        return plaintext_size + SEALED_OVERHEAD;
    }
};

}
