#pragma once

#include "crypto_types.hpp"
#include <atomic>

namespace chunkvault::crypto {

class SecureRandom {
public:
    // Idempotent; safe to call from several threads.
    static bool initialize();
    
    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    static SecureBytes generate_bytes(size_t count);
    
    static EncryptionKey generate_key();

private:
    static std::atomic<bool> initialized_;
};

}
