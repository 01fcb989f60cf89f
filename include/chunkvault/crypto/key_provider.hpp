#pragma once

#include "crypto_types.hpp"
#include <filesystem>
#include <string>

namespace chunkvault::crypto {

// Supplies the key for one file. Key lifecycle (storage, rotation) lives
// behind this interface; the storage engine only ever borrows keys.
class KeyProvider {
public:
    virtual ~KeyProvider() = default;
    
    virtual CryptoResult key_for(const std::string& file_id, EncryptionKey& out_key) = 0;
};

class StaticKeyProvider : public KeyProvider {
public:
    explicit StaticKeyProvider(EncryptionKey key);
    
    CryptoResult key_for(const std::string& file_id, EncryptionKey& out_key) override;

private:
    EncryptionKey key_;
};

// Per-file keys: BLAKE2b keyed with the master key over a context string and
// the file id. Replacing the master key rotates every derived key.
class DerivedKeyProvider : public KeyProvider {
public:
    explicit DerivedKeyProvider(EncryptionKey master_key);
    
    CryptoResult key_for(const std::string& file_id, EncryptionKey& out_key) override;

private:
    EncryptionKey master_key_;
};

namespace key_file {

CryptoResult generate(const std::filesystem::path& path, EncryptionKey& out_key);

CryptoResult load(const std::filesystem::path& path, EncryptionKey& out_key);

CryptoResult save(const std::filesystem::path& path, const EncryptionKey& key);

}

// SHA-256 of the passphrase. Convenience for interactive tools only.
EncryptionKey derive_key_from_passphrase(const std::string& passphrase);

}
