#include "chunkvault/crypto/key_provider.hpp"
#include "chunkvault/crypto/encryption.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/crypto/random.hpp"
#include "chunkvault/core/logger.hpp"
#include <sodium.h>
#include <fstream>
#include <iterator>

namespace chunkvault::crypto {

namespace {
    constexpr char FILE_KEY_CONTEXT[] = "chunkvault-file-key";
}

StaticKeyProvider::StaticKeyProvider(EncryptionKey key) 
    : key_(std::move(key)) {
}

CryptoResult StaticKeyProvider::key_for(const std::string& /*file_id*/, EncryptionKey& out_key) {
    if (key_.empty()) {
        return CryptoResult(CryptoError::KEY_NOT_FOUND, "no key configured");
    }
    out_key = EncryptionKey(key_.span());
    return CryptoResult();
}

DerivedKeyProvider::DerivedKeyProvider(EncryptionKey master_key)
    : master_key_(std::move(master_key)) {
}

CryptoResult DerivedKeyProvider::key_for(const std::string& file_id, EncryptionKey& out_key) {
    auto key_check = EncryptionEngine::check_key(master_key_.span());
    if (!key_check) {
        return CryptoResult(CryptoError::INVALID_KEY_LENGTH, "master " + key_check.message);
    }
    
    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::INVALID_STATE, "libsodium is not available");
    }
    
    crypto_generichash_state state;
    if (crypto_generichash_init(&state, master_key_.data_ptr(), master_key_.size(), ENCRYPTION_KEY_SIZE) != 0) {
        return CryptoResult(CryptoError::INVALID_STATE, "Failed to initialize key derivation");
    }
    
    crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(FILE_KEY_CONTEXT),
                              sizeof(FILE_KEY_CONTEXT) - 1);
    crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(file_id.data()),
                              file_id.size());
    
    EncryptionKey derived(ENCRYPTION_KEY_SIZE);
    int result = crypto_generichash_final(&state, derived.data_ptr(), derived.size());
    sodium_memzero(&state, sizeof(state));
    
    if (result != 0) {
        return CryptoResult(CryptoError::INVALID_STATE, "Failed to derive file key");
    }
    
    out_key = std::move(derived);
    return CryptoResult();
}

namespace key_file {

CryptoResult generate(const std::filesystem::path& path, EncryptionKey& out_key) {
    EncryptionKey key = SecureRandom::generate_key();
    auto result = save(path, key);
    if (!result) {
        return result;
    }
    
    LOG_INFO("Generated new master key at {}", path.string());
    out_key = std::move(key);
    return CryptoResult();
}

CryptoResult load(const std::filesystem::path& path, EncryptionKey& out_key) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return CryptoResult(CryptoError::KEY_NOT_FOUND, "cannot open key file " + path.string());
    }
    
    std::vector<std::uint8_t> raw((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
    EncryptionKey key(raw);
    sodium_memzero(raw.data(), raw.size());
    
    auto key_check = EncryptionEngine::check_key(key.span());
    if (!key_check) {
        return CryptoResult(CryptoError::INVALID_KEY_LENGTH, path.string() + ": " + key_check.message);
    }
    
    out_key = std::move(key);
    return CryptoResult();
}

CryptoResult save(const std::filesystem::path& path, const EncryptionKey& key) {
    auto key_check = EncryptionEngine::check_key(key.span());
    if (!key_check) {
        return key_check;
    }
    
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return CryptoResult(CryptoError::INVALID_STATE,
                                "cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }
    
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return CryptoResult(CryptoError::INVALID_STATE, "cannot write key file " + path.string());
        }
        file.write(reinterpret_cast<const char*>(key.data_ptr()), static_cast<std::streamsize>(key.size()));
        if (!file.good()) {
            return CryptoResult(CryptoError::INVALID_STATE, "short write to key file " + path.string());
        }
    }
    
    std::error_code ec;
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        LOG_WARN("Could not restrict permissions on {}: {}", path.string(), ec.message());
    }
    
    return CryptoResult();
}

}

EncryptionKey derive_key_from_passphrase(const std::string& passphrase) {
    auto digest = hash_utils::hash_string(passphrase);
    EncryptionKey key{std::span<const std::uint8_t>(digest)};
    sodium_memzero(digest.data(), digest.size());
    return key;
}

}
