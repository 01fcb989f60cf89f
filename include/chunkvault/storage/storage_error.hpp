#pragma once

#include "../crypto/crypto_types.hpp"
#include <string>

namespace chunkvault::storage {

enum class StorageError {
    SUCCESS = 0,
    NOT_FOUND,
    INVALID_KEY_LENGTH,
    AUTHENTICATION_FAILED,
    INTEGRITY_MISMATCH,
    PARTIAL_WRITE,
    STORAGE_IO_ERROR,
    INVALID_ARGUMENT,
    QUOTA_EXCEEDED
};

const char* to_string(StorageError error);

struct StorageResult {
    StorageError error;
    std::string message;
    
    StorageResult(StorageError err = StorageError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    // Message reads "<operation> <id>: <cause>".
    static StorageResult failure(StorageError err,
                                 const std::string& operation,
                                 const std::string& id,
                                 const std::string& cause);
    
    bool success() const { return error == StorageError::SUCCESS; }
    operator bool() const { return success(); }
};

// Maps crypto failures onto the storage taxonomy.
StorageError from_crypto_error(crypto::CryptoError error);

}
