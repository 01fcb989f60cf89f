#include "chunkvault/storage/storage_error.hpp"

namespace chunkvault::storage {

const char* to_string(StorageError error) {
    switch (error) {
        case StorageError::SUCCESS: return "SUCCESS";
        case StorageError::NOT_FOUND: return "NOT_FOUND";
        case StorageError::INVALID_KEY_LENGTH: return "INVALID_KEY_LENGTH";
        case StorageError::AUTHENTICATION_FAILED: return "AUTHENTICATION_FAILED";
        case StorageError::INTEGRITY_MISMATCH: return "INTEGRITY_MISMATCH";
        case StorageError::PARTIAL_WRITE: return "PARTIAL_WRITE";
        case StorageError::STORAGE_IO_ERROR: return "STORAGE_IO_ERROR";
        case StorageError::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case StorageError::QUOTA_EXCEEDED: return "QUOTA_EXCEEDED";
    }
    return "UNKNOWN";
}

StorageResult StorageResult::failure(StorageError err,
                                     const std::string& operation,
                                     const std::string& id,
                                     const std::string& cause) {
    std::string message = operation;
    if (!id.empty()) {
        message += " " + id;
    }
    message += ": " + cause;
    return StorageResult(err, std::move(message));
}

StorageError from_crypto_error(crypto::CryptoError error) {
    switch (error) {
        case crypto::CryptoError::SUCCESS:
            return StorageError::SUCCESS;
        case crypto::CryptoError::INVALID_KEY_LENGTH:
            return StorageError::INVALID_KEY_LENGTH;
        case crypto::CryptoError::AUTHENTICATION_FAILED:
            return StorageError::AUTHENTICATION_FAILED;
        case crypto::CryptoError::KEY_NOT_FOUND:
            return StorageError::NOT_FOUND;
        default:
            return StorageError::STORAGE_IO_ERROR;
    }
}

}
