#pragma once

#include "storage_error.hpp"
#include <filesystem>

namespace chunkvault::storage {

// Advisory flock(2) on a lock file, shared between processes that open the
// same store. Each FileLock holds its own descriptor, so two FileLocks in one
// process exclude each other just as two processes do.
class FileLock {
public:
    enum class Mode {
        Shared,
        Exclusive
    };
    
    FileLock() = default;
    ~FileLock();
    
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&&) = delete;
    
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    
    // Creates the lock file if needed and blocks until the lock is granted.
    StorageResult acquire(const std::filesystem::path& path, Mode mode);
    
    void release();
    
    bool held() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

}
