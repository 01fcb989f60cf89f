#include "chunkvault/storage/file_lock.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace chunkvault::storage {

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

StorageResult FileLock::acquire(const std::filesystem::path& path, Mode mode) {
    release();
    
    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd < 0) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "lock", path.string(), std::strerror(errno));
    }
    
    int operation = mode == Mode::Exclusive ? LOCK_EX : LOCK_SH;
    int rc;
    do {
        rc = ::flock(fd, operation);
    } while (rc != 0 && errno == EINTR);
    
    if (rc != 0) {
        int error = errno;
        ::close(fd);
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "lock", path.string(), std::strerror(error));
    }
    
    fd_ = fd;
    return StorageResult();
}

void FileLock::release() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

}
