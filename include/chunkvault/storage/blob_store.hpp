#pragma once

#include "storage_error.hpp"
#include <filesystem>
#include <string>
#include <vector>
#include <span>
#include <cstdint>

namespace chunkvault::storage {

// Opaque blob persistence keyed by content address. Operations on different
// ids may run concurrently; callers serialize work on the same id.
class BlobStore {
public:
    virtual ~BlobStore() = default;
    
    virtual StorageResult put(const std::string& id, std::span<const std::uint8_t> data) = 0;
    
    // NOT_FOUND when absent.
    virtual StorageResult get(const std::string& id, std::vector<std::uint8_t>& out) = 0;
    
    // Removing an absent id succeeds.
    virtual StorageResult remove(const std::string& id) = 0;
    
    virtual bool exists(const std::string& id) = 0;
    
    virtual StorageResult list(std::vector<std::string>& out_ids) = 0;
    
    // Total bytes of all stored blobs.
    virtual StorageResult usage(std::uint64_t& out_bytes) = 0;
};

// Layout: <base>/<first two hex chars of id>/<id>
//
// Writes go to a temporary sibling and are renamed into place, so a reader
// never observes a half-written blob.
class FileBlobStore : public BlobStore {
public:
    static constexpr size_t SHARD_PREFIX_LENGTH = 2;
    
    explicit FileBlobStore(const std::filesystem::path& base_dir);
    
    // Creates the base directory.
    StorageResult initialize();
    
    StorageResult put(const std::string& id, std::span<const std::uint8_t> data) override;
    StorageResult get(const std::string& id, std::vector<std::uint8_t>& out) override;
    StorageResult remove(const std::string& id) override;
    bool exists(const std::string& id) override;
    StorageResult list(std::vector<std::string>& out_ids) override;
    StorageResult usage(std::uint64_t& out_bytes) override;
    
    std::filesystem::path get_blob_path(const std::string& id) const;
    
    static std::string shard_of(const std::string& id);
    
    const std::filesystem::path& base_directory() const { return base_dir_; }

private:
    std::filesystem::path base_dir_;
    
    // Visits every committed blob; temporaries are skipped.
    template<typename Visitor>
    StorageResult for_each_blob(const char* operation, Visitor&& visit);
};

}
