#pragma once

#include "blob_store.hpp"
#include "chunk_manager.hpp"
#include "file_lock.hpp"
#include "file_record.hpp"
#include "key_lock.hpp"
#include "metadata_repository.hpp"
#include "storage_config.hpp"
#include "storage_error.hpp"
#include "../crypto/key_provider.hpp"
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace chunkvault::storage {

struct StorageStats {
    size_t file_count = 0;
    size_t blob_count = 0;
    std::uint64_t bytes_used = 0;       // bytes on disk, sealed
    std::uint64_t logical_bytes = 0;    // plaintext bytes of all files
};

// Front door of the engine: wires the chunk manager to a metadata repository
// and a key provider, enforces quotas and deduplicates uploads.
class StorageService {
public:
    StorageService(const StorageConfig& config,
                   std::shared_ptr<BlobStore> blob_store,
                   std::shared_ptr<MetadataRepository> metadata,
                   std::shared_ptr<crypto::KeyProvider> key_provider,
                   std::shared_ptr<ReplicaPlacement> placement = nullptr);
    ~StorageService();
    
    StorageService(const StorageService&) = delete;
    StorageService& operator=(const StorageService&) = delete;
    
    // Builds the on-disk stack: FileBlobStore under config.blob_directory,
    // FileIndex at config.database_path, LocalNodePlacement for config.node_id.
    static StorageResult open(const StorageConfig& config,
                              std::shared_ptr<crypto::KeyProvider> key_provider,
                              std::unique_ptr<StorageService>& out_service);
    
    // Uploading content that is already stored returns the existing record.
    StorageResult upload(const std::string& name,
                         const std::string& content_type,
                         const std::string& owner,
                         std::span<const std::uint8_t> data,
                         FileRecord& out_record);
    
    StorageResult download(const std::string& file_id,
                           FileRecord& out_record,
                           std::vector<std::uint8_t>& out_data);
    
    // Chunks go first, so a failure leaves the record pointing at what is left.
    StorageResult remove(const std::string& file_id);
    
    StorageResult info(const std::string& file_id, FileRecord& out_record);
    
    StorageResult list_files(std::vector<FileRecord>& out_records);
    StorageResult search(const std::string& query, std::vector<FileRecord>& out_records);
    
    StorageResult stats(StorageStats& out_stats);
    
    // Deletes blobs no record references, such as those left by a crash
    // between writing chunks and saving the record. Waits for uploads and
    // removals in other processes sharing the store to finish first.
    StorageResult collect_garbage(size_t& out_removed);
    
    const StorageConfig& config() const { return config_; }

private:
    StorageConfig config_;
    std::shared_ptr<BlobStore> blob_store_;
    std::shared_ptr<MetadataRepository> metadata_;
    std::shared_ptr<crypto::KeyProvider> key_provider_;
    std::unique_ptr<ChunkManager> chunk_manager_;
    
    KeyLockTable locks_;
    
    // Shared by every file operation, exclusive for garbage collection so a
    // store in progress never loses its fresh chunks.
    std::shared_mutex gc_mutex_;
    
    // The same exclusion across processes, "<database>.lock". Empty when the
    // config names no database.
    std::filesystem::path lock_path_;
    
    StorageResult lock_store(FileLock::Mode mode, FileLock& out_lock);
    
    StorageResult key_for(const std::string& file_id, const char* operation, crypto::EncryptionKey& out_key);
};

}
