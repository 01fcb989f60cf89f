#include "chunkvault/storage/storage_service.hpp"
#include "chunkvault/storage/content_address.hpp"
#include "chunkvault/storage/file_index.hpp"
#include "chunkvault/storage/replica_placement.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/core/logger.hpp"
#include <unordered_set>

namespace chunkvault::storage {

using core::utils::StringUtils;

StorageService::StorageService(const StorageConfig& config,
                               std::shared_ptr<BlobStore> blob_store,
                               std::shared_ptr<MetadataRepository> metadata,
                               std::shared_ptr<crypto::KeyProvider> key_provider,
                               std::shared_ptr<ReplicaPlacement> placement)
    : config_(config),
      blob_store_(std::move(blob_store)),
      metadata_(std::move(metadata)),
      key_provider_(std::move(key_provider)),
      lock_path_(config.database_path.empty() ? std::filesystem::path()
                                              : std::filesystem::path(config.database_path.string() + ".lock")) {
    if (!blob_store_ || !metadata_) {
        throw std::invalid_argument("StorageService requires a blob store and a metadata repository");
    }
    if (config_.encrypt && !key_provider_) {
        throw std::invalid_argument("StorageService with encryption requires a key provider");
    }
    chunk_manager_ = std::make_unique<ChunkManager>(blob_store_, config_, std::move(placement));
}

StorageService::~StorageService() = default;

StorageResult StorageService::open(const StorageConfig& config,
                                   std::shared_ptr<crypto::KeyProvider> key_provider,
                                   std::unique_ptr<StorageService>& out_service) {
    auto problem = config.validate();
    if (!problem.empty()) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "open", config.base_directory.string(), problem);
    }
    
    if (!config.create_directories()) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "open", config.base_directory.string(),
                                      "cannot create storage directories");
    }
    
    auto blob_store = std::make_shared<FileBlobStore>(config.blob_directory);
    auto result = blob_store->initialize();
    if (!result) {
        return result;
    }
    
    auto index = std::make_shared<FileIndex>(config.database_path);
    result = index->initialize();
    if (!result) {
        return result;
    }
    
    try {
        out_service = std::make_unique<StorageService>(config, std::move(blob_store), std::move(index),
                                                       std::move(key_provider),
                                                       std::make_shared<LocalNodePlacement>(config.node_id));
    } catch (const std::exception& e) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "open", config.base_directory.string(), e.what());
    }
    
    LOG_INFO("Storage opened at {}", config.base_directory.string());
    return StorageResult();
}

StorageResult StorageService::key_for(const std::string& file_id, const char* operation,
                                      crypto::EncryptionKey& out_key) {
    if (!key_provider_) {
        return StorageResult::failure(StorageError::NOT_FOUND, operation, file_id, "no key provider configured");
    }
    
    auto result = key_provider_->key_for(file_id, out_key);
    if (!result) {
        return StorageResult::failure(from_crypto_error(result.error), operation, file_id,
                                      "no key: " + result.message);
    }
    return StorageResult();
}

StorageResult StorageService::lock_store(FileLock::Mode mode, FileLock& out_lock) {
    if (lock_path_.empty()) {
        return StorageResult();
    }
    return out_lock.acquire(lock_path_, mode);
}

StorageResult StorageService::upload(const std::string& name,
                                     const std::string& content_type,
                                     const std::string& owner,
                                     std::span<const std::uint8_t> data,
                                     FileRecord& out_record) {
    if (name.empty()) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "upload", "", "file name is empty");
    }
    
    if (data.size() > config_.max_file_size) {
        return StorageResult::failure(StorageError::QUOTA_EXCEEDED, "upload", name,
                                      "file of " + StringUtils::format_bytes(data.size()) +
                                      " exceeds limit of " + StringUtils::format_bytes(config_.max_file_size));
    }
    
    auto file_id = content_address::file_id(name, data);
    auto content_hash = content_address::hash(data);
    
    std::shared_lock<std::shared_mutex> gc_guard(gc_mutex_);
    FileLock store_lock;
    auto lock_result = lock_store(FileLock::Mode::Shared, store_lock);
    if (!lock_result) {
        return lock_result;
    }
    auto guard = locks_.acquire(file_id);
    
    FileRecord existing;
    auto lookup = metadata_->get(file_id, existing);
    if (lookup) {
        if (existing.name != name || existing.size != data.size() || existing.hash != content_hash) {
            return StorageResult::failure(StorageError::INTEGRITY_MISMATCH, "upload", file_id,
                                          "id already belongs to " + existing.name + " with different content");
        }
        LOG_INFO("{} already stored as {}", name, file_id);
        out_record = std::move(existing);
        return StorageResult();
    }
    if (lookup.error != StorageError::NOT_FOUND) {
        return lookup;
    }
    
    std::uint64_t used = 0;
    auto usage_result = metadata_->total_size(used);
    if (!usage_result) {
        return usage_result;
    }
    if (used + data.size() > config_.max_storage_size) {
        return StorageResult::failure(StorageError::QUOTA_EXCEEDED, "upload", file_id,
                                      "storage limit of " + StringUtils::format_bytes(config_.max_storage_size) +
                                      " reached (" + StringUtils::format_bytes(used) + " used)");
    }
    
    crypto::EncryptionKey key;
    if (config_.encrypt) {
        auto key_result = key_for(file_id, "upload", key);
        if (!key_result) {
            return key_result;
        }
    }
    
    FileRecord record(name, content_type, owner);
    record.file_id = file_id;
    record.is_encrypted = config_.encrypt;
    record.replicas = config_.replicas;
    
    auto result = chunk_manager_->store_file(record, data, key);
    if (!result) {
        return result;
    }
    
    result = metadata_->put(record);
    if (!result) {
        LOG_ERROR("Saving record for {} failed, removing its chunks: {}", file_id, result.message);
        auto rollback_result = chunk_manager_->rollback(file_id, record.chunk_ids());
        if (!rollback_result) {
            LOG_ERROR("Rollback of {} incomplete: {}", file_id, rollback_result.message);
        }
        return result;
    }
    
    out_record = std::move(record);
    return StorageResult();
}

StorageResult StorageService::download(const std::string& file_id,
                                       FileRecord& out_record,
                                       std::vector<std::uint8_t>& out_data) {
    if (!content_address::is_valid_id(file_id)) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "download", file_id, "malformed file id");
    }
    
    std::shared_lock<std::shared_mutex> gc_guard(gc_mutex_);
    auto guard = locks_.acquire(file_id);
    
    FileRecord record;
    auto result = metadata_->get(file_id, record);
    if (!result) {
        return result;
    }
    
    crypto::EncryptionKey key;
    if (record.is_encrypted) {
        result = key_for(file_id, "download", key);
        if (!result) {
            return result;
        }
    }
    
    result = chunk_manager_->retrieve_file(record, key, out_data);
    if (!result) {
        return result;
    }
    
    out_record = std::move(record);
    return StorageResult();
}

StorageResult StorageService::remove(const std::string& file_id) {
    if (!content_address::is_valid_id(file_id)) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "remove", file_id, "malformed file id");
    }
    
    std::shared_lock<std::shared_mutex> gc_guard(gc_mutex_);
    FileLock store_lock;
    auto result = lock_store(FileLock::Mode::Shared, store_lock);
    if (!result) {
        return result;
    }
    auto guard = locks_.acquire(file_id);
    
    FileRecord record;
    result = metadata_->get(file_id, record);
    if (!result) {
        return result;
    }
    
    result = chunk_manager_->delete_file(record);
    if (!result) {
        return result;
    }
    
    result = metadata_->remove(file_id);
    if (!result) {
        return result;
    }
    
    LOG_INFO("Removed {} ({})", record.name, file_id);
    return StorageResult();
}

StorageResult StorageService::info(const std::string& file_id, FileRecord& out_record) {
    if (!content_address::is_valid_id(file_id)) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "info", file_id, "malformed file id");
    }
    return metadata_->get(file_id, out_record);
}

StorageResult StorageService::list_files(std::vector<FileRecord>& out_records) {
    return metadata_->list(out_records);
}

StorageResult StorageService::search(const std::string& query, std::vector<FileRecord>& out_records) {
    return metadata_->search(query, out_records);
}

StorageResult StorageService::stats(StorageStats& out_stats) {
    StorageStats stats;
    auto result = metadata_->count(stats.file_count);
    if (!result) {
        return result;
    }
    
    result = metadata_->total_size(stats.logical_bytes);
    if (!result) {
        return result;
    }
    
    std::vector<std::string> ids;
    result = blob_store_->list(ids);
    if (!result) {
        return result;
    }
    stats.blob_count = ids.size();
    
    result = blob_store_->usage(stats.bytes_used);
    if (!result) {
        return result;
    }
    
    out_stats = stats;
    return StorageResult();
}

StorageResult StorageService::collect_garbage(size_t& out_removed) {
    std::unique_lock<std::shared_mutex> gc_guard(gc_mutex_);
    FileLock store_lock;
    auto result = lock_store(FileLock::Mode::Exclusive, store_lock);
    if (!result) {
        return result;
    }
    
    out_removed = 0;
    
    std::vector<FileRecord> records;
    result = metadata_->list(records);
    if (!result) {
        return StorageResult::failure(result.error, "gc", "", "cannot read index, nothing removed: " + result.message);
    }
    
    size_t recorded = 0;
    result = metadata_->count(recorded);
    if (!result) {
        return StorageResult::failure(result.error, "gc", "", "cannot read index, nothing removed: " + result.message);
    }
    if (records.size() != recorded) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "gc", "",
                                      "metadata listing is incomplete, nothing removed");
    }
    
    std::unordered_set<std::string> referenced;
    for (const auto& record : records) {
        for (const auto& chunk : record.chunks) {
            referenced.insert(chunk.chunk_id);
        }
    }
    
    std::vector<std::string> ids;
    result = blob_store_->list(ids);
    if (!result) {
        return result;
    }
    
    for (const auto& id : ids) {
        if (referenced.count(id) != 0) {
            continue;
        }
        result = blob_store_->remove(id);
        if (!result) {
            return result;
        }
        ++out_removed;
    }
    
    if (out_removed > 0) {
        LOG_INFO("Garbage collection removed {} orphaned blob(s)", out_removed);
    }
    return StorageResult();
}

}
