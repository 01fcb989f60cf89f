#include "chunkvault/storage/chunk_manager.hpp"
#include "chunkvault/storage/content_address.hpp"
#include "chunkvault/storage/splitter.hpp"
#include "chunkvault/core/thread_pool.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/core/logger.hpp"
#include <algorithm>
#include <future>

namespace chunkvault::storage {

const char* to_string(StoreState state) {
    switch (state) {
        case StoreState::Splitting: return "splitting";
        case StoreState::Hashing: return "hashing";
        case StoreState::Encrypting: return "encrypting";
        case StoreState::Persisting: return "persisting";
        case StoreState::Committed: return "committed";
        case StoreState::RollingBack: return "rolling back";
        case StoreState::Failed: return "failed";
    }
    return "unknown";
}

struct ChunkManager::ChunkWrite {
    ChunkRecord record;
    ByteSpan plaintext;
    std::vector<std::uint8_t> sealed;
    bool created = false;
};

namespace {
    // Upper bound on the up-front reservation for a retrieved file. The
    // buffer still grows past it as verified chunks arrive.
    constexpr std::uint64_t MAX_INITIAL_RESERVE = 64ULL * 1024 * 1024;
    
    // Waits for every task of a window. Returns the first failure in index
    // order and its offset within the window.
    StorageResult wait_all(std::vector<std::future<StorageResult>>& pending, size_t& failed_offset) {
        StorageResult first_failure;
        for (size_t i = 0; i < pending.size(); ++i) {
            auto result = pending[i].get();
            if (!result && first_failure) {
                first_failure = std::move(result);
                failed_offset = i;
            }
        }
        pending.clear();
        return first_failure;
    }
    
    std::string short_id(const std::string& id) {
        return id.substr(0, 12);
    }
}

ChunkManager::ChunkManager(std::shared_ptr<BlobStore> blob_store,
                           const StorageConfig& config,
                           std::shared_ptr<ReplicaPlacement> placement)
    : blob_store_(std::move(blob_store)),
      placement_(std::move(placement)),
      chunk_size_(static_cast<size_t>(config.chunk_size)),
      max_parallel_writes_(std::max<size_t>(1, config.max_parallel_writes)),
      default_replicas_(config.replicas) {
    if (!blob_store_) {
        throw std::invalid_argument("ChunkManager requires a blob store");
    }
    pool_ = std::make_unique<core::ThreadPool>(max_parallel_writes_);
}

ChunkManager::~ChunkManager() = default;

void ChunkManager::transition(const std::string& file_id, StoreState& current, StoreState next) {
    if (current == next) {
        return;
    }
    current = next;
    LOG_TRACE("store {}: {}", short_id(file_id), to_string(next));
    if (observer_) {
        observer_(file_id, next);
    }
}

StorageResult ChunkManager::prepare_chunk(ChunkWrite& write, std::span<const std::uint8_t> key, bool encrypt) const {
    if (!encrypt) {
        write.sealed.assign(write.plaintext.begin(), write.plaintext.end());
        return StorageResult();
    }
    
    auto result = engine_.seal(write.plaintext, key, write.sealed);
    if (!result) {
        return StorageResult(from_crypto_error(result.error), "seal failed: " + result.message);
    }
    return StorageResult();
}

StorageResult ChunkManager::persist_chunk(ChunkWrite& write) {
    try {
        const auto& id = write.record.chunk_id;
        bool existed = blob_store_->exists(id);
        
        auto result = blob_store_->put(id, write.sealed);
        if (!result) {
            return result;
        }
        
        write.created = !existed;
        write.record.checksum = content_address::hash(write.sealed);
        return StorageResult();
    } catch (const std::exception& e) {
        return StorageResult(StorageError::STORAGE_IO_ERROR, e.what());
    }
}

StorageResult ChunkManager::store_file(FileRecord& record,
                                       std::span<const std::uint8_t> plaintext,
                                       const crypto::EncryptionKey& key) {
    const bool encrypt = record.is_encrypted;
    
    if (encrypt) {
        auto key_check = crypto::EncryptionEngine::check_key(key.span());
        if (!key_check) {
            return StorageResult::failure(StorageError::INVALID_KEY_LENGTH, "store",
                                          record.file_id.empty() ? record.name : record.file_id,
                                          key_check.message);
        }
    }
    
    std::string file_id = record.file_id;
    if (file_id.empty()) {
        file_id = content_address::file_id(record.name, plaintext);
    } else if (!content_address::is_valid_id(file_id)) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "store", file_id, "malformed file id");
    }
    
    StoreState state = StoreState::Failed;
    transition(file_id, state, StoreState::Splitting);
    
    auto segments = split(plaintext, chunk_size_);
    
    transition(file_id, state, StoreState::Hashing);
    
    std::string file_hash = content_address::hash(plaintext);
    
    std::vector<ChunkWrite> writes(segments.size());
    for (size_t i = 0; i < segments.size(); ++i) {
        auto& write = writes[i];
        write.plaintext = segments[i];
        write.record.index = i;
        write.record.size = segments[i].size();
        write.record.hash = content_address::hash(segments[i]);
        write.record.chunk_id = content_address::chunk_id(file_id, i, segments[i]);
    }
    
    LOG_DEBUG("Storing {} ({}) as {} chunk(s)", record.name, core::utils::StringUtils::format_bytes(plaintext.size()),
              writes.size());
    
    // Windows of max_parallel_writes chunks bound the number of sealed
    // buffers and outstanding blob writes, whatever the file size.
    auto key_span = key.span();
    std::vector<std::future<StorageResult>> pending;
    pending.reserve(max_parallel_writes_);
    
    StorageResult outcome;
    size_t failed_index = 0;
    
    for (size_t start = 0; start < writes.size() && outcome; start += max_parallel_writes_) {
        size_t end = std::min(start + max_parallel_writes_, writes.size());
        size_t failed_offset = 0;
        
        transition(file_id, state, StoreState::Encrypting);
        for (size_t i = start; i < end; ++i) {
            auto& write = writes[i];
            pending.push_back(pool_->enqueue([this, &write, key_span, encrypt]() {
                return prepare_chunk(write, key_span, encrypt);
            }));
        }
        outcome = wait_all(pending, failed_offset);
        
        if (outcome) {
            transition(file_id, state, StoreState::Persisting);
            for (size_t i = start; i < end; ++i) {
                auto& write = writes[i];
                pending.push_back(pool_->enqueue([this, &write]() {
                    return persist_chunk(write);
                }));
            }
            outcome = wait_all(pending, failed_offset);
        }
        
        if (!outcome) {
            failed_index = start + failed_offset;
        }
        
        for (size_t i = start; i < end; ++i) {
            std::vector<std::uint8_t>().swap(writes[i].sealed);
        }
    }
    
    if (!outcome) {
        transition(file_id, state, StoreState::RollingBack);
        
        std::vector<std::string> created;
        for (const auto& write : writes) {
            if (write.created) {
                created.push_back(write.record.chunk_id);
            }
        }
        
        auto rollback_result = rollback(file_id, created);
        
        transition(file_id, state, StoreState::Failed);
        
        std::string cause = "chunk " + std::to_string(failed_index) + " (" +
                            writes[failed_index].record.chunk_id + "): " + outcome.message +
                            "; rolled back " + std::to_string(created.size()) + " blob(s)";
        if (!rollback_result) {
            cause += "; rollback incomplete: " + rollback_result.message;
        }
        
        LOG_WARN("Store of {} failed: {}", record.name, cause);
        return StorageResult::failure(StorageError::PARTIAL_WRITE, "store", file_id, cause);
    }
    
    std::uint32_t replicas = record.replicas != 0 ? record.replicas : default_replicas_;
    
    std::vector<ChunkRecord> chunks;
    chunks.reserve(writes.size());
    for (auto& write : writes) {
        if (placement_) {
            write.record.node_ids = placement_->place(file_id, write.record, replicas);
        }
        chunks.push_back(std::move(write.record));
    }
    
    auto now = std::chrono::system_clock::now();
    record.file_id = file_id;
    record.size = plaintext.size();
    record.hash = std::move(file_hash);
    record.chunks = std::move(chunks);
    record.replicas = replicas;
    if (record.created_at == std::chrono::system_clock::time_point{}) {
        record.created_at = now;
    }
    record.updated_at = now;
    
    transition(file_id, state, StoreState::Committed);
    
    LOG_INFO("Stored {} as {} ({} chunk(s))", record.name, short_id(file_id), record.chunks.size());
    return StorageResult();
}

StorageResult ChunkManager::retrieve_file(const FileRecord& record,
                                          const crypto::EncryptionKey& key,
                                          std::vector<std::uint8_t>& out) {
    auto problem = record.check_consistency();
    if (!problem.empty()) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "retrieve", record.file_id, problem);
    }
    
    if (record.is_encrypted) {
        auto key_check = crypto::EncryptionEngine::check_key(key.span());
        if (!key_check) {
            return StorageResult::failure(StorageError::INVALID_KEY_LENGTH, "retrieve", record.file_id,
                                          key_check.message);
        }
    }
    
    std::vector<std::uint8_t> assembled;
    assembled.reserve(static_cast<size_t>(std::min(record.size, MAX_INITIAL_RESERVE)));
    
    std::vector<std::uint8_t> blob;
    std::vector<std::uint8_t> plaintext;
    
    for (const auto& chunk : record.chunks) {
        std::string where = "chunk " + std::to_string(chunk.index) + " (" + chunk.chunk_id + ")";
        
        auto get_result = blob_store_->get(chunk.chunk_id, blob);
        if (!get_result) {
            return StorageResult::failure(get_result.error, "retrieve", record.file_id,
                                          where + ": " + get_result.message);
        }
        
        if (!chunk.checksum.empty() && content_address::hash(blob) != chunk.checksum) {
            return StorageResult::failure(StorageError::INTEGRITY_MISMATCH, "retrieve", record.file_id,
                                          where + ": stored blob checksum mismatch");
        }
        
        if (record.is_encrypted) {
            auto open_result = engine_.open(blob, key.span(), plaintext);
            if (!open_result) {
                return StorageResult::failure(from_crypto_error(open_result.error), "retrieve", record.file_id,
                                              where + ": " + open_result.message);
            }
        } else {
            plaintext.swap(blob);
        }
        
        if (plaintext.size() != chunk.size || content_address::hash(plaintext) != chunk.hash) {
            return StorageResult::failure(StorageError::INTEGRITY_MISMATCH, "retrieve", record.file_id,
                                          where + ": plaintext does not match recorded hash");
        }
        
        assembled.insert(assembled.end(), plaintext.begin(), plaintext.end());
    }
    
    if (assembled.size() != record.size || content_address::hash(assembled) != record.hash) {
        return StorageResult::failure(StorageError::INTEGRITY_MISMATCH, "retrieve", record.file_id,
                                      "assembled content does not match file hash");
    }
    
    out = std::move(assembled);
    LOG_DEBUG("Retrieved {} ({})", short_id(record.file_id), core::utils::StringUtils::format_bytes(out.size()));
    return StorageResult();
}

StorageResult ChunkManager::delete_file(const FileRecord& record) {
    auto result = rollback(record.file_id, record.chunk_ids());
    if (!result) {
        return StorageResult::failure(result.error, "delete", record.file_id, result.message);
    }
    
    LOG_DEBUG("Deleted {} chunk(s) of {}", record.chunks.size(), short_id(record.file_id));
    return StorageResult();
}

StorageResult ChunkManager::rollback(const std::string& file_id, const std::vector<std::string>& chunk_ids) {
    std::string failures;
    size_t failed = 0;
    
    // Keep going past failures so as few blobs as possible are left behind.
    for (const auto& id : chunk_ids) {
        auto result = blob_store_->remove(id);
        if (!result) {
            ++failed;
            if (!failures.empty()) {
                failures += "; ";
            }
            failures += result.message;
        }
    }
    
    if (failed > 0) {
        LOG_ERROR("Could not remove {} of {} chunk(s) of {}", failed, chunk_ids.size(), short_id(file_id));
        return StorageResult(StorageError::STORAGE_IO_ERROR, failures);
    }
    
    return StorageResult();
}

}
