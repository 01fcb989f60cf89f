#pragma once

#include "blob_store.hpp"
#include "file_record.hpp"
#include "replica_placement.hpp"
#include "storage_config.hpp"
#include "storage_error.hpp"
#include "../crypto/crypto_types.hpp"
#include "../crypto/encryption.hpp"
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace chunkvault::core {
class ThreadPool;
}

namespace chunkvault::storage {

// Progress of a single store operation:
//   Splitting -> Hashing -> Encrypting -> Persisting -> Committed
// with Persisting -> RollingBack -> Failed on a write failure. Chunks are
// sealed and written one window at a time, so Encrypting and Persisting
// alternate once per window for files larger than a window.
enum class StoreState {
    Splitting,
    Hashing,
    Encrypting,
    Persisting,
    Committed,
    RollingBack,
    Failed
};

const char* to_string(StoreState state);

class ChunkManager {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024; // 1MB
    
    using StateObserver = std::function<void(const std::string& file_id, StoreState state)>;
    
    // A null placement records no node ids.
    ChunkManager(std::shared_ptr<BlobStore> blob_store,
                 const StorageConfig& config,
                 std::shared_ptr<ReplicaPlacement> placement = nullptr);
    ~ChunkManager();
    
    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;
    
    // Splits, hashes, seals (when record.is_encrypted) and persists every
    // chunk, then completes `record` in place. The caller fills name,
    // content_type, owner and optionally file_id; a missing file_id is
    // derived from name and content.
    //
    // All or nothing: on PARTIAL_WRITE every blob this call created has been
    // removed again and `record` is left untouched.
    StorageResult store_file(FileRecord& record,
                             std::span<const std::uint8_t> plaintext,
                             const crypto::EncryptionKey& key);
    
    // Reads chunks in index order and verifies each one before assembling.
    // Nothing is written to `out` unless the whole file verifies.
    StorageResult retrieve_file(const FileRecord& record,
                                const crypto::EncryptionKey& key,
                                std::vector<std::uint8_t>& out);
    
    // Removes every chunk blob; repeating it on the same record succeeds.
    StorageResult delete_file(const FileRecord& record);
    
    // Removes the given chunk blobs. Used after a failed store and by callers
    // that abandon a store midway.
    StorageResult rollback(const std::string& file_id, const std::vector<std::string>& chunk_ids);
    
    // Set before sharing the manager between threads.
    void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }

private:
    struct ChunkWrite;
    
    std::shared_ptr<BlobStore> blob_store_;
    std::shared_ptr<ReplicaPlacement> placement_;
    std::unique_ptr<core::ThreadPool> pool_;
    crypto::EncryptionEngine engine_;
    
    size_t chunk_size_;
    size_t max_parallel_writes_;
    std::uint32_t default_replicas_;
    
    StateObserver observer_;
    
    void transition(const std::string& file_id, StoreState& current, StoreState next);
    
    // Seals (or copies) one chunk; fills write.sealed and write.checksum.
    StorageResult prepare_chunk(ChunkWrite& write, std::span<const std::uint8_t> key, bool encrypt) const;
    StorageResult persist_chunk(ChunkWrite& write);
};

}
