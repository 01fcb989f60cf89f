#pragma once

#include "file_record.hpp"
#include "storage_error.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace chunkvault::storage {

// Durable home of FileRecords. The chunk manager produces and consumes
// records but never stores them itself. Reads report failures rather than
// returning empty results.
class MetadataRepository {
public:
    virtual ~MetadataRepository() = default;
    
    // Inserts or replaces the record with the same file id.
    virtual StorageResult put(const FileRecord& record) = 0;
    
    virtual StorageResult get(const std::string& file_id, FileRecord& out_record) = 0;
    
    virtual StorageResult remove(const std::string& file_id) = 0;
    
    virtual StorageResult exists(const std::string& file_id, bool& out_exists) = 0;
    
    // Newest first.
    virtual StorageResult list(std::vector<FileRecord>& out_records) = 0;
    
    // Substring match on name, content type or owner.
    virtual StorageResult search(const std::string& query, std::vector<FileRecord>& out_records) = 0;
    
    virtual StorageResult count(size_t& out_count) = 0;
    
    // Sum of plaintext sizes of all records.
    virtual StorageResult total_size(std::uint64_t& out_bytes) = 0;
};

}
