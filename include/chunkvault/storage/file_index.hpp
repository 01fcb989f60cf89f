#pragma once

#include "metadata_repository.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace chunkvault::storage {

// SQLite-backed MetadataRepository. One connection, guarded by a mutex.
class FileIndex : public MetadataRepository {
public:
    // ":memory:" opens a private in-memory database.
    explicit FileIndex(const std::filesystem::path& db_path);
    ~FileIndex() override;
    
    FileIndex(const FileIndex&) = delete;
    FileIndex& operator=(const FileIndex&) = delete;
    
    StorageResult initialize();
    
    StorageResult put(const FileRecord& record) override;
    StorageResult get(const std::string& file_id, FileRecord& out_record) override;
    StorageResult remove(const std::string& file_id) override;
    StorageResult exists(const std::string& file_id, bool& out_exists) override;
    StorageResult list(std::vector<FileRecord>& out_records) override;
    StorageResult search(const std::string& query, std::vector<FileRecord>& out_records) override;
    StorageResult count(size_t& out_count) override;
    StorageResult total_size(std::uint64_t& out_bytes) override;

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;
    
    bool create_tables();
    bool exec(const char* sql);
    std::string last_error() const;
    
    StorageResult collect_records(sqlite3_stmt* stmt, const char* operation, std::vector<FileRecord>& out_records);
    StorageResult query_uint64(const char* sql, const char* operation, std::uint64_t& out_value);
};

}
