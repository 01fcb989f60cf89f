#include "chunkvault/storage/file_index.hpp"
#include "chunkvault/core/logger.hpp"
#include <sqlite3.h>
#include <chrono>

namespace chunkvault::storage {

namespace {
    struct Statement {
        sqlite3_stmt* stmt = nullptr;
        
        ~Statement() {
            if (stmt) {
                sqlite3_finalize(stmt);
            }
        }
    };
    
    std::int64_t to_millis(std::chrono::system_clock::time_point time) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }
    
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
        sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }
}

FileIndex::FileIndex(const std::filesystem::path& db_path) 
    : db_path_(db_path), db_(nullptr) {
}

FileIndex::~FileIndex() {
    if (db_) {
        sqlite3_close(db_);
    }
}

StorageResult FileIndex::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (db_) {
        return StorageResult();
    }
    
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int result = sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr);
    if (result != SQLITE_OK) {
        std::string cause = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(result);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "open", db_path_.string(), cause);
    }
    
    sqlite3_busy_timeout(db_, 5000);
    
    if (!create_tables()) {
        auto cause = last_error();
        sqlite3_close(db_);
        db_ = nullptr;
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "open", db_path_.string(), cause);
    }
    
    LOG_DEBUG("File index opened at {}", db_path_.string());
    return StorageResult();
}

bool FileIndex::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("SQLite error: {}", error_msg ? error_msg : sqlite3_errstr(result));
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

std::string FileIndex::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

bool FileIndex::create_tables() {
    const char* create_files_table = R"(
        CREATE TABLE IF NOT EXISTS files (
            file_id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            size INTEGER NOT NULL,
            content_type TEXT,
            owner TEXT,
            file_hash TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            is_encrypted INTEGER NOT NULL,
            replicas INTEGER NOT NULL,
            record_blob BLOB NOT NULL
        );
    )";
    
    const char* create_chunks_table = R"(
        CREATE TABLE IF NOT EXISTS chunks (
            file_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            chunk_id TEXT NOT NULL,
            size INTEGER NOT NULL,
            chunk_hash TEXT NOT NULL,
            checksum TEXT NOT NULL,
            PRIMARY KEY (file_id, chunk_index),
            FOREIGN KEY (file_id) REFERENCES files(file_id) ON DELETE CASCADE
        );
    )";
    
    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_files_name ON files(name);
        CREATE INDEX IF NOT EXISTS idx_files_created_at ON files(created_at);
        CREATE INDEX IF NOT EXISTS idx_chunks_chunk_id ON chunks(chunk_id);
    )";
    
    return exec("PRAGMA foreign_keys = ON;") &&
           exec(create_files_table) &&
           exec(create_chunks_table) &&
           exec(create_indexes);
}

StorageResult FileIndex::put(const FileRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!db_) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index put", record.file_id, "database not open");
    }
    
    if (!exec("BEGIN IMMEDIATE;")) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index put", record.file_id, last_error());
    }
    
    auto fail = [this, &record](const std::string& cause) {
        exec("ROLLBACK;");
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index put", record.file_id, cause);
    };
    
    const char* insert_file_sql = R"(
        INSERT OR REPLACE INTO files
        (file_id, name, size, content_type, owner, file_hash, created_at, updated_at, is_encrypted, replicas, record_blob)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";
    
    {
        Statement stmt;
        if (sqlite3_prepare_v2(db_, insert_file_sql, -1, &stmt.stmt, nullptr) != SQLITE_OK) {
            return fail(last_error());
        }
        
        auto serialized = record.serialize();
        
        bind_text(stmt.stmt, 1, record.file_id);
        bind_text(stmt.stmt, 2, record.name);
        sqlite3_bind_int64(stmt.stmt, 3, static_cast<sqlite3_int64>(record.size));
        bind_text(stmt.stmt, 4, record.content_type);
        bind_text(stmt.stmt, 5, record.owner);
        bind_text(stmt.stmt, 6, record.hash);
        sqlite3_bind_int64(stmt.stmt, 7, to_millis(record.created_at));
        sqlite3_bind_int64(stmt.stmt, 8, to_millis(record.updated_at));
        sqlite3_bind_int(stmt.stmt, 9, record.is_encrypted ? 1 : 0);
        sqlite3_bind_int64(stmt.stmt, 10, record.replicas);
        sqlite3_bind_blob(stmt.stmt, 11, serialized.data(), static_cast<int>(serialized.size()), SQLITE_TRANSIENT);
        
        if (sqlite3_step(stmt.stmt) != SQLITE_DONE) {
            return fail(last_error());
        }
    }
    
    {
        Statement clear_stmt;
        if (sqlite3_prepare_v2(db_, "DELETE FROM chunks WHERE file_id = ?;", -1, &clear_stmt.stmt, nullptr) != SQLITE_OK) {
            return fail(last_error());
        }
        
        bind_text(clear_stmt.stmt, 1, record.file_id);
        if (sqlite3_step(clear_stmt.stmt) != SQLITE_DONE) {
            return fail(last_error());
        }
    }
    
    const char* insert_chunk_sql = R"(
        INSERT OR REPLACE INTO chunks (file_id, chunk_index, chunk_id, size, chunk_hash, checksum)
        VALUES (?, ?, ?, ?, ?, ?);
    )";
    
    Statement chunk_stmt;
    if (sqlite3_prepare_v2(db_, insert_chunk_sql, -1, &chunk_stmt.stmt, nullptr) != SQLITE_OK) {
        return fail(last_error());
    }
    
    for (const auto& chunk : record.chunks) {
        sqlite3_reset(chunk_stmt.stmt);
        sqlite3_clear_bindings(chunk_stmt.stmt);
        
        bind_text(chunk_stmt.stmt, 1, record.file_id);
        sqlite3_bind_int64(chunk_stmt.stmt, 2, static_cast<sqlite3_int64>(chunk.index));
        bind_text(chunk_stmt.stmt, 3, chunk.chunk_id);
        sqlite3_bind_int64(chunk_stmt.stmt, 4, static_cast<sqlite3_int64>(chunk.size));
        bind_text(chunk_stmt.stmt, 5, chunk.hash);
        bind_text(chunk_stmt.stmt, 6, chunk.checksum);
        
        if (sqlite3_step(chunk_stmt.stmt) != SQLITE_DONE) {
            return fail(last_error());
        }
    }
    
    if (!exec("COMMIT;")) {
        return fail(last_error());
    }
    
    return StorageResult();
}

StorageResult FileIndex::get(const std::string& file_id, FileRecord& out_record) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!db_) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index get", file_id, "database not open");
    }
    
    Statement stmt;
    if (sqlite3_prepare_v2(db_, "SELECT record_blob FROM files WHERE file_id = ?;", -1, &stmt.stmt, nullptr) != SQLITE_OK) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index get", file_id, last_error());
    }
    
    bind_text(stmt.stmt, 1, file_id);
    
    int result = sqlite3_step(stmt.stmt);
    if (result == SQLITE_DONE) {
        return StorageResult::failure(StorageError::NOT_FOUND, "index get", file_id, "no such file");
    }
    if (result != SQLITE_ROW) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index get", file_id, last_error());
    }
    
    const auto* blob_data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt.stmt, 0));
    int blob_size = sqlite3_column_bytes(stmt.stmt, 0);
    
    std::vector<std::uint8_t> serialized(blob_data, blob_data + blob_size);
    auto record = FileRecord::deserialize(serialized);
    if (!record) {
        return StorageResult::failure(StorageError::INTEGRITY_MISMATCH, "index get", file_id, "stored record is corrupt");
    }
    
    out_record = std::move(*record);
    return StorageResult();
}

StorageResult FileIndex::remove(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!db_) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index delete", file_id, "database not open");
    }
    
    Statement stmt;
    if (sqlite3_prepare_v2(db_, "DELETE FROM files WHERE file_id = ?;", -1, &stmt.stmt, nullptr) != SQLITE_OK) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index delete", file_id, last_error());
    }
    
    bind_text(stmt.stmt, 1, file_id);
    if (sqlite3_step(stmt.stmt) != SQLITE_DONE) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index delete", file_id, last_error());
    }
    
    if (sqlite3_changes(db_) == 0) {
        return StorageResult::failure(StorageError::NOT_FOUND, "index delete", file_id, "no such file");
    }
    
    return StorageResult();
}

StorageResult FileIndex::exists(const std::string& file_id, bool& out_exists) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!db_) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index exists", file_id, "database not open");
    }
    
    Statement stmt;
    if (sqlite3_prepare_v2(db_, "SELECT 1 FROM files WHERE file_id = ? LIMIT 1;", -1, &stmt.stmt, nullptr) != SQLITE_OK) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index exists", file_id, last_error());
    }
    
    bind_text(stmt.stmt, 1, file_id);
    
    int result = sqlite3_step(stmt.stmt);
    if (result != SQLITE_ROW && result != SQLITE_DONE) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index exists", file_id, last_error());
    }
    
    out_exists = result == SQLITE_ROW;
    return StorageResult();
}

StorageResult FileIndex::collect_records(sqlite3_stmt* stmt, const char* operation,
                                         std::vector<FileRecord>& out_records) {
    std::vector<FileRecord> records;
    
    int result;
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        const auto* blob_data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, 0));
        int blob_size = sqlite3_column_bytes(stmt, 0);
        
        std::vector<std::uint8_t> serialized(blob_data, blob_data + blob_size);
        auto record = FileRecord::deserialize(serialized);
        if (!record) {
            return StorageResult::failure(StorageError::INTEGRITY_MISMATCH, operation, "",
                                          "stored record is corrupt");
        }
        records.push_back(std::move(*record));
    }
    
    if (result != SQLITE_DONE) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, operation, "", last_error());
    }
    
    out_records = std::move(records);
    return StorageResult();
}

StorageResult FileIndex::list(std::vector<FileRecord>& out_records) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!db_) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index list", "", "database not open");
    }
    
    Statement stmt;
    if (sqlite3_prepare_v2(db_, "SELECT record_blob FROM files ORDER BY created_at DESC, file_id;",
                           -1, &stmt.stmt, nullptr) != SQLITE_OK) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index list", "", last_error());
    }
    
    return collect_records(stmt.stmt, "index list", out_records);
}

StorageResult FileIndex::search(const std::string& query, std::vector<FileRecord>& out_records) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!db_) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index search", query, "database not open");
    }
    
    const char* search_sql = R"(
        SELECT record_blob FROM files
        WHERE name LIKE ?1 OR content_type LIKE ?1 OR owner LIKE ?1
        ORDER BY created_at DESC, file_id;
    )";
    
    Statement stmt;
    if (sqlite3_prepare_v2(db_, search_sql, -1, &stmt.stmt, nullptr) != SQLITE_OK) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "index search", query, last_error());
    }
    
    bind_text(stmt.stmt, 1, "%" + query + "%");
    return collect_records(stmt.stmt, "index search", out_records);
}

StorageResult FileIndex::query_uint64(const char* sql, const char* operation, std::uint64_t& out_value) {
    if (!db_) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, operation, "", "database not open");
    }
    
    Statement stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt.stmt, nullptr) != SQLITE_OK) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, operation, "", last_error());
    }
    
    if (sqlite3_step(stmt.stmt) != SQLITE_ROW) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, operation, "", last_error());
    }
    
    out_value = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.stmt, 0));
    return StorageResult();
}

StorageResult FileIndex::count(size_t& out_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::uint64_t value = 0;
    auto result = query_uint64("SELECT COUNT(*) FROM files;", "index count", value);
    if (result) {
        out_count = static_cast<size_t>(value);
    }
    return result;
}

StorageResult FileIndex::total_size(std::uint64_t& out_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_uint64("SELECT COALESCE(SUM(size), 0) FROM files;", "index total size", out_bytes);
}

}
