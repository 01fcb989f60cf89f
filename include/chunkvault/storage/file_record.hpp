#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace chunkvault::storage {

struct ChunkRecord {
    std::string chunk_id;               // content address of (file id, index, plaintext)
    std::uint64_t index = 0;
    std::uint64_t size = 0;             // plaintext bytes
    std::string hash;                   // SHA-256 of the plaintext
    std::string checksum;               // SHA-256 of the stored (possibly sealed) blob
    std::vector<std::string> node_ids;  // nodes holding a copy; may be empty
    
    bool operator==(const ChunkRecord& other) const = default;
};

struct FileRecord {
    std::string file_id;
    std::string name;
    std::uint64_t size = 0;
    std::string content_type;
    std::string owner;
    std::string hash;                   // SHA-256 of the full plaintext
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point updated_at{};
    bool is_encrypted = true;
    std::vector<ChunkRecord> chunks;
    std::uint32_t replicas = 0;
    
    FileRecord() = default;
    
    FileRecord(const std::string& name, const std::string& content_type, const std::string& owner);
    
    std::vector<std::uint8_t> serialize() const;
    
    // nullopt on truncated or malformed input.
    static std::optional<FileRecord> deserialize(const std::vector<std::uint8_t>& data);
    
    // Checks that indices run 0..n-1 and chunk sizes add up to `size`.
    // Returns an empty string when consistent, otherwise the first problem.
    std::string check_consistency() const;
    
    std::vector<std::string> chunk_ids() const;
    
    bool operator==(const FileRecord& other) const;
    bool operator!=(const FileRecord& other) const { return !(*this == other); }
};

}
