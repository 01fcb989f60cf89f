#pragma once

#include <filesystem>
#include <string>
#include <cstdint>

namespace chunkvault::core {
class Config;
}

namespace chunkvault::storage {

struct StorageConfig {
    std::filesystem::path base_directory;
    std::filesystem::path blob_directory;
    std::filesystem::path database_path;
    std::filesystem::path key_file_path;
    
    std::uint64_t chunk_size = 1024 * 1024; // 1MB
    std::uint32_t max_parallel_writes = 4;
    std::uint32_t replicas = 3;
    std::string node_id = "local";
    
    std::uint64_t max_file_size = 100ULL * 1024 * 1024; // 100MB
    std::uint64_t max_storage_size = 10ULL * 1024 * 1024 * 1024; // 10GB
    
    bool encrypt = true;
    
    StorageConfig() = default;
    
    explicit StorageConfig(const std::filesystem::path& base_dir);
    
    // Reads the storage.* and node.* keys, falling back to the defaults above.
    static StorageConfig from_config(const core::Config& config);
    
    // Empty when valid, otherwise a description of the first bad setting.
    std::string validate() const;
    
    bool create_directories() const;
    
    void set_base_directory(const std::filesystem::path& base_dir);
};

}
