#include "chunkvault/storage/storage_config.hpp"
#include "chunkvault/core/config.hpp"
#include "chunkvault/core/logger.hpp"

namespace chunkvault::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

StorageConfig StorageConfig::from_config(const core::Config& config) {
    StorageConfig defaults;
    StorageConfig storage_config(config.get_string("storage.base_dir", "./chunkvault_data"));
    
    storage_config.chunk_size = config.get_uint64("storage.chunk_size", defaults.chunk_size);
    storage_config.max_parallel_writes = static_cast<std::uint32_t>(
        config.get_int("storage.max_parallel_writes", static_cast<int>(defaults.max_parallel_writes)));
    storage_config.replicas = static_cast<std::uint32_t>(
        config.get_int("storage.replicas", static_cast<int>(defaults.replicas)));
    storage_config.max_file_size = config.get_uint64("storage.max_file_size", defaults.max_file_size);
    storage_config.max_storage_size = config.get_uint64("storage.max_storage", defaults.max_storage_size);
    storage_config.encrypt = config.get_bool("storage.encrypt", defaults.encrypt);
    storage_config.node_id = config.get_string("node.id", defaults.node_id);
    
    return storage_config;
}

std::string StorageConfig::validate() const {
    if (base_directory.empty() || blob_directory.empty() || database_path.empty()) {
        return "storage directories are not set";
    }
    
    if (chunk_size == 0) {
        return "chunk size must be positive";
    }
    
    if (max_parallel_writes == 0 || max_parallel_writes > 256) {
        return "max parallel writes must be between 1 and 256";
    }
    
    if (replicas == 0) {
        return "replica count must be positive";
    }
    
    if (max_file_size == 0 || max_storage_size == 0) {
        return "size limits must be positive";
    }
    
    return "";
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(base_directory);
        std::filesystem::create_directories(blob_directory);
        
        auto db_dir = database_path.parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }
        
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR("Failed to create storage directories: {}", e.what());
        return false;
    }
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    base_directory = base_dir;
    blob_directory = base_dir / "blobs";
    database_path = base_dir / "chunkvault.db";
    key_file_path = base_dir / "master.key";
}

}
