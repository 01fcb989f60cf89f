#include "chunkvault/storage/blob_store.hpp"
#include "chunkvault/storage/content_address.hpp"
#include "chunkvault/crypto/random.hpp"
#include "chunkvault/core/logger.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>
#include <fstream>

namespace chunkvault::storage {

namespace {
    constexpr char TEMP_MARKER[] = ".tmp-";
    constexpr size_t TEMP_RANDOM_BYTES = 8;
    
    bool is_shard_name(const std::string& name) {
        if (name.size() != FileBlobStore::SHARD_PREFIX_LENGTH) {
            return false;
        }
        return std::all_of(name.begin(), name.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
    }
    
    std::string temp_suffix() {
        std::array<std::uint8_t, TEMP_RANDOM_BYTES> random_bytes{};
        auto result = crypto::SecureRandom::generate_bytes(std::span(random_bytes));
        if (!result) {
            throw std::runtime_error("blob store: " + result.message);
        }
        
        std::array<char, TEMP_RANDOM_BYTES * 2 + 1> hex{};
        sodium_bin2hex(hex.data(), hex.size(), random_bytes.data(), random_bytes.size());
        return std::string(TEMP_MARKER) + hex.data();
    }
}

FileBlobStore::FileBlobStore(const std::filesystem::path& base_dir)
    : base_dir_(base_dir) {
}

StorageResult FileBlobStore::initialize() {
    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
    if (ec) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "init", base_dir_.string(),
                                      "cannot create directory: " + ec.message());
    }
    
    LOG_DEBUG("Blob store ready at {}", base_dir_.string());
    return StorageResult();
}

std::string FileBlobStore::shard_of(const std::string& id) {
    return id.substr(0, SHARD_PREFIX_LENGTH);
}

std::filesystem::path FileBlobStore::get_blob_path(const std::string& id) const {
    return base_dir_ / shard_of(id) / id;
}

StorageResult FileBlobStore::put(const std::string& id, std::span<const std::uint8_t> data) {
    if (!content_address::is_valid_id(id)) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "put", id, "malformed blob id");
    }
    
    auto blob_path = get_blob_path(id);
    
    std::error_code ec;
    std::filesystem::create_directories(blob_path.parent_path(), ec);
    if (ec) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "put", id,
                                      "cannot create shard directory: " + ec.message());
    }
    
    auto temp_path = blob_path;
    temp_path += temp_suffix();
    
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "put", id,
                                          "cannot open " + temp_path.string());
        }
        
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "put", id, "short write");
        }
    }
    
    std::filesystem::rename(temp_path, blob_path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "put", id,
                                      "cannot move blob into place: " + ec.message());
    }
    
    LOG_TRACE("Stored blob {} ({} bytes)", id, data.size());
    return StorageResult();
}

StorageResult FileBlobStore::get(const std::string& id, std::vector<std::uint8_t>& out) {
    out.clear();
    
    if (!content_address::is_valid_id(id)) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "get", id, "malformed blob id");
    }
    
    auto blob_path = get_blob_path(id);
    
    std::error_code ec;
    auto size = std::filesystem::file_size(blob_path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return StorageResult::failure(StorageError::NOT_FOUND, "get", id, "blob not found");
        }
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "get", id, ec.message());
    }
    
    std::ifstream file(blob_path, std::ios::binary);
    if (!file.is_open()) {
        return StorageResult::failure(StorageError::NOT_FOUND, "get", id, "blob not found");
    }
    
    std::vector<std::uint8_t> data(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (static_cast<std::uintmax_t>(file.gcount()) != size) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "get", id, "short read");
    }
    
    out = std::move(data);
    return StorageResult();
}

StorageResult FileBlobStore::remove(const std::string& id) {
    if (!content_address::is_valid_id(id)) {
        return StorageResult::failure(StorageError::INVALID_ARGUMENT, "delete", id, "malformed blob id");
    }
    
    std::error_code ec;
    bool removed = std::filesystem::remove(get_blob_path(id), ec);
    if (ec) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, "delete", id, ec.message());
    }
    
    if (removed) {
        LOG_TRACE("Removed blob {}", id);
    }
    return StorageResult();
}

bool FileBlobStore::exists(const std::string& id) {
    if (!content_address::is_valid_id(id)) {
        return false;
    }
    
    std::error_code ec;
    return std::filesystem::is_regular_file(get_blob_path(id), ec);
}

template<typename Visitor>
StorageResult FileBlobStore::for_each_blob(const char* operation, Visitor&& visit) {
    std::error_code ec;
    if (!std::filesystem::exists(base_dir_, ec)) {
        return StorageResult();
    }
    
    try {
        std::filesystem::directory_iterator shards(base_dir_, ec);
        if (ec) {
            return StorageResult::failure(StorageError::STORAGE_IO_ERROR, operation, base_dir_.string(), ec.message());
        }
    
        for (const auto& shard : shards) {
            auto shard_name = shard.path().filename().string();
            if (!is_shard_name(shard_name) || !shard.is_directory(ec)) {
                continue;
            }
        
            std::filesystem::directory_iterator blobs(shard.path(), ec);
            if (ec) {
                // The shard may have been removed concurrently
                if (ec == std::errc::no_such_file_or_directory) {
                    continue;
                }
                return StorageResult::failure(StorageError::STORAGE_IO_ERROR, operation, shard.path().string(), ec.message());
            }
        
            for (const auto& blob : blobs) {
                auto name = blob.path().filename().string();
                if (!content_address::is_valid_id(name) || shard_of(name) != shard_name) {
                    continue;
                }
            
                auto size = blob.file_size(ec);
                if (ec) {
                    if (ec == std::errc::no_such_file_or_directory) {
                        continue;
                    }
                    return StorageResult::failure(StorageError::STORAGE_IO_ERROR, operation, name, ec.message());
                }
            
                visit(name, static_cast<std::uint64_t>(size));
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        return StorageResult::failure(StorageError::STORAGE_IO_ERROR, operation, base_dir_.string(), e.what());
    }
    
    return StorageResult();
}

StorageResult FileBlobStore::list(std::vector<std::string>& out_ids) {
    std::vector<std::string> ids;
    auto result = for_each_blob("list", [&ids](const std::string& id, std::uint64_t) {
        ids.push_back(id);
    });
    if (!result) {
        return result;
    }
    
    std::sort(ids.begin(), ids.end());
    out_ids = std::move(ids);
    return StorageResult();
}

StorageResult FileBlobStore::usage(std::uint64_t& out_bytes) {
    std::uint64_t total = 0;
    auto result = for_each_blob("usage", [&total](const std::string&, std::uint64_t size) {
        total += size;
    });
    if (!result) {
        return result;
    }
    
    out_bytes = total;
    return StorageResult();
}

}
