#include "chunkvault/core/command_handler.hpp"
#include "chunkvault/core/config.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/key_provider.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace chunkvault::core {

using utils::StringUtils;

namespace {
    std::string format_time(std::chrono::system_clock::time_point time) {
        auto seconds = std::chrono::system_clock::to_time_t(time);
        std::tm tm{};
        gmtime_r(&seconds, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
        return oss.str();
    }
    
    CommandResult failed(const storage::StorageResult& result) {
        return CommandResult::error(std::string(storage::to_string(result.error)) + ": " + result.message);
    }
}

storage::StorageResult StorageCommandHandler::open_service() {
    if (service_) {
        return storage::StorageResult();
    }
    
    auto config = storage::StorageConfig::from_config(Config::instance());
    if (!config.create_directories()) {
        return storage::StorageResult::failure(storage::StorageError::STORAGE_IO_ERROR, "open",
                                               config.base_directory.string(), "cannot create directories");
    }
    
    std::shared_ptr<crypto::KeyProvider> key_provider;
    if (config.encrypt) {
        crypto::EncryptionKey master_key;
        auto key_result = utils::FileUtils::exists(config.key_file_path)
            ? crypto::key_file::load(config.key_file_path, master_key)
            : crypto::key_file::generate(config.key_file_path, master_key);
        if (!key_result) {
            return storage::StorageResult::failure(storage::from_crypto_error(key_result.error), "open",
                                                   config.key_file_path.string(), key_result.message);
        }
        key_provider = std::make_shared<crypto::DerivedKeyProvider>(std::move(master_key));
    }
    
    return storage::StorageService::open(config, std::move(key_provider), service_);
}

PutCommandHandler::PutCommandHandler(std::string content_type, std::string owner)
    : content_type_(std::move(content_type)), owner_(std::move(owner)) {
}

CommandResult PutCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = args[1];
    
    std::vector<std::uint8_t> data;
    if (!utils::FileUtils::read_file(file_path, data)) {
        return CommandResult::error("Cannot read file: " + file_path.string());
    }
    
    auto result = open_service();
    if (!result) {
        return failed(result);
    }
    
    LOG_INFO("Storing {} ({})", file_path.string(), StringUtils::format_bytes(data.size()));
    
    storage::FileRecord record;
    result = service().upload(file_path.filename().string(), content_type_, owner_, data, record);
    if (!result) {
        return failed(result);
    }
    
    std::cout << record.file_id << "\n";
    std::cout << "  Name:   " << record.name << "\n";
    std::cout << "  Size:   " << StringUtils::format_bytes(record.size) << "\n";
    std::cout << "  Chunks: " << record.chunks.size() << "\n";
    
    return CommandResult::ok();
}

CommandResult GetCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto result = open_service();
    if (!result) {
        return failed(result);
    }
    
    storage::FileRecord record;
    std::vector<std::uint8_t> data;
    result = service().download(args[1], record, data);
    if (!result) {
        return failed(result);
    }
    
    std::filesystem::path output_path = args[2];
    if (!utils::FileUtils::write_file(output_path, data)) {
        return CommandResult::error("Cannot write file: " + output_path.string());
    }
    
    std::cout << "Restored " << record.name << " (" << StringUtils::format_bytes(record.size)
              << ") to " << output_path.string() << "\n";
    return CommandResult::ok();
}

CommandResult RemoveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto result = open_service();
    if (!result) {
        return failed(result);
    }
    
    result = service().remove(args[1]);
    if (!result) {
        return failed(result);
    }
    
    std::cout << "Removed " << args[1] << "\n";
    return CommandResult::ok();
}

CommandResult ListCommandHandler::execute(const std::vector<std::string>& args) {
    auto result = open_service();
    if (!result) {
        return failed(result);
    }
    
    std::vector<storage::FileRecord> records;
    result = args.size() > 1 ? service().search(args[1], records) : service().list_files(records);
    if (!result) {
        return failed(result);
    }
    
    if (records.empty()) {
        std::cout << "No files stored.\n";
        return CommandResult::ok();
    }
    
    for (const auto& record : records) {
        std::cout << record.file_id.substr(0, 16) << "  "
                  << std::right << std::setw(10) << StringUtils::format_bytes(record.size) << "  "
                  << format_time(record.created_at) << "  "
                  << record.name << "\n";
    }
    std::cout << records.size() << " file(s)\n";
    
    return CommandResult::ok();
}

CommandResult InfoCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto result = open_service();
    if (!result) {
        return failed(result);
    }
    
    storage::FileRecord record;
    result = service().info(args[1], record);
    if (!result) {
        return failed(result);
    }
    
    std::cout << "File ID:      " << record.file_id << "\n";
    std::cout << "Name:         " << record.name << "\n";
    std::cout << "Size:         " << StringUtils::format_bytes(record.size) << " (" << record.size << " bytes)\n";
    std::cout << "Content type: " << record.content_type << "\n";
    std::cout << "Owner:        " << (record.owner.empty() ? "-" : record.owner) << "\n";
    std::cout << "Hash:         " << record.hash << "\n";
    std::cout << "Encrypted:    " << (record.is_encrypted ? "yes" : "no") << "\n";
    std::cout << "Replicas:     " << record.replicas << "\n";
    std::cout << "Created:      " << format_time(record.created_at) << "\n";
    std::cout << "Updated:      " << format_time(record.updated_at) << "\n";
    std::cout << "Chunks:       " << record.chunks.size() << "\n";
    
    for (const auto& chunk : record.chunks) {
        std::cout << "  [" << chunk.index << "] " << chunk.chunk_id
                  << "  " << StringUtils::format_bytes(chunk.size);
        if (!chunk.node_ids.empty()) {
            std::cout << "  on";
            for (const auto& node : chunk.node_ids) {
                std::cout << " " << node;
            }
        }
        std::cout << "\n";
    }
    
    return CommandResult::ok();
}

CommandResult StatsCommandHandler::execute(const std::vector<std::string>& args) {
    auto result = open_service();
    if (!result) {
        return failed(result);
    }
    
    storage::StorageStats stats;
    result = service().stats(stats);
    if (!result) {
        return failed(result);
    }
    
    const auto& config = service().config();
    std::cout << "Files:        " << stats.file_count << "\n";
    std::cout << "Blobs:        " << stats.blob_count << "\n";
    std::cout << "Stored data:  " << StringUtils::format_bytes(stats.logical_bytes) << "\n";
    std::cout << "Disk usage:   " << StringUtils::format_bytes(stats.bytes_used) << "\n";
    std::cout << "Storage cap:  " << StringUtils::format_bytes(config.max_storage_size) << "\n";
    std::cout << "Location:     " << config.base_directory.string() << "\n";
    
    return CommandResult::ok();
}

CommandResult GcCommandHandler::execute(const std::vector<std::string>& args) {
    auto result = open_service();
    if (!result) {
        return failed(result);
    }
    
    size_t removed = 0;
    result = service().collect_garbage(removed);
    if (!result) {
        return failed(result);
    }
    
    std::cout << "Removed " << removed << " orphaned blob(s)\n";
    return CommandResult::ok();
}

}
