#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>
#include <span>

namespace chunkvault::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    
    // 1536 -> "1.5 KB"
    static std::string format_bytes(std::uint64_t bytes);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    
    static bool read_file(const std::filesystem::path& path, std::vector<std::uint8_t>& out);
    static bool write_file(const std::filesystem::path& path, std::span<const std::uint8_t> data);
};

}
