#include "chunkvault/core/config.hpp"
#include "chunkvault/core/utils.hpp"
#include <algorithm>
#include <cctype>

namespace chunkvault::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        
        if (!key.empty()) {
            values_[key] = value;
        }
    }
    
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# chunkvault configuration\n\n";
    
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }
    
    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get_as<std::uint64_t>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["storage.base_dir"] = "./chunkvault_data";
    values_["storage.chunk_size"] = "1048576";
    values_["storage.max_parallel_writes"] = "4";
    values_["storage.replicas"] = "3";
    values_["storage.max_file_size"] = "104857600";
    values_["storage.max_storage"] = "10737418240";
    values_["storage.encrypt"] = "true";
    values_["node.id"] = "local";
    values_["log.level"] = "info";
    values_["log.file"] = "chunkvault.log";
}

std::string Config::trim(const std::string& str) const {
    return utils::StringUtils::trim(str);
}

}
