#pragma once

#include <string>
#include <memory>
#include <unordered_map>
#include <mutex>

namespace chunkvault::storage {

// One mutex per key, created on first use and dropped once nobody holds or
// waits for it. Work on different keys never contends.
class KeyLockTable {
    struct Entry {
        std::mutex mutex;
        size_t users = 0;
    };

public:
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        ~Guard();
        
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        
    private:
        friend class KeyLockTable;
        
        Guard(KeyLockTable* table, std::string key, std::shared_ptr<Entry> entry);
        
        KeyLockTable* table_;
        std::string key_;
        std::shared_ptr<Entry> entry_;
        std::unique_lock<std::mutex> lock_;
    };
    
    // Blocks until the key is free.
    Guard acquire(const std::string& key);
    
    // Keys currently held or waited on.
    size_t size() const;

private:
    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    
    void release(const std::string& key);
};

}
