#include "chunkvault/storage/key_lock.hpp"

namespace chunkvault::storage {

KeyLockTable::Guard::Guard(KeyLockTable* table, std::string key, std::shared_ptr<Entry> entry)
    : table_(table), key_(std::move(key)), entry_(std::move(entry)), lock_(entry_->mutex) {
}

KeyLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_),
      key_(std::move(other.key_)),
      entry_(std::move(other.entry_)),
      lock_(std::move(other.lock_)) {
    other.table_ = nullptr;
}

KeyLockTable::Guard::~Guard() {
    if (!table_) {
        return;
    }
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
    table_->release(key_);
}

KeyLockTable::Guard KeyLockTable::acquire(const std::string& key) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        auto& slot = entries_[key];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        ++slot->users;
        entry = slot;
    }
    
    // Locks outside the table mutex so other keys stay available.
    return Guard(this, key, std::move(entry));
}

size_t KeyLockTable::size() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return entries_.size();
}

void KeyLockTable::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    if (--it->second->users == 0) {
        entries_.erase(it);
    }
}

}
