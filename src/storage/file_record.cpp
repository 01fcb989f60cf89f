#include "chunkvault/storage/file_record.hpp"

namespace chunkvault::storage {

namespace {
    constexpr std::uint32_t RECORD_FORMAT_VERSION = 1;
    
    void write_u32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            buffer.push_back(static_cast<std::uint8_t>(value >> shift));
        }
    }
    
    void write_u64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            buffer.push_back(static_cast<std::uint8_t>(value >> shift));
        }
    }
    
    void write_string(std::vector<std::uint8_t>& buffer, const std::string& value) {
        write_u32(buffer, static_cast<std::uint32_t>(value.size()));
        buffer.insert(buffer.end(), value.begin(), value.end());
    }
    
    std::int64_t to_millis(std::chrono::system_clock::time_point time) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }
    
    std::chrono::system_clock::time_point from_millis(std::int64_t millis) {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
    }
    
    class Reader {
    public:
        explicit Reader(const std::vector<std::uint8_t>& data) : data_(data) {}
        
        bool read_u32(std::uint32_t& value) {
            if (remaining() < 4) return false;
            value = 0;
            for (int i = 0; i < 4; ++i) {
                value = (value << 8) | data_[offset_++];
            }
            return true;
        }
        
        bool read_u64(std::uint64_t& value) {
            if (remaining() < 8) return false;
            value = 0;
            for (int i = 0; i < 8; ++i) {
                value = (value << 8) | data_[offset_++];
            }
            return true;
        }
        
        bool read_string(std::string& value) {
            std::uint32_t length = 0;
            if (!read_u32(length) || remaining() < length) return false;
            value.assign(reinterpret_cast<const char*>(data_.data() + offset_), length);
            offset_ += length;
            return true;
        }
        
        bool at_end() const { return offset_ == data_.size(); }
        
    private:
        size_t remaining() const { return data_.size() - offset_; }
        
        const std::vector<std::uint8_t>& data_;
        size_t offset_ = 0;
    };
}

FileRecord::FileRecord(const std::string& name, const std::string& content_type, const std::string& owner)
    : name(name)
    , content_type(content_type)
    , owner(owner) {
}

std::vector<std::uint8_t> FileRecord::serialize() const {
    std::vector<std::uint8_t> buffer;
    
    write_u32(buffer, RECORD_FORMAT_VERSION);
    write_string(buffer, file_id);
    write_string(buffer, name);
    write_u64(buffer, size);
    write_string(buffer, content_type);
    write_string(buffer, owner);
    write_string(buffer, hash);
    write_u64(buffer, static_cast<std::uint64_t>(to_millis(created_at)));
    write_u64(buffer, static_cast<std::uint64_t>(to_millis(updated_at)));
    write_u32(buffer, is_encrypted ? 1 : 0);
    write_u32(buffer, replicas);
    
    write_u32(buffer, static_cast<std::uint32_t>(chunks.size()));
    for (const auto& chunk : chunks) {
        write_string(buffer, chunk.chunk_id);
        write_u64(buffer, chunk.index);
        write_u64(buffer, chunk.size);
        write_string(buffer, chunk.hash);
        write_string(buffer, chunk.checksum);
        
        write_u32(buffer, static_cast<std::uint32_t>(chunk.node_ids.size()));
        for (const auto& node_id : chunk.node_ids) {
            write_string(buffer, node_id);
        }
    }
    
    return buffer;
}

std::optional<FileRecord> FileRecord::deserialize(const std::vector<std::uint8_t>& data) {
    Reader reader(data);
    FileRecord record;
    
    std::uint32_t version = 0;
    if (!reader.read_u32(version) || version != RECORD_FORMAT_VERSION) {
        return std::nullopt;
    }
    
    std::uint64_t created = 0;
    std::uint64_t updated = 0;
    std::uint32_t encrypted = 0;
    std::uint32_t chunk_count = 0;
    
    if (!reader.read_string(record.file_id) ||
        !reader.read_string(record.name) ||
        !reader.read_u64(record.size) ||
        !reader.read_string(record.content_type) ||
        !reader.read_string(record.owner) ||
        !reader.read_string(record.hash) ||
        !reader.read_u64(created) ||
        !reader.read_u64(updated) ||
        !reader.read_u32(encrypted) ||
        !reader.read_u32(record.replicas) ||
        !reader.read_u32(chunk_count)) {
        return std::nullopt;
    }
    
    record.created_at = from_millis(static_cast<std::int64_t>(created));
    record.updated_at = from_millis(static_cast<std::int64_t>(updated));
    record.is_encrypted = encrypted != 0;
    
    for (std::uint32_t i = 0; i < chunk_count; ++i) {
        ChunkRecord chunk;
        std::uint32_t node_count = 0;
        
        if (!reader.read_string(chunk.chunk_id) ||
            !reader.read_u64(chunk.index) ||
            !reader.read_u64(chunk.size) ||
            !reader.read_string(chunk.hash) ||
            !reader.read_string(chunk.checksum) ||
            !reader.read_u32(node_count)) {
            return std::nullopt;
        }
        
        for (std::uint32_t n = 0; n < node_count; ++n) {
            std::string node_id;
            if (!reader.read_string(node_id)) {
                return std::nullopt;
            }
            chunk.node_ids.push_back(std::move(node_id));
        }
        
        record.chunks.push_back(std::move(chunk));
    }
    
    if (!reader.at_end()) {
        return std::nullopt;
    }
    
    return record;
}

std::string FileRecord::check_consistency() const {
    std::uint64_t total = 0;
    
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].index != i) {
            return "chunk at position " + std::to_string(i) + " has index " + std::to_string(chunks[i].index);
        }
        total += chunks[i].size;
    }
    
    if (total != size) {
        return "chunk sizes sum to " + std::to_string(total) + " but file size is " + std::to_string(size);
    }
    
    return "";
}

std::vector<std::string> FileRecord::chunk_ids() const {
    std::vector<std::string> ids;
    ids.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        ids.push_back(chunk.chunk_id);
    }
    return ids;
}

bool FileRecord::operator==(const FileRecord& other) const {
    // Timestamps compare at the millisecond precision they are persisted with
    return file_id == other.file_id &&
           name == other.name &&
           size == other.size &&
           content_type == other.content_type &&
           owner == other.owner &&
           hash == other.hash &&
           to_millis(created_at) == to_millis(other.created_at) &&
           to_millis(updated_at) == to_millis(other.updated_at) &&
           is_encrypted == other.is_encrypted &&
           chunks == other.chunks &&
           replicas == other.replicas;
}

}
