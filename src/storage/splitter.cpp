#include "chunkvault/storage/splitter.hpp"
#include <algorithm>

namespace chunkvault::storage {

size_t segment_count(size_t data_size, size_t chunk_size) {
    if (chunk_size == 0 || data_size == 0) {
        return 1;
    }
    return (data_size + chunk_size - 1) / chunk_size;
}

std::vector<ByteSpan> split(ByteSpan data, size_t chunk_size) {
    std::vector<ByteSpan> segments;
    
    if (chunk_size == 0 || data.empty()) {
        segments.push_back(data);
        return segments;
    }
    
    segments.reserve(segment_count(data.size(), chunk_size));
    for (size_t offset = 0; offset < data.size(); offset += chunk_size) {
        size_t length = std::min(chunk_size, data.size() - offset);
        segments.push_back(data.subspan(offset, length));
    }
    
    return segments;
}

namespace {
    template<typename Segments>
    std::vector<std::uint8_t> concatenate(const Segments& segments) {
        size_t total = 0;
        for (const auto& segment : segments) {
            total += segment.size();
        }
        
        std::vector<std::uint8_t> result;
        result.reserve(total);
        for (const auto& segment : segments) {
            result.insert(result.end(), segment.begin(), segment.end());
        }
        return result;
    }
}

std::vector<std::uint8_t> join(const std::vector<ByteSpan>& segments) {
    return concatenate(segments);
}

std::vector<std::uint8_t> join(const std::vector<std::vector<std::uint8_t>>& segments) {
    return concatenate(segments);
}

}
