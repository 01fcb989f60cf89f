#pragma once

#include <vector>
#include <span>
#include <cstdint>

namespace chunkvault::storage {

using ByteSpan = std::span<const std::uint8_t>;

// Views into `data` in order. Every segment but the last holds exactly
// chunk_size bytes. chunk_size == 0 yields the whole input as one segment and
// empty input yields a single empty segment.
std::vector<ByteSpan> split(ByteSpan data, size_t chunk_size);

// Number of segments split() would produce.
size_t segment_count(size_t data_size, size_t chunk_size);

std::vector<std::uint8_t> join(const std::vector<ByteSpan>& segments);
std::vector<std::uint8_t> join(const std::vector<std::vector<std::uint8_t>>& segments);

}
