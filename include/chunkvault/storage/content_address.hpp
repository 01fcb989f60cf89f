#pragma once

#include "../crypto/crypto_types.hpp"
#include <string>
#include <span>
#include <cstdint>

namespace chunkvault::storage::content_address {

constexpr size_t ID_LENGTH = crypto::SHA256_HASH_SIZE * 2;

// SHA-256(big-endian uint64 name length || name || content), hex encoded.
// The length prefix keeps ("a", "bc") and ("ab", "c") apart.
std::string file_id(const std::string& name, std::span<const std::uint8_t> content);

// SHA-256(file_id || big-endian uint64 index || content), hex encoded. The
// position is part of the address, so equal bytes at different offsets or in
// different files get different ids.
std::string chunk_id(const std::string& file_id, std::uint64_t index, std::span<const std::uint8_t> content);

// SHA-256(content), hex encoded. Pure content, used for integrity checks.
std::string hash(std::span<const std::uint8_t> content);

// 64 lowercase hex characters.
bool is_valid_id(const std::string& id);

}
