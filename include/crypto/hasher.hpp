#ifndef KNAPSACK_HASHER_HPP
#define KNAPSACK_HASHER_HPP

#include <vector>
#include <string>
#include <optional>
#include "../video/video_metadata.hpp" // For hash_t

namespace Hasher {

/**
 * @brief Calculates the SHA-256 hash of a data buffer.
 * @param data The data to hash.
 * @param size Number of bytes at data.
 * @return A 32-byte SHA-256 hash.
 * @throws std::runtime_error if OpenSSL fails.
 */
hash_t sha256(const uint8_t* data, size_t size);

hash_t sha256(const std::vector<uint8_t>& data);
hash_t sha256(const std::string& data);

/**
 * @brief Parses 64 hex characters.
 * @throws KnapsackError(InvalidMetadata) on malformed input.
 */
hash_t hex_to_hash(const std::string& hex);

// Like hex_to_hash, but returns nullopt on malformed input.
std::optional<hash_t> try_hex_to_hash(const std::string& hex);

std::string hash_to_hex(const hash_t& hash);

// First 8 hex characters, for log lines.
std::string short_hex(const hash_t& hash);

} // namespace Hasher

#endif // KNAPSACK_HASHER_HPP
