#ifndef KNAPSACK_VIDEO_METADATA_HPP
#define KNAPSACK_VIDEO_METADATA_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <array>
#include <iosfwd>

// SHA-256 digests identify every chunk and video.
constexpr size_t HASH_SIZE = 32;
using hash_t = std::array<uint8_t, HASH_SIZE>;
using ContentId = hash_t;

constexpr double UNKNOWN_DURATION = 0.0;
constexpr const char* UNKNOWN_CODEC = "unknown";

struct ChunkSummary {
    ContentId id{};
    uint32_t order = 0;
    uint64_t size = 0;

    bool operator==(const ChunkSummary& other) const {
        return id == other.id && order == other.order && size == other.size;
    }
};

// A stored chunk: the summary plus the video it was stored under.
struct ChunkRecord {
    ContentId id{};
    uint32_t order = 0;
    uint64_t size = 0;
    ContentId video_id{};
};

struct VideoMetadata {
    ContentId id{};
    std::vector<ChunkSummary> chunks; // sorted by order, dense 0..n-1
    double duration = UNKNOWN_DURATION; // seconds
    std::string codec = UNKNOWN_CODEC;
    std::string title;
    std::string description;

    uint64_t total_size() const;

    // Prints a human-readable summary (used by the command line tool).
    void print(std::ostream& out) const;
};

/**
 * @brief Digest of the ordered concatenation of the chunk ids.
 *
 * Chunk ids are fixed width so no delimiter is needed.
 */
ContentId compute_video_id(const std::vector<ChunkSummary>& chunks);

/**
 * @brief Checks the structural invariants of a metadata record.
 *
 * Throws KnapsackError(InvalidMetadata) when the chunk list is empty or its
 * order is not the dense sequence 0..n-1, and KnapsackError(HashMismatch) when
 * the id is not the digest of the chunk ids.
 */
void validate_metadata(const VideoMetadata& metadata);

// Non-throwing variant of validate_metadata.
bool is_valid_metadata(const VideoMetadata& metadata);

// Case-insensitive substring match on title/description, or exact hex id.
bool matches_query(const VideoMetadata& metadata, const std::string& query);

#endif // KNAPSACK_VIDEO_METADATA_HPP
