#ifndef KNAPSACK_CONTENT_ADDRESSER_HPP
#define KNAPSACK_CONTENT_ADDRESSER_HPP

#include "video_metadata.hpp"
#include "../common/config.hpp" // For DEFAULT_CHUNK_SIZE
#include <functional>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

class ContentAddresser {
public:
    // Side-channel metadata file: "KPSK", version byte, encoded VideoMetadata.
    static constexpr char METADATA_MAGIC[4] = {'K', 'P', 'S', 'K'};
    static constexpr uint8_t METADATA_FORMAT_VERSION = 1;
    static constexpr const char* METADATA_EXTENSION = ".kpsk";

    /**
     * @brief Splits bytes into chunks and derives every content id.
     *
     * Chunks are chunk_size bytes except possibly the last. Each chunk id is
     * the SHA-256 of its payload; the video id is the SHA-256 of the chunk ids
     * in order. Title, description, duration and codec are left at defaults.
     *
     * @throws KnapsackError(EmptyInput) if bytes is empty, (InvalidArgument) if
     *         chunk_size is zero or larger than MAX_CHUNK_SIZE.
     */
    static VideoMetadata chunk_and_hash(const std::vector<uint8_t>& bytes, uint32_t chunk_size = DEFAULT_CHUNK_SIZE);

    // The chunk payloads chunk_and_hash hashes, in order.
    static std::vector<std::vector<uint8_t>> split_chunks(const std::vector<uint8_t>& bytes, uint32_t chunk_size = DEFAULT_CHUNK_SIZE);

    /**
     * @brief Reads a whole file.
     * @throws KnapsackError(IoError) if the file cannot be opened or read.
     */
    static std::vector<uint8_t> read_file(const fs::path& file_path);

    using ChunkVisitor = std::function<void(uint32_t order, const std::vector<uint8_t>& payload)>;

    /**
     * @brief Streams a file through visit one chunk at a time, in order.
     *
     * Only one chunk_size buffer is held, so files larger than memory work.
     * @throws KnapsackError(IoError) on open or read failures.
     */
    static void for_each_file_chunk(const fs::path& file_path, uint32_t chunk_size, const ChunkVisitor& visit);

    /**
     * @brief Builds complete metadata for a media file without loading it whole.
     *
     * Title is the file stem; duration and codec come from read_media_file_info.
     * @throws KnapsackError(EmptyInput) for an empty file.
     */
    static VideoMetadata prepare_file(const fs::path& file_path, uint32_t chunk_size = DEFAULT_CHUNK_SIZE);

    // Fills title/duration/codec from the file name and container.
    static void describe(VideoMetadata& metadata, const fs::path& file_path);

    // "<media>.kpsk"
    static fs::path metadata_file_path(const fs::path& media_path);

    static void write_metadata_file(const VideoMetadata& metadata, const fs::path& path);

    /**
     * @brief Reads and validates a side-channel metadata file.
     * @throws KnapsackError(IoError) if unreadable, (InvalidMetadata) if malformed.
     */
    static VideoMetadata read_metadata_file(const fs::path& path);
};

#endif // KNAPSACK_CONTENT_ADDRESSER_HPP
