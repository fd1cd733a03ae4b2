#include "video/content_addresser.hpp"
#include "video/media_info.hpp"
#include "crypto/hasher.hpp"
#include "common/serializer.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include "network/protocol.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <string>

namespace {

void check_chunk_size(uint32_t chunk_size, const char* operation) {
    if (chunk_size == 0) {
        throw KnapsackError(ErrorKind::InvalidArgument, operation, "chunk size must be positive");
    }
    if (chunk_size > MAX_CHUNK_SIZE) {
        throw KnapsackError(ErrorKind::InvalidArgument, operation,
                            "chunk size " + std::to_string(chunk_size) + " exceeds the largest transferable chunk (" +
                                std::to_string(MAX_CHUNK_SIZE) + " bytes)");
    }
}

// Calls slice(order, data, size) for each chunk_size piece of bytes, in order.
template <typename Slice>
void for_each_slice(const std::vector<uint8_t>& bytes, uint32_t chunk_size, Slice slice) {
    uint32_t order = 0;
    for (size_t offset = 0; offset < bytes.size(); offset += chunk_size) {
        const size_t size = std::min<size_t>(chunk_size, bytes.size() - offset);
        slice(order++, bytes.data() + offset, size);
    }
}

} // namespace

VideoMetadata ContentAddresser::chunk_and_hash(const std::vector<uint8_t>& bytes, uint32_t chunk_size) {
    check_chunk_size(chunk_size, "chunk_and_hash");
    if (bytes.empty()) {
        throw KnapsackError(ErrorKind::EmptyInput, "chunk_and_hash", "nothing to chunk");
    }

    VideoMetadata metadata;
    metadata.chunks.reserve((bytes.size() + chunk_size - 1) / chunk_size);
    for_each_slice(bytes, chunk_size, [&metadata](uint32_t order, const uint8_t* data, size_t size) {
        ChunkSummary chunk;
        chunk.id = Hasher::sha256(data, size);
        chunk.order = order;
        chunk.size = size;
        metadata.chunks.push_back(chunk);
    });

    metadata.id = compute_video_id(metadata.chunks);
    return metadata;
}

std::vector<std::vector<uint8_t>> ContentAddresser::split_chunks(const std::vector<uint8_t>& bytes, uint32_t chunk_size) {
    check_chunk_size(chunk_size, "split_chunks");
    std::vector<std::vector<uint8_t>> chunks;
    for_each_slice(bytes, chunk_size, [&chunks](uint32_t, const uint8_t* data, size_t size) {
        chunks.emplace_back(data, data + size);
    });
    return chunks;
}

void ContentAddresser::for_each_file_chunk(const fs::path& file_path, uint32_t chunk_size, const ChunkVisitor& visit) {
    check_chunk_size(chunk_size, "for_each_file_chunk");
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        throw KnapsackError(ErrorKind::IoError, "for_each_file_chunk", "not a regular file: " + file_path.string());
    }
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw KnapsackError(ErrorKind::IoError, "for_each_file_chunk", "failed to open " + file_path.string());
    }

    // One chunk in memory at a time.
    std::vector<uint8_t> chunk_buffer(chunk_size);
    for (uint32_t order = 0;; ++order) {
        file.read(reinterpret_cast<char*>(chunk_buffer.data()), chunk_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read <= 0) break;

        // If we read less than a full chunk, this is the tail
        if (static_cast<size_t>(bytes_read) < chunk_buffer.size()) {
            chunk_buffer.resize(static_cast<size_t>(bytes_read));
        }
        visit(order, chunk_buffer);
        if (!file) break;
    }
    if (file.bad()) {
        throw KnapsackError(ErrorKind::IoError, "for_each_file_chunk", "read error on " + file_path.string());
    }
}

std::vector<uint8_t> ContentAddresser::read_file(const fs::path& file_path) {
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        throw KnapsackError(ErrorKind::IoError, "read_file",
                            "not a regular file: " + file_path.string());
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw KnapsackError(ErrorKind::IoError, "read_file", "failed to open " + file_path.string());
    }

    const auto file_size = fs::file_size(file_path, ec);
    if (ec) {
        throw KnapsackError(ErrorKind::IoError, "read_file", file_path.string() + ": " + ec.message());
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(file_size));
    if (!bytes.empty() && !file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()))) {
        throw KnapsackError(ErrorKind::IoError, "read_file", "short read from " + file_path.string());
    }
    return bytes;
}

void ContentAddresser::describe(VideoMetadata& metadata, const fs::path& file_path) {
    metadata.title = file_path.stem().string();
    MediaInfo info = read_media_file_info(file_path);
    metadata.duration = info.duration;
    metadata.codec = info.codec;
}

VideoMetadata ContentAddresser::prepare_file(const fs::path& file_path, uint32_t chunk_size) {
    VideoMetadata metadata;
    for_each_file_chunk(file_path, chunk_size, [&metadata](uint32_t order, const std::vector<uint8_t>& payload) {
        ChunkSummary chunk;
        chunk.id = Hasher::sha256(payload);
        chunk.order = order;
        chunk.size = payload.size();
        metadata.chunks.push_back(chunk);
    });
    if (metadata.chunks.empty()) {
        throw KnapsackError(ErrorKind::EmptyInput, "prepare_file", file_path.string() + " is empty");
    }
    metadata.id = compute_video_id(metadata.chunks);

    describe(metadata, file_path);
    LOG_DEBUG("Chunked ", file_path.string(), " into ", metadata.chunks.size(), " chunks, id ",
              Hasher::short_hex(metadata.id));
    return metadata;
}

fs::path ContentAddresser::metadata_file_path(const fs::path& media_path) {
    fs::path path = media_path;
    path += METADATA_EXTENSION;
    return path;
}

void ContentAddresser::write_metadata_file(const VideoMetadata& metadata, const fs::path& path) {
    std::vector<uint8_t> body = Serializer::serialize_video_metadata(metadata);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw KnapsackError(ErrorKind::IoError, "write_metadata_file", "cannot write " + path.string());
    }
    out.write(METADATA_MAGIC, sizeof(METADATA_MAGIC));
    out.put(static_cast<char>(METADATA_FORMAT_VERSION));
    out.write(reinterpret_cast<const char*>(body.data()), static_cast<std::streamsize>(body.size()));
    if (!out) {
        throw KnapsackError(ErrorKind::IoError, "write_metadata_file", "write failed for " + path.string());
    }
}

VideoMetadata ContentAddresser::read_metadata_file(const fs::path& path) {
    std::vector<uint8_t> bytes = read_file(path);

    const size_t header = sizeof(METADATA_MAGIC) + 1;
    if (bytes.size() < header || std::memcmp(bytes.data(), METADATA_MAGIC, sizeof(METADATA_MAGIC)) != 0) {
        throw KnapsackError(ErrorKind::InvalidMetadata, "read_metadata_file", path.string() + " is not a metadata file");
    }
    if (bytes[sizeof(METADATA_MAGIC)] != METADATA_FORMAT_VERSION) {
        throw KnapsackError(ErrorKind::InvalidMetadata, "read_metadata_file",
                            "unsupported format version " + std::to_string(bytes[sizeof(METADATA_MAGIC)]));
    }

    std::vector<uint8_t> body(bytes.begin() + header, bytes.end());
    VideoMetadata metadata = Serializer::deserialize_video_metadata(body);
    validate_metadata(metadata);
    return metadata;
}
