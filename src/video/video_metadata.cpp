#include "video/video_metadata.hpp"
#include "crypto/hasher.hpp"
#include "common/error.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <ostream>

uint64_t VideoMetadata::total_size() const {
    uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size;
    }
    return total;
}

void VideoMetadata::print(std::ostream& out) const {
    out << "--- Video ---\n"
        << "Id:          " << Hasher::hash_to_hex(id) << "\n"
        << "Title:       " << title << "\n"
        << "Description: " << description << "\n"
        << "Codec:       " << codec << "\n"
        << "Duration:    " << std::fixed << std::setprecision(2) << duration << " s\n"
        << "Size:        " << total_size() << " bytes\n"
        << "Chunks:      (" << chunks.size() << ")\n";
    for (const auto& chunk : chunks) {
        out << "  [" << std::setw(4) << std::setfill(' ') << chunk.order << "]: "
            << Hasher::hash_to_hex(chunk.id) << " " << chunk.size << " bytes\n";
    }
    out << "-------------\n";
}

ContentId compute_video_id(const std::vector<ChunkSummary>& chunks) {
    std::vector<uint8_t> concatenated;
    concatenated.reserve(chunks.size() * HASH_SIZE);
    for (const auto& chunk : chunks) {
        concatenated.insert(concatenated.end(), chunk.id.begin(), chunk.id.end());
    }
    return Hasher::sha256(concatenated);
}

void validate_metadata(const VideoMetadata& metadata) {
    if (metadata.chunks.empty()) {
        throw KnapsackError(ErrorKind::InvalidMetadata, "validate_metadata", "video has no chunks");
    }
    for (size_t i = 0; i < metadata.chunks.size(); ++i) {
        if (metadata.chunks[i].order != i) {
            throw KnapsackError(ErrorKind::InvalidMetadata, "validate_metadata",
                                "chunk at position " + std::to_string(i) + " has order " +
                                std::to_string(metadata.chunks[i].order));
        }
    }
    if (compute_video_id(metadata.chunks) != metadata.id) {
        throw KnapsackError(ErrorKind::HashMismatch, "validate_metadata",
                            "video id " + Hasher::short_hex(metadata.id) + " does not match its chunk ids");
    }
}

bool is_valid_metadata(const VideoMetadata& metadata) {
    try {
        validate_metadata(metadata);
        return true;
    } catch (const KnapsackError&) {
        return false;
    }
}

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool matches_query(const VideoMetadata& metadata, const std::string& query) {
    if (query.empty()) return false;
    std::string needle = to_lower(query);
    if (needle == Hasher::hash_to_hex(metadata.id)) return true;
    return to_lower(metadata.title).find(needle) != std::string::npos ||
           to_lower(metadata.description).find(needle) != std::string::npos;
}
