#include "video/media_info.hpp"
#include <array>
#include <cstring>
#include <fstream>

namespace {

constexpr int MAX_BOX_DEPTH = 8;
// A moov box larger than this is not worth reading for two fields.
constexpr uint64_t MAX_MOOV_SIZE = 64 * 1024 * 1024;

const std::array<const char*, 6> VIDEO_FOURCCS = {"avc1", "hvc1", "hev1", "av01", "vp09", "mp4v"};

uint32_t read_u32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

uint64_t read_u64(const uint8_t* p) {
    return (uint64_t(read_u32(p)) << 32) | read_u32(p + 4);
}

bool is_container(const char* type) {
    return std::memcmp(type, "moov", 4) == 0 || std::memcmp(type, "trak", 4) == 0 ||
           std::memcmp(type, "mdia", 4) == 0 || std::memcmp(type, "minf", 4) == 0 ||
           std::memcmp(type, "stbl", 4) == 0;
}

void parse_mvhd(const uint8_t* body, size_t size, MediaInfo& info) {
    if (size < 4) return;
    uint8_t version = body[0];
    uint32_t timescale = 0;
    uint64_t duration = 0;
    if (version == 1) {
        // flags, creation (64), modification (64), timescale, duration (64)
        if (size < 4 + 8 + 8 + 4 + 8) return;
        timescale = read_u32(body + 20);
        duration = read_u64(body + 24);
    } else {
        // flags, creation, modification, timescale, duration
        if (size < 4 + 4 + 4 + 4 + 4) return;
        timescale = read_u32(body + 12);
        duration = read_u32(body + 16);
    }
    if (timescale != 0) {
        info.duration = static_cast<double>(duration) / timescale;
    }
}

void parse_stsd(const uint8_t* body, size_t size, MediaInfo& info) {
    if (size < 8) return;
    uint32_t entry_count = read_u32(body + 4);
    size_t offset = 8;
    for (uint32_t i = 0; i < entry_count && offset + 8 <= size; ++i) {
        uint32_t entry_size = read_u32(body + offset);
        const char* fourcc = reinterpret_cast<const char*>(body + offset + 4);
        for (const char* known : VIDEO_FOURCCS) {
            if (std::memcmp(fourcc, known, 4) == 0) {
                info.codec.assign(fourcc, 4);
                return;
            }
        }
        if (entry_size < 8) return;
        offset += entry_size;
    }
}

void walk_boxes(const uint8_t* data, size_t size, int depth, MediaInfo& info) {
    if (depth > MAX_BOX_DEPTH) return;
    size_t offset = 0;
    while (offset + 8 <= size) {
        uint64_t box_size = read_u32(data + offset);
        const char* type = reinterpret_cast<const char*>(data + offset + 4);
        size_t header = 8;
        if (box_size == 1) {
            if (offset + 16 > size) return;
            box_size = read_u64(data + offset + 8);
            header = 16;
        } else if (box_size == 0) {
            box_size = size - offset; // Extends to the end of the enclosing box
        }
        if (box_size < header || box_size > size - offset) return;

        const uint8_t* body = data + offset + header;
        size_t body_size = static_cast<size_t>(box_size) - header;
        if (std::memcmp(type, "mvhd", 4) == 0) {
            parse_mvhd(body, body_size, info);
        } else if (std::memcmp(type, "stsd", 4) == 0 && info.codec == UNKNOWN_CODEC) {
            parse_stsd(body, body_size, info);
        } else if (is_container(type)) {
            walk_boxes(body, body_size, depth + 1, info);
        }
        offset += static_cast<size_t>(box_size);
    }
}

} // namespace

MediaInfo read_media_info(const std::vector<uint8_t>& bytes) {
    MediaInfo info;
    // ISO-BMFF files open with an ftyp box.
    if (bytes.size() < 8 || std::memcmp(bytes.data() + 4, "ftyp", 4) != 0) {
        return info;
    }
    walk_boxes(bytes.data(), bytes.size(), 0, info);
    return info;
}

MediaInfo read_media_file_info(const std::filesystem::path& file_path) {
    MediaInfo info;
    std::error_code ec;
    const uint64_t file_size = std::filesystem::file_size(file_path, ec);
    std::ifstream file(file_path, std::ios::binary);
    if (ec || !file.is_open()) {
        return info;
    }

    // Walk top-level box headers and load only moov.
    uint8_t header[16];
    uint64_t offset = 0;
    while (offset + 8 <= file_size) {
        file.seekg(static_cast<std::streamoff>(offset));
        if (!file.read(reinterpret_cast<char*>(header), 8)) return info;
        if (offset == 0 && std::memcmp(header + 4, "ftyp", 4) != 0) return info;

        uint64_t box_size = read_u32(header);
        uint64_t header_size = 8;
        if (box_size == 1) {
            if (!file.read(reinterpret_cast<char*>(header + 8), 8)) return info;
            box_size = read_u64(header + 8);
            header_size = 16;
        } else if (box_size == 0) {
            box_size = file_size - offset;
        }
        if (box_size < header_size || box_size > file_size - offset) return info;

        if (std::memcmp(header + 4, "moov", 4) == 0) {
            if (box_size > MAX_MOOV_SIZE) return info;
            std::vector<uint8_t> body(static_cast<size_t>(box_size - header_size));
            if (!file.read(reinterpret_cast<char*>(body.data()), static_cast<std::streamsize>(body.size()))) {
                return info;
            }
            walk_boxes(body.data(), body.size(), 1, info);
            return info;
        }
        offset += box_size;
    }
    return info;
}
