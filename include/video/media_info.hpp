#ifndef KNAPSACK_MEDIA_INFO_HPP
#define KNAPSACK_MEDIA_INFO_HPP

#include <filesystem>
#include <string>
#include <vector>
#include <cstdint>

#include "video_metadata.hpp"

struct MediaInfo {
    double duration = UNKNOWN_DURATION; // seconds
    std::string codec = UNKNOWN_CODEC;  // sample entry fourcc, e.g. "avc1"
};

/**
 * @brief Best-effort container inspection.
 *
 * Understands ISO-BMFF (MP4/MOV): the movie header for duration and the first
 * video sample entry for the codec. Anything it cannot parse yields the
 * unknown sentinels; it never throws.
 */
MediaInfo read_media_info(const std::vector<uint8_t>& bytes);

// Same as read_media_info, but seeks over top-level boxes and reads only moov.
MediaInfo read_media_file_info(const std::filesystem::path& file_path);

#endif // KNAPSACK_MEDIA_INFO_HPP
