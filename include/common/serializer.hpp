#ifndef KNAPSACK_SERIALIZER_HPP
#define KNAPSACK_SERIALIZER_HPP

#include "../video/video_metadata.hpp"
#include "../network/protocol.hpp" // For Request/Response/DhtMessage
#include "error.hpp"
#include <vector>
#include <string>
#include <utility>

namespace Serializer {

/**
 * @brief Appends big-endian fields to a byte buffer.
 */
class Writer {
public:
    void u8(uint8_t v) { buffer_.push_back(v); }
    void u16(uint16_t v);
    void u32(uint32_t v);
    void u64(uint64_t v);
    void f64(double v);
    void hash(const hash_t& h) { buffer_.insert(buffer_.end(), h.begin(), h.end()); }
    void raw(const uint8_t* data, size_t size) { buffer_.insert(buffer_.end(), data, data + size); }
    // uint32 length prefix followed by the bytes
    void bytes(const std::vector<uint8_t>& data);
    void string(const std::string& s);

    std::vector<uint8_t>& buffer() { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * @brief Reads big-endian fields from a byte buffer.
 *
 * Every read is bounds checked; running past the end throws
 * KnapsackError with the kind given at construction.
 */
class Reader {
public:
    Reader(const uint8_t* data, size_t size, const char* operation, ErrorKind kind = ErrorKind::InvalidMetadata);
    Reader(const std::vector<uint8_t>& buffer, const char* operation, ErrorKind kind = ErrorKind::InvalidMetadata)
        : Reader(buffer.data(), buffer.size(), operation, kind) {}

    uint8_t u8();
    uint16_t u16();
    uint32_t u32();
    uint64_t u64();
    double f64();
    hash_t hash();
    std::vector<uint8_t> bytes();
    std::string string();

    // Reads a uint32 element count, rejecting counts the remaining bytes cannot hold.
    uint32_t count(size_t min_element_size);

    size_t remaining() const { return size_ - offset_; }
    bool at_end() const { return offset_ == size_; }
    // Fails unless the whole buffer was consumed.
    void expect_end();

    [[noreturn]] void fail(const std::string& detail) const;

private:
    void need(size_t n) const;

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
    const char* operation_;
    ErrorKind kind_;
};

/**
 * @brief Serializes a VideoMetadata record.
 *
 * Layout: id, chunk count, per chunk (id, order, size), duration, codec, title, description.
 */
std::vector<uint8_t> serialize_video_metadata(const VideoMetadata& m);

/**
 * @brief Decodes a VideoMetadata record.
 *
 * Throws KnapsackError(InvalidMetadata) on truncated or trailing bytes. The
 * result is not validated against its own id; callers run validate_metadata.
 */
VideoMetadata deserialize_video_metadata(const std::vector<uint8_t>& buffer);

std::vector<uint8_t> serialize_hello_payload(const HelloPayload& p);
HelloPayload deserialize_hello_payload(const std::vector<uint8_t>& buffer);

// REQUEST payload: [request_id (uint64)][kind (uint8)][content id | query]
std::vector<uint8_t> serialize_request_payload(uint64_t request_id, const Request& request);
std::pair<uint64_t, Request> deserialize_request_payload(const std::vector<uint8_t>& buffer);

// RESPONSE payload: [request_id (uint64)][kind (uint8)][bytes | results]
std::vector<uint8_t> serialize_response_payload(uint64_t request_id, const Response& response);
std::pair<uint64_t, Response> deserialize_response_payload(const std::vector<uint8_t>& buffer);

/**
 * @brief Encodes a whole DHT datagram, header included.
 */
std::vector<uint8_t> serialize_dht_message(const DhtMessage& msg);

/**
 * @brief Decodes a DHT datagram. Throws KnapsackError(IoError) on malformed input.
 */
DhtMessage deserialize_dht_message(const uint8_t* data, size_t size);

} // namespace Serializer

#endif // KNAPSACK_SERIALIZER_HPP
