#ifndef KNAPSACK_PROTOCOL_HPP
#define KNAPSACK_PROTOCOL_HPP

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include "video/video_metadata.hpp"
#include "dht/kademlia.hpp" // For PeerId

// Protocol version, carried in HELLO
constexpr uint16_t PROTOCOL_VERSION = 1;

// Message framing: [len (uint32, big endian)][msg_type (uint8)][payload...]
constexpr size_t HEADER_SIZE = sizeof(uint32_t) + sizeof(uint8_t);

// Largest payload a peer will accept: one chunk plus envelope slack.
constexpr uint32_t MAX_PAYLOAD_SIZE = 64 * 1024 * 1024;

// A Chunk response payload is [request id (u64)][kind (u8)][len (u32)][bytes].
constexpr uint32_t CHUNK_RESPONSE_ENVELOPE = sizeof(uint64_t) + sizeof(uint8_t) + sizeof(uint32_t);
// Largest chunk whose response still fits in one frame.
constexpr uint32_t MAX_CHUNK_SIZE = MAX_PAYLOAD_SIZE - CHUNK_RESPONSE_ENVELOPE;

enum class MessageType : uint8_t {
    HELLO = 0,
    REQUEST = 1,
    RESPONSE = 2,

    ERROR_UNSPECIFIED = 255
};

struct HelloPayload {
    uint16_t protocol_version = PROTOCOL_VERSION;
    PeerId peer_id{};
    uint16_t listen_port = 0;
};

enum class RequestKind : uint8_t {
    Metadata = 1,
    Chunk = 2,
    Search = 3
};

// One arm per request kind; content_id is set for Metadata/Chunk, query for Search.
struct Request {
    RequestKind kind = RequestKind::Metadata;
    ContentId content_id{};
    std::string query;

    static Request metadata(const ContentId& video_id);
    static Request chunk(const ContentId& chunk_id);
    static Request search(const std::string& query);
};

enum class ResponseKind : uint8_t {
    Metadata = 1,
    Chunk = 2,
    SearchResults = 3,
    NotFound = 4
};

// bytes is set for Metadata (encoded VideoMetadata) and Chunk (payload),
// results for SearchResults.
struct Response {
    ResponseKind kind = ResponseKind::NotFound;
    std::vector<uint8_t> bytes;
    std::vector<VideoMetadata> results;

    static Response metadata(std::vector<uint8_t> encoded);
    static Response chunk(std::vector<uint8_t> payload);
    static Response search_results(std::vector<VideoMetadata> results);
    static Response not_found();
};

const char* request_kind_name(RequestKind kind);
const char* response_kind_name(ResponseKind kind);

// A response only answers the request kind it was sent for (NotFound answers any).
bool response_matches(const Request& request, const Response& response);

// --- DHT datagrams (UDP) ---
// Every datagram: [type (uint8)][txn (uint32)][sender_id][sender tcp port (uint16)][body...]

enum class DhtMessageType : uint8_t {
    PING = 1,
    PONG = 2,
    FIND_NODE = 3,
    FIND_NODE_RESPONSE = 4,
    ADD_PROVIDER = 5,
    GET_PROVIDERS = 6,
    GET_PROVIDERS_RESPONSE = 7
};

// Largest datagram the DHT sends or reads.
constexpr size_t MAX_DHT_DATAGRAM = 8192;

struct DhtMessage {
    DhtMessageType type = DhtMessageType::PING;
    uint32_t txn = 0;
    dht::NodeID sender_id{};
    uint16_t sender_tcp_port = 0;

    dht::NodeID target{};                  // FIND_NODE, ADD_PROVIDER, GET_PROVIDERS
    std::vector<dht::NodeInfo> nodes;      // *_RESPONSE: closer contacts
    std::vector<dht::NodeInfo> providers;  // GET_PROVIDERS_RESPONSE
};

const char* dht_message_type_name(DhtMessageType type);

#endif // KNAPSACK_PROTOCOL_HPP
