#include "common/serializer.hpp"
#include <cstring> // For std::memcpy
#include <asio/ip/address.hpp>

namespace Serializer {

// --- Writer ---

void Writer::u16(uint16_t v) {
    buffer_.push_back(static_cast<uint8_t>(v >> 8));
    buffer_.push_back(static_cast<uint8_t>(v));
}

void Writer::u32(uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>(v >> shift));
    }
}

void Writer::u64(uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>(v >> shift));
    }
}

void Writer::f64(double v) {
    static_assert(sizeof(double) == sizeof(uint64_t), "IEEE-754 double expected");
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    u64(bits);
}

void Writer::bytes(const std::vector<uint8_t>& data) {
    u32(static_cast<uint32_t>(data.size()));
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void Writer::string(const std::string& s) {
    u32(static_cast<uint32_t>(s.size()));
    buffer_.insert(buffer_.end(), s.begin(), s.end());
}

// --- Reader ---

Reader::Reader(const uint8_t* data, size_t size, const char* operation, ErrorKind kind)
    : data_(data), size_(size), operation_(operation), kind_(kind) {}

void Reader::fail(const std::string& detail) const {
    throw KnapsackError(kind_, operation_, detail);
}

void Reader::need(size_t n) const {
    if (n > remaining()) {
        fail("truncated input at offset " + std::to_string(offset_));
    }
}

uint8_t Reader::u8() {
    need(1);
    return data_[offset_++];
}

uint16_t Reader::u16() {
    need(2);
    uint16_t v = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return v;
}

uint32_t Reader::u32() {
    need(4);
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v = (v << 8) | data_[offset_++];
    }
    return v;
}

uint64_t Reader::u64() {
    need(8);
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | data_[offset_++];
    }
    return v;
}

double Reader::f64() {
    uint64_t bits = u64();
    double v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

hash_t Reader::hash() {
    need(HASH_SIZE);
    hash_t h;
    std::memcpy(h.data(), data_ + offset_, HASH_SIZE);
    offset_ += HASH_SIZE;
    return h;
}

std::vector<uint8_t> Reader::bytes() {
    uint32_t len = u32();
    need(len);
    std::vector<uint8_t> out(data_ + offset_, data_ + offset_ + len);
    offset_ += len;
    return out;
}

std::string Reader::string() {
    uint32_t len = u32();
    need(len);
    std::string out(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return out;
}

uint32_t Reader::count(size_t min_element_size) {
    uint32_t n = u32();
    if (min_element_size > 0 && n > remaining() / min_element_size) {
        fail("element count " + std::to_string(n) + " exceeds input");
    }
    return n;
}

void Reader::expect_end() {
    if (!at_end()) {
        fail(std::to_string(remaining()) + " trailing bytes");
    }
}

// --- Video metadata ---

namespace {

constexpr size_t CHUNK_SUMMARY_SIZE = HASH_SIZE + sizeof(uint32_t) + sizeof(uint64_t);

void write_metadata(Writer& w, const VideoMetadata& m) {
    w.hash(m.id);
    w.u32(static_cast<uint32_t>(m.chunks.size()));
    for (const auto& c : m.chunks) {
        w.hash(c.id);
        w.u32(c.order);
        w.u64(c.size);
    }
    w.f64(m.duration);
    w.string(m.codec);
    w.string(m.title);
    w.string(m.description);
}

VideoMetadata read_metadata(Reader& r) {
    VideoMetadata m;
    m.id = r.hash();
    uint32_t count = r.count(CHUNK_SUMMARY_SIZE);
    m.chunks.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        ChunkSummary c;
        c.id = r.hash();
        c.order = r.u32();
        c.size = r.u64();
        m.chunks.push_back(c);
    }
    m.duration = r.f64();
    m.codec = r.string();
    m.title = r.string();
    m.description = r.string();
    return m;
}

} // namespace

std::vector<uint8_t> serialize_video_metadata(const VideoMetadata& m) {
    Writer w;
    w.buffer().reserve(HASH_SIZE + sizeof(uint32_t) + m.chunks.size() * CHUNK_SUMMARY_SIZE +
                       sizeof(double) + 3 * sizeof(uint32_t) + m.codec.size() + m.title.size() + m.description.size());
    write_metadata(w, m);
    return w.take();
}

VideoMetadata deserialize_video_metadata(const std::vector<uint8_t>& buffer) {
    Reader r(buffer, "deserialize_video_metadata");
    VideoMetadata m = read_metadata(r);
    r.expect_end();
    return m;
}

// --- Exchange protocol ---

std::vector<uint8_t> serialize_hello_payload(const HelloPayload& p) {
    Writer w;
    w.u16(p.protocol_version);
    w.hash(p.peer_id);
    w.u16(p.listen_port);
    return w.take();
}

HelloPayload deserialize_hello_payload(const std::vector<uint8_t>& buffer) {
    Reader r(buffer, "deserialize_hello_payload", ErrorKind::IoError);
    HelloPayload p;
    p.protocol_version = r.u16();
    p.peer_id = r.hash();
    p.listen_port = r.u16();
    r.expect_end();
    return p;
}

std::vector<uint8_t> serialize_request_payload(uint64_t request_id, const Request& request) {
    Writer w;
    w.u64(request_id);
    w.u8(static_cast<uint8_t>(request.kind));
    if (request.kind == RequestKind::Search) {
        w.string(request.query);
    } else {
        w.hash(request.content_id);
    }
    return w.take();
}

std::pair<uint64_t, Request> deserialize_request_payload(const std::vector<uint8_t>& buffer) {
    Reader r(buffer, "deserialize_request_payload", ErrorKind::IoError);
    uint64_t request_id = r.u64();
    Request request;
    uint8_t kind = r.u8();
    switch (static_cast<RequestKind>(kind)) {
        case RequestKind::Metadata:
        case RequestKind::Chunk:
            request.kind = static_cast<RequestKind>(kind);
            request.content_id = r.hash();
            break;
        case RequestKind::Search:
            request.kind = RequestKind::Search;
            request.query = r.string();
            break;
        default:
            r.fail("unknown request kind " + std::to_string(kind));
    }
    r.expect_end();
    return {request_id, std::move(request)};
}

std::vector<uint8_t> serialize_response_payload(uint64_t request_id, const Response& response) {
    Writer w;
    w.u64(request_id);
    w.u8(static_cast<uint8_t>(response.kind));
    switch (response.kind) {
        case ResponseKind::Metadata:
        case ResponseKind::Chunk:
            w.buffer().reserve(w.buffer().size() + sizeof(uint32_t) + response.bytes.size());
            w.bytes(response.bytes);
            break;
        case ResponseKind::SearchResults:
            w.u32(static_cast<uint32_t>(response.results.size()));
            for (const auto& m : response.results) {
                write_metadata(w, m);
            }
            break;
        case ResponseKind::NotFound:
            break;
    }
    return w.take();
}

std::pair<uint64_t, Response> deserialize_response_payload(const std::vector<uint8_t>& buffer) {
    Reader r(buffer, "deserialize_response_payload", ErrorKind::IoError);
    uint64_t request_id = r.u64();
    Response response;
    uint8_t kind = r.u8();
    switch (static_cast<ResponseKind>(kind)) {
        case ResponseKind::Metadata:
        case ResponseKind::Chunk:
            response.kind = static_cast<ResponseKind>(kind);
            response.bytes = r.bytes();
            break;
        case ResponseKind::SearchResults: {
            response.kind = ResponseKind::SearchResults;
            uint32_t count = r.count(HASH_SIZE + sizeof(uint32_t));
            response.results.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                response.results.push_back(read_metadata(r));
            }
            break;
        }
        case ResponseKind::NotFound:
            response.kind = ResponseKind::NotFound;
            break;
        default:
            r.fail("unknown response kind " + std::to_string(kind));
    }
    r.expect_end();
    return {request_id, std::move(response)};
}

// --- DHT datagrams ---

namespace {

// id, family, at least 4 address bytes, udp port, tcp port
constexpr size_t MIN_NODE_INFO_SIZE = dht::NODE_ID_SIZE + 1 + 4 + 2 + 2;

void write_nodes(Writer& w, const std::vector<dht::NodeInfo>& nodes) {
    w.u32(static_cast<uint32_t>(nodes.size()));
    for (const auto& node : nodes) {
        w.hash(node.id);
        const asio::ip::address addr = node.endpoint.address();
        if (addr.is_v6()) {
            w.u8(6);
            auto bytes = addr.to_v6().to_bytes();
            w.raw(bytes.data(), bytes.size());
        } else {
            w.u8(4);
            auto bytes = addr.to_v4().to_bytes();
            w.raw(bytes.data(), bytes.size());
        }
        w.u16(node.endpoint.port());
        w.u16(node.tcp_port);
    }
}

std::vector<dht::NodeInfo> read_nodes(Reader& r) {
    uint32_t count = r.count(MIN_NODE_INFO_SIZE);
    std::vector<dht::NodeInfo> nodes;
    nodes.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        dht::NodeInfo node;
        node.id = r.hash();
        uint8_t family = r.u8();
        asio::ip::address addr;
        if (family == 4) {
            asio::ip::address_v4::bytes_type bytes;
            for (auto& b : bytes) b = r.u8();
            addr = asio::ip::address_v4(bytes);
        } else if (family == 6) {
            asio::ip::address_v6::bytes_type bytes;
            for (auto& b : bytes) b = r.u8();
            addr = asio::ip::address_v6(bytes);
        } else {
            r.fail("unknown address family " + std::to_string(family));
        }
        uint16_t udp_port = r.u16();
        node.endpoint = asio::ip::udp::endpoint(addr, udp_port);
        node.tcp_port = r.u16();
        nodes.push_back(node);
    }
    return nodes;
}

} // namespace

std::vector<uint8_t> serialize_dht_message(const DhtMessage& msg) {
    Writer w;
    w.u8(static_cast<uint8_t>(msg.type));
    w.u32(msg.txn);
    w.hash(msg.sender_id);
    w.u16(msg.sender_tcp_port);

    switch (msg.type) {
        case DhtMessageType::PING:
        case DhtMessageType::PONG:
            break;
        case DhtMessageType::FIND_NODE:
        case DhtMessageType::ADD_PROVIDER:
        case DhtMessageType::GET_PROVIDERS:
            w.hash(msg.target);
            break;
        case DhtMessageType::FIND_NODE_RESPONSE:
            write_nodes(w, msg.nodes);
            break;
        case DhtMessageType::GET_PROVIDERS_RESPONSE:
            w.hash(msg.target);
            write_nodes(w, msg.providers);
            write_nodes(w, msg.nodes);
            break;
    }
    return w.take();
}

DhtMessage deserialize_dht_message(const uint8_t* data, size_t size) {
    Reader r(data, size, "deserialize_dht_message", ErrorKind::IoError);
    DhtMessage msg;
    uint8_t type = r.u8();
    msg.type = static_cast<DhtMessageType>(type);
    msg.txn = r.u32();
    msg.sender_id = r.hash();
    msg.sender_tcp_port = r.u16();

    switch (msg.type) {
        case DhtMessageType::PING:
        case DhtMessageType::PONG:
            break;
        case DhtMessageType::FIND_NODE:
        case DhtMessageType::ADD_PROVIDER:
        case DhtMessageType::GET_PROVIDERS:
            msg.target = r.hash();
            break;
        case DhtMessageType::FIND_NODE_RESPONSE:
            msg.nodes = read_nodes(r);
            break;
        case DhtMessageType::GET_PROVIDERS_RESPONSE:
            msg.target = r.hash();
            msg.providers = read_nodes(r);
            msg.nodes = read_nodes(r);
            break;
        default:
            r.fail("unknown message type " + std::to_string(type));
    }
    r.expect_end();
    return msg;
}

} // namespace Serializer
