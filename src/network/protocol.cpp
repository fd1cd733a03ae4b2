#include "network/protocol.hpp"

#include <utility>

Request Request::metadata(const ContentId& video_id) {
    Request r;
    r.kind = RequestKind::Metadata;
    r.content_id = video_id;
    return r;
}

Request Request::chunk(const ContentId& chunk_id) {
    Request r;
    r.kind = RequestKind::Chunk;
    r.content_id = chunk_id;
    return r;
}

Request Request::search(const std::string& query) {
    Request r;
    r.kind = RequestKind::Search;
    r.query = query;
    return r;
}

Response Response::metadata(std::vector<uint8_t> encoded) {
    Response r;
    r.kind = ResponseKind::Metadata;
    r.bytes = std::move(encoded);
    return r;
}

Response Response::chunk(std::vector<uint8_t> payload) {
    Response r;
    r.kind = ResponseKind::Chunk;
    r.bytes = std::move(payload);
    return r;
}

Response Response::search_results(std::vector<VideoMetadata> results) {
    Response r;
    r.kind = ResponseKind::SearchResults;
    r.results = std::move(results);
    return r;
}

Response Response::not_found() {
    return Response{};
}

const char* request_kind_name(RequestKind kind) {
    switch (kind) {
        case RequestKind::Metadata: return "Metadata";
        case RequestKind::Chunk: return "Chunk";
        case RequestKind::Search: return "Search";
    }
    return "Unknown";
}

const char* response_kind_name(ResponseKind kind) {
    switch (kind) {
        case ResponseKind::Metadata: return "Metadata";
        case ResponseKind::Chunk: return "Chunk";
        case ResponseKind::SearchResults: return "SearchResults";
        case ResponseKind::NotFound: return "NotFound";
    }
    return "Unknown";
}

bool response_matches(const Request& request, const Response& response) {
    if (response.kind == ResponseKind::NotFound) return true;
    switch (request.kind) {
        case RequestKind::Metadata: return response.kind == ResponseKind::Metadata;
        case RequestKind::Chunk: return response.kind == ResponseKind::Chunk;
        case RequestKind::Search: return response.kind == ResponseKind::SearchResults;
    }
    return false;
}

const char* dht_message_type_name(DhtMessageType type) {
    switch (type) {
        case DhtMessageType::PING: return "PING";
        case DhtMessageType::PONG: return "PONG";
        case DhtMessageType::FIND_NODE: return "FIND_NODE";
        case DhtMessageType::FIND_NODE_RESPONSE: return "FIND_NODE_RESPONSE";
        case DhtMessageType::ADD_PROVIDER: return "ADD_PROVIDER";
        case DhtMessageType::GET_PROVIDERS: return "GET_PROVIDERS";
        case DhtMessageType::GET_PROVIDERS_RESPONSE: return "GET_PROVIDERS_RESPONSE";
    }
    return "UNKNOWN";
}
