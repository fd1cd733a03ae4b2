#include "network/request_handler.hpp"
#include "storage/chunk_store.hpp"
#include "common/serializer.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include <asio/post.hpp>

StoreRequestHandler::StoreRequestHandler(ChunkStore& store, asio::thread_pool& disk_pool)
    : store_(store), disk_pool_(disk_pool) {}

void StoreRequestHandler::handle(const PeerId& from, const Request& request, Responder respond) {
    asio::post(disk_pool_, [this, from, request, respond = std::move(respond)]() {
        Response response = answer(store_, request);
        LOG_DEBUG("Answered ", request_kind_name(request.kind), " from ", Hasher::short_hex(from),
                  " with ", response_kind_name(response.kind));
        respond(std::move(response));
    });
}

Response StoreRequestHandler::answer(ChunkStore& store, const Request& request) {
    try {
        switch (request.kind) {
            case RequestKind::Metadata: {
                std::optional<VideoMetadata> metadata = store.find_video(request.content_id);
                if (!metadata) return Response::not_found();
                return Response::metadata(Serializer::serialize_video_metadata(*metadata));
            }
            case RequestKind::Chunk: {
                if (!store.has_chunk(request.content_id)) return Response::not_found();
                return Response::chunk(store.get_chunk(request.content_id));
            }
            case RequestKind::Search: {
                std::vector<VideoMetadata> results = store.search_videos(request.query);
                if (results.size() > MAX_SEARCH_RESULTS) results.resize(MAX_SEARCH_RESULTS);
                return Response::search_results(std::move(results));
            }
        }
    } catch (const KnapsackError& e) {
        // The requester must get an answer; a broken local store reads as absent content.
        LOG_ERR("Serving ", request_kind_name(request.kind), " failed: ", e.what());
    }
    return Response::not_found();
}
