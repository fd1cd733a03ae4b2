#ifndef KNAPSACK_TESTS_TEST_PEER_HPP
#define KNAPSACK_TESTS_TEST_PEER_HPP

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "memory_overlay.hpp"
#include "crypto/hasher.hpp"
#include "network/exchange_client.hpp"
#include "network/exchange_server.hpp"
#include "network/peer_scores.hpp"
#include "network/request_handler.hpp"
#include "session/session_coordinator.hpp"
#include "storage/chunk_store.hpp"
#include "video/content_addresser.hpp"

// Deterministic filler so payloads differ between videos.
inline std::vector<uint8_t> make_bytes(size_t size, uint32_t seed) {
    std::vector<uint8_t> bytes(size);
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        bytes[i] = static_cast<uint8_t>(state >> 16);
    }
    return bytes;
}

// Serves from the store unless a test interceptor claims the request.
class InterceptingHandler : public RequestHandler {
public:
    // Returns true when it took over the request (and owns respond).
    using Interceptor = std::function<bool(const PeerId& from, const Request& request, Responder& respond)>;

    explicit InterceptingHandler(std::shared_ptr<RequestHandler> inner) : inner_(std::move(inner)) {}

    void set_interceptor(Interceptor interceptor) {
        std::lock_guard<std::mutex> lock(mutex_);
        interceptor_ = std::move(interceptor);
    }

    void handle(const PeerId& from, const Request& request, Responder respond) override {
        Interceptor interceptor;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interceptor = interceptor_;
        }
        if (interceptor && interceptor(from, request, respond)) return;
        inner_->handle(from, request, std::move(respond));
    }

private:
    std::shared_ptr<RequestHandler> inner_;
    std::mutex mutex_;
    Interceptor interceptor_;
};

inline SessionOptions fast_session_options() {
    SessionOptions options;
    options.fetch_fanout = 4;
    options.max_providers = 8;
    options.max_discovery_rounds = 3;
    options.rediscover_delay = std::chrono::milliseconds(50);
    options.acquire_timeout = std::chrono::milliseconds(20000);
    options.exchange_timeout = std::chrono::milliseconds(500);
    options.search_fanout = 8;
    options.search_quorum = 3;
    options.search_timeout = std::chrono::milliseconds(2000);
    return options;
}

/**
 * A complete participant on its own event loop: in-memory store, exchange
 * server and client, session coordinator, all wired to a MemoryOverlay.
 */
class TestPeer {
public:
    TestPeer(MemoryOverlay& overlay, const std::string& name, SessionOptions options = fast_session_options())
        : id(Hasher::sha256(name)),
          work_guard(asio::make_work_guard(io)),
          store(":memory:"),
          discovery(io, overlay, id),
          handler(std::make_shared<InterceptingHandler>(std::make_shared<StoreRequestHandler>(store, disk))),
          server(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0), id, handler),
          client(io, discovery, scores, id, server.port()),
          sessions(io, disk, discovery, client, store, scores, options) {
        overlay.add_peer(id, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server.port()));
        server.start();
        thread = std::thread([this]() { io.run(); });
    }

    ~TestPeer() { stop(); }

    void stop() {
        if (stopped) return;
        stopped = true;
        std::promise<void> done;
        asio::post(io, [this, &done]() {
            sessions.stop();
            client.stop();
            server.stop();
            asio::post(io, [&done]() { done.set_value(); });
        });
        done.get_future().wait();
        disk.join();
        work_guard.reset();
        io.stop();
        if (thread.joinable()) thread.join();
    }

    // Chunks bytes into this peer's store, as prepare does for a file.
    VideoMetadata add_video(const std::vector<uint8_t>& bytes, uint32_t chunk_size, const std::string& title) {
        VideoMetadata metadata = ContentAddresser::chunk_and_hash(bytes, chunk_size);
        metadata.title = title;
        store.put_video(metadata);
        auto payloads = ContentAddresser::split_chunks(bytes, chunk_size);
        for (size_t i = 0; i < payloads.size(); ++i) {
            store.put_chunk(metadata.chunks[i].id, metadata.id, payloads[i]);
        }
        return metadata;
    }

    void advertise(const VideoMetadata& metadata) {
        discovery.publish(metadata.id);
        for (const auto& chunk : metadata.chunks) discovery.publish(chunk.id);
    }

    AcquireResult acquire(const ContentId& video_id, std::chrono::milliseconds wait = std::chrono::milliseconds(30000)) {
        auto promise = std::make_shared<std::promise<AcquireResult>>();
        auto future = promise->get_future();
        sessions.acquire(video_id, [promise](AcquireResult result) { promise->set_value(std::move(result)); });
        if (future.wait_for(wait) != std::future_status::ready) {
            return AcquireResult::failure(ErrorKind::TimedOut, "test gave up waiting");
        }
        return future.get();
    }

    LocateResult locate(const std::string& query, size_t max_results) {
        auto promise = std::make_shared<std::promise<LocateResult>>();
        auto future = promise->get_future();
        sessions.locate(query, max_results, [promise](LocateResult result) { promise->set_value(std::move(result)); });
        return future.get();
    }

    PeerId id;
    asio::io_context io;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard;
    asio::thread_pool disk{2};
    ChunkStore store;
    PeerScores scores;
    MemoryDiscovery discovery;
    std::shared_ptr<InterceptingHandler> handler;
    ExchangeServer server;
    ExchangeClient client;
    SessionCoordinator sessions;
    std::thread thread;
    bool stopped = false;
};

#endif // KNAPSACK_TESTS_TEST_PEER_HPP
