#ifndef KNAPSACK_SESSION_COORDINATOR_HPP
#define KNAPSACK_SESSION_COORDINATOR_HPP

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../dht/discovery.hpp"
#include "../network/exchange_client.hpp"
#include "../network/peer_scores.hpp"
#include "../storage/chunk_store.hpp"
#include "../video/video_metadata.hpp"
#include "../common/error.hpp"

struct SessionOptions {
    size_t fetch_fanout = 4;
    size_t max_providers = 8;
    size_t max_discovery_rounds = 3;
    std::chrono::milliseconds rediscover_delay{500};
    std::chrono::milliseconds acquire_timeout{10 * 60 * 1000};
    std::chrono::milliseconds exchange_timeout{10000};
    size_t search_fanout = 8;
    size_t search_quorum = 3;
    std::chrono::milliseconds search_timeout{5000};
};

struct AcquireResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string detail;
    std::optional<VideoMetadata> metadata; // set on success

    static AcquireResult success(VideoMetadata metadata) {
        AcquireResult result;
        result.ok = true;
        result.metadata = std::move(metadata);
        return result;
    }
    static AcquireResult failure(ErrorKind kind, std::string detail) {
        AcquireResult result;
        result.kind = kind;
        result.detail = std::move(detail);
        return result;
    }
};

struct LocateResult {
    std::vector<VideoMetadata> videos; // distinct ids, in order of arrival
    size_t peers_asked = 0;
    size_t peers_answered = 0;
};

/**
 * @brief Caller's view of a running acquire.
 *
 * Counters are updated from the event loop and may be read from any thread.
 */
class AcquireHandle {
public:
    // Stops issuing new requests. Requests already in flight still store their chunks.
    // Safe to call after the acquire finished or its node was destroyed.
    void cancel();

    bool cancelled() const { return cancelled_.load(); }
    bool finished() const { return finished_.load(); }
    size_t stored_chunks() const { return stored_chunks_.load(); }
    size_t total_chunks() const { return total_chunks_.load(); }

private:
    friend class AcquireSession;
    friend class SessionCoordinator;

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};
    std::atomic<size_t> stored_chunks_{0};
    std::atomic<size_t> total_chunks_{0};

    void set_cancel_hook(std::function<void()> hook);
    // Drops the hook; cancel() only sets the flag from then on.
    void detach();

    std::mutex hook_mutex_;
    std::function<void()> cancel_hook_;
};

class AcquireSession;

/**
 * @brief Acquires whole videos and runs searches across the overlay.
 *
 * Everything runs on the io_context; chunk store access is pushed to the disk
 * pool and its outcome posted back, so a slow disk never stalls the network.
 * Retry and peer selection live here, the exchange layer never retries.
 */
class SessionCoordinator {
public:
    using LocateHandler = std::function<void(LocateResult)>;
    using AcquireHandler = std::function<void(AcquireResult)>;

    SessionCoordinator(asio::io_context& io_context, asio::thread_pool& disk_pool, Discovery& discovery,
                       ExchangeClient& exchange, ChunkStore& store, PeerScores& scores,
                       SessionOptions options = {});
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    /**
     * @brief Sends Search to general routing peers and merges their answers.
     *
     * Completes once min(search_quorum, peers asked) peers answered, every peer
     * finished, or search_timeout elapsed. Partial results are still results.
     */
    void locate(const std::string& query, size_t max_results, LocateHandler handler);

    // handler runs on the io_context exactly once.
    std::shared_ptr<AcquireHandle> acquire(const ContentId& video_id, AcquireHandler handler);

    // Ends every running acquire with Cancelled. Must run on the io_context thread.
    void stop();

    size_t active_sessions() const { return sessions_.size(); }

private:
    friend class AcquireSession;

    // Runs work on the disk pool; done is posted back with the KnapsackError kind (None on success).
    void run_on_disk(std::function<void()> work, std::function<void(ErrorKind, const std::string&)> done);
    void session_finished(uint64_t session_id);

    asio::io_context& io_context_;
    asio::thread_pool& disk_pool_;
    Discovery& discovery_;
    ExchangeClient& exchange_;
    ChunkStore& store_;
    PeerScores& scores_;
    SessionOptions options_;

    std::map<uint64_t, std::shared_ptr<AcquireSession>> sessions_;
    // Every handle given out and not yet finished; detached on destruction.
    std::mutex handles_mutex_;
    std::vector<std::weak_ptr<AcquireHandle>> handles_;
    std::atomic<uint64_t> next_session_id_{1}; // acquire() may be called from any thread
    bool stopped_ = false;
};

#endif // KNAPSACK_SESSION_COORDINATOR_HPP
