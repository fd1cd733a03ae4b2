#ifndef KNAPSACK_NODE_HPP
#define KNAPSACK_NODE_HPP

#include <asio.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../common/config.hpp"
#include "../crypto/identity.hpp"
#include "../dht/discovery.hpp"
#include "../dht/dht_node.hpp"
#include "../network/exchange_client.hpp"
#include "../network/exchange_server.hpp"
#include "../network/peer_scores.hpp"
#include "../network/request_handler.hpp"
#include "../session/session_coordinator.hpp"
#include "../storage/chunk_store.hpp"
#include "../video/video_metadata.hpp"

/**
 * @brief One KnapSack participant: store, overlay, exchange and sessions.
 *
 * The node runs its own event loop thread and disk pool. The blocking
 * operations (prepare, search, acquire, bootstrap) must not be called from
 * handlers running on that loop.
 */
class Node {
public:
    // Builds the discovery service once the node knows its id and exchange port.
    using DiscoveryFactory =
        std::function<std::unique_ptr<Discovery>(asio::io_context&, const PeerId& self_id, uint16_t exchange_port)>;

    // Uses the built-in UDP Kademlia overlay on config.dht_port.
    explicit Node(NodeConfig config);
    Node(NodeConfig config, DiscoveryFactory discovery_factory);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Starts the loop, re-advertises complete videos and bootstraps from
    // configured seeds plus persisted contacts.
    void start();
    // Persists routing contacts and shuts everything down. Idempotent.
    void stop();

    /**
     * @brief Chunks a media file into the store and writes "<file>.kpsk".
     * @throws KnapsackError on unreadable or empty files and store failures.
     */
    VideoMetadata prepare(const std::filesystem::path& file_path);

    /**
     * @brief Publishes the video id and every locally stored chunk id.
     * @throws KnapsackError(NotFound) if the video is not in the store.
     */
    void advertise(const VideoMetadata& metadata);

    /**
     * @brief Deletes a stored video and stops announcing it.
     *
     * Chunks still listed by another stored video stay stored and announced.
     * @throws KnapsackError(NotFound) if the video is not in the store.
     */
    void evict(const ContentId& video_id);

    std::vector<VideoMetadata> search(const std::string& query, size_t count);

    // Blocks until the acquire completes; a completed video is advertised.
    AcquireResult acquire(const ContentId& video_id);
    std::shared_ptr<AcquireHandle> acquire_async(const ContentId& video_id, SessionCoordinator::AcquireHandler handler);

    // Blocks until the overlay answered or gave up. False means local-only.
    bool bootstrap(const std::vector<asio::ip::udp::endpoint>& seeds);

    const PeerId& peer_id() const { return identity_.peer_id(); }
    uint16_t exchange_port() const { return server_->port(); }
    asio::ip::tcp::endpoint exchange_endpoint() const;
    // Zero when discovery was injected.
    uint16_t dht_port() const { return dht_ ? dht_->port() : 0; }

    const NodeConfig& config() const { return config_; }
    ChunkStore& store() { return *store_; }
    PeerScores& scores() { return scores_; }
    Discovery& discovery() { return *discovery_; }

    // "host:port" to a UDP endpoint; nullopt when it does not resolve.
    static std::optional<asio::ip::udp::endpoint> resolve_seed(const std::string& host_port);

private:
    static std::filesystem::path ensure_data_dir(const std::string& data_dir);
    void readvertise_stored();
    std::vector<asio::ip::udp::endpoint> collect_seeds() const;
    void persist_contacts();

    NodeConfig config_;
    std::filesystem::path data_dir_;

    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    asio::thread_pool disk_pool_;

    Identity identity_;
    std::unique_ptr<ChunkStore> store_;
    PeerScores scores_;

    std::shared_ptr<StoreRequestHandler> handler_;
    std::unique_ptr<ExchangeServer> server_;
    std::unique_ptr<Discovery> discovery_;
    dht::DhtNode* dht_ = nullptr; // discovery_ when it is the built-in overlay
    std::unique_ptr<ExchangeClient> client_;
    std::unique_ptr<SessionCoordinator> sessions_;

    std::thread io_thread_;
    std::mutex state_mutex_;
    bool started_ = false;
    bool stopped_ = false;
};

#endif // KNAPSACK_NODE_HPP
