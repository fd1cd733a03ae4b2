#ifndef KNAPSACK_DHT_NODE_HPP
#define KNAPSACK_DHT_NODE_HPP

#include <asio.hpp>
#include "kademlia.hpp"
#include "discovery.hpp"
#include "provider_store.hpp"
#include "../network/protocol.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <functional>
#include <optional>

namespace dht {

struct DhtOptions {
    std::chrono::seconds provider_ttl{3600};
    std::chrono::seconds republish_interval{20 * 60};
    std::chrono::milliseconds rpc_timeout{2000};
    std::chrono::milliseconds lookup_timeout{8000};
    std::chrono::seconds sweep_interval{60};
};

struct LookupState {
    uint64_t lookup_id = 0;
    NodeID target_id{};
    bool want_providers = false;
    size_t max_providers = 0;

    std::map<NodeID, NodeInfo> all_known_nodes; // Every contact encountered during lookup
    std::set<NodeID> queried_nodes;
    std::set<NodeID> responded_nodes;
    std::vector<NodeInfo> providers;
    std::set<NodeID> provider_ids;

    size_t outstanding_rpcs = 0;
    bool lookup_finished = false;
    std::unique_ptr<asio::steady_timer> deadline;

    std::function<void(LookupState&)> on_complete;
};

/**
 * @brief UDP Kademlia node implementing the Discovery service.
 *
 * All protocol state lives on the io_context; public entry points post onto it.
 */
class DhtNode : public Discovery {
public:
    DhtNode(asio::io_context& io_context, const NodeID& self_id,
            const asio::ip::udp::endpoint& bind_endpoint, uint16_t tcp_port,
            DhtOptions options = {});
    ~DhtNode() override;

    void start();
    void stop();

    uint16_t port() const { return local_endpoint_.port(); }
    asio::ip::udp::endpoint local_endpoint() const { return local_endpoint_; }

    // Discovery
    const PeerId& self_id() const override { return self_id_; }
    void bootstrap(const std::vector<asio::ip::udp::endpoint>& seeds, BootstrapHandler handler) override;
    void publish(const ContentId& content_id) override;
    void unpublish(const ContentId& content_id) override;
    void find_providers(const ContentId& content_id, size_t max_results, ProvidersHandler handler) override;
    void find_peer(const PeerId& peer_id, PeerHandler handler) override;
    std::vector<PeerId> routing_peers(size_t max_results) const override;

    // Iterative FIND_NODE; yields the K closest contacts that answered.
    void start_find_node_lookup(const NodeID& target_id, std::function<void(std::vector<NodeInfo>)> callback);

    // Routing contacts, for persistence across restarts.
    std::vector<NodeInfo> contacts() const { return routing_table_.get_all_nodes(); }

    RoutingTable& routing_table() { return routing_table_; }
    ProviderStore& provider_store() { return provider_store_; }

    // Must run on the io_context thread.
    size_t address_book_size() const { return address_book_.size(); }
    bool is_published(const ContentId& content_id) const { return published_.count(content_id) > 0; }

private:
    using ReplyHandler = std::function<void(const DhtMessage* reply)>; // nullptr on timeout

    struct PendingRpc {
        std::optional<NodeID> expected_id;
        std::unique_ptr<asio::steady_timer> timer;
        ReplyHandler handler;
    };

    void read_message();
    void handle_message(const DhtMessage& msg, const asio::ip::udp::endpoint& sender);

    void send_message(const asio::ip::udp::endpoint& target, DhtMessage msg);
    void send_rpc(const asio::ip::udp::endpoint& target, std::optional<NodeID> expected_id,
                  DhtMessage msg, ReplyHandler handler);
    void on_rpc_timeout(uint32_t txn);
    DhtMessage make_message(DhtMessageType type, uint32_t txn = 0) const;
    NodeInfo self_info() const;

    void start_lookup(const NodeID& target_id, bool want_providers, size_t max_providers,
                      std::function<void(LookupState&)> on_complete);
    void continue_lookup(uint64_t lookup_id);
    void process_lookup_reply(uint64_t lookup_id, const NodeID& queried_id, const DhtMessage* reply);
    void finish_lookup(uint64_t lookup_id);

    void announce(const ContentId& content_id);
    void schedule_republish();
    void schedule_sweep();
    void remember_address(const NodeInfo& node);
    size_t sweep_address_book(std::chrono::steady_clock::time_point now);

    asio::io_context& io_context_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint local_endpoint_;
    NodeID self_id_;
    uint16_t tcp_port_;
    DhtOptions options_;

    RoutingTable routing_table_;
    ProviderStore provider_store_;

    std::vector<uint8_t> read_buffer_;
    asio::ip::udp::endpoint remote_endpoint_;
    asio::steady_timer republish_timer_;
    asio::steady_timer sweep_timer_;

    std::map<uint32_t, PendingRpc> pending_rpcs_;
    std::map<uint64_t, std::shared_ptr<LookupState>> active_lookups_;
    uint64_t next_lookup_id_ = 1;

    std::set<ContentId> published_;
    // Contacts learned from provider records, forgotten with the records.
    struct AddressEntry {
        NodeInfo contact;
        std::chrono::steady_clock::time_point learned_at;
    };
    std::map<PeerId, AddressEntry> address_book_;

    std::mt19937 rng_;
    bool stopped_ = false;
};

} // namespace dht

#endif // KNAPSACK_DHT_NODE_HPP
