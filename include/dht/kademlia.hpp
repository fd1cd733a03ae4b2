#ifndef KNAPSACK_KADEMLIA_HPP
#define KNAPSACK_KADEMLIA_HPP

#include <array>
#include <vector>
#include <string>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <asio/ip/udp.hpp>
#include <asio/ip/tcp.hpp>

#include "../video/video_metadata.hpp" // For hash_t

namespace dht {

constexpr size_t NODE_ID_SIZE = HASH_SIZE; // 256 bits, same as content ids
using NodeID = hash_t;

struct NodeInfo {
    NodeID id{};
    asio::ip::udp::endpoint endpoint; // DHT (UDP)
    uint16_t tcp_port = 0;            // exchange protocol (TCP)

    asio::ip::tcp::endpoint exchange_endpoint() const {
        return asio::ip::tcp::endpoint(endpoint.address(), tcp_port);
    }
};

// Helper to calculate XOR distance
NodeID xor_distance(const NodeID& id1, const NodeID& id2);

// Helper to compare distances
bool is_closer(const NodeID& dist1, const NodeID& dist2);

// Kademlia constants
constexpr size_t K = 20; // K-bucket size
constexpr size_t ALPHA = 3; // Kademlia concurrency parameter

/**
 * @brief 256 k-buckets ordered most-recently-seen first.
 *
 * Internally synchronized; callers may use it from any thread.
 */
class RoutingTable {
public:
    explicit RoutingTable(NodeID self_id);

    // Adds or refreshes a node. Returns false if its bucket is full.
    bool add_node(const NodeInfo& node);

    void remove_node(const NodeID& id);

    std::optional<NodeInfo> find_node(const NodeID& id) const;

    // Find the K closest nodes to a given target ID
    std::vector<NodeInfo> find_closest_nodes(const NodeID& target_id, size_t count = K) const;

    // Get all nodes from all k-buckets
    std::vector<NodeInfo> get_all_nodes() const;

    size_t size() const;
    bool empty() const { return size() == 0; }

    const NodeID& self_id() const { return self_id_; }

    size_t get_bucket_index(const NodeID& other_id) const;

private:
    NodeID self_id_;
    std::list<NodeInfo> k_buckets_[NODE_ID_SIZE * 8];
    mutable std::mutex mutex_;
};

} // namespace dht

using PeerId = dht::NodeID;

#endif // KNAPSACK_KADEMLIA_HPP
