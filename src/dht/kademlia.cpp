#include "dht/kademlia.hpp"
#include <algorithm>
#include <vector>
#include <iterator>

namespace dht {

// Helper to calculate XOR distance
NodeID xor_distance(const NodeID& id1, const NodeID& id2) {
    NodeID distance;
    for (size_t i = 0; i < NODE_ID_SIZE; ++i) {
        distance[i] = id1[i] ^ id2[i];
    }
    return distance;
}

// Helper to compare distances
bool is_closer(const NodeID& dist1, const NodeID& dist2) {
    return std::lexicographical_compare(dist1.begin(), dist1.end(), dist2.begin(), dist2.end());
}

RoutingTable::RoutingTable(NodeID self_id) : self_id_(self_id) {}

size_t RoutingTable::get_bucket_index(const NodeID& other_id) const {
    NodeID distance = xor_distance(self_id_, other_id);
    for (size_t i = 0; i < NODE_ID_SIZE * 8; ++i) {
        size_t byte_index = i / 8;
        uint8_t bit_index = 7 - (i % 8);
        if ((distance[byte_index] >> bit_index) & 1) {
            return (NODE_ID_SIZE * 8 - 1) - i;
        }
    }
    return 0; // identical ids
}

bool RoutingTable::add_node(const NodeInfo& node) {
    if (node.id == self_id_) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = k_buckets_[get_bucket_index(node.id)];

    for (auto it = bucket.begin(); it != bucket.end(); ++it) {
        if (it->id == node.id) {
            // Refresh the contact (it may have moved) and mark it most recently seen
            *it = node;
            bucket.splice(bucket.begin(), bucket, it);
            return true;
        }
    }

    if (bucket.size() < K) {
        bucket.push_front(node);
        return true;
    }
    // Full bucket: keep the long-lived contacts. Stale ones are evicted when
    // an RPC to them times out, which frees a slot for the next newcomer.
    return false;
}

void RoutingTable::remove_node(const NodeID& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = k_buckets_[get_bucket_index(id)];
    bucket.remove_if([&id](const NodeInfo& n) { return n.id == id; });
}

std::optional<NodeInfo> RoutingTable::find_node(const NodeID& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& bucket = k_buckets_[get_bucket_index(id)];
    for (const auto& node : bucket) {
        if (node.id == id) return node;
    }
    return std::nullopt;
}

std::vector<NodeInfo> RoutingTable::find_closest_nodes(const NodeID& target_id, size_t count) const {
    std::vector<NodeInfo> all_nodes = get_all_nodes();

    std::sort(all_nodes.begin(), all_nodes.end(),
        [&target_id](const NodeInfo& a, const NodeInfo& b) {
            return is_closer(xor_distance(a.id, target_id), xor_distance(b.id, target_id));
        });

    if (all_nodes.size() > count) {
        all_nodes.resize(count);
    }

    return all_nodes;
}

std::vector<NodeInfo> RoutingTable::get_all_nodes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NodeInfo> all_nodes;
    for (const auto& bucket : k_buckets_) {
        all_nodes.insert(all_nodes.end(), bucket.begin(), bucket.end());
    }
    return all_nodes;
}

size_t RoutingTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& bucket : k_buckets_) {
        total += bucket.size();
    }
    return total;
}

} // namespace dht
