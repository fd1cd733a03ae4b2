#ifndef KNAPSACK_PROVIDER_STORE_HPP
#define KNAPSACK_PROVIDER_STORE_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <vector>

#include "kademlia.hpp"

namespace dht {

struct ProviderRecord {
    ContentId content_id{};
    PeerId peer_id{};
    NodeInfo contact;
    std::chrono::steady_clock::time_point advertised_at;
};

/**
 * @brief Provider records held by this node on behalf of the overlay.
 *
 * A peer has at most one record per content id; re-announcing refreshes it.
 * Records older than the TTL are invisible to lookups and dropped by sweep().
 */
class ProviderStore {
public:
    using clock = std::chrono::steady_clock;

    explicit ProviderStore(std::chrono::seconds ttl);

    void add(const ContentId& content_id, const NodeInfo& provider, clock::time_point now = clock::now());

    // Live providers of content_id, most recently advertised first.
    std::vector<NodeInfo> get(const ContentId& content_id, size_t max_results, clock::time_point now = clock::now()) const;

    // Drops provider's record for content_id; false if there was none.
    bool remove(const ContentId& content_id, const PeerId& provider);

    // Removes expired records; returns how many were dropped.
    size_t sweep(clock::time_point now = clock::now());

    size_t size() const;
    std::chrono::seconds ttl() const { return ttl_; }

private:
    bool expired(const ProviderRecord& record, clock::time_point now) const {
        return now - record.advertised_at >= ttl_;
    }

    std::chrono::seconds ttl_;
    std::map<ContentId, std::vector<ProviderRecord>> records_;
    mutable std::mutex mutex_;
};

} // namespace dht

#endif // KNAPSACK_PROVIDER_STORE_HPP
