#include "dht/provider_store.hpp"
#include <algorithm>

namespace dht {

ProviderStore::ProviderStore(std::chrono::seconds ttl) : ttl_(ttl) {}

void ProviderStore::add(const ContentId& content_id, const NodeInfo& provider, clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& records = records_[content_id];
    auto it = std::find_if(records.begin(), records.end(),
                           [&](const ProviderRecord& r) { return r.peer_id == provider.id; });
    if (it != records.end()) {
        it->contact = provider;
        it->advertised_at = now;
        return;
    }
    records.push_back({content_id, provider.id, provider, now});
}

std::vector<NodeInfo> ProviderStore::get(const ContentId& content_id, size_t max_results, clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(content_id);
    if (it == records_.end()) return {};

    std::vector<ProviderRecord> live;
    for (const auto& record : it->second) {
        if (!expired(record, now)) live.push_back(record);
    }
    std::sort(live.begin(), live.end(), [](const ProviderRecord& a, const ProviderRecord& b) {
        return a.advertised_at > b.advertised_at;
    });

    std::vector<NodeInfo> result;
    for (const auto& record : live) {
        if (result.size() >= max_results) break;
        result.push_back(record.contact);
    }
    return result;
}

bool ProviderStore::remove(const ContentId& content_id, const PeerId& provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(content_id);
    if (it == records_.end()) return false;

    auto& records = it->second;
    auto end = std::remove_if(records.begin(), records.end(),
                              [&](const ProviderRecord& r) { return r.peer_id == provider; });
    bool removed = end != records.end();
    records.erase(end, records.end());
    if (records.empty()) records_.erase(it);
    return removed;
}

size_t ProviderStore::sweep(clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        auto& records = it->second;
        auto end = std::remove_if(records.begin(), records.end(),
                                  [&](const ProviderRecord& r) { return expired(r, now); });
        dropped += static_cast<size_t>(std::distance(end, records.end()));
        records.erase(end, records.end());
        if (records.empty()) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
    return dropped;
}

size_t ProviderStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& entry : records_) {
        total += entry.second.size();
    }
    return total;
}

} // namespace dht
