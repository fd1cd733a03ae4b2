#ifndef KNAPSACK_TESTS_MEMORY_OVERLAY_HPP
#define KNAPSACK_TESTS_MEMORY_OVERLAY_HPP

#include <asio.hpp>
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "dht/discovery.hpp"

// Shared registry standing in for the overlay: who is where, who provides what.
class MemoryOverlay {
public:
    void add_peer(const PeerId& peer, const asio::ip::tcp::endpoint& endpoint) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (endpoints_.find(peer) == endpoints_.end()) order_.push_back(peer);
        endpoints_[peer] = endpoint;
    }

    void add_provider(const ContentId& content_id, const PeerId& peer) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& list = providers_[content_id];
        if (std::find(list.begin(), list.end(), peer) == list.end()) list.push_back(peer);
    }

    void remove_provider(const ContentId& content_id, const PeerId& peer) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(content_id);
        if (it == providers_.end()) return;
        it->second.erase(std::remove(it->second.begin(), it->second.end(), peer), it->second.end());
    }

    std::vector<PeerId> providers(const ContentId& content_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(content_id);
        return it == providers_.end() ? std::vector<PeerId>{} : it->second;
    }

    std::optional<asio::ip::tcp::endpoint> endpoint(const PeerId& peer) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = endpoints_.find(peer);
        if (it == endpoints_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<PeerId> peers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

    // An unavailable overlay answers every lookup with OverlayUnavailable.
    void set_available(bool available) { available_ = available; }
    bool available() const { return available_; }

private:
    mutable std::mutex mutex_;
    std::map<PeerId, asio::ip::tcp::endpoint> endpoints_;
    std::vector<PeerId> order_;
    std::map<ContentId, std::vector<PeerId>> providers_;
    std::atomic<bool> available_{true};
};

// One node's view of a MemoryOverlay. Handlers are posted, as the real overlay does.
class MemoryDiscovery : public Discovery {
public:
    MemoryDiscovery(asio::io_context& io_context, MemoryOverlay& overlay, const PeerId& self_id)
        : io_context_(io_context), overlay_(overlay), self_id_(self_id) {}

    const PeerId& self_id() const override { return self_id_; }

    void bootstrap(const std::vector<asio::ip::udp::endpoint>&, BootstrapHandler handler) override {
        bool joined = overlay_.available();
        asio::post(io_context_, [handler, joined]() { handler(joined); });
    }

    void publish(const ContentId& content_id) override {
        overlay_.add_provider(content_id, self_id_);
    }

    void unpublish(const ContentId& content_id) override {
        overlay_.remove_provider(content_id, self_id_);
    }

    void find_providers(const ContentId& content_id, size_t max_results, ProvidersHandler handler) override {
        ++provider_lookups_;
        ProvidersResult result;
        if (!overlay_.available()) {
            result.status = ErrorKind::OverlayUnavailable;
            result.detail = "overlay offline";
        } else {
            result.providers = overlay_.providers(content_id);
            if (result.providers.size() > max_results) result.providers.resize(max_results);
        }
        asio::post(io_context_, [handler, result]() { handler(result); });
    }

    void find_peer(const PeerId& peer_id, PeerHandler handler) override {
        std::optional<asio::ip::tcp::endpoint> endpoint = overlay_.endpoint(peer_id);
        asio::post(io_context_, [handler, endpoint]() { handler(endpoint); });
    }

    std::vector<PeerId> routing_peers(size_t max_results) const override {
        std::vector<PeerId> peers;
        for (const PeerId& peer : overlay_.peers()) {
            if (peer == self_id_) continue;
            if (peers.size() >= max_results) break;
            peers.push_back(peer);
        }
        return peers;
    }

    size_t provider_lookups() const { return provider_lookups_.load(); }

private:
    asio::io_context& io_context_;
    MemoryOverlay& overlay_;
    PeerId self_id_;
    std::atomic<size_t> provider_lookups_{0};
};

#endif // KNAPSACK_TESTS_MEMORY_OVERLAY_HPP
