#ifndef KNAPSACK_DISCOVERY_HPP
#define KNAPSACK_DISCOVERY_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <asio/ip/tcp.hpp>
#include <asio/ip/udp.hpp>

#include "kademlia.hpp"
#include "../common/error.hpp"

// Outcome of a provider lookup. An empty provider list with status None means
// "nobody is known to serve this yet"; OverlayUnavailable means the overlay
// could not be queried at all.
struct ProvidersResult {
    ErrorKind status = ErrorKind::None;
    std::vector<PeerId> providers;
    std::string detail;

    bool ok() const { return status == ErrorKind::None; }
};

/**
 * @brief Content-to-peer discovery service.
 *
 * Handlers are invoked asynchronously on the owning event loop, never from
 * inside the call that registered them.
 */
class Discovery {
public:
    using BootstrapHandler = std::function<void(bool joined)>;
    using ProvidersHandler = std::function<void(ProvidersResult)>;
    using PeerHandler = std::function<void(std::optional<asio::ip::tcp::endpoint>)>;

    virtual ~Discovery() = default;

    virtual const PeerId& self_id() const = 0;

    // Joins the overlay through the given seeds. joined is false when no seed answered.
    virtual void bootstrap(const std::vector<asio::ip::udp::endpoint>& seeds, BootstrapHandler handler) = 0;

    // Announces this node as a provider of content_id and keeps re-announcing it.
    virtual void publish(const ContentId& content_id) = 0;

    // Stops re-announcing content_id. Records already held by others expire on their own.
    virtual void unpublish(const ContentId& content_id) = 0;

    virtual void find_providers(const ContentId& content_id, size_t max_results, ProvidersHandler handler) = 0;

    // Resolves a peer to its exchange (TCP) endpoint; nullopt if it cannot be located.
    virtual void find_peer(const PeerId& peer_id, PeerHandler handler) = 0;

    // General routing contacts, closest to this node first.
    virtual std::vector<PeerId> routing_peers(size_t max_results) const = 0;
};

#endif // KNAPSACK_DISCOVERY_HPP
