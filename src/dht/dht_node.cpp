#include "dht/dht_node.hpp"
#include "common/serializer.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include <algorithm> // For std::sort

namespace dht {

namespace {

void sort_by_distance(std::vector<NodeInfo>& nodes, const NodeID& target) {
    std::sort(nodes.begin(), nodes.end(), [&target](const NodeInfo& a, const NodeInfo& b) {
        return is_closer(xor_distance(a.id, target), xor_distance(b.id, target));
    });
}

} // namespace

DhtNode::DhtNode(asio::io_context& io_context, const NodeID& self_id,
                 const asio::ip::udp::endpoint& bind_endpoint, uint16_t tcp_port, DhtOptions options)
    : io_context_(io_context),
      socket_(io_context, bind_endpoint),
      local_endpoint_(socket_.local_endpoint()),
      self_id_(self_id),
      tcp_port_(tcp_port),
      options_(options),
      routing_table_(self_id_),
      provider_store_(options.provider_ttl),
      republish_timer_(io_context),
      sweep_timer_(io_context),
      rng_(std::random_device{}()) {
    LOG_INFO("DHT node ", Hasher::short_hex(self_id_), " listening on udp ", local_endpoint_);
}

DhtNode::~DhtNode() {
    asio::error_code ec;
    socket_.close(ec);
    if (ec) {
        LOG_DEBUG("DHT socket close: ", ec.message());
    }
}

void DhtNode::start() {
    asio::post(io_context_, [this]() {
        read_message();
        schedule_republish();
        schedule_sweep();
    });
}

void DhtNode::stop() {
    if (stopped_) return;
    stopped_ = true;

    republish_timer_.cancel();
    sweep_timer_.cancel();
    asio::error_code ec;
    socket_.close(ec);

    // Complete every outstanding lookup with what it has so far.
    std::vector<uint64_t> lookups;
    for (const auto& entry : active_lookups_) lookups.push_back(entry.first);
    for (uint64_t id : lookups) finish_lookup(id);

    for (auto& entry : pending_rpcs_) entry.second.timer->cancel();
    pending_rpcs_.clear();
}

NodeInfo DhtNode::self_info() const {
    return NodeInfo{self_id_, local_endpoint_, tcp_port_};
}

DhtMessage DhtNode::make_message(DhtMessageType type, uint32_t txn) const {
    DhtMessage msg;
    msg.type = type;
    msg.txn = txn;
    msg.sender_id = self_id_;
    msg.sender_tcp_port = tcp_port_;
    return msg;
}

void DhtNode::schedule_republish() {
    republish_timer_.expires_after(options_.republish_interval);
    republish_timer_.async_wait([this](const asio::error_code& error) {
        if (error || stopped_) return;
        LOG_DEBUG("Republishing ", published_.size(), " provider records");
        for (const auto& content_id : published_) {
            provider_store_.add(content_id, self_info());
            announce(content_id);
        }
        schedule_republish();
    });
}

void DhtNode::schedule_sweep() {
    sweep_timer_.expires_after(options_.sweep_interval);
    sweep_timer_.async_wait([this](const asio::error_code& error) {
        if (error || stopped_) return;
        size_t dropped = provider_store_.sweep();
        size_t forgotten = sweep_address_book(std::chrono::steady_clock::now());
        if (dropped > 0 || forgotten > 0) {
            LOG_DEBUG("Expired ", dropped, " provider records and ", forgotten, " learned addresses");
        }
        schedule_sweep();
    });
}

void DhtNode::remember_address(const NodeInfo& node) {
    address_book_[node.id] = AddressEntry{node, std::chrono::steady_clock::now()};
}

size_t DhtNode::sweep_address_book(std::chrono::steady_clock::time_point now) {
    size_t forgotten = 0;
    for (auto it = address_book_.begin(); it != address_book_.end();) {
        if (now - it->second.learned_at >= options_.provider_ttl) {
            it = address_book_.erase(it);
            ++forgotten;
        } else {
            ++it;
        }
    }
    return forgotten;
}

void DhtNode::read_message() {
    read_buffer_.resize(MAX_DHT_DATAGRAM);
    socket_.async_receive_from(
        asio::buffer(read_buffer_), remote_endpoint_,
        [this](const asio::error_code& error, size_t bytes_transferred) {
            if (error == asio::error::operation_aborted || stopped_) return;
            if (!error) {
                try {
                    DhtMessage msg = Serializer::deserialize_dht_message(read_buffer_.data(), bytes_transferred);
                    handle_message(msg, remote_endpoint_);
                } catch (const KnapsackError& e) {
                    LOG_DEBUG("Dropping malformed datagram from ", remote_endpoint_, ": ", e.what());
                }
            } else {
                LOG_WARN("DHT read error: ", error.message());
            }
            read_message(); // Listen for next message
        });
}

void DhtNode::handle_message(const DhtMessage& msg, const asio::ip::udp::endpoint& sender) {
    if (msg.sender_id == self_id_) return;

    NodeInfo sender_info{msg.sender_id, sender, msg.sender_tcp_port};
    routing_table_.add_node(sender_info);

    switch (msg.type) {
        case DhtMessageType::PING: {
            send_message(sender, make_message(DhtMessageType::PONG, msg.txn));
            break;
        }
        case DhtMessageType::FIND_NODE: {
            DhtMessage reply = make_message(DhtMessageType::FIND_NODE_RESPONSE, msg.txn);
            for (const auto& node : routing_table_.find_closest_nodes(msg.target, K + 1)) {
                if (node.id != msg.sender_id && reply.nodes.size() < K) reply.nodes.push_back(node);
            }
            send_message(sender, std::move(reply));
            break;
        }
        case DhtMessageType::ADD_PROVIDER: {
            provider_store_.add(msg.target, sender_info);
            LOG_DEBUG("Stored provider ", Hasher::short_hex(msg.sender_id), " for ", Hasher::short_hex(msg.target));
            break;
        }
        case DhtMessageType::GET_PROVIDERS: {
            DhtMessage reply = make_message(DhtMessageType::GET_PROVIDERS_RESPONSE, msg.txn);
            reply.target = msg.target;
            reply.providers = provider_store_.get(msg.target, K);
            for (const auto& node : routing_table_.find_closest_nodes(msg.target, K + 1)) {
                if (node.id != msg.sender_id && reply.nodes.size() < K) reply.nodes.push_back(node);
            }
            send_message(sender, std::move(reply));
            break;
        }
        case DhtMessageType::PONG:
        case DhtMessageType::FIND_NODE_RESPONSE:
        case DhtMessageType::GET_PROVIDERS_RESPONSE: {
            auto it = pending_rpcs_.find(msg.txn);
            if (it == pending_rpcs_.end()) {
                LOG_DEBUG("Late or unknown ", dht_message_type_name(msg.type), " from ", sender);
                return;
            }
            if (it->second.expected_id && *it->second.expected_id != msg.sender_id) {
                LOG_DEBUG("Reply for txn ", msg.txn, " from unexpected node ", Hasher::short_hex(msg.sender_id));
                return;
            }
            it->second.timer->cancel();
            ReplyHandler handler = std::move(it->second.handler);
            pending_rpcs_.erase(it);
            if (handler) handler(&msg);
            break;
        }
    }
}

void DhtNode::send_message(const asio::ip::udp::endpoint& target, DhtMessage msg) {
    if (stopped_) return;
    auto data = std::make_shared<std::vector<uint8_t>>(Serializer::serialize_dht_message(msg));
    DhtMessageType type = msg.type;
    socket_.async_send_to(asio::buffer(*data), target,
        [data, target, type](const asio::error_code& error, size_t) {
            if (error && error != asio::error::operation_aborted) {
                LOG_DEBUG("Error sending ", dht_message_type_name(type), " to ", target, ": ", error.message());
            }
        });
}

void DhtNode::send_rpc(const asio::ip::udp::endpoint& target, std::optional<NodeID> expected_id,
                       DhtMessage msg, ReplyHandler handler) {
    uint32_t txn;
    do {
        txn = static_cast<uint32_t>(rng_());
    } while (txn == 0 || pending_rpcs_.count(txn));
    msg.txn = txn;

    PendingRpc rpc;
    rpc.expected_id = expected_id;
    rpc.handler = std::move(handler);
    rpc.timer = std::make_unique<asio::steady_timer>(io_context_, options_.rpc_timeout);
    rpc.timer->async_wait([this, txn](const asio::error_code& error) {
        if (error == asio::error::operation_aborted) return;
        on_rpc_timeout(txn);
    });
    pending_rpcs_.emplace(txn, std::move(rpc));

    send_message(target, std::move(msg));
}

void DhtNode::on_rpc_timeout(uint32_t txn) {
    auto it = pending_rpcs_.find(txn);
    if (it == pending_rpcs_.end()) return;

    std::optional<NodeID> expected_id = it->second.expected_id;
    ReplyHandler handler = std::move(it->second.handler);
    pending_rpcs_.erase(it);

    if (expected_id) {
        // Unresponsive contacts make room for live ones.
        routing_table_.remove_node(*expected_id);
        LOG_DEBUG("Evicted unresponsive node ", Hasher::short_hex(*expected_id));
    }
    if (handler) handler(nullptr);
}

// --- Discovery ---

void DhtNode::bootstrap(const std::vector<asio::ip::udp::endpoint>& seeds, BootstrapHandler handler) {
    asio::post(io_context_, [this, seeds, handler]() {
        std::vector<asio::ip::udp::endpoint> targets;
        for (const auto& seed : seeds) {
            if (seed != local_endpoint_) targets.push_back(seed);
        }
        if (targets.empty()) {
            bool joined = !routing_table_.empty();
            if (!joined) LOG_WARN("DHT bootstrap: no seeds, running local-only");
            if (handler) handler(joined);
            return;
        }

        auto remaining = std::make_shared<size_t>(targets.size());
        auto answered = std::make_shared<size_t>(0);
        for (const auto& seed : targets) {
            LOG_DEBUG("Bootstrapping from ", seed);
            send_rpc(seed, std::nullopt, make_message(DhtMessageType::PING),
                [this, remaining, answered, handler](const DhtMessage* reply) {
                    if (reply) ++*answered;
                    if (--*remaining > 0) return;

                    if (*answered == 0) {
                        LOG_WARN("DHT bootstrap failed: no seed answered, running local-only");
                        if (handler) handler(false);
                        return;
                    }
                    // Populate the buckets around our own id.
                    start_find_node_lookup(self_id_, [this, handler](std::vector<NodeInfo>) {
                        LOG_INFO("Joined overlay, ", routing_table_.size(), " contacts known");
                        if (handler) handler(true);
                    });
                });
        }
    });
}

void DhtNode::publish(const ContentId& content_id) {
    asio::post(io_context_, [this, content_id]() {
        published_.insert(content_id);
        provider_store_.add(content_id, self_info());
        announce(content_id);
    });
}

void DhtNode::unpublish(const ContentId& content_id) {
    asio::post(io_context_, [this, content_id]() {
        if (published_.erase(content_id) == 0) return;
        provider_store_.remove(content_id, self_id_);
        LOG_DEBUG("Stopped announcing ", Hasher::short_hex(content_id));
    });
}

void DhtNode::announce(const ContentId& content_id) {
    if (routing_table_.empty()) {
        LOG_DEBUG("No contacts to announce ", Hasher::short_hex(content_id), " to");
        return;
    }
    start_lookup(content_id, false, 0, [this, content_id](LookupState& state) {
        size_t sent = 0;
        std::vector<NodeInfo> closest;
        for (const auto& id : state.responded_nodes) {
            closest.push_back(state.all_known_nodes[id]);
        }
        sort_by_distance(closest, content_id);
        for (const auto& node : closest) {
            if (sent >= K) break;
            DhtMessage msg = make_message(DhtMessageType::ADD_PROVIDER);
            msg.target = content_id;
            send_message(node.endpoint, std::move(msg));
            ++sent;
        }
        LOG_DEBUG("Announced ", Hasher::short_hex(content_id), " to ", sent, " nodes");
    });
}

void DhtNode::find_providers(const ContentId& content_id, size_t max_results, ProvidersHandler handler) {
    asio::post(io_context_, [this, content_id, max_results, handler]() {
        // Local records come first; they are the cheapest to act on.
        std::vector<NodeInfo> local = provider_store_.get(content_id, max_results + 1);

        auto collect = [this, max_results](const std::vector<NodeInfo>& candidates) {
            std::vector<PeerId> result;
            std::set<PeerId> seen;
            for (const auto& node : candidates) {
                if (node.id == self_id_ || !seen.insert(node.id).second) continue;
                remember_address(node);
                if (result.size() < max_results) result.push_back(node.id);
            }
            return result;
        };

        if (routing_table_.empty()) {
            ProvidersResult result;
            result.providers = collect(local);
            if (result.providers.empty()) {
                result.status = ErrorKind::OverlayUnavailable;
                result.detail = "routing table is empty";
            }
            handler(std::move(result));
            return;
        }

        start_lookup(content_id, true, max_results, [local, collect, handler](LookupState& state) {
            std::vector<NodeInfo> candidates = local;
            candidates.insert(candidates.end(), state.providers.begin(), state.providers.end());
            ProvidersResult result;
            result.providers = collect(candidates);
            if (result.providers.empty() && state.responded_nodes.empty()) {
                result.status = ErrorKind::OverlayUnavailable;
                result.detail = "no overlay contact answered";
            }
            handler(std::move(result));
        });
    });
}

void DhtNode::find_peer(const PeerId& peer_id, PeerHandler handler) {
    asio::post(io_context_, [this, peer_id, handler]() {
        if (peer_id == self_id_) {
            handler(self_info().exchange_endpoint());
            return;
        }
        std::optional<NodeInfo> node = routing_table_.find_node(peer_id);
        if (!node) {
            auto it = address_book_.find(peer_id);
            if (it != address_book_.end()) node = it->second.contact;
        }
        if (node && node->tcp_port != 0) {
            handler(node->exchange_endpoint());
            return;
        }
        if (routing_table_.empty()) {
            handler(std::nullopt);
            return;
        }
        start_find_node_lookup(peer_id, [peer_id, handler](std::vector<NodeInfo> nodes) {
            for (const auto& n : nodes) {
                if (n.id == peer_id && n.tcp_port != 0) {
                    handler(n.exchange_endpoint());
                    return;
                }
            }
            handler(std::nullopt);
        });
    });
}

std::vector<PeerId> DhtNode::routing_peers(size_t max_results) const {
    std::vector<PeerId> peers;
    for (const auto& node : routing_table_.find_closest_nodes(self_id_, max_results)) {
        peers.push_back(node.id);
    }
    return peers;
}

// --- Iterative lookup ---

void DhtNode::start_find_node_lookup(const NodeID& target_id, std::function<void(std::vector<NodeInfo>)> callback) {
    asio::post(io_context_, [this, target_id, callback]() {
        start_lookup(target_id, false, 0, [target_id, callback](LookupState& state) {
            std::vector<NodeInfo> closest;
            for (const auto& id : state.responded_nodes) {
                closest.push_back(state.all_known_nodes[id]);
            }
            sort_by_distance(closest, target_id);
            if (closest.size() > K) closest.resize(K);
            callback(std::move(closest));
        });
    });
}

void DhtNode::start_lookup(const NodeID& target_id, bool want_providers, size_t max_providers,
                           std::function<void(LookupState&)> on_complete) {
    auto state = std::make_shared<LookupState>();
    state->lookup_id = next_lookup_id_++;
    state->target_id = target_id;
    state->want_providers = want_providers;
    state->max_providers = max_providers;
    state->on_complete = std::move(on_complete);

    for (const auto& node : routing_table_.find_closest_nodes(target_id)) {
        state->all_known_nodes.emplace(node.id, node);
    }

    uint64_t lookup_id = state->lookup_id;
    state->deadline = std::make_unique<asio::steady_timer>(io_context_, options_.lookup_timeout);
    state->deadline->async_wait([this, lookup_id](const asio::error_code& error) {
        if (error == asio::error::operation_aborted) return;
        LOG_DEBUG("Lookup ", lookup_id, " hit its time budget");
        finish_lookup(lookup_id);
    });

    active_lookups_.emplace(lookup_id, state);
    continue_lookup(lookup_id);
}

void DhtNode::continue_lookup(uint64_t lookup_id) {
    auto it = active_lookups_.find(lookup_id);
    if (it == active_lookups_.end()) return;
    std::shared_ptr<LookupState> state = it->second;

    if (state->lookup_finished) return;
    if (stopped_ || (state->want_providers && state->providers.size() >= state->max_providers)) {
        finish_lookup(lookup_id);
        return;
    }

    // Only the K closest contacts seen so far are worth querying.
    std::vector<NodeInfo> ordered;
    for (const auto& entry : state->all_known_nodes) ordered.push_back(entry.second);
    sort_by_distance(ordered, state->target_id);
    if (ordered.size() > K) ordered.resize(K);

    std::vector<NodeInfo> nodes_to_query;
    for (const auto& node : ordered) {
        if (state->outstanding_rpcs + nodes_to_query.size() >= ALPHA) break;
        if (state->queried_nodes.count(node.id) == 0) nodes_to_query.push_back(node);
    }

    if (nodes_to_query.empty() && state->outstanding_rpcs == 0) {
        finish_lookup(lookup_id);
        return;
    }

    for (const auto& node : nodes_to_query) {
        state->queried_nodes.insert(node.id);
        state->outstanding_rpcs++;

        DhtMessage msg = make_message(state->want_providers ? DhtMessageType::GET_PROVIDERS : DhtMessageType::FIND_NODE);
        msg.target = state->target_id;
        NodeID queried_id = node.id;
        send_rpc(node.endpoint, node.id, std::move(msg),
            [this, lookup_id, queried_id](const DhtMessage* reply) {
                process_lookup_reply(lookup_id, queried_id, reply);
            });
    }
}

void DhtNode::process_lookup_reply(uint64_t lookup_id, const NodeID& queried_id, const DhtMessage* reply) {
    auto it = active_lookups_.find(lookup_id);
    if (it == active_lookups_.end()) {
        // Lookup already finished
        return;
    }
    LookupState& state = *it->second;
    state.outstanding_rpcs--;

    if (reply) {
        state.responded_nodes.insert(queried_id);
        for (const auto& node : reply->nodes) {
            if (node.id != self_id_) state.all_known_nodes.emplace(node.id, node);
        }
        for (const auto& provider : reply->providers) {
            if (state.provider_ids.insert(provider.id).second) {
                state.providers.push_back(provider);
            }
        }
    }

    continue_lookup(lookup_id);
}

void DhtNode::finish_lookup(uint64_t lookup_id) {
    auto it = active_lookups_.find(lookup_id);
    if (it == active_lookups_.end()) return;

    std::shared_ptr<LookupState> state = it->second;
    active_lookups_.erase(it);
    state->lookup_finished = true;
    if (state->deadline) state->deadline->cancel();
    if (state->on_complete) state->on_complete(*state);
}

} // namespace dht
