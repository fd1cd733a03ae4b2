#include "network/exchange_client.hpp"
#include "common/serializer.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include <algorithm>
#include <future>
#include <tuple>

const char* exchange_state_name(ExchangeState state) {
    switch (state) {
        case ExchangeState::Pending: return "Pending";
        case ExchangeState::Fulfilled: return "Fulfilled";
        case ExchangeState::TimedOut: return "TimedOut";
        case ExchangeState::Errored: return "Errored";
    }
    return "Unknown";
}

// --- Exchange ---

Exchange::Exchange(uint64_t id, const PeerId& peer, Request request, Handler handler)
    : id_(id), peer_(peer), request_(std::move(request)), handler_(std::move(handler)) {}

bool Exchange::fulfill(Response response) {
    ExchangeResult result;
    result.state = ExchangeState::Fulfilled;
    result.response = std::move(response);
    return finish(std::move(result));
}

bool Exchange::time_out(const std::string& detail) {
    ExchangeResult result;
    result.state = ExchangeState::TimedOut;
    result.error = ErrorKind::TimedOut;
    result.detail = detail;
    return finish(std::move(result));
}

bool Exchange::fail(ErrorKind kind, const std::string& detail) {
    ExchangeResult result;
    result.state = ExchangeState::Errored;
    result.error = kind;
    result.detail = detail;
    return finish(std::move(result));
}

bool Exchange::finish(ExchangeResult result) {
    if (state_ != ExchangeState::Pending) return false;
    state_ = result.state;
    if (deadline_) deadline_->cancel();

    if (!result.ok()) {
        LOG_DEBUG(request_kind_name(request_.kind), " exchange ", id_, " with ", Hasher::short_hex(peer_),
                  " ended ", exchange_state_name(result.state), " [", error_kind_name(result.error), "]: ", result.detail);
    }
    result.peer = peer_;
    Handler handler = std::move(handler_);
    handler_ = nullptr;
    if (handler) handler(std::move(result));
    return true;
}

// --- ExchangeClient ---

ExchangeClient::ExchangeClient(asio::io_context& io_context, Discovery& discovery, PeerScores& scores,
                               const PeerId& self_id, uint16_t listen_port)
    : io_context_(io_context),
      discovery_(discovery),
      scores_(scores),
      self_id_(self_id),
      listen_port_(listen_port) {}

void ExchangeClient::async_send(const PeerId& peer, Request request, std::chrono::milliseconds timeout, Handler handler) {
    asio::post(io_context_,
        [this, peer, request = std::move(request), timeout, handler = std::move(handler)]() mutable {
            auto exchange = std::make_shared<Exchange>(next_request_id_++, peer, std::move(request), std::move(handler));
            start_exchange(exchange, timeout);
        });
}

ExchangeResult ExchangeClient::send(const PeerId& peer, const Request& request, std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<ExchangeResult>>();
    std::future<ExchangeResult> future = promise->get_future();
    async_send(peer, request, timeout, [promise](ExchangeResult result) {
        promise->set_value(std::move(result));
    });
    return future.get();
}

void ExchangeClient::stop() {
    stopped_ = true;
    std::vector<std::shared_ptr<PeerLink>> links;
    for (const auto& entry : links_) links.push_back(entry.second);
    for (const auto& link : links) {
        drop_link(link, ErrorKind::IoError, "exchange client stopped");
    }
}

void ExchangeClient::start_exchange(const std::shared_ptr<Exchange>& exchange, std::chrono::milliseconds timeout) {
    if (stopped_) {
        exchange->fail(ErrorKind::IoError, "exchange client stopped");
        return;
    }

    const uint64_t id = exchange->id();
    exchanges_.emplace(id, exchange);

    auto timer = std::make_unique<asio::steady_timer>(io_context_, timeout);
    timer->async_wait([this, id, timeout](const asio::error_code& error) {
        if (error == asio::error::operation_aborted) return;
        if (auto timed_out = take(id)) {
            scores_.record_timeout(timed_out->peer());
            timed_out->time_out("no response within " + std::to_string(timeout.count()) + " ms");
        }
    });
    exchange->set_deadline(std::move(timer));

    std::shared_ptr<PeerLink>& link = links_[exchange->peer()];
    if (!link) {
        link = std::make_shared<PeerLink>();
        link->peer = exchange->peer();
        link->waiting.push_back(id);
        dial(link);
        return;
    }
    if (link->ready) {
        transmit(link, id);
    } else {
        link->waiting.push_back(id);
    }
}

void ExchangeClient::dial(const std::shared_ptr<PeerLink>& link) {
    discovery_.find_peer(link->peer, [this, link](std::optional<asio::ip::tcp::endpoint> endpoint) {
        auto it = links_.find(link->peer);
        if (it == links_.end() || it->second != link) return; // Dropped meanwhile

        if (!endpoint) {
            drop_link(link, ErrorKind::Unreachable, "peer " + Hasher::short_hex(link->peer) + " is not locatable");
            return;
        }
        connect(link, *endpoint);
    });
}

void ExchangeClient::connect(const std::shared_ptr<PeerLink>& link, const asio::ip::tcp::endpoint& endpoint) {
    auto connection = std::make_shared<Connection>(io_context_);
    link->connection = connection;

    connection->socket().async_connect(endpoint,
        [this, link, connection, endpoint](const asio::error_code& error) {
            auto it = links_.find(link->peer);
            if (it == links_.end() || it->second != link) {
                connection->close();
                return;
            }
            if (error) {
                drop_link(link, ErrorKind::Unreachable,
                          "connect to " + endpoint.address().to_string() + ":" + std::to_string(endpoint.port()) +
                          " failed: " + error.message());
                return;
            }

            std::weak_ptr<PeerLink> weak_link = link;
            connection->set_message_handler([this, weak_link](Message msg) {
                if (auto l = weak_link.lock()) handle_message(l, std::move(msg));
            });
            connection->set_close_handler([this, weak_link](const asio::error_code& reason) {
                if (auto l = weak_link.lock()) {
                    drop_link(l, ErrorKind::IoError, "connection closed: " + reason.message());
                }
            });
            connection->start();

            HelloPayload hello;
            hello.peer_id = self_id_;
            hello.listen_port = listen_port_;
            Message msg;
            msg.type = MessageType::HELLO;
            msg.payload = Serializer::serialize_hello_payload(hello);
            connection->send_message(std::move(msg));
            LOG_DEBUG("Connected to ", Hasher::short_hex(link->peer), " at ", endpoint);
        });
}

void ExchangeClient::handle_message(const std::shared_ptr<PeerLink>& link, Message msg) {
    switch (msg.type) {
        case MessageType::HELLO:
            handle_hello(link, msg);
            break;
        case MessageType::RESPONSE:
            handle_response(link, msg);
            break;
        default:
            scores_.record_error(link->peer);
            drop_link(link, ErrorKind::IoError, "unexpected message type " + std::to_string(static_cast<int>(msg.type)));
            break;
    }
}

void ExchangeClient::handle_hello(const std::shared_ptr<PeerLink>& link, const Message& msg) {
    HelloPayload hello;
    try {
        hello = Serializer::deserialize_hello_payload(msg.payload);
    } catch (const KnapsackError& e) {
        drop_link(link, ErrorKind::IoError, std::string("malformed HELLO: ") + e.what());
        return;
    }
    if (hello.peer_id != link->peer) {
        // Whoever answers at that address is not the peer we asked for.
        LOG_WARN("Dialled ", Hasher::short_hex(link->peer), " but ", Hasher::short_hex(hello.peer_id), " answered");
        drop_link(link, ErrorKind::Unreachable, "endpoint answered as " + Hasher::short_hex(hello.peer_id));
        return;
    }
    if (hello.protocol_version != PROTOCOL_VERSION) {
        drop_link(link, ErrorKind::Unreachable, "protocol version " + std::to_string(hello.protocol_version));
        return;
    }

    link->ready = true;
    link->connection->set_remote_peer(hello.peer_id);
    std::vector<uint64_t> waiting;
    waiting.swap(link->waiting);
    for (uint64_t id : waiting) {
        transmit(link, id);
    }
}

void ExchangeClient::transmit(const std::shared_ptr<PeerLink>& link, uint64_t exchange_id) {
    auto it = exchanges_.find(exchange_id);
    if (it == exchanges_.end()) return; // Timed out while queued

    link->in_flight.insert(exchange_id);
    Message msg;
    msg.type = MessageType::REQUEST;
    msg.payload = Serializer::serialize_request_payload(exchange_id, it->second->request());
    link->connection->send_message(std::move(msg));
}

void ExchangeClient::handle_response(const std::shared_ptr<PeerLink>& link, const Message& msg) {
    uint64_t request_id = 0;
    Response response;
    try {
        std::tie(request_id, response) = Serializer::deserialize_response_payload(msg.payload);
    } catch (const KnapsackError& e) {
        scores_.record_error(link->peer);
        drop_link(link, ErrorKind::IoError, std::string("malformed response: ") + e.what());
        return;
    }

    if (link->in_flight.count(request_id) == 0) {
        LOG_DEBUG("Late response ", request_id, " from ", Hasher::short_hex(link->peer));
        return;
    }
    std::shared_ptr<Exchange> exchange = take(request_id);
    if (!exchange) return;

    const Request& request = exchange->request();
    if (!response_matches(request, response)) {
        scores_.record_error(link->peer);
        exchange->fail(ErrorKind::IoError, std::string(response_kind_name(response.kind)) + " response to " +
                                          request_kind_name(request.kind) + " request");
        return;
    }

    if (response.kind == ResponseKind::Chunk && Hasher::sha256(response.bytes) != request.content_id) {
        scores_.record_integrity_violation(link->peer);
        LOG_WARN("Peer ", Hasher::short_hex(link->peer), " sent corrupt chunk ", Hasher::short_hex(request.content_id));
        exchange->fail(ErrorKind::IntegrityViolation,
                       "chunk payload does not hash to " + Hasher::short_hex(request.content_id));
        return;
    }

    scores_.record_success(link->peer);
    exchange->fulfill(std::move(response));
}

void ExchangeClient::drop_link(const std::shared_ptr<PeerLink>& link, ErrorKind kind, const std::string& detail) {
    auto it = links_.find(link->peer);
    if (it != links_.end() && it->second == link) {
        links_.erase(it);
    }
    if (link->connection) {
        link->connection->close();
    }

    std::vector<uint64_t> affected(link->waiting.begin(), link->waiting.end());
    affected.insert(affected.end(), link->in_flight.begin(), link->in_flight.end());
    link->waiting.clear();
    link->in_flight.clear();

    for (uint64_t id : affected) {
        auto ex = exchanges_.find(id);
        if (ex == exchanges_.end()) continue;
        std::shared_ptr<Exchange> exchange = ex->second;
        exchanges_.erase(ex);
        if (!stopped_) scores_.record_error(link->peer);
        exchange->fail(kind, detail);
    }
}

std::shared_ptr<Exchange> ExchangeClient::take(uint64_t exchange_id) {
    auto it = exchanges_.find(exchange_id);
    if (it == exchanges_.end()) return nullptr;

    std::shared_ptr<Exchange> exchange = it->second;
    exchanges_.erase(it);

    auto link_it = links_.find(exchange->peer());
    if (link_it != links_.end()) {
        auto& link = link_it->second;
        link->in_flight.erase(exchange_id);
        link->waiting.erase(std::remove(link->waiting.begin(), link->waiting.end(), exchange_id), link->waiting.end());
    }
    return exchange;
}
