#ifndef KNAPSACK_EXCHANGE_CLIENT_HPP
#define KNAPSACK_EXCHANGE_CLIENT_HPP

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "connection.hpp"
#include "protocol.hpp"
#include "peer_scores.hpp"
#include "../dht/discovery.hpp"
#include "../common/error.hpp"

enum class ExchangeState {
    Pending,   // sent, awaiting response
    Fulfilled, // matching response received
    TimedOut,  // no response within the deadline
    Errored    // transport failure or bad response
};

const char* exchange_state_name(ExchangeState state);

struct ExchangeResult {
    ExchangeState state = ExchangeState::Pending;
    std::optional<Response> response; // set when Fulfilled
    ErrorKind error = ErrorKind::None;
    std::string detail;
    PeerId peer{};

    bool ok() const { return state == ExchangeState::Fulfilled; }
};

/**
 * @brief State machine of one request/response round trip.
 *
 * Pending is the only non-terminal state; the first transition out of it
 * wins and later ones are ignored.
 */
class Exchange {
public:
    using Handler = std::function<void(ExchangeResult)>;

    Exchange(uint64_t id, const PeerId& peer, Request request, Handler handler);

    uint64_t id() const { return id_; }
    const PeerId& peer() const { return peer_; }
    const Request& request() const { return request_; }
    ExchangeState state() const { return state_; }
    bool pending() const { return state_ == ExchangeState::Pending; }

    // Each returns false if the exchange had already left Pending.
    bool fulfill(Response response);
    bool time_out(const std::string& detail);
    bool fail(ErrorKind kind, const std::string& detail);

    void set_deadline(std::unique_ptr<asio::steady_timer> timer) { deadline_ = std::move(timer); }

private:
    bool finish(ExchangeResult result);

    uint64_t id_;
    PeerId peer_;
    Request request_;
    Handler handler_;
    ExchangeState state_ = ExchangeState::Pending;
    std::unique_ptr<asio::steady_timer> deadline_;
};

/**
 * @brief Sends requests to peers by PeerId.
 *
 * Peers are resolved through Discovery and dialled once; every exchange to a
 * peer then shares that connection, correlated by request id. Chunk payloads
 * are verified against the requested id before the handler sees them.
 * No retries happen here: callers decide what to try next.
 */
class ExchangeClient {
public:
    using Handler = Exchange::Handler;

    ExchangeClient(asio::io_context& io_context, Discovery& discovery, PeerScores& scores,
                   const PeerId& self_id, uint16_t listen_port);

    // handler runs on the io_context.
    void async_send(const PeerId& peer, Request request, std::chrono::milliseconds timeout, Handler handler);

    // Blocks until the exchange leaves Pending. Never call from the io_context thread.
    ExchangeResult send(const PeerId& peer, const Request& request, std::chrono::milliseconds timeout);

    // Closes every connection; pending exchanges end Errored. Must run on the io_context thread.
    void stop();

    size_t connection_count() const { return links_.size(); }

private:
    struct PeerLink {
        PeerId peer{};
        std::shared_ptr<Connection> connection;
        bool ready = false;                   // HELLO answered
        std::vector<uint64_t> waiting;        // queued until ready
        std::set<uint64_t> in_flight;
    };

    void start_exchange(const std::shared_ptr<Exchange>& exchange, std::chrono::milliseconds timeout);
    void dial(const std::shared_ptr<PeerLink>& link);
    void connect(const std::shared_ptr<PeerLink>& link, const asio::ip::tcp::endpoint& endpoint);
    void handle_message(const std::shared_ptr<PeerLink>& link, Message msg);
    void handle_hello(const std::shared_ptr<PeerLink>& link, const Message& msg);
    void handle_response(const std::shared_ptr<PeerLink>& link, const Message& msg);
    void transmit(const std::shared_ptr<PeerLink>& link, uint64_t exchange_id);
    void drop_link(const std::shared_ptr<PeerLink>& link, ErrorKind kind, const std::string& detail);

    // Removes the exchange from the tables; nullptr if it already completed.
    std::shared_ptr<Exchange> take(uint64_t exchange_id);

    asio::io_context& io_context_;
    Discovery& discovery_;
    PeerScores& scores_;
    PeerId self_id_;
    uint16_t listen_port_;

    std::map<PeerId, std::shared_ptr<PeerLink>> links_;
    std::map<uint64_t, std::shared_ptr<Exchange>> exchanges_;
    uint64_t next_request_id_ = 1;
    bool stopped_ = false;
};

#endif // KNAPSACK_EXCHANGE_CLIENT_HPP
