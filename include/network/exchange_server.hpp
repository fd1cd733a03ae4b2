#ifndef KNAPSACK_EXCHANGE_SERVER_HPP
#define KNAPSACK_EXCHANGE_SERVER_HPP

#include <asio.hpp>
#include <memory>
#include <set>

#include "connection.hpp"
#include "protocol.hpp"
#include "request_handler.hpp"

/**
 * @brief Accepts exchange connections and answers their requests.
 *
 * A connection must open with HELLO; the server answers with its own HELLO
 * and then hands every REQUEST to the RequestHandler. Responses carry the
 * request id they answer, so slow answers never block later requests.
 */
class ExchangeServer {
public:
    ExchangeServer(asio::io_context& io_context, const asio::ip::tcp::endpoint& bind_endpoint,
                   const PeerId& self_id, std::shared_ptr<RequestHandler> handler);

    void start();
    // Must run on the io_context thread.
    void stop();

    uint16_t port() const { return port_; }
    size_t connection_count() const { return connections_.size(); }

private:
    void start_accept();
    void handle_message(Message msg, const std::shared_ptr<Connection>& connection);
    void handle_hello(const Message& msg, const std::shared_ptr<Connection>& connection);
    void handle_request(const Message& msg, const std::shared_ptr<Connection>& connection);

    asio::io_context& io_context_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_;
    PeerId self_id_;
    std::shared_ptr<RequestHandler> handler_;
    std::set<std::shared_ptr<Connection>> connections_; // To keep connections alive
    bool stopped_ = false;
};

#endif // KNAPSACK_EXCHANGE_SERVER_HPP
