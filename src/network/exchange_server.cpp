#include "network/exchange_server.hpp"
#include "common/serializer.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"

ExchangeServer::ExchangeServer(asio::io_context& io_context, const asio::ip::tcp::endpoint& bind_endpoint,
                               const PeerId& self_id, std::shared_ptr<RequestHandler> handler)
    : io_context_(io_context),
      acceptor_(io_context, bind_endpoint),
      port_(acceptor_.local_endpoint().port()),
      self_id_(self_id),
      handler_(std::move(handler)) {
    LOG_INFO("Exchange server listening on tcp ", acceptor_.local_endpoint());
}

void ExchangeServer::start() {
    asio::post(io_context_, [this]() { start_accept(); });
}

void ExchangeServer::stop() {
    if (stopped_) return;
    stopped_ = true;
    asio::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        LOG_DEBUG("Exchange acceptor close: ", ec.message());
    }
    auto connections = connections_;
    for (const auto& connection : connections) {
        connection->close();
    }
}

void ExchangeServer::start_accept() {
    auto new_connection = std::make_shared<Connection>(io_context_);

    acceptor_.async_accept(new_connection->socket(),
        [this, new_connection](const asio::error_code& error) {
            if (error == asio::error::operation_aborted || stopped_) return;
            if (!error) {
                asio::error_code ec;
                LOG_DEBUG("New connection accepted from ", new_connection->socket().remote_endpoint(ec));

                std::weak_ptr<Connection> conn_weak = new_connection;
                new_connection->set_message_handler([this, conn_weak](Message msg) {
                    if (auto conn_shared = conn_weak.lock()) {
                        handle_message(std::move(msg), conn_shared);
                    }
                });
                new_connection->set_close_handler([this, conn_weak](const asio::error_code&) {
                    if (auto conn_shared = conn_weak.lock()) {
                        connections_.erase(conn_shared);
                    }
                });
                connections_.insert(new_connection);
                new_connection->start();
            } else {
                LOG_ERR("Error accepting connection: ", error.message());
            }
            start_accept();
        });
}

void ExchangeServer::handle_message(Message msg, const std::shared_ptr<Connection>& connection) {
    switch (msg.type) {
        case MessageType::HELLO:
            handle_hello(msg, connection);
            break;
        case MessageType::REQUEST:
            handle_request(msg, connection);
            break;
        default:
            LOG_WARN("Exchange server received unexpected message type ", static_cast<int>(msg.type));
            connection->close();
            break;
    }
}

void ExchangeServer::handle_hello(const Message& msg, const std::shared_ptr<Connection>& connection) {
    HelloPayload received;
    try {
        received = Serializer::deserialize_hello_payload(msg.payload);
    } catch (const KnapsackError& e) {
        LOG_WARN("Malformed HELLO: ", e.what());
        connection->close();
        return;
    }
    if (received.protocol_version != PROTOCOL_VERSION) {
        LOG_WARN("Peer ", Hasher::short_hex(received.peer_id), " speaks protocol ", received.protocol_version,
                 ", expected ", PROTOCOL_VERSION);
        connection->close();
        return;
    }
    connection->set_remote_peer(received.peer_id);

    HelloPayload own;
    own.peer_id = self_id_;
    own.listen_port = port_;

    Message reply;
    reply.type = MessageType::HELLO;
    reply.payload = Serializer::serialize_hello_payload(own);
    connection->send_message(std::move(reply));
    LOG_DEBUG("HELLO from ", Hasher::short_hex(received.peer_id));
}

void ExchangeServer::handle_request(const Message& msg, const std::shared_ptr<Connection>& connection) {
    if (!connection->remote_peer()) {
        LOG_WARN("REQUEST before HELLO, closing connection");
        connection->close();
        return;
    }

    uint64_t request_id = 0;
    Request request;
    try {
        std::tie(request_id, request) = Serializer::deserialize_request_payload(msg.payload);
    } catch (const KnapsackError& e) {
        LOG_WARN("Malformed REQUEST from ", Hasher::short_hex(*connection->remote_peer()), ": ", e.what());
        connection->close();
        return;
    }

    std::weak_ptr<Connection> conn_weak = connection;
    handler_->handle(*connection->remote_peer(), request, [conn_weak, request_id](Response response) {
        auto conn = conn_weak.lock();
        if (!conn) return; // Requester went away

        Message reply;
        reply.type = MessageType::RESPONSE;
        reply.payload = Serializer::serialize_response_payload(request_id, response);
        conn->send_message(std::move(reply));
    });
}
