#ifndef KNAPSACK_CONNECTION_HPP
#define KNAPSACK_CONNECTION_HPP

#include <asio.hpp>
#include <array>
#include <cstring>
#include <deque>
#include <memory>
#include <functional>
#include <optional>

#include "protocol.hpp"
#include "../common/logger.hpp"

// Define a message structure for easier handling
struct Message {
    MessageType type = MessageType::ERROR_UNSPECIFIED;
    std::vector<uint8_t> payload;
};

/**
 * @brief One framed TCP stream between two peers.
 *
 * Frames are [len (uint32, big endian)][type (uint8)][payload]. All handlers
 * run on the io_context; send_message and close may be called from any thread.
 * The close handler fires exactly once, after which no handler is called.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using message_handler = std::function<void(Message)>;
    using close_handler = std::function<void(const asio::error_code&)>;

    explicit Connection(asio::io_context& io_context)
        : io_context_(io_context), socket_(io_context) {}

    void set_message_handler(message_handler handler) {
        message_handler_ = std::move(handler);
    }

    void set_close_handler(close_handler handler) {
        close_handler_ = std::move(handler);
    }

    asio::ip::tcp::socket& socket() {
        return socket_;
    }

    asio::io_context& get_io_context() {
        return io_context_;
    }

    void start() {
        read_header();
    }

    void send_message(Message msg) {
        asio::post(io_context_,
                   [self = shared_from_this(), msg = std::move(msg)]() mutable {
                       if (self->closed_) return;
                       bool write_in_progress = !self->write_msgs_.empty();
                       self->write_msgs_.push_back(std::move(msg));
                       if (!write_in_progress) {
                           self->write_header();
                       }
                   });
    }

    void close() {
        asio::post(io_context_, [self = shared_from_this()]() {
            self->do_close(asio::error::operation_aborted);
        });
    }

    bool is_closed() const { return closed_; }

    // Identity the remote side announced in HELLO.
    void set_remote_peer(const PeerId& peer_id) { remote_peer_ = peer_id; }
    const std::optional<PeerId>& remote_peer() const { return remote_peer_; }

private:
    void read_header() {
        asio::async_read(socket_, asio::buffer(read_header_buffer_, HEADER_SIZE),
            [self = shared_from_this()](const asio::error_code& error, size_t) {
                if (error) {
                    self->do_close(error);
                    return;
                }
                uint32_t payload_len;
                std::memcpy(&payload_len, self->read_header_buffer_.data(), sizeof(uint32_t));
                payload_len = asio::detail::socket_ops::network_to_host_long(payload_len);

                if (payload_len > MAX_PAYLOAD_SIZE) {
                    LOG_WARN("Dropping connection: frame of ", payload_len, " bytes exceeds limit");
                    self->do_close(asio::error::message_size);
                    return;
                }

                MessageType msg_type = static_cast<MessageType>(self->read_header_buffer_[sizeof(uint32_t)]);
                self->read_body(payload_len, msg_type);
            });
    }

    void read_body(uint32_t payload_len, MessageType msg_type) {
        read_msg_.type = msg_type;
        read_msg_.payload.resize(payload_len);

        asio::async_read(socket_, asio::buffer(read_msg_.payload),
            [self = shared_from_this()](const asio::error_code& error, size_t) {
                if (error) {
                    self->do_close(error);
                    return;
                }
                if (self->message_handler_) {
                    self->message_handler_(std::move(self->read_msg_));
                }
                if (!self->closed_) {
                    self->read_header();
                }
            });
    }

    void write_header() {
        if (write_msgs_.empty() || closed_) return;

        const Message& msg = write_msgs_.front();
        uint32_t payload_len = static_cast<uint32_t>(msg.payload.size());
        payload_len = asio::detail::socket_ops::host_to_network_long(payload_len);

        std::memcpy(write_header_buffer_.data(), &payload_len, sizeof(uint32_t));
        write_header_buffer_[sizeof(uint32_t)] = static_cast<uint8_t>(msg.type);

        std::array<asio::const_buffer, 2> buffers = {
            asio::buffer(write_header_buffer_, HEADER_SIZE),
            asio::buffer(msg.payload)
        };
        asio::async_write(socket_, buffers,
            [self = shared_from_this()](const asio::error_code& error, size_t) {
                if (error) {
                    self->do_close(error);
                    return;
                }
                self->write_msgs_.pop_front();
                self->write_header();
            });
    }

    void do_close(const asio::error_code& reason) {
        if (closed_) return;
        closed_ = true;

        asio::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        write_msgs_.clear();

        // Drop the handlers so captured owners are released.
        message_handler_ = nullptr;
        close_handler handler = std::move(close_handler_);
        close_handler_ = nullptr;
        if (handler) handler(reason);
    }

    asio::io_context& io_context_;
    asio::ip::tcp::socket socket_;
    message_handler message_handler_;
    close_handler close_handler_;
    std::array<uint8_t, HEADER_SIZE> read_header_buffer_{};
    std::array<uint8_t, HEADER_SIZE> write_header_buffer_{};
    Message read_msg_;
    std::deque<Message> write_msgs_;
    bool closed_ = false;

    std::optional<PeerId> remote_peer_;
};

#endif // KNAPSACK_CONNECTION_HPP
