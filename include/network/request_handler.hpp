#ifndef KNAPSACK_REQUEST_HANDLER_HPP
#define KNAPSACK_REQUEST_HANDLER_HPP

#include <asio/thread_pool.hpp>
#include <functional>

#include "protocol.hpp"

class ChunkStore;

/**
 * @brief Serving side of the exchange protocol.
 *
 * handle() must eventually call respond exactly once; it may do so from any
 * thread.
 */
class RequestHandler {
public:
    using Responder = std::function<void(Response)>;

    virtual ~RequestHandler() = default;

    virtual void handle(const PeerId& from, const Request& request, Responder respond) = 0;
};

// Answers from the local ChunkStore on a disk worker pool.
class StoreRequestHandler : public RequestHandler {
public:
    // Cap on results per Search answer.
    static constexpr size_t MAX_SEARCH_RESULTS = 64;

    StoreRequestHandler(ChunkStore& store, asio::thread_pool& disk_pool);

    void handle(const PeerId& from, const Request& request, Responder respond) override;

    // The synchronous lookup behind handle(). Store failures answer NotFound.
    static Response answer(ChunkStore& store, const Request& request);

private:
    ChunkStore& store_;
    asio::thread_pool& disk_pool_;
};

#endif // KNAPSACK_REQUEST_HANDLER_HPP
