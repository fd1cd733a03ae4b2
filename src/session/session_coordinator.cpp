#include "session/session_coordinator.hpp"
#include "common/serializer.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include <algorithm>
#include <set>

namespace {

struct LocateOperation {
    explicit LocateOperation(asio::io_context& io_context) : timer(io_context) {}

    std::string query;
    size_t max_results = 0;
    size_t quorum = 0;
    size_t outstanding = 0;
    bool done = false;
    std::set<ContentId> seen;
    LocateResult result;
    asio::steady_timer timer;
    SessionCoordinator::LocateHandler handler;
};

void complete_locate(const std::shared_ptr<LocateOperation>& op) {
    if (op->done) return;
    op->done = true;
    op->timer.cancel();
    if (op->result.videos.size() > op->max_results) {
        op->result.videos.resize(op->max_results);
    }
    LOG_INFO("Search '", op->query, "': ", op->result.videos.size(), " result(s) from ",
             op->result.peers_answered, "/", op->result.peers_asked, " peer(s)");
    auto handler = std::move(op->handler);
    if (handler) handler(std::move(op->result));
}

} // namespace

// --- AcquireSession ---

/**
 * @brief One running acquire: metadata first, then every missing chunk.
 *
 * Chunks move Needed -> Discovering -> Needed (with candidates) -> Requested
 * -> Have. A chunk whose candidates all failed is Exhausted until the next
 * discovery round. Lives on the io_context only.
 */
class AcquireSession : public std::enable_shared_from_this<AcquireSession> {
public:
    AcquireSession(SessionCoordinator& coordinator, uint64_t id, const ContentId& video_id,
                   std::shared_ptr<AcquireHandle> handle, SessionCoordinator::AcquireHandler handler);

    void start();
    void cancel();
    void abort(const std::string& detail);

private:
    enum class ChunkState {
        Needed,
        Discovering,
        Requested,
        Exhausted,
        Have
    };

    struct ChunkSlot {
        ChunkSummary summary;
        ChunkState state = ChunkState::Needed;
        std::vector<PeerId> candidates; // ranked, not tried yet this round
        bool discovered = false;        // discovery already ran this round
    };

    const SessionOptions& options() const { return coordinator_.options_; }
    size_t max_rounds() const { return std::max<size_t>(1, options().max_discovery_rounds); }
    std::vector<PeerId> usable(const std::vector<PeerId>& providers) const;

    // Metadata stage
    void resolve_metadata();
    void on_metadata_providers(ProvidersResult result);
    void on_metadata_response(ExchangeResult result);
    void metadata_round_failed(ErrorKind kind, const std::string& detail);
    void store_metadata(VideoMetadata metadata);

    // Chunk stage
    void begin_chunks(VideoMetadata metadata);
    void schedule_work();
    void discover(uint32_t order);
    void on_chunk_providers(uint32_t order, ProvidersResult result);
    void fetch(uint32_t order);
    void on_chunk_response(uint32_t order, ExchangeResult result);
    void on_chunk_stored(uint32_t order, ErrorKind kind, const std::string& detail);
    void end_round();
    void rediscover();
    void verify_complete();
    void video_evicted();

    void schedule_retry(void (AcquireSession::*next)());
    void finish(AcquireResult result);

    SessionCoordinator& coordinator_;
    uint64_t id_;
    ContentId video_id_;
    std::shared_ptr<AcquireHandle> handle_;
    SessionCoordinator::AcquireHandler handler_;

    asio::steady_timer deadline_;
    asio::steady_timer retry_timer_;
    bool finished_ = false;

    // Metadata stage
    size_t metadata_pending_ = 0;
    bool metadata_accepted_ = false;

    // Chunk stage
    std::optional<VideoMetadata> metadata_;
    std::vector<ChunkSlot> slots_;
    size_t stored_ = 0;
    size_t active_ = 0; // discoveries + fetches + stores in progress
    bool progress_ = false;

    size_t rounds_without_progress_ = 0;
    ErrorKind last_failure_kind_ = ErrorKind::Unreachable;
    std::string last_failure_;
};

AcquireSession::AcquireSession(SessionCoordinator& coordinator, uint64_t id, const ContentId& video_id,
                               std::shared_ptr<AcquireHandle> handle, SessionCoordinator::AcquireHandler handler)
    : coordinator_(coordinator),
      id_(id),
      video_id_(video_id),
      handle_(std::move(handle)),
      handler_(std::move(handler)),
      deadline_(coordinator.io_context_),
      retry_timer_(coordinator.io_context_) {}

void AcquireSession::start() {
    auto self = shared_from_this();
    deadline_.expires_after(options().acquire_timeout);
    deadline_.async_wait([self](const asio::error_code& error) {
        if (error == asio::error::operation_aborted) return;
        self->finish(AcquireResult::failure(ErrorKind::TimedOut,
            "no completion within " + std::to_string(self->options().acquire_timeout.count()) + " ms"));
    });

    auto local = std::make_shared<std::optional<VideoMetadata>>();
    coordinator_.run_on_disk(
        [self, local]() { *local = self->coordinator_.store_.find_video(self->video_id_); },
        [self, local](ErrorKind kind, const std::string& detail) {
            if (self->finished_) return;
            if (kind != ErrorKind::None) {
                self->finish(AcquireResult::failure(kind, detail));
            } else if (*local) {
                self->begin_chunks(std::move(**local));
            } else {
                self->resolve_metadata();
            }
        });
}

void AcquireSession::cancel() {
    if (finished_) return;
    LOG_INFO("Acquire of ", Hasher::short_hex(video_id_), " cancelled, ", active_, " operation(s) still in flight");
    finish(AcquireResult::failure(ErrorKind::Cancelled, "cancelled by caller"));
}

void AcquireSession::abort(const std::string& detail) {
    finish(AcquireResult::failure(ErrorKind::Cancelled, detail));
}

std::vector<PeerId> AcquireSession::usable(const std::vector<PeerId>& providers) const {
    const PeerId& self_id = coordinator_.discovery_.self_id();
    std::vector<PeerId> result;
    std::set<PeerId> seen;
    for (const PeerId& peer : providers) {
        if (peer == self_id || !seen.insert(peer).second) continue;
        result.push_back(peer);
    }
    return coordinator_.scores_.rank(std::move(result));
}

// --- Metadata stage ---

void AcquireSession::resolve_metadata() {
    if (finished_) return;
    auto self = shared_from_this();
    coordinator_.discovery_.find_providers(video_id_, options().max_providers, [self](ProvidersResult result) {
        self->on_metadata_providers(std::move(result));
    });
}

void AcquireSession::on_metadata_providers(ProvidersResult result) {
    if (finished_) return;
    if (!result.ok()) {
        metadata_round_failed(result.status, result.detail);
        return;
    }
    std::vector<PeerId> providers = usable(result.providers);
    if (providers.empty()) {
        metadata_round_failed(ErrorKind::Unreachable, "no provider of the video is known");
        return;
    }

    LOG_DEBUG("Asking ", providers.size(), " provider(s) for metadata of ", Hasher::short_hex(video_id_));
    auto self = shared_from_this();
    metadata_pending_ = providers.size();
    for (const PeerId& peer : providers) {
        coordinator_.exchange_.async_send(peer, Request::metadata(video_id_), options().exchange_timeout,
            [self](ExchangeResult exchange) { self->on_metadata_response(std::move(exchange)); });
    }
}

void AcquireSession::on_metadata_response(ExchangeResult result) {
    --metadata_pending_;
    if (finished_ || metadata_accepted_) return;

    std::string failure;
    if (!result.ok()) {
        failure = std::string(error_kind_name(result.error)) + ": " + result.detail;
    } else if (result.response->kind != ResponseKind::Metadata) {
        failure = "peer does not have it";
    } else {
        try {
            VideoMetadata metadata = Serializer::deserialize_video_metadata(result.response->bytes);
            validate_metadata(metadata);
            if (metadata.id != video_id_) {
                throw KnapsackError(ErrorKind::HashMismatch, "acquire",
                                    "peer answered with metadata of " + Hasher::short_hex(metadata.id));
            }
            metadata_accepted_ = true;
            store_metadata(std::move(metadata));
            return;
        } catch (const KnapsackError& e) {
            coordinator_.scores_.record_integrity_violation(result.peer);
            failure = e.what();
        }
    }

    LOG_DEBUG("Metadata of ", Hasher::short_hex(video_id_), " from ", Hasher::short_hex(result.peer), ": ", failure);
    if (metadata_pending_ == 0) {
        metadata_round_failed(ErrorKind::Unreachable, "no provider served valid metadata (last: " + failure + ")");
    }
}

void AcquireSession::metadata_round_failed(ErrorKind kind, const std::string& detail) {
    ++rounds_without_progress_;
    if (rounds_without_progress_ >= max_rounds()) {
        ErrorKind final_kind = kind == ErrorKind::OverlayUnavailable ? kind : ErrorKind::Unreachable;
        finish(AcquireResult::failure(final_kind, "metadata after " + std::to_string(rounds_without_progress_) +
                                                  " discovery round(s): " + detail));
        return;
    }
    LOG_DEBUG("Metadata round ", rounds_without_progress_, " for ", Hasher::short_hex(video_id_), " failed: ", detail);
    schedule_retry(&AcquireSession::resolve_metadata);
}

void AcquireSession::store_metadata(VideoMetadata metadata) {
    auto self = shared_from_this();
    auto shared = std::make_shared<VideoMetadata>(std::move(metadata));
    coordinator_.run_on_disk(
        [self, shared]() { self->coordinator_.store_.put_video(*shared); },
        [self, shared](ErrorKind kind, const std::string& detail) {
            if (self->finished_) return;
            if (kind != ErrorKind::None) {
                self->finish(AcquireResult::failure(kind, detail));
                return;
            }
            LOG_INFO("Stored metadata of '", shared->title, "' (", shared->chunks.size(), " chunks)");
            self->rounds_without_progress_ = 0;
            self->begin_chunks(*shared);
        });
}

// --- Chunk stage ---

void AcquireSession::begin_chunks(VideoMetadata metadata) {
    metadata_ = std::move(metadata);
    handle_->total_chunks_ = metadata_->chunks.size();

    auto self = shared_from_this();
    auto missing = std::make_shared<std::vector<ChunkSummary>>();
    auto present = std::make_shared<bool>(false);
    coordinator_.run_on_disk(
        [self, missing, present]() {
            *present = self->coordinator_.store_.has_video(self->video_id_);
            *missing = self->coordinator_.store_.missing_chunks(self->video_id_);
        },
        [self, missing, present](ErrorKind kind, const std::string& detail) {
            if (self->finished_) return;
            if (kind != ErrorKind::None) {
                self->finish(AcquireResult::failure(kind, detail));
                return;
            }
            if (!*present) {
                self->video_evicted();
                return;
            }

            self->slots_.clear();
            for (const ChunkSummary& chunk : self->metadata_->chunks) {
                ChunkSlot slot;
                slot.summary = chunk;
                slot.state = ChunkState::Have;
                self->slots_.push_back(slot);
            }
            for (const ChunkSummary& chunk : *missing) {
                if (chunk.order < self->slots_.size()) self->slots_[chunk.order].state = ChunkState::Needed;
            }
            self->stored_ = self->slots_.size() - missing->size();
            self->handle_->stored_chunks_ = self->stored_;

            if (missing->empty()) {
                self->verify_complete();
                return;
            }
            LOG_INFO("Fetching ", missing->size(), " of ", self->slots_.size(), " chunks for ",
                     Hasher::short_hex(self->video_id_));
            self->schedule_work();
        });
}

void AcquireSession::schedule_work() {
    if (finished_) return;
    if (handle_->cancelled()) {
        cancel();
        return;
    }

    const size_t fanout = std::max<size_t>(1, options().fetch_fanout);
    for (ChunkSlot& slot : slots_) {
        if (active_ >= fanout) break;
        if (slot.state != ChunkState::Needed) continue;
        if (!slot.candidates.empty()) {
            fetch(slot.summary.order);
        } else if (!slot.discovered) {
            discover(slot.summary.order);
        } else {
            slot.state = ChunkState::Exhausted;
        }
    }
    if (active_ == 0) end_round();
}

void AcquireSession::discover(uint32_t order) {
    ChunkSlot& slot = slots_[order];
    slot.state = ChunkState::Discovering;
    slot.discovered = true;
    ++active_;

    auto self = shared_from_this();
    coordinator_.discovery_.find_providers(slot.summary.id, options().max_providers,
        [self, order](ProvidersResult result) { self->on_chunk_providers(order, std::move(result)); });
}

void AcquireSession::on_chunk_providers(uint32_t order, ProvidersResult result) {
    --active_;
    ChunkSlot& slot = slots_[order];
    if (slot.state != ChunkState::Discovering) return;

    if (!result.ok()) {
        last_failure_kind_ = result.status;
        last_failure_ = result.detail;
    } else {
        slot.candidates = usable(result.providers);
        if (slot.candidates.empty()) {
            last_failure_kind_ = ErrorKind::Unreachable;
            last_failure_ = "no provider of chunk " + std::to_string(order) + " is known";
        }
    }
    slot.state = ChunkState::Needed;
    schedule_work();
}

void AcquireSession::fetch(uint32_t order) {
    ChunkSlot& slot = slots_[order];
    PeerId peer = slot.candidates.front();
    slot.candidates.erase(slot.candidates.begin());
    slot.state = ChunkState::Requested;
    ++active_;

    auto self = shared_from_this();
    coordinator_.exchange_.async_send(peer, Request::chunk(slot.summary.id), options().exchange_timeout,
        [self, order](ExchangeResult result) { self->on_chunk_response(order, std::move(result)); });
}

void AcquireSession::on_chunk_response(uint32_t order, ExchangeResult result) {
    if (result.ok() && result.response->kind == ResponseKind::Chunk) {
        // Stored even after cancellation; active_ stays held until the write lands.
        auto self = shared_from_this();
        auto payload = std::make_shared<std::vector<uint8_t>>(std::move(result.response->bytes));
        const ContentId chunk_id = slots_[order].summary.id;
        coordinator_.run_on_disk(
            [self, chunk_id, payload]() { self->coordinator_.store_.put_chunk(chunk_id, self->video_id_, *payload); },
            [self, order](ErrorKind kind, const std::string& detail) { self->on_chunk_stored(order, kind, detail); });
        return;
    }

    --active_;
    if (result.ok()) {
        last_failure_kind_ = ErrorKind::Unreachable;
        last_failure_ = "peer " + Hasher::short_hex(result.peer) + " does not have chunk " + std::to_string(order);
    } else {
        last_failure_kind_ = result.error;
        last_failure_ = result.detail;
    }
    LOG_DEBUG("Chunk ", order, " of ", Hasher::short_hex(video_id_), " from ", Hasher::short_hex(result.peer),
              " failed: ", last_failure_);
    slots_[order].state = ChunkState::Needed;
    schedule_work();
}

void AcquireSession::on_chunk_stored(uint32_t order, ErrorKind kind, const std::string& detail) {
    --active_;
    if (kind == ErrorKind::DanglingReference) {
        video_evicted();
        return;
    }
    if (kind != ErrorKind::None) {
        // A verified payload the store refuses is a local problem, not the peer's.
        LOG_ERR("Storing chunk ", order, " of ", Hasher::short_hex(video_id_), " failed: ", detail);
        finish(AcquireResult::failure(kind, detail));
        return;
    }

    slots_[order].state = ChunkState::Have;
    ++stored_;
    progress_ = true;
    handle_->stored_chunks_ = stored_;
    if (finished_) return;

    if (stored_ == slots_.size()) {
        verify_complete();
        return;
    }
    schedule_work();
}

void AcquireSession::end_round() {
    bool exhausted = std::any_of(slots_.begin(), slots_.end(),
                                 [](const ChunkSlot& slot) { return slot.state == ChunkState::Exhausted; });
    if (!exhausted) return;

    if (progress_) {
        rounds_without_progress_ = 0;
    } else {
        ++rounds_without_progress_;
    }
    progress_ = false;

    if (rounds_without_progress_ >= max_rounds()) {
        ErrorKind final_kind = last_failure_kind_ == ErrorKind::OverlayUnavailable ? last_failure_kind_
                                                                                  : ErrorKind::Unreachable;
        finish(AcquireResult::failure(final_kind, std::to_string(slots_.size() - stored_) + " chunk(s) missing after " +
                                                  std::to_string(rounds_without_progress_) +
                                                  " discovery round(s) without progress (last: " + last_failure_ + ")"));
        return;
    }
    LOG_INFO("Rediscovering providers for ", Hasher::short_hex(video_id_), " in ",
             options().rediscover_delay.count(), " ms");
    schedule_retry(&AcquireSession::rediscover);
}

void AcquireSession::rediscover() {
    for (ChunkSlot& slot : slots_) {
        if (slot.state != ChunkState::Exhausted) continue;
        slot.state = ChunkState::Needed;
        slot.discovered = false;
        slot.candidates.clear();
    }
    schedule_work();
}

void AcquireSession::verify_complete() {
    if (finished_) return;
    auto self = shared_from_this();
    auto complete = std::make_shared<bool>(false);
    auto present = std::make_shared<bool>(false);
    coordinator_.run_on_disk(
        [self, complete, present]() {
            *complete = self->coordinator_.store_.has_all_chunks(self->video_id_);
            *present = *complete || self->coordinator_.store_.has_video(self->video_id_);
        },
        [self, complete, present](ErrorKind kind, const std::string& detail) {
            if (self->finished_) return;
            if (kind != ErrorKind::None) {
                self->finish(AcquireResult::failure(kind, detail));
            } else if (*complete) {
                self->finish(AcquireResult::success(*self->metadata_));
            } else if (!*present) {
                self->video_evicted();
            } else {
                // Some chunks were evicted underneath us; recount and carry on.
                VideoMetadata metadata = *self->metadata_;
                self->begin_chunks(std::move(metadata));
            }
        });
}

// The whole video was deleted locally while we were filling it in.
void AcquireSession::video_evicted() {
    finish(AcquireResult::failure(ErrorKind::NotFound, "video " + Hasher::short_hex(video_id_) +
                                                       " was evicted from the local store during acquire"));
}

void AcquireSession::schedule_retry(void (AcquireSession::*next)()) {
    auto self = shared_from_this();
    retry_timer_.expires_after(options().rediscover_delay);
    retry_timer_.async_wait([self, next](const asio::error_code& error) {
        if (error == asio::error::operation_aborted || self->finished_) return;
        ((*self).*next)();
    });
}

void AcquireSession::finish(AcquireResult result) {
    if (finished_) return;
    auto self = shared_from_this();
    finished_ = true;
    deadline_.cancel();
    retry_timer_.cancel();
    handle_->finished_ = true;
    handle_->detach();

    if (result.ok) {
        LOG_INFO("Acquired '", result.metadata->title, "' (", Hasher::short_hex(video_id_), ")");
    } else {
        LOG_WARN("acquire ", Hasher::short_hex(video_id_), " failed [", error_kind_name(result.kind), "]: ",
                 result.detail);
    }

    auto handler = std::move(handler_);
    handler_ = nullptr;
    coordinator_.session_finished(id_);
    if (handler) handler(std::move(result));
}

// --- AcquireHandle ---

void AcquireHandle::cancel() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lock(hook_mutex_);
    if (cancel_hook_) cancel_hook_();
}

void AcquireHandle::set_cancel_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    cancel_hook_ = std::move(hook);
}

void AcquireHandle::detach() {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    cancel_hook_ = nullptr;
}

// --- SessionCoordinator ---

SessionCoordinator::SessionCoordinator(asio::io_context& io_context, asio::thread_pool& disk_pool,
                                       Discovery& discovery, ExchangeClient& exchange, ChunkStore& store,
                                       PeerScores& scores, SessionOptions options)
    : io_context_(io_context),
      disk_pool_(disk_pool),
      discovery_(discovery),
      exchange_(exchange),
      store_(store),
      scores_(scores),
      options_(options) {}

SessionCoordinator::~SessionCoordinator() {
    // Handles can outlive us; their cancel() must not reach into a dead coordinator.
    std::lock_guard<std::mutex> lock(handles_mutex_);
    for (auto& weak_handle : handles_) {
        if (auto handle = weak_handle.lock()) handle->detach();
    }
}

void SessionCoordinator::locate(const std::string& query, size_t max_results, LocateHandler handler) {
    asio::post(io_context_, [this, query, max_results, handler = std::move(handler)]() mutable {
        auto op = std::make_shared<LocateOperation>(io_context_);
        op->query = query;
        op->max_results = max_results;
        op->handler = std::move(handler);

        std::vector<PeerId> peers = discovery_.routing_peers(options_.search_fanout);
        op->result.peers_asked = peers.size();
        if (peers.empty()) {
            LOG_WARN("Search '", query, "' has no peers to ask");
            complete_locate(op);
            return;
        }
        op->quorum = std::min(std::max<size_t>(1, options_.search_quorum), peers.size());
        op->outstanding = peers.size();

        op->timer.expires_after(options_.search_timeout);
        op->timer.async_wait([op](const asio::error_code& error) {
            if (error == asio::error::operation_aborted) return;
            complete_locate(op);
        });

        const auto timeout = std::min(options_.exchange_timeout, options_.search_timeout);
        for (const PeerId& peer : peers) {
            exchange_.async_send(peer, Request::search(query), timeout, [op](ExchangeResult result) {
                --op->outstanding;
                if (op->done) return;

                if (result.ok()) {
                    ++op->result.peers_answered;
                    for (VideoMetadata& video : result.response->results) {
                        if (!is_valid_metadata(video) || !matches_query(video, op->query)) {
                            LOG_DEBUG("Dropping unusable search result from ", Hasher::short_hex(result.peer));
                            continue;
                        }
                        if (op->seen.insert(video.id).second) {
                            op->result.videos.push_back(std::move(video));
                        }
                    }
                } else {
                    LOG_DEBUG("Search at ", Hasher::short_hex(result.peer), " ended ",
                              exchange_state_name(result.state), ": ", result.detail);
                }

                if (op->result.peers_answered >= op->quorum || op->outstanding == 0) {
                    complete_locate(op);
                }
            });
        }
    });
}

std::shared_ptr<AcquireHandle> SessionCoordinator::acquire(const ContentId& video_id, AcquireHandler handler) {
    auto handle = std::make_shared<AcquireHandle>();
    const uint64_t id = next_session_id_++;
    auto session = std::make_shared<AcquireSession>(*this, id, video_id, handle, std::move(handler));

    std::weak_ptr<AcquireSession> weak_session = session;
    handle->set_cancel_hook([this, weak_session]() {
        asio::post(io_context_, [weak_session]() {
            if (auto s = weak_session.lock()) s->cancel();
        });
    });
    {
        std::lock_guard<std::mutex> lock(handles_mutex_);
        handles_.erase(std::remove_if(handles_.begin(), handles_.end(),
                                      [](const std::weak_ptr<AcquireHandle>& weak_handle) {
                                          auto h = weak_handle.lock();
                                          return !h || h->finished();
                                      }),
                       handles_.end());
        handles_.push_back(handle);
    }

    asio::post(io_context_, [this, id, session]() {
        if (stopped_) {
            session->abort("session coordinator stopped");
            return;
        }
        sessions_.emplace(id, session);
        session->start();
    });
    return handle;
}

void SessionCoordinator::stop() {
    stopped_ = true;
    auto sessions = sessions_;
    for (auto& entry : sessions) {
        entry.second->abort("node stopping");
    }
}

void SessionCoordinator::run_on_disk(std::function<void()> work,
                                     std::function<void(ErrorKind, const std::string&)> done) {
    asio::post(disk_pool_, [this, work = std::move(work), done = std::move(done)]() {
        ErrorKind kind = ErrorKind::None;
        std::string detail;
        try {
            work();
        } catch (const KnapsackError& e) {
            kind = e.kind();
            detail = e.what();
        }
        asio::post(io_context_, [kind, detail, done]() { done(kind, detail); });
    });
}

void SessionCoordinator::session_finished(uint64_t session_id) {
    sessions_.erase(session_id);
}
