#include "core/node.hpp"
#include "video/content_addresser.hpp"
#include "common/logger.hpp"
#include "common/error.hpp"
#include "crypto/hasher.hpp"
#include <future>

namespace {

asio::ip::address parse_bind_address(const std::string& text) {
    asio::error_code ec;
    asio::ip::address address = asio::ip::make_address(text, ec);
    if (ec) {
        throw KnapsackError(ErrorKind::IoError, "Node", "invalid bind address '" + text + "': " + ec.message());
    }
    return address;
}

dht::DhtOptions dht_options(const NodeConfig& config) {
    dht::DhtOptions options;
    options.provider_ttl = config.provider_ttl;
    options.republish_interval = config.republish_interval;
    options.rpc_timeout = config.rpc_timeout;
    options.lookup_timeout = config.lookup_timeout;
    return options;
}

SessionOptions session_options(const NodeConfig& config) {
    SessionOptions options;
    options.fetch_fanout = config.fetch_fanout;
    options.max_providers = config.max_providers;
    options.max_discovery_rounds = config.max_discovery_rounds;
    options.rediscover_delay = config.rediscover_delay;
    options.acquire_timeout = config.acquire_timeout;
    options.exchange_timeout = config.exchange_timeout;
    options.search_fanout = config.search_fanout;
    options.search_quorum = config.search_quorum;
    options.search_timeout = config.search_timeout;
    return options;
}

} // namespace

Node::Node(NodeConfig config)
    : Node(std::move(config), nullptr) {}

Node::Node(NodeConfig config, DiscoveryFactory discovery_factory)
    : config_(std::move(config)),
      data_dir_(ensure_data_dir(config_.data_dir)),
      io_context_(),
      work_guard_(asio::make_work_guard(io_context_)),
      disk_pool_(std::max<size_t>(1, config_.disk_threads)),
      identity_(Identity::load_or_create(data_dir_ / "identity.pem")) {
    const asio::ip::address address = parse_bind_address(config_.bind_address);

    store_ = std::make_unique<ChunkStore>((data_dir_ / "knapsack.db").string());
    handler_ = std::make_shared<StoreRequestHandler>(*store_, disk_pool_);
    server_ = std::make_unique<ExchangeServer>(io_context_, asio::ip::tcp::endpoint(address, config_.listen_port),
                                               identity_.peer_id(), handler_);

    if (discovery_factory) {
        discovery_ = discovery_factory(io_context_, identity_.peer_id(), server_->port());
    } else {
        auto dht_node = std::make_unique<dht::DhtNode>(io_context_, identity_.peer_id(),
                                                       asio::ip::udp::endpoint(address, config_.dht_port),
                                                       server_->port(), dht_options(config_));
        dht_ = dht_node.get();
        discovery_ = std::move(dht_node);
    }

    client_ = std::make_unique<ExchangeClient>(io_context_, *discovery_, scores_, identity_.peer_id(), server_->port());
    sessions_ = std::make_unique<SessionCoordinator>(io_context_, disk_pool_, *discovery_, *client_, *store_, scores_,
                                                     session_options(config_));

    LOG_INFO("Node ", Hasher::short_hex(identity_.peer_id()), " ready in ", data_dir_.string());
}

Node::~Node() {
    stop();
}

std::filesystem::path Node::ensure_data_dir(const std::string& data_dir) {
    std::filesystem::path path(data_dir);
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw KnapsackError(ErrorKind::IoError, "Node", "cannot create " + data_dir + ": " + ec.message());
    }
    return path;
}

void Node::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (started_) return;
        started_ = true;
    }

    io_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            LOG_ERR("IO thread error: ", e.what());
        }
    });

    server_->start();
    if (dht_) dht_->start();

    readvertise_stored();

    std::vector<asio::ip::udp::endpoint> seeds = collect_seeds();
    if (!seeds.empty()) {
        if (!bootstrap(seeds)) {
            LOG_WARN("No seed answered; serving local content only");
        }
    }
    LOG_INFO("Node started: exchange tcp ", exchange_port(), ", dht udp ", dht_port());
}

void Node::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!started_ || stopped_) return;
        stopped_ = true;
    }

    persist_contacts();

    std::promise<void> stopped;
    asio::post(io_context_, [this, &stopped]() {
        sessions_->stop();
        client_->stop();
        server_->stop();
        if (dht_) dht_->stop();
        // Closes queued by the stops above run before this.
        asio::post(io_context_, [&stopped]() { stopped.set_value(); });
    });
    stopped.get_future().wait();

    disk_pool_.join();
    work_guard_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) io_thread_.join();
    LOG_INFO("Node ", Hasher::short_hex(identity_.peer_id()), " stopped");
}

asio::ip::tcp::endpoint Node::exchange_endpoint() const {
    return asio::ip::tcp::endpoint(parse_bind_address(config_.bind_address), server_->port());
}

VideoMetadata Node::prepare(const std::filesystem::path& file_path) {
    // Two streaming passes: the video id is only known once every chunk is hashed.
    VideoMetadata metadata = ContentAddresser::prepare_file(file_path, config_.chunk_size);

    store_->put_video(metadata);
    ContentAddresser::for_each_file_chunk(file_path, config_.chunk_size,
        [this, &metadata](uint32_t order, const std::vector<uint8_t>& payload) {
            if (order >= metadata.chunks.size()) {
                throw KnapsackError(ErrorKind::IoError, "prepare", "file grew while it was being prepared");
            }
            store_->put_chunk(metadata.chunks[order].id, metadata.id, payload);
        });

    ContentAddresser::write_metadata_file(metadata, ContentAddresser::metadata_file_path(file_path));
    LOG_INFO("Prepared '", metadata.title, "': ", metadata.chunks.size(), " chunks, id ",
             Hasher::hash_to_hex(metadata.id));
    return metadata;
}

void Node::advertise(const VideoMetadata& metadata) {
    if (!store_->has_video(metadata.id)) {
        throw KnapsackError(ErrorKind::NotFound, "advertise", "video " + Hasher::short_hex(metadata.id) + " is not stored");
    }
    discovery_->publish(metadata.id);
    size_t published = 0;
    for (const ChunkSummary& chunk : metadata.chunks) {
        if (!store_->has_chunk(chunk.id)) continue;
        discovery_->publish(chunk.id);
        ++published;
    }
    LOG_INFO("Advertising '", metadata.title, "' and ", published, "/", metadata.chunks.size(), " chunks");
}

void Node::evict(const ContentId& video_id) {
    VideoMetadata metadata = store_->get_video(video_id);
    store_->delete_video(video_id);

    discovery_->unpublish(video_id);
    size_t withdrawn = 0;
    for (const ChunkSummary& chunk : metadata.chunks) {
        if (store_->has_chunk(chunk.id)) continue; // still held for another video
        discovery_->unpublish(chunk.id);
        ++withdrawn;
    }
    LOG_INFO("Evicted '", metadata.title, "', withdrew ", withdrawn, "/", metadata.chunks.size(), " chunk announcements");
}

std::vector<VideoMetadata> Node::search(const std::string& query, size_t count) {
    auto promise = std::make_shared<std::promise<LocateResult>>();
    std::future<LocateResult> future = promise->get_future();
    sessions_->locate(query, count, [promise](LocateResult result) {
        promise->set_value(std::move(result));
    });
    return future.get().videos;
}

AcquireResult Node::acquire(const ContentId& video_id) {
    auto promise = std::make_shared<std::promise<AcquireResult>>();
    std::future<AcquireResult> future = promise->get_future();
    acquire_async(video_id, [promise](AcquireResult result) {
        promise->set_value(std::move(result));
    });
    return future.get();
}

std::shared_ptr<AcquireHandle> Node::acquire_async(const ContentId& video_id,
                                                   SessionCoordinator::AcquireHandler handler) {
    return sessions_->acquire(video_id, [this, handler = std::move(handler)](AcquireResult result) {
        if (result.ok) {
            // Store reads stay off the event loop.
            VideoMetadata metadata = *result.metadata;
            asio::post(disk_pool_, [this, metadata]() {
                try {
                    advertise(metadata);
                } catch (const KnapsackError& e) {
                    LOG_WARN(e.what());
                }
            });
        }
        if (handler) handler(std::move(result));
    });
}

bool Node::bootstrap(const std::vector<asio::ip::udp::endpoint>& seeds) {
    auto promise = std::make_shared<std::promise<bool>>();
    std::future<bool> future = promise->get_future();
    discovery_->bootstrap(seeds, [promise](bool joined) {
        promise->set_value(joined);
    });
    return future.get();
}

std::optional<asio::ip::udp::endpoint> Node::resolve_seed(const std::string& host_port) {
    size_t colon = host_port.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == host_port.size()) {
        LOG_WARN("Ignoring seed '", host_port, "': expected host:port");
        return std::nullopt;
    }
    std::string host = host_port.substr(0, colon);
    std::string port = host_port.substr(colon + 1);

    asio::io_context resolver_io;
    asio::ip::udp::resolver resolver(resolver_io);
    asio::error_code ec;
    auto results = resolver.resolve(asio::ip::udp::v4(), host, port, ec);
    if (ec || results.empty()) {
        LOG_WARN("Ignoring seed '", host_port, "': ", ec ? ec.message() : "no address");
        return std::nullopt;
    }
    return results.begin()->endpoint();
}

void Node::readvertise_stored() {
    try {
        for (const VideoMetadata& video : store_->list_videos()) {
            if (store_->has_all_chunks(video.id)) advertise(video);
        }
    } catch (const KnapsackError& e) {
        LOG_ERR("Re-advertising stored videos failed: ", e.what());
    }
}

std::vector<asio::ip::udp::endpoint> Node::collect_seeds() const {
    std::vector<asio::ip::udp::endpoint> seeds;
    for (const std::string& seed : config_.bootstrap_peers) {
        if (auto endpoint = resolve_seed(seed)) seeds.push_back(*endpoint);
    }
    try {
        for (const dht::NodeInfo& peer : store_->load_peers()) {
            if (peer.id != identity_.peer_id()) seeds.push_back(peer.endpoint);
        }
    } catch (const KnapsackError& e) {
        LOG_WARN("Loading persisted peers failed: ", e.what());
    }
    return seeds;
}

void Node::persist_contacts() {
    if (!dht_) return;
    // contacts() locks the routing table, so this is safe off the loop.
    std::vector<dht::NodeInfo> contacts = dht_->contacts();
    try {
        for (const dht::NodeInfo& contact : contacts) {
            store_->save_peer(contact);
        }
        LOG_DEBUG("Persisted ", contacts.size(), " routing contact(s)");
    } catch (const KnapsackError& e) {
        LOG_WARN("Persisting routing contacts failed: ", e.what());
    }
}
