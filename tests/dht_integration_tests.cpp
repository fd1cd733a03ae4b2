#include "gtest/gtest.h"
#include "dht/dht_node.hpp"
#include "crypto/hasher.hpp"
#include "common/logger.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>

namespace {

dht::DhtOptions fast_dht_options() {
    dht::DhtOptions options;
    options.rpc_timeout = std::chrono::milliseconds(300);
    options.lookup_timeout = std::chrono::milliseconds(3000);
    return options;
}

asio::ip::udp::endpoint loopback(uint16_t port) {
    return asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), port);
}

} // namespace

// Fixture for DHT Node tests: three nodes sharing one event loop.
class DhtNodeIntegrationTest : public ::testing::Test {
protected:
    asio::io_context io_context;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard{asio::make_work_guard(io_context)};

    std::unique_ptr<dht::DhtNode> node1;
    std::unique_ptr<dht::DhtNode> node2;
    std::unique_ptr<dht::DhtNode> node3;

    std::thread thread;

    void SetUp() override {
        Logger::instance().set_console(false);

        node1 = std::make_unique<dht::DhtNode>(io_context, Hasher::sha256(std::string("dht-1")), loopback(0), 7101, fast_dht_options());
        node2 = std::make_unique<dht::DhtNode>(io_context, Hasher::sha256(std::string("dht-2")), loopback(0), 7102, fast_dht_options());
        node3 = std::make_unique<dht::DhtNode>(io_context, Hasher::sha256(std::string("dht-3")), loopback(0), 7103, fast_dht_options());

        node1->start();
        node2->start();
        node3->start();

        thread = std::thread([this]() { io_context.run(); });
    }

    void TearDown() override {
        std::promise<void> stopped;
        asio::post(io_context, [this, &stopped]() {
            node1->stop();
            node2->stop();
            node3->stop();
            stopped.set_value();
        });
        stopped.get_future().wait();
        work_guard.reset();
        io_context.stop();
        if (thread.joinable()) thread.join();
    }

    bool bootstrap(dht::DhtNode& node, const std::vector<asio::ip::udp::endpoint>& seeds) {
        std::promise<bool> joined;
        node.bootstrap(seeds, [&joined](bool ok) { joined.set_value(ok); });
        return joined.get_future().get();
    }

    void join_all() {
        ASSERT_TRUE(bootstrap(*node2, {node1->local_endpoint()}));
        ASSERT_TRUE(bootstrap(*node3, {node2->local_endpoint()}));
    }

    ProvidersResult find_providers(dht::DhtNode& node, const ContentId& content_id) {
        std::promise<ProvidersResult> done;
        node.find_providers(content_id, 8, [&done](ProvidersResult result) { done.set_value(std::move(result)); });
        return done.get_future().get();
    }
};

TEST_F(DhtNodeIntegrationTest, BootstrapAndFindNode) {
    join_all();

    std::promise<std::vector<dht::NodeInfo>> lookup;
    asio::post(io_context, [this, &lookup]() {
        node3->start_find_node_lookup(node1->self_id(), [&lookup](std::vector<dht::NodeInfo> nodes) {
            lookup.set_value(std::move(nodes));
        });
    });
    std::vector<dht::NodeInfo> found_nodes = lookup.get_future().get();
    ASSERT_FALSE(found_nodes.empty());

    bool node1_found = false;
    for (const auto& node_info : found_nodes) {
        if (node_info.id == node1->self_id()) {
            node1_found = true;
            ASSERT_EQ(node_info.tcp_port, 7101);
            break;
        }
    }
    ASSERT_TRUE(node1_found);
    ASSERT_FALSE(node3->routing_peers(8).empty());
}

TEST_F(DhtNodeIntegrationTest, PublishAndFindProviders) {
    join_all();

    ContentId video = Hasher::sha256(std::string("a video"));
    node1->publish(video);

    // ADD_PROVIDER is fire-and-forget; give it a moment to land.
    ProvidersResult result;
    for (int i = 0; i < 20; ++i) {
        result = find_providers(*node3, video);
        if (!result.providers.empty()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    ASSERT_TRUE(result.ok()) << result.detail;
    ASSERT_EQ(result.providers.size(), 1u);
    ASSERT_EQ(result.providers[0], node1->self_id());

    // Nobody provides this one: an empty answer, not a failure.
    ProvidersResult none = find_providers(*node3, Hasher::sha256(std::string("unpublished")));
    ASSERT_TRUE(none.ok());
    ASSERT_TRUE(none.providers.empty());
}

TEST_F(DhtNodeIntegrationTest, FindPeerResolvesExchangeEndpoint) {
    join_all();

    std::promise<std::optional<asio::ip::tcp::endpoint>> resolved;
    node3->find_peer(node1->self_id(), [&resolved](std::optional<asio::ip::tcp::endpoint> endpoint) {
        resolved.set_value(endpoint);
    });
    std::optional<asio::ip::tcp::endpoint> endpoint = resolved.get_future().get();
    ASSERT_TRUE(endpoint.has_value());
    ASSERT_EQ(endpoint->port(), 7101);
    ASSERT_EQ(endpoint->address(), asio::ip::make_address("127.0.0.1"));

    std::promise<std::optional<asio::ip::tcp::endpoint>> unknown;
    node3->find_peer(Hasher::sha256(std::string("nobody")), [&unknown](std::optional<asio::ip::tcp::endpoint> endpoint) {
        unknown.set_value(endpoint);
    });
    ASSERT_FALSE(unknown.get_future().get().has_value());
}

TEST_F(DhtNodeIntegrationTest, DeadSeedFailsBootstrap) {
    uint16_t dead_port = 0;
    {
        asio::ip::udp::socket scratch(io_context, loopback(0));
        dead_port = scratch.local_endpoint().port();
    }
    ASSERT_FALSE(bootstrap(*node2, {loopback(dead_port)}));
    ASSERT_TRUE(node2->routing_table().empty());
}

TEST_F(DhtNodeIntegrationTest, LoneNodeReportsOverlayUnavailable) {
    ContentId video = Hasher::sha256(std::string("lonely"));
    ProvidersResult result = find_providers(*node1, video);
    ASSERT_FALSE(result.ok());
    ASSERT_EQ(result.status, ErrorKind::OverlayUnavailable);

    // Its own record does not count as a provider to fetch from.
    node1->publish(video);
    result = find_providers(*node1, video);
    ASSERT_EQ(result.status, ErrorKind::OverlayUnavailable);
}

TEST_F(DhtNodeIntegrationTest, UnpublishDropsOwnRecord) {
    join_all();

    ContentId video = Hasher::sha256(std::string("withdrawn"));
    node1->publish(video);

    auto on_loop = [this](std::function<bool()> read) {
        std::promise<bool> value;
        asio::post(io_context, [&value, &read]() { value.set_value(read()); });
        return value.get_future().get();
    };
    auto self_listed = [this, video]() {
        for (const auto& provider : node1->provider_store().get(video, 8)) {
            if (provider.id == node1->self_id()) return true;
        }
        return false;
    };

    ASSERT_TRUE(on_loop([&]() { return node1->is_published(video); }));
    ASSERT_TRUE(on_loop(self_listed));

    node1->unpublish(video);
    EXPECT_FALSE(on_loop([&]() { return node1->is_published(video); }));
    EXPECT_FALSE(on_loop(self_listed));

    // Withdrawing something never published is a no-op.
    node1->unpublish(Hasher::sha256(std::string("never published")));
    EXPECT_FALSE(on_loop([&]() { return node1->is_published(video); }));
}

// Addresses learned from provider answers are forgotten once they are older than the provider TTL.
TEST(DhtAddressBookTest, LearnedAddressesExpire) {
    Logger::instance().set_console(false);
    asio::io_context io_context;
    auto work_guard = asio::make_work_guard(io_context);

    dht::DhtOptions options = fast_dht_options();
    options.provider_ttl = std::chrono::seconds(1);
    options.sweep_interval = std::chrono::seconds(1);
    dht::DhtNode provider(io_context, Hasher::sha256(std::string("book-1")), loopback(0), 7201, options);
    dht::DhtNode seeker(io_context, Hasher::sha256(std::string("book-2")), loopback(0), 7202, options);
    provider.start();
    seeker.start();
    std::thread thread([&io_context]() { io_context.run(); });

    auto book_size = [&]() {
        std::promise<size_t> size;
        asio::post(io_context, [&]() { size.set_value(seeker.address_book_size()); });
        return size.get_future().get();
    };

    std::promise<bool> joined;
    seeker.bootstrap({provider.local_endpoint()}, [&joined](bool ok) { joined.set_value(ok); });
    EXPECT_TRUE(joined.get_future().get());

    ContentId video = Hasher::sha256(std::string("short lived"));
    provider.publish(video);
    ProvidersResult result;
    for (int i = 0; i < 5 && result.providers.empty(); ++i) {
        std::promise<ProvidersResult> found;
        seeker.find_providers(video, 8, [&found](ProvidersResult answer) { found.set_value(std::move(answer)); });
        result = found.get_future().get();
    }
    EXPECT_EQ(result.providers.size(), 1u) << result.detail;
    EXPECT_GT(book_size(), 0u);

    std::this_thread::sleep_for(std::chrono::milliseconds(2500));
    EXPECT_EQ(book_size(), 0u);

    std::promise<void> stopped;
    asio::post(io_context, [&]() {
        provider.stop();
        seeker.stop();
        stopped.set_value();
    });
    stopped.get_future().wait();
    work_guard.reset();
    io_context.stop();
    thread.join();
}
