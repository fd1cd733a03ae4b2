#include "gtest/gtest.h"
#include "core/node.hpp"
#include "cli/cli.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include "video/content_addresser.hpp"
#include "network/protocol.hpp"
#include "support/memory_overlay.hpp"
#include "support/test_peer.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

NodeConfig test_config(const fs::path& data_dir) {
    NodeConfig config;
    config.data_dir = data_dir.string();
    config.chunk_size = 64 * 1024;
    config.rpc_timeout = std::chrono::milliseconds(300);
    config.lookup_timeout = std::chrono::milliseconds(3000);
    config.exchange_timeout = std::chrono::milliseconds(2000);
    config.rediscover_delay = std::chrono::milliseconds(100);
    config.acquire_timeout = std::chrono::milliseconds(30000);
    config.search_timeout = std::chrono::milliseconds(2000);
    config.log_to_console = false;
    return config;
}

void write_file(const fs::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

} // namespace

class NodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_console(false);
        root = fs::temp_directory_path() /
               ("knapsack_node_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path media_file(const std::string& name, size_t size, uint32_t seed) {
        fs::path path = root / name;
        write_file(path, make_bytes(size, seed));
        return path;
    }

    fs::path root;
};

TEST_F(NodeTest, PrepareStoresChunksAndWritesMetadataFile) {
    Node node(test_config(root / "a"));
    fs::path media = media_file("lecture.mp4", 200 * 1024, 1);

    VideoMetadata metadata = node.prepare(media);
    ASSERT_EQ(metadata.title, "lecture");
    ASSERT_EQ(metadata.chunks.size(), 4u);
    ASSERT_TRUE(node.store().has_all_chunks(metadata.id));

    fs::path side = ContentAddresser::metadata_file_path(media);
    ASSERT_TRUE(fs::exists(side));
    ASSERT_EQ(ContentAddresser::read_metadata_file(side).id, metadata.id);

    // Preparing the same file again changes nothing.
    ASSERT_EQ(node.prepare(media).id, metadata.id);
    ASSERT_EQ(node.store().stored_chunk_count(), 4u);
}

TEST_F(NodeTest, PrepareAndAdvertiseErrors) {
    Node node(test_config(root / "a"));
    node.start();

    try {
        node.prepare(root / "missing.mp4");
        FAIL() << "prepare of a missing file succeeded";
    } catch (const KnapsackError& e) {
        ASSERT_EQ(e.kind(), ErrorKind::IoError);
    }

    fs::path empty = root / "empty.mp4";
    write_file(empty, {});
    try {
        node.prepare(empty);
        FAIL() << "prepare of an empty file succeeded";
    } catch (const KnapsackError& e) {
        ASSERT_EQ(e.kind(), ErrorKind::EmptyInput);
    }

    VideoMetadata unknown = ContentAddresser::chunk_and_hash(make_bytes(100, 2), 64);
    try {
        node.advertise(unknown);
        FAIL() << "advertise of an unknown video succeeded";
    } catch (const KnapsackError& e) {
        ASSERT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(NodeTest, IdentitySurvivesRestart) {
    PeerId first;
    {
        Node node(test_config(root / "a"));
        first = node.peer_id();
    }
    Node again(test_config(root / "a"));
    ASSERT_EQ(again.peer_id(), first);
}

TEST_F(NodeTest, AcquiresOverTheOverlayAndPersistsContacts) {
    Node a(test_config(root / "a"));
    a.start();
    VideoMetadata metadata = a.prepare(media_file("trip.mp4", 300 * 1024 + 5, 3));
    a.advertise(metadata);

    NodeConfig b_config = test_config(root / "b");
    b_config.bootstrap_peers.push_back("127.0.0.1:" + std::to_string(a.dht_port()));
    auto b = std::make_unique<Node>(b_config);
    b->start();

    AcquireResult result = b->acquire(metadata.id);
    ASSERT_TRUE(result.ok) << result.detail;
    ASSERT_TRUE(result.metadata.has_value());
    ASSERT_EQ(result.metadata->title, "trip");
    ASSERT_TRUE(b->store().has_all_chunks(metadata.id));
    ASSERT_EQ(b->store().get_chunk(metadata.chunks[2].id), a.store().get_chunk(metadata.chunks[2].id));

    std::vector<VideoMetadata> found = b->search("TRIP", 10);
    ASSERT_EQ(found.size(), 1u);
    ASSERT_EQ(found[0].id, metadata.id);

    PeerId a_id = a.peer_id();
    b->stop();
    bool a_persisted = false;
    for (const auto& contact : b->store().load_peers()) {
        if (contact.id == a_id) a_persisted = true;
    }
    ASSERT_TRUE(a_persisted);
}

TEST_F(NodeTest, InjectedDiscoveryIsUsed) {
    MemoryOverlay overlay;
    auto factory = [&overlay](asio::io_context& io, const PeerId& id, uint16_t port) -> std::unique_ptr<Discovery> {
        overlay.add_peer(id, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        return std::make_unique<MemoryDiscovery>(io, overlay, id);
    };

    Node a(test_config(root / "a"), factory);
    Node b(test_config(root / "b"), factory);
    ASSERT_EQ(a.dht_port(), 0);
    a.start();
    b.start();

    VideoMetadata metadata = a.prepare(media_file("garden.mp4", 100 * 1024, 4));
    a.advertise(metadata);

    std::vector<VideoMetadata> found = b.search("garden", 10);
    ASSERT_EQ(found.size(), 1u);

    AcquireResult result = b.acquire(metadata.id);
    ASSERT_TRUE(result.ok) << result.detail;

    // The completed copy is advertised, so b now provides every chunk too.
    for (int i = 0; i < 50 && overlay.providers(metadata.chunks.back().id).size() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_EQ(overlay.providers(metadata.id).size(), 2u);
    ASSERT_EQ(overlay.providers(metadata.chunks.back().id).size(), 2u);
}

TEST_F(NodeTest, PrepareRejectsUntransferableChunkSize) {
    NodeConfig config = test_config(root / "a");
    config.chunk_size = MAX_CHUNK_SIZE + 1;
    Node node(config);
    try {
        node.prepare(media_file("big-chunks.mp4", 1024, 6));
        FAIL() << "prepare with an oversized chunk accepted";
    } catch (const KnapsackError& e) {
        ASSERT_EQ(e.kind(), ErrorKind::InvalidArgument);
    }
    ASSERT_TRUE(node.store().list_videos().empty());
}

// Reading the chunks back in order reproduces the prepared file byte for byte.
TEST_F(NodeTest, StoredChunksReassembleThePreparedFile) {
    Node node(test_config(root / "a"));
    std::vector<uint8_t> bytes = make_bytes(3 * 64 * 1024 + 11, 7);
    fs::path media = root / "reel.mp4";
    write_file(media, bytes);

    VideoMetadata metadata = node.prepare(media);
    std::vector<uint8_t> joined;
    for (const ChunkSummary& chunk : metadata.chunks) {
        std::vector<uint8_t> payload = node.store().get_chunk(chunk.id);
        joined.insert(joined.end(), payload.begin(), payload.end());
    }
    ASSERT_EQ(joined, bytes);
}

TEST_F(NodeTest, EvictWithdrawsAnnouncements) {
    MemoryOverlay overlay;
    auto factory = [&overlay](asio::io_context& io, const PeerId& id, uint16_t port) -> std::unique_ptr<Discovery> {
        overlay.add_peer(id, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        return std::make_unique<MemoryDiscovery>(io, overlay, id);
    };
    Node node(test_config(root / "a"), factory);
    node.start();

    // The trailer is the first chunk of the feature, so that chunk stays.
    std::vector<uint8_t> bytes = make_bytes(2 * 64 * 1024, 8);
    fs::path feature_path = root / "feature.mp4";
    fs::path trailer_path = root / "trailer.mp4";
    write_file(feature_path, bytes);
    write_file(trailer_path, std::vector<uint8_t>(bytes.begin(), bytes.begin() + 64 * 1024));
    VideoMetadata feature = node.prepare(feature_path);
    VideoMetadata trailer = node.prepare(trailer_path);
    node.advertise(feature);
    node.advertise(trailer);
    ASSERT_EQ(overlay.providers(feature.chunks[1].id).size(), 1u);

    node.evict(feature.id);
    EXPECT_FALSE(node.store().has_video(feature.id));
    EXPECT_TRUE(overlay.providers(feature.id).empty());
    EXPECT_TRUE(overlay.providers(feature.chunks[1].id).empty());
    EXPECT_EQ(overlay.providers(feature.chunks[0].id).size(), 1u);
    EXPECT_TRUE(node.store().has_all_chunks(trailer.id));

    try {
        node.evict(feature.id);
        FAIL() << "evicting twice succeeded";
    } catch (const KnapsackError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(NodeTest, RemoveCommand) {
    MemoryOverlay overlay;
    auto factory = [&overlay](asio::io_context& io, const PeerId& id, uint16_t) -> std::unique_ptr<Discovery> {
        return std::make_unique<MemoryDiscovery>(io, overlay, id);
    };
    Node node(test_config(root / "a"), factory);
    node.start();
    VideoMetadata metadata = node.prepare(media_file("notes.mp4", 70 * 1024, 9));
    const std::string hex = Hasher::hash_to_hex(metadata.id);

    std::ostringstream out;
    CLI cli(node, out);
    ASSERT_EQ(cli.execute("rm", {}), 2);
    ASSERT_EQ(cli.execute("rm", {"not-hex"}), 2);
    ASSERT_EQ(cli.execute("rm", {hex}), 0);
    ASSERT_FALSE(node.store().has_video(metadata.id));
    ASSERT_EQ(node.store().stored_chunk_count(), 0u);
    ASSERT_EQ(cli.execute("rm", {hex}), 1);
}

TEST_F(NodeTest, HandleOutlivesNode) {
    MemoryOverlay overlay;
    auto factory = [&overlay](asio::io_context& io, const PeerId& id, uint16_t) -> std::unique_ptr<Discovery> {
        return std::make_unique<MemoryDiscovery>(io, overlay, id);
    };
    auto node = std::make_unique<Node>(test_config(root / "a"), factory);
    node->start();

    std::shared_ptr<AcquireHandle> handle = node->acquire_async(Hasher::sha256(std::string("nobody")), nullptr);
    node.reset();

    EXPECT_TRUE(handle->finished());
    handle->cancel();
    EXPECT_TRUE(handle->cancelled());
}

TEST_F(NodeTest, ResolveSeed) {
    auto seed = Node::resolve_seed("127.0.0.1:4000");
    ASSERT_TRUE(seed.has_value());
    ASSERT_EQ(seed->port(), 4000);
    ASSERT_FALSE(Node::resolve_seed("no-port-here").has_value());
    ASSERT_FALSE(Node::resolve_seed("127.0.0.1:notaport").has_value());
}
