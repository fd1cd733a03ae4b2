#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "support/memory_overlay.hpp"
#include "support/test_peer.hpp"
#include "common/logger.hpp"
#include "common/serializer.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

namespace {

constexpr uint32_t TEST_CHUNK_SIZE = 64 * 1024;

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

// Holds responders it never calls, which is what a hung peer looks like.
struct StallBox {
    std::mutex mutex;
    std::vector<RequestHandler::Responder> held;
    std::atomic<size_t> count{0};

    void hold(RequestHandler::Responder& respond) {
        std::lock_guard<std::mutex> lock(mutex);
        held.push_back(respond);
        ++count;
    }
};

} // namespace

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_console(false);
    }

    MemoryOverlay overlay;
};

// Two peers: A advertises a video, B acquires it with nothing stored locally.
TEST_F(SessionTest, AcquiresWholeVideoFromProvider) {
    TestPeer a(overlay, "peer-a");
    TestPeer b(overlay, "peer-b");

    std::vector<uint8_t> bytes = make_bytes(5 * TEST_CHUNK_SIZE + 1000, 1);
    VideoMetadata video = a.add_video(bytes, TEST_CHUNK_SIZE, "holiday");
    a.advertise(video);

    AcquireResult result = b.acquire(video.id);
    ASSERT_TRUE(result.ok) << error_kind_name(result.kind) << ": " << result.detail;
    ASSERT_TRUE(result.metadata.has_value());
    EXPECT_EQ(result.metadata->id, video.id);
    EXPECT_EQ(result.metadata->title, "holiday");

    ASSERT_TRUE(b.store.has_all_chunks(video.id));
    for (const auto& chunk : video.chunks) {
        EXPECT_EQ(b.store.get_chunk(chunk.id), a.store.get_chunk(chunk.id));
    }
    EXPECT_GT(b.scores.score(a.id), 0);
}

TEST_F(SessionTest, HandleReportsProgress) {
    TestPeer a(overlay, "peer-a");
    TestPeer b(overlay, "peer-b");

    VideoMetadata video = a.add_video(make_bytes(3 * TEST_CHUNK_SIZE, 2), TEST_CHUNK_SIZE, "clip");
    a.advertise(video);

    std::promise<AcquireResult> promise;
    auto future = promise.get_future();
    auto handle = b.sessions.acquire(video.id, [&promise](AcquireResult result) { promise.set_value(std::move(result)); });
    ASSERT_EQ(future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    ASSERT_TRUE(future.get().ok);

    EXPECT_TRUE(handle->finished());
    EXPECT_FALSE(handle->cancelled());
    EXPECT_EQ(handle->total_chunks(), 3u);
    EXPECT_EQ(handle->stored_chunks(), 3u);
}

// A hangs on one chunk and is then killed; C turns up as a provider and finishes the job.
TEST_F(SessionTest, KilledProviderIsReplacedAfterRediscovery) {
    TestPeer a(overlay, "peer-a");
    TestPeer b(overlay, "peer-b");
    TestPeer c(overlay, "peer-c");

    std::vector<uint8_t> bytes = make_bytes(4 * TEST_CHUNK_SIZE, 3);
    VideoMetadata video = a.add_video(bytes, TEST_CHUNK_SIZE, "concert");
    c.add_video(bytes, TEST_CHUNK_SIZE, "concert");
    a.advertise(video);

    const ContentId stalled_chunk = video.chunks[1].id;
    StallBox stall;
    a.handler->set_interceptor([&](const PeerId&, const Request& request, RequestHandler::Responder& respond) {
        if (request.kind != RequestKind::Chunk || request.content_id != stalled_chunk) return false;
        stall.hold(respond);
        c.advertise(video);
        return true;
    });

    std::promise<AcquireResult> promise;
    auto future = promise.get_future();
    b.sessions.acquire(video.id, [&promise](AcquireResult result) { promise.set_value(std::move(result)); });

    ASSERT_TRUE(wait_until([&]() { return stall.count.load() > 0; }));
    a.stop();

    ASSERT_EQ(future.wait_for(std::chrono::seconds(15)), std::future_status::ready);
    AcquireResult result = future.get();
    ASSERT_TRUE(result.ok) << error_kind_name(result.kind) << ": " << result.detail;
    ASSERT_TRUE(b.store.has_all_chunks(video.id));
    EXPECT_EQ(b.store.get_chunk(stalled_chunk), c.store.get_chunk(stalled_chunk));
    EXPECT_LT(b.scores.score(a.id), 0);
}

TEST_F(SessionTest, StalledChunkTimesOutAndMovesToNextCandidate) {
    TestPeer a(overlay, "peer-a");
    TestPeer b(overlay, "peer-b");
    TestPeer c(overlay, "peer-c");

    std::vector<uint8_t> bytes = make_bytes(3 * TEST_CHUNK_SIZE, 4);
    VideoMetadata video = a.add_video(bytes, TEST_CHUNK_SIZE, "lecture");
    c.add_video(bytes, TEST_CHUNK_SIZE, "lecture");
    a.advertise(video);
    c.advertise(video);

    StallBox stall;
    a.handler->set_interceptor([&](const PeerId&, const Request& request, RequestHandler::Responder& respond) {
        if (request.kind != RequestKind::Chunk || request.content_id != video.chunks[2].id) return false;
        stall.hold(respond);
        return true;
    });

    AcquireResult result = b.acquire(video.id);
    ASSERT_TRUE(result.ok) << error_kind_name(result.kind) << ": " << result.detail;
    EXPECT_TRUE(b.store.has_all_chunks(video.id));
    EXPECT_EQ(b.store.get_chunk(video.chunks[2].id), c.store.get_chunk(video.chunks[2].id));
}

TEST_F(SessionTest, UnknownVideoFailsUnreachableAfterDiscoveryRounds) {
    TestPeer a(overlay, "peer-a");
    TestPeer b(overlay, "peer-b");

    AcquireResult result = b.acquire(Hasher::sha256(std::string("nobody has this")));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, ErrorKind::Unreachable);
    EXPECT_EQ(b.discovery.provider_lookups(), fast_session_options().max_discovery_rounds);
}

TEST_F(SessionTest, OfflineOverlayIsReported) {
    TestPeer b(overlay, "peer-b");
    overlay.set_available(false);

    AcquireResult result = b.acquire(Hasher::sha256(std::string("anything")));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, ErrorKind::OverlayUnavailable);
}

TEST_F(SessionTest, MetadataForAnotherVideoIsRejected) {
    TestPeer a(overlay, "peer-a");
    TestPeer b(overlay, "peer-b");

    VideoMetadata wanted = a.add_video(make_bytes(2 * TEST_CHUNK_SIZE, 5), TEST_CHUNK_SIZE, "wanted");
    VideoMetadata other = a.add_video(make_bytes(2 * TEST_CHUNK_SIZE, 6), TEST_CHUNK_SIZE, "other");
    a.advertise(wanted);

    a.handler->set_interceptor([&](const PeerId&, const Request& request, RequestHandler::Responder& respond) {
        if (request.kind != RequestKind::Metadata) return false;
        respond(Response::metadata(Serializer::serialize_video_metadata(other)));
        return true;
    });

    AcquireResult result = b.acquire(wanted.id);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, ErrorKind::Unreachable);
    EXPECT_FALSE(b.store.has_video(wanted.id));
    EXPECT_LT(b.scores.score(a.id), 0);
}

TEST_F(SessionTest, CancelLetsInFlightChunksLand) {
    SessionOptions options = fast_session_options();
    options.fetch_fanout = 2;
    options.exchange_timeout = std::chrono::milliseconds(10000);

    TestPeer a(overlay, "peer-a");
    TestPeer b(overlay, "peer-b", options);

    VideoMetadata video = a.add_video(make_bytes(6 * TEST_CHUNK_SIZE, 7), TEST_CHUNK_SIZE, "long film");
    a.advertise(video);

    std::mutex held_mutex;
    std::vector<std::pair<ContentId, RequestHandler::Responder>> held;
    std::atomic<size_t> chunk_requests{0};
    a.handler->set_interceptor([&](const PeerId&, const Request& request, RequestHandler::Responder& respond) {
        if (request.kind != RequestKind::Chunk) return false;
        std::lock_guard<std::mutex> lock(held_mutex);
        held.emplace_back(request.content_id, respond);
        ++chunk_requests;
        return true;
    });

    std::promise<AcquireResult> promise;
    auto future = promise.get_future();
    auto handle = b.sessions.acquire(video.id, [&promise](AcquireResult result) { promise.set_value(std::move(result)); });

    ASSERT_TRUE(wait_until([&]() { return chunk_requests.load() == 2; }));
    handle->cancel();

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    AcquireResult result = future.get();
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, ErrorKind::Cancelled);
    EXPECT_TRUE(handle->cancelled());

    // Release the two requests that were already in flight.
    {
        std::lock_guard<std::mutex> lock(held_mutex);
        for (auto& entry : held) {
            entry.second(Response::chunk(a.store.get_chunk(entry.first)));
        }
    }
    EXPECT_TRUE(wait_until([&]() { return b.store.stored_chunk_count() == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(chunk_requests.load(), 2u);
    EXPECT_FALSE(b.store.has_all_chunks(video.id));
}

// A handle can be kept and cancelled after its coordinator is gone.
TEST_F(SessionTest, CancelAfterShutdownIsHarmless) {
    std::shared_ptr<AcquireHandle> handle;
    {
        TestPeer b(overlay, "peer-b");
        handle = b.sessions.acquire(Hasher::sha256(std::string("never published")), nullptr);
    }
    EXPECT_TRUE(handle->finished());
    handle->cancel();
    EXPECT_TRUE(handle->cancelled());
}

// The local copy is deleted while its chunks are still being fetched.
TEST_F(SessionTest, EvictionDuringAcquireEndsNotFound) {
    TestPeer a(overlay, "peer-a");
    TestPeer b(overlay, "peer-b");

    VideoMetadata video = a.add_video(make_bytes(3 * TEST_CHUNK_SIZE, 10), TEST_CHUNK_SIZE, "short-lived");
    a.advertise(video);

    std::atomic<bool> evicted{false};
    a.handler->set_interceptor([&](const PeerId&, const Request& request, RequestHandler::Responder&) {
        if (request.kind == RequestKind::Chunk && !evicted.exchange(true)) {
            b.store.delete_video(video.id);
        }
        return false;
    });

    auto started = std::chrono::steady_clock::now();
    AcquireResult result = b.acquire(video.id);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, ErrorKind::NotFound) << result.detail;
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(evicted.load());
    EXPECT_FALSE(b.store.has_video(video.id));
    EXPECT_EQ(b.store.stored_chunk_count(), 0u);
}

TEST_F(SessionTest, ResumesPartiallyStoredVideo) {
    TestPeer a(overlay, "peer-a");
    TestPeer b(overlay, "peer-b");

    std::vector<uint8_t> bytes = make_bytes(4 * TEST_CHUNK_SIZE, 8);
    VideoMetadata video = a.add_video(bytes, TEST_CHUNK_SIZE, "series");
    a.advertise(video);

    auto payloads = ContentAddresser::split_chunks(bytes, TEST_CHUNK_SIZE);
    b.store.put_video(video);
    b.store.put_chunk(video.chunks[0].id, video.id, payloads[0]);
    b.store.put_chunk(video.chunks[3].id, video.id, payloads[3]);

    std::atomic<size_t> chunk_requests{0};
    a.handler->set_interceptor([&](const PeerId&, const Request& request, RequestHandler::Responder&) {
        if (request.kind == RequestKind::Chunk) ++chunk_requests;
        return false;
    });

    AcquireResult result = b.acquire(video.id);
    ASSERT_TRUE(result.ok) << result.detail;
    EXPECT_TRUE(b.store.has_all_chunks(video.id));
    EXPECT_EQ(chunk_requests.load(), 2u);
}

TEST_F(SessionTest, CompleteLocalVideoNeedsNoDiscovery) {
    TestPeer b(overlay, "peer-b");
    VideoMetadata video = b.add_video(make_bytes(2 * TEST_CHUNK_SIZE, 9), TEST_CHUNK_SIZE, "mine");

    AcquireResult result = b.acquire(video.id);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(b.discovery.provider_lookups(), 0u);
}

// Three peers answer, only one has a title matching the query.
TEST_F(SessionTest, LocateReturnsOnlyMatchingVideo) {
    TestPeer a(overlay, "peer-a");
    TestPeer c(overlay, "peer-c");
    TestPeer d(overlay, "peer-d");
    TestPeer b(overlay, "peer-b");

    VideoMetadata foo = a.add_video(make_bytes(TEST_CHUNK_SIZE, 10), TEST_CHUNK_SIZE, "foo fighters live");
    c.add_video(make_bytes(TEST_CHUNK_SIZE, 11), TEST_CHUNK_SIZE, "bar night");
    d.add_video(make_bytes(TEST_CHUNK_SIZE, 12), TEST_CHUNK_SIZE, "baz documentary");

    LocateResult result = b.locate("foo", 10);
    EXPECT_EQ(result.peers_asked, 3u);
    EXPECT_EQ(result.peers_answered, 3u);
    ASSERT_EQ(result.videos.size(), 1u);
    EXPECT_EQ(result.videos[0].id, foo.id);
    EXPECT_EQ(result.videos[0].title, "foo fighters live");
}

TEST_F(SessionTest, LocateDeduplicatesAndTruncates) {
    TestPeer a(overlay, "peer-a");
    TestPeer c(overlay, "peer-c");
    TestPeer b(overlay, "peer-b");

    std::vector<uint8_t> shared = make_bytes(TEST_CHUNK_SIZE, 13);
    VideoMetadata one = a.add_video(shared, TEST_CHUNK_SIZE, "cats one");
    c.add_video(shared, TEST_CHUNK_SIZE, "cats one");
    VideoMetadata two = c.add_video(make_bytes(TEST_CHUNK_SIZE, 14), TEST_CHUNK_SIZE, "cats two");

    LocateResult all = b.locate("CATS", 10);
    std::vector<ContentId> ids;
    for (const auto& video : all.videos) ids.push_back(video.id);
    EXPECT_THAT(ids, ::testing::UnorderedElementsAre(one.id, two.id));

    LocateResult limited = b.locate("cats", 1);
    EXPECT_EQ(limited.videos.size(), 1u);
}

TEST_F(SessionTest, LocateReturnsPartialResultsWhenAPeerHangs) {
    TestPeer a(overlay, "peer-a");
    TestPeer c(overlay, "peer-c");
    TestPeer b(overlay, "peer-b");

    VideoMetadata foo = a.add_video(make_bytes(TEST_CHUNK_SIZE, 15), TEST_CHUNK_SIZE, "foo");
    StallBox stall;
    c.handler->set_interceptor([&](const PeerId&, const Request& request, RequestHandler::Responder& respond) {
        if (request.kind != RequestKind::Search) return false;
        stall.hold(respond);
        return true;
    });

    LocateResult result = b.locate("foo", 10);
    EXPECT_EQ(result.peers_asked, 2u);
    EXPECT_EQ(result.peers_answered, 1u);
    ASSERT_EQ(result.videos.size(), 1u);
    EXPECT_EQ(result.videos[0].id, foo.id);
}

TEST_F(SessionTest, LocateWithoutPeersIsEmpty) {
    TestPeer b(overlay, "peer-b");
    LocateResult result = b.locate("anything", 5);
    EXPECT_EQ(result.peers_asked, 0u);
    EXPECT_TRUE(result.videos.empty());
}
