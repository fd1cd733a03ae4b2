#ifndef KNAPSACK_CHUNK_STORE_HPP
#define KNAPSACK_CHUNK_STORE_HPP

#include <string>
#include <vector>
#include <mutex>
#include <optional>

#include "../video/video_metadata.hpp"
#include "../dht/kademlia.hpp" // For dht::NodeInfo

// Forward declarations for SQLite types
struct sqlite3;

/**
 * @brief Durable storage for video metadata and chunk payloads.
 *
 * Backed by SQLite in WAL mode with foreign keys enforced. Every chunk row
 * references an existing video; the per-video chunk list is kept in
 * video_chunks so completeness checks are a single query.
 *
 * Writes go through one connection, one transaction at a time (SQLite has a
 * single writer). Reads borrow a connection from a pool and see the last
 * committed state, so serving chunks never waits behind a write. An in-memory
 * store cannot be shared between connections and reads use the writer.
 *
 * All methods are thread-safe. Failures throw KnapsackError.
 */
class ChunkStore {
public:
    // Opens (creating if needed) the database at db_path. ":memory:" is accepted.
    explicit ChunkStore(const std::string& db_path);
    ~ChunkStore();

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    /**
     * @brief Inserts or replaces a video's metadata.
     *
     * The metadata is validated first (InvalidMetadata / HashMismatch).
     * Storing identical metadata twice leaves the store unchanged.
     */
    void put_video(const VideoMetadata& metadata);

    /**
     * @brief Stores one chunk payload under a known video.
     *
     * Fails with DanglingReference if the video is unknown or does not list
     * chunk_id, and with HashMismatch if the payload digest differs from
     * chunk_id or a different payload is already stored under it. Storing the
     * same payload again is a no-op.
     */
    void put_chunk(const ContentId& chunk_id, const ContentId& video_id, const std::vector<uint8_t>& payload);

    // Throw KnapsackError(NotFound) if absent.
    std::vector<uint8_t> get_chunk(const ContentId& chunk_id) const;
    VideoMetadata get_video(const ContentId& video_id) const;

    // Where a stored chunk is filed: the video that owns it and its position there.
    std::optional<ChunkRecord> find_chunk_record(const ContentId& chunk_id) const;

    std::optional<VideoMetadata> find_video(const ContentId& video_id) const;
    bool has_video(const ContentId& video_id) const;
    bool has_chunk(const ContentId& chunk_id) const;

    // True iff the video is known and every chunk it lists is stored.
    bool has_all_chunks(const ContentId& video_id) const;

    // Chunks of the video not stored yet, in order.
    std::vector<ChunkSummary> missing_chunks(const ContentId& video_id) const;

    std::vector<VideoMetadata> list_videos() const;

    // Case-insensitive substring match on title/description, or exact hex id.
    std::vector<VideoMetadata> search_videos(const std::string& query) const;

    /**
     * @brief Evicts a video in one transaction.
     *
     * Chunks no other video lists are deleted; shared chunks are re-parented
     * to a video that still lists them.
     */
    void delete_video(const ContentId& video_id);

    size_t stored_chunk_count() const;

    // Routing contacts, persisted so a restarted node can rejoin without seeds.
    void save_peer(const dht::NodeInfo& peer);
    std::vector<dht::NodeInfo> load_peers() const;

    const std::string& path() const { return db_path_; }

private:
    // A read connection borrowed from the pool, returned on destruction.
    class ReadLease {
    public:
        explicit ReadLease(const ChunkStore& store);
        ~ReadLease();
        ReadLease(const ReadLease&) = delete;
        ReadLease& operator=(const ReadLease&) = delete;

        sqlite3* get() const { return db_; }

    private:
        const ChunkStore& store_;
        sqlite3* db_ = nullptr;
        std::unique_lock<std::mutex> writer_lock_; // held only for in-memory stores
    };

    sqlite3* open_connection(int flags) const;
    void close();
    void create_tables();
    void execute_sql(const std::string& sql, const char* operation);

    std::string db_path_;
    bool in_memory_ = false;

    sqlite3* db_ = nullptr; // the writer
    // Serializes writes, including multi-statement transactions.
    mutable std::mutex write_mutex_;

    mutable std::mutex pool_mutex_;
    mutable std::vector<sqlite3*> idle_readers_;
};

#endif // KNAPSACK_CHUNK_STORE_HPP
