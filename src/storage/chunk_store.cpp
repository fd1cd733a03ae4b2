#include "storage/chunk_store.hpp"
#include "crypto/hasher.hpp"
#include "common/serializer.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <sqlite3.h>
#include <ctime>   // For std::time

namespace {

// Prepared statement that finalizes itself and throws on SQLite errors.
class Statement {
public:
    Statement(sqlite3* db, const char* sql, const char* operation)
        : db_(db), operation_(operation) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            fail("prepare");
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& text) {
        check(sqlite3_bind_text(stmt_, index, text.c_str(), -1, SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }

    Statement& bind_blob(int index, const std::vector<uint8_t>& data) {
        if (data.empty()) {
            check(sqlite3_bind_zeroblob(stmt_, index, 0));
        } else {
            check(sqlite3_bind_blob(stmt_, index, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT));
        }
        return *this;
    }

    // True while rows are available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail("step");
    }

    std::string text(int col) const {
        const unsigned char* value = sqlite3_column_text(stmt_, col);
        return value ? reinterpret_cast<const char*>(value) : "";
    }

    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

    std::vector<uint8_t> blob(int col) const {
        const uint8_t* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, col));
        int size = sqlite3_column_bytes(stmt_, col);
        if (!data || size <= 0) return {};
        return std::vector<uint8_t>(data, data + size);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) fail("bind");
    }

    [[noreturn]] void fail(const char* stage) {
        throw KnapsackError(ErrorKind::IoError, operation_, std::string(stage) + ": " + sqlite3_errmsg(db_));
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    const char* operation_;
};

// BEGIN IMMEDIATE ... COMMIT, rolled back if not committed.
class Transaction {
public:
    Transaction(sqlite3* db, const char* operation) : db_(db), operation_(operation) {
        exec("BEGIN IMMEDIATE;");
    }
    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit() {
        exec("COMMIT;");
        committed_ = true;
    }

private:
    void exec(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string detail = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            throw KnapsackError(ErrorKind::IoError, operation_, detail);
        }
    }

    sqlite3* db_;
    const char* operation_;
    bool committed_ = false;
};

std::string hex(const ContentId& id) {
    return Hasher::hash_to_hex(id);
}

bool video_exists(sqlite3* db, const std::string& video_hex, const char* operation) {
    Statement stmt(db, "SELECT 1 FROM videos WHERE id = ?;", operation);
    stmt.bind(1, video_hex);
    return stmt.step();
}

} // namespace

ChunkStore::ChunkStore(const std::string& db_path)
    : db_path_(db_path), in_memory_(db_path == ":memory:" || db_path.empty()) {
    db_ = open_connection(SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX);
    try {
        create_tables();
    } catch (const KnapsackError&) {
        close();
        throw;
    }
    LOG_DEBUG("Opened chunk store ", db_path_);
}

ChunkStore::~ChunkStore() {
    close();
}

sqlite3* ChunkStore::open_connection(int flags) const {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(db_path_.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw KnapsackError(ErrorKind::IoError, "ChunkStore::open", db_path_ + ": " + detail);
    }
    sqlite3_busy_timeout(db, 5000);
    return db;
}

void ChunkStore::close() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    for (sqlite3* reader : idle_readers_) {
        sqlite3_close(reader);
    }
    idle_readers_.clear();
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

ChunkStore::ReadLease::ReadLease(const ChunkStore& store) : store_(store) {
    if (store_.in_memory_) {
        writer_lock_ = std::unique_lock<std::mutex>(store_.write_mutex_);
        db_ = store_.db_;
        return;
    }
    {
        std::lock_guard<std::mutex> lock(store_.pool_mutex_);
        if (!store_.idle_readers_.empty()) {
            db_ = store_.idle_readers_.back();
            store_.idle_readers_.pop_back();
            return;
        }
    }
    // One per concurrent reader; the pool grows to the number of disk workers.
    db_ = store_.open_connection(SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX);
}

ChunkStore::ReadLease::~ReadLease() {
    if (writer_lock_.owns_lock()) return;
    std::lock_guard<std::mutex> lock(store_.pool_mutex_);
    store_.idle_readers_.push_back(db_);
}

void ChunkStore::execute_sql(const std::string& sql, const char* operation) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string detail = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        throw KnapsackError(ErrorKind::IoError, operation, detail);
    }
}

void ChunkStore::create_tables() {
    execute_sql("PRAGMA journal_mode = WAL;", "ChunkStore::create_tables");
    execute_sql("PRAGMA synchronous = NORMAL;", "ChunkStore::create_tables");
    execute_sql("PRAGMA foreign_keys = ON;", "ChunkStore::create_tables");

    std::string create_videos_sql = R"(
        CREATE TABLE IF NOT EXISTS videos (
            id TEXT PRIMARY KEY NOT NULL,
            title TEXT NOT NULL,
            description TEXT NOT NULL,
            metadata BLOB NOT NULL
        );
    )";

    std::string create_video_chunks_sql = R"(
        CREATE TABLE IF NOT EXISTS video_chunks (
            video_id TEXT NOT NULL REFERENCES videos(id) ON DELETE CASCADE,
            ord INTEGER NOT NULL,
            chunk_id TEXT NOT NULL,
            size INTEGER NOT NULL,
            PRIMARY KEY (video_id, ord)
        );
        CREATE INDEX IF NOT EXISTS video_chunks_by_chunk ON video_chunks(chunk_id);
    )";

    // No cascade: a video cannot disappear from under its stored chunks.
    std::string create_chunks_sql = R"(
        CREATE TABLE IF NOT EXISTS chunks (
            id TEXT PRIMARY KEY NOT NULL,
            video_id TEXT NOT NULL REFERENCES videos(id),
            ord INTEGER NOT NULL,
            size INTEGER NOT NULL,
            data BLOB NOT NULL
        );
        CREATE INDEX IF NOT EXISTS chunks_by_video ON chunks(video_id);
    )";

    std::string create_peers_sql = R"(
        CREATE TABLE IF NOT EXISTS peers (
            id TEXT PRIMARY KEY NOT NULL,
            ip TEXT NOT NULL,
            udp_port INTEGER NOT NULL,
            tcp_port INTEGER NOT NULL,
            last_seen INTEGER
        );
    )";

    execute_sql(create_videos_sql, "ChunkStore::create_tables");
    execute_sql(create_video_chunks_sql, "ChunkStore::create_tables");
    execute_sql(create_chunks_sql, "ChunkStore::create_tables");
    execute_sql(create_peers_sql, "ChunkStore::create_tables");
}

// Video operations
void ChunkStore::put_video(const VideoMetadata& metadata) {
    validate_metadata(metadata);
    const std::vector<uint8_t> blob = Serializer::serialize_video_metadata(metadata);
    const std::string video_hex = hex(metadata.id);

    std::lock_guard<std::mutex> lock(write_mutex_);
    Transaction txn(db_, "ChunkStore::put_video");

    // Upsert rather than REPLACE: REPLACE deletes the row first, which the
    // chunks foreign key forbids once payloads are stored.
    Statement upsert(db_,
        "INSERT INTO videos (id, title, description, metadata) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET title = excluded.title, "
        "description = excluded.description, metadata = excluded.metadata;",
        "ChunkStore::put_video");
    upsert.bind(1, video_hex).bind(2, metadata.title).bind(3, metadata.description).bind_blob(4, blob);
    upsert.step();

    Statement clear(db_, "DELETE FROM video_chunks WHERE video_id = ?;", "ChunkStore::put_video");
    clear.bind(1, video_hex);
    clear.step();

    for (const auto& chunk : metadata.chunks) {
        Statement insert(db_,
            "INSERT INTO video_chunks (video_id, ord, chunk_id, size) VALUES (?, ?, ?, ?);",
            "ChunkStore::put_video");
        insert.bind(1, video_hex)
              .bind(2, static_cast<int64_t>(chunk.order))
              .bind(3, hex(chunk.id))
              .bind(4, static_cast<int64_t>(chunk.size));
        insert.step();
    }

    txn.commit();
    LOG_DEBUG("Stored metadata for video ", Hasher::short_hex(metadata.id), " (", metadata.chunks.size(), " chunks)");
}

std::optional<VideoMetadata> ChunkStore::find_video(const ContentId& video_id) const {
    ReadLease conn(*this);
    Statement stmt(conn.get(), "SELECT metadata FROM videos WHERE id = ?;", "ChunkStore::get_video");
    stmt.bind(1, hex(video_id));
    if (!stmt.step()) return std::nullopt;
    return Serializer::deserialize_video_metadata(stmt.blob(0));
}

VideoMetadata ChunkStore::get_video(const ContentId& video_id) const {
    std::optional<VideoMetadata> metadata = find_video(video_id);
    if (!metadata) {
        throw KnapsackError(ErrorKind::NotFound, "ChunkStore::get_video", "no video " + hex(video_id));
    }
    return *metadata;
}

bool ChunkStore::has_video(const ContentId& video_id) const {
    ReadLease conn(*this);
    return video_exists(conn.get(), hex(video_id), "ChunkStore::has_video");
}

std::vector<VideoMetadata> ChunkStore::list_videos() const {
    ReadLease conn(*this);
    std::vector<VideoMetadata> videos;
    Statement stmt(conn.get(), "SELECT metadata FROM videos ORDER BY title, id;", "ChunkStore::list_videos");
    while (stmt.step()) {
        videos.push_back(Serializer::deserialize_video_metadata(stmt.blob(0)));
    }
    return videos;
}

std::vector<VideoMetadata> ChunkStore::search_videos(const std::string& query) const {
    std::vector<VideoMetadata> matches;
    for (auto& metadata : list_videos()) {
        if (matches_query(metadata, query)) {
            matches.push_back(std::move(metadata));
        }
    }
    return matches;
}

void ChunkStore::delete_video(const ContentId& video_id) {
    const std::string video_hex = hex(video_id);

    std::lock_guard<std::mutex> lock(write_mutex_);
    Transaction txn(db_, "ChunkStore::delete_video");

    if (!video_exists(db_, video_hex, "ChunkStore::delete_video")) {
        throw KnapsackError(ErrorKind::NotFound, "ChunkStore::delete_video", "no video " + video_hex);
    }

    // Hand shared chunks over to another video that lists them.
    Statement reparent(db_, R"(
        UPDATE chunks SET
            video_id = (SELECT vc.video_id FROM video_chunks vc
                        WHERE vc.chunk_id = chunks.id AND vc.video_id <> ?1
                        ORDER BY vc.video_id LIMIT 1),
            ord = (SELECT vc.ord FROM video_chunks vc
                   WHERE vc.chunk_id = chunks.id AND vc.video_id <> ?1
                   ORDER BY vc.video_id LIMIT 1)
        WHERE video_id = ?1 AND EXISTS (
            SELECT 1 FROM video_chunks vc WHERE vc.chunk_id = chunks.id AND vc.video_id <> ?1);
    )", "ChunkStore::delete_video");
    reparent.bind(1, video_hex);
    reparent.step();

    Statement drop_chunks(db_, "DELETE FROM chunks WHERE video_id = ?;", "ChunkStore::delete_video");
    drop_chunks.bind(1, video_hex);
    drop_chunks.step();

    Statement drop_video(db_, "DELETE FROM videos WHERE id = ?;", "ChunkStore::delete_video");
    drop_video.bind(1, video_hex);
    drop_video.step();

    txn.commit();
    LOG_INFO("Deleted video ", Hasher::short_hex(video_id));
}

// Chunk operations
void ChunkStore::put_chunk(const ContentId& chunk_id, const ContentId& video_id, const std::vector<uint8_t>& payload) {
    const std::string video_hex = hex(video_id);
    const std::string chunk_hex = hex(chunk_id);
    const hash_t digest = Hasher::sha256(payload);

    std::lock_guard<std::mutex> lock(write_mutex_);
    Transaction txn(db_, "ChunkStore::put_chunk");

    if (!video_exists(db_, video_hex, "ChunkStore::put_chunk")) {
        throw KnapsackError(ErrorKind::DanglingReference, "ChunkStore::put_chunk",
                            "chunk " + chunk_hex + " references unknown video " + video_hex);
    }

    Statement listed(db_, "SELECT ord FROM video_chunks WHERE video_id = ? AND chunk_id = ? ORDER BY ord LIMIT 1;",
                     "ChunkStore::put_chunk");
    listed.bind(1, video_hex).bind(2, chunk_hex);
    if (!listed.step()) {
        throw KnapsackError(ErrorKind::DanglingReference, "ChunkStore::put_chunk",
                            "video " + video_hex + " does not list chunk " + chunk_hex);
    }
    const int64_t order = listed.int64(0);

    if (digest != chunk_id) {
        throw KnapsackError(ErrorKind::HashMismatch, "ChunkStore::put_chunk",
                            "payload digest " + hex(digest) + " does not match id " + chunk_hex);
    }

    Statement existing(db_, "SELECT data FROM chunks WHERE id = ?;", "ChunkStore::put_chunk");
    existing.bind(1, chunk_hex);
    if (existing.step()) {
        if (existing.blob(0) == payload) {
            return; // Same bytes already stored
        }
        throw KnapsackError(ErrorKind::HashMismatch, "ChunkStore::put_chunk",
                            "different payload already stored under " + chunk_hex);
    }

    Statement insert(db_, "INSERT INTO chunks (id, video_id, ord, size, data) VALUES (?, ?, ?, ?, ?);",
                     "ChunkStore::put_chunk");
    insert.bind(1, chunk_hex)
          .bind(2, video_hex)
          .bind(3, order)
          .bind(4, static_cast<int64_t>(payload.size()))
          .bind_blob(5, payload);
    insert.step();

    txn.commit();
}

std::vector<uint8_t> ChunkStore::get_chunk(const ContentId& chunk_id) const {
    ReadLease conn(*this);
    Statement stmt(conn.get(), "SELECT data FROM chunks WHERE id = ?;", "ChunkStore::get_chunk");
    stmt.bind(1, hex(chunk_id));
    if (!stmt.step()) {
        throw KnapsackError(ErrorKind::NotFound, "ChunkStore::get_chunk", "no chunk " + hex(chunk_id));
    }
    return stmt.blob(0);
}

std::optional<ChunkRecord> ChunkStore::find_chunk_record(const ContentId& chunk_id) const {
    ReadLease conn(*this);
    Statement stmt(conn.get(), "SELECT video_id, ord, size FROM chunks WHERE id = ?;", "ChunkStore::find_chunk_record");
    stmt.bind(1, hex(chunk_id));
    if (!stmt.step()) return std::nullopt;

    ChunkRecord record;
    record.id = chunk_id;
    record.video_id = Hasher::hex_to_hash(stmt.text(0));
    record.order = static_cast<uint32_t>(stmt.int64(1));
    record.size = static_cast<uint64_t>(stmt.int64(2));
    return record;
}

bool ChunkStore::has_chunk(const ContentId& chunk_id) const {
    ReadLease conn(*this);
    Statement stmt(conn.get(), "SELECT 1 FROM chunks WHERE id = ?;", "ChunkStore::has_chunk");
    stmt.bind(1, hex(chunk_id));
    return stmt.step();
}

bool ChunkStore::has_all_chunks(const ContentId& video_id) const {
    const std::string video_hex = hex(video_id);

    ReadLease conn(*this);
    if (!video_exists(conn.get(), video_hex, "ChunkStore::has_all_chunks")) return false;

    Statement stmt(conn.get(), R"(
        SELECT COUNT(*) FROM video_chunks vc
        LEFT JOIN chunks c ON c.id = vc.chunk_id
        WHERE vc.video_id = ? AND c.id IS NULL;
    )", "ChunkStore::has_all_chunks");
    stmt.bind(1, video_hex);
    stmt.step();
    return stmt.int64(0) == 0;
}

std::vector<ChunkSummary> ChunkStore::missing_chunks(const ContentId& video_id) const {
    ReadLease conn(*this);
    std::vector<ChunkSummary> missing;
    Statement stmt(conn.get(), R"(
        SELECT vc.chunk_id, vc.ord, vc.size FROM video_chunks vc
        LEFT JOIN chunks c ON c.id = vc.chunk_id
        WHERE vc.video_id = ? AND c.id IS NULL
        ORDER BY vc.ord;
    )", "ChunkStore::missing_chunks");
    stmt.bind(1, hex(video_id));
    while (stmt.step()) {
        ChunkSummary summary;
        summary.id = Hasher::hex_to_hash(stmt.text(0));
        summary.order = static_cast<uint32_t>(stmt.int64(1));
        summary.size = static_cast<uint64_t>(stmt.int64(2));
        missing.push_back(summary);
    }
    return missing;
}

size_t ChunkStore::stored_chunk_count() const {
    ReadLease conn(*this);
    Statement stmt(conn.get(), "SELECT COUNT(*) FROM chunks;", "ChunkStore::stored_chunk_count");
    stmt.step();
    return static_cast<size_t>(stmt.int64(0));
}

// Peer operations
void ChunkStore::save_peer(const dht::NodeInfo& peer) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    Statement stmt(db_,
        "INSERT OR REPLACE INTO peers (id, ip, udp_port, tcp_port, last_seen) VALUES (?, ?, ?, ?, ?);",
        "ChunkStore::save_peer");
    stmt.bind(1, hex(peer.id))
        .bind(2, peer.endpoint.address().to_string())
        .bind(3, static_cast<int64_t>(peer.endpoint.port()))
        .bind(4, static_cast<int64_t>(peer.tcp_port))
        .bind(5, static_cast<int64_t>(std::time(nullptr)));
    stmt.step();
}

std::vector<dht::NodeInfo> ChunkStore::load_peers() const {
    ReadLease conn(*this);
    std::vector<dht::NodeInfo> peers;
    Statement stmt(conn.get(), "SELECT id, ip, udp_port, tcp_port FROM peers ORDER BY last_seen DESC;",
                   "ChunkStore::load_peers");
    while (stmt.step()) {
        std::optional<hash_t> id = Hasher::try_hex_to_hash(stmt.text(0));
        asio::error_code ec;
        asio::ip::address address = asio::ip::make_address(stmt.text(1), ec);
        if (!id || ec) {
            LOG_WARN("Skipping malformed peer row ", stmt.text(0));
            continue;
        }
        dht::NodeInfo peer;
        peer.id = *id;
        peer.endpoint = asio::ip::udp::endpoint(address, static_cast<uint16_t>(stmt.int64(2)));
        peer.tcp_port = static_cast<uint16_t>(stmt.int64(3));
        peers.push_back(peer);
    }
    return peers;
}
