#include "cli/cli.hpp"
#include "crypto/hasher.hpp"
#include "common/logger.hpp"
#include <asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <future>
#include <sstream>

CLI::CLI(Node& node, std::ostream& out)
    : node_(node), out_(out) {}

void CLI::print_usage(std::ostream& out) {
    out << "Usage: kpsk [options] <command> [args]\n"
        << "Commands:\n"
        << "  prep <file>                 - Chunk a media file into the store, write <file>.kpsk\n"
        << "  serve                       - Join the overlay and serve stored videos (interactive)\n"
        << "  find <count> <query...>     - Search peers for matching videos\n"
        << "  get <video-id-hex>          - Acquire a video by id\n"
        << "  rm <video-id-hex>           - Delete a stored video and stop announcing it\n"
        << "Options:\n"
        << "  --data-dir <dir>            - Database and identity location (default kpsk-data)\n"
        << "  --bind <ipv4>               - Listen/advertised address (default 127.0.0.1)\n"
        << "  --port <n>                  - TCP exchange port (default ephemeral)\n"
        << "  --dht-port <n>              - UDP overlay port (default ephemeral)\n"
        << "  --bootstrap <host:port>     - Overlay seed, may repeat\n"
        << "  --chunk-size <bytes>        - Chunk size for prep (default 4 MiB)\n"
        << "  --fanout <n>                - Concurrent chunk fetches (default 4)\n"
        << "  --timeout <ms>              - Single exchange deadline (default 10000)\n"
        << "  --log-file <path>           - Append log lines to a file\n"
        << "  --log-level <level>         - debug, info, warn, error (default info)\n"
        << "  --quiet                     - No log output on the console\n";
}

int CLI::execute(const std::string& command, const std::vector<std::string>& args) {
    try {
        if (command == "prep") return cmd_prep(args, false);
        if (command == "serve") return cmd_serve(args);
        if (command == "find") return cmd_find(args);
        if (command == "get") return cmd_get(args);
        if (command == "rm") return cmd_rm(args);
    } catch (const KnapsackError& e) {
        LOG_ERR(e.what());
        out_ << "Error: " << e.what() << std::endl;
        return 1;
    }
    print_usage(out_);
    return 2;
}

int CLI::cmd_prep(const std::vector<std::string>& args, bool advertise) {
    if (args.empty()) {
        out_ << "Usage: prep <file>" << std::endl;
        return 2;
    }
    VideoMetadata metadata = node_.prepare(args[0]);
    metadata.print(out_);
    if (advertise) {
        node_.advertise(metadata);
        out_ << "Advertising " << Hasher::hash_to_hex(metadata.id) << std::endl;
    } else {
        out_ << "Stored. Run 'kpsk serve' to share it." << std::endl;
    }
    return 0;
}

int CLI::cmd_find(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        out_ << "Usage: find <count> <query...>" << std::endl;
        return 2;
    }
    size_t count = 0;
    try {
        count = static_cast<size_t>(std::stoul(args[0]));
    } catch (const std::exception&) {
        out_ << "Invalid count: " << args[0] << std::endl;
        return 2;
    }
    std::string query = args[1];
    for (size_t i = 2; i < args.size(); ++i) query += " " + args[i];

    node_.start();
    std::vector<VideoMetadata> results = node_.search(query, count);
    out_ << "Found " << results.size() << " video(s) for '" << query << "'" << std::endl;
    for (const auto& video : results) {
        video.print(out_);
    }
    return 0;
}

int CLI::cmd_get(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: get <video-id-hex>" << std::endl;
        return 2;
    }
    std::optional<ContentId> video_id = Hasher::try_hex_to_hash(args[0]);
    if (!video_id) {
        out_ << "Invalid video id: expected " << HASH_SIZE * 2 << " hex characters" << std::endl;
        return 2;
    }

    node_.start();
    auto promise = std::make_shared<std::promise<AcquireResult>>();
    std::future<AcquireResult> future = promise->get_future();
    std::shared_ptr<AcquireHandle> handle = node_.acquire_async(*video_id, [promise](AcquireResult result) {
        promise->set_value(std::move(result));
    });

    size_t last_reported = 0;
    while (future.wait_for(std::chrono::milliseconds(500)) != std::future_status::ready) {
        size_t stored = handle->stored_chunks();
        if (stored != last_reported && handle->total_chunks() > 0) {
            out_ << "  " << stored << "/" << handle->total_chunks() << " chunks" << std::endl;
            last_reported = stored;
        }
    }

    AcquireResult result = future.get();
    if (!result.ok) {
        out_ << "get failed [" << error_kind_name(result.kind) << "]: " << result.detail << std::endl;
        return 1;
    }
    out_ << "Acquired:" << std::endl;
    result.metadata->print(out_);
    return 0;
}

int CLI::cmd_rm(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: rm <video-id-hex>" << std::endl;
        return 2;
    }
    std::optional<ContentId> video_id = Hasher::try_hex_to_hash(args[0]);
    if (!video_id) {
        out_ << "Invalid video id: expected " << HASH_SIZE * 2 << " hex characters" << std::endl;
        return 2;
    }
    node_.evict(*video_id);
    out_ << "Removed " << args[0] << std::endl;
    return 0;
}

int CLI::cmd_videos(const std::vector<std::string>&) {
    std::vector<VideoMetadata> videos = node_.store().list_videos();
    out_ << "Stored videos: " << videos.size() << std::endl;
    for (const auto& video : videos) {
        bool complete = node_.store().has_all_chunks(video.id);
        out_ << " - " << video.title << " (" << Hasher::hash_to_hex(video.id) << ")"
             << (complete ? "" : " [incomplete]") << std::endl;
    }
    return 0;
}

int CLI::cmd_status(const std::vector<std::string>&) {
    out_ << "Peer id:   " << Hasher::hash_to_hex(node_.peer_id()) << "\n"
         << "Exchange:  tcp " << node_.exchange_port() << "\n"
         << "Overlay:   udp " << node_.dht_port() << "\n"
         << "Contacts:  " << node_.discovery().routing_peers(1000).size() << "\n"
         << "Chunks:    " << node_.store().stored_chunk_count() << std::endl;
    return 0;
}

int CLI::cmd_serve(const std::vector<std::string>&) {
    node_.start();
    out_ << "Serving as " << Hasher::hash_to_hex(node_.peer_id()) << " on tcp " << node_.exchange_port()
         << ", udp " << node_.dht_port() << std::endl;
    print_shell_help();

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        if (!handle_shell_line(line)) return 0;
    }
    // stdin closed: keep serving until interrupted.
    wait_for_signal();
    return 0;
}

void CLI::print_shell_help() {
    out_ << "Available commands:\n"
         << "  prep <file>             - Chunk, store and advertise a file\n"
         << "  find <count> <query...> - Search peers\n"
         << "  get <video-id-hex>      - Acquire a video\n"
         << "  videos                  - List stored videos\n"
         << "  rm <video-id-hex>       - Delete a stored video\n"
         << "  status                  - Show node status\n"
         << "  help                    - Show this help\n"
         << "  quit / exit             - Stop serving\n"
         << std::endl;
}

bool CLI::handle_shell_line(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) args.push_back(arg);

    try {
        if (cmd == "prep") cmd_prep(args, true);
        else if (cmd == "find") cmd_find(args);
        else if (cmd == "get") cmd_get(args);
        else if (cmd == "rm") cmd_rm(args);
        else if (cmd == "videos") cmd_videos(args);
        else if (cmd == "status") cmd_status(args);
        else if (cmd == "help") print_shell_help();
        else if (cmd == "quit" || cmd == "exit") return false;
        else out_ << "Unknown command: " << cmd << std::endl;
    } catch (const KnapsackError& e) {
        LOG_ERR(e.what());
        out_ << "Error: " << e.what() << std::endl;
    }
    return true;
}

void CLI::wait_for_signal() {
    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([](const asio::error_code& error, int signal_number) {
        if (!error) LOG_INFO("Received signal ", signal_number, ", shutting down");
    });
    signal_io.run();
}
