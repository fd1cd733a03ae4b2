#ifndef KNAPSACK_CONFIG_HPP
#define KNAPSACK_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "logger.hpp"

constexpr uint32_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;

struct NodeConfig {
    std::string data_dir = "kpsk-data";
    std::string bind_address = "127.0.0.1";
    uint16_t listen_port = 0;   // TCP exchange, 0 = ephemeral
    uint16_t dht_port = 0;      // UDP overlay, 0 = ephemeral
    std::vector<std::string> bootstrap_peers; // "host:port" (UDP)

    uint32_t chunk_size = DEFAULT_CHUNK_SIZE;

    // Discovery overlay
    std::chrono::seconds provider_ttl{3600};
    std::chrono::seconds republish_interval{20 * 60};
    std::chrono::milliseconds rpc_timeout{2000};
    std::chrono::milliseconds lookup_timeout{8000};

    // Exchange protocol
    std::chrono::milliseconds exchange_timeout{10000};

    // Session coordinator
    size_t fetch_fanout = 4;
    size_t max_providers = 8;
    size_t max_discovery_rounds = 3;
    std::chrono::milliseconds rediscover_delay{500};
    std::chrono::milliseconds acquire_timeout{10 * 60 * 1000};
    size_t search_fanout = 8;
    size_t search_quorum = 3;
    std::chrono::milliseconds search_timeout{5000};

    size_t disk_threads = 2;

    // Logging
    std::string log_file;
    LogLevel log_level = LogLevel::INFO;
    bool log_to_console = true;
};

#endif // KNAPSACK_CONFIG_HPP
