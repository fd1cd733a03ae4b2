#include <iostream>
#include <string>
#include <vector>

#include "core/node.hpp"
#include "cli/cli.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "network/protocol.hpp"

namespace {

// Parses leading --options into config; the rest is the command and its arguments.
bool parse_options(int argc, char* argv[], NodeConfig& config, std::vector<std::string>& rest) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || !rest.empty()) {
            rest.push_back(arg);
            continue;
        }
        if (arg == "--quiet") {
            config.log_to_console = false;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return false;
        }
        std::string value = argv[++i];
        try {
            if (arg == "--data-dir") config.data_dir = value;
            else if (arg == "--bind") config.bind_address = value;
            else if (arg == "--port") config.listen_port = static_cast<uint16_t>(std::stoi(value));
            else if (arg == "--dht-port") config.dht_port = static_cast<uint16_t>(std::stoi(value));
            else if (arg == "--bootstrap") config.bootstrap_peers.push_back(value);
            else if (arg == "--chunk-size") {
                unsigned long long chunk_size = std::stoull(value);
                if (value.find('-') != std::string::npos || chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) {
                    std::cerr << "--chunk-size must be between 1 and " << MAX_CHUNK_SIZE << " bytes" << std::endl;
                    return false;
                }
                config.chunk_size = static_cast<uint32_t>(chunk_size);
            }
            else if (arg == "--fanout") config.fetch_fanout = std::stoul(value);
            else if (arg == "--timeout") config.exchange_timeout = std::chrono::milliseconds(std::stol(value));
            else if (arg == "--log-file") config.log_file = value;
            else if (arg == "--log-level") config.log_level = parse_log_level(value);
            else {
                std::cerr << "Unknown option " << arg << std::endl;
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << ": " << value << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    NodeConfig config;
    std::vector<std::string> rest;
    if (!parse_options(argc, argv, config, rest) || rest.empty()) {
        CLI::print_usage(std::cerr);
        return 2;
    }

    if (!config.log_file.empty()) {
        Logger::instance().init(config.log_file);
    }
    Logger::instance().set_level(config.log_level);
    Logger::instance().set_console(config.log_to_console);

    std::string command = rest.front();
    std::vector<std::string> args(rest.begin() + 1, rest.end());

    try {
        Node node(config);
        CLI cli(node);
        int status = cli.execute(command, args);
        node.stop();
        return status;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
