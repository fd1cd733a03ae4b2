#ifndef KNAPSACK_CLI_HPP
#define KNAPSACK_CLI_HPP

#include <string>
#include <vector>
#include <iostream>

#include "../core/node.hpp"

/**
 * @brief Thin command layer over Node.
 *
 * One-shot commands (prep, find, get) return a process exit code; serve keeps
 * the node up and reads further commands from stdin.
 */
class CLI {
public:
    explicit CLI(Node& node, std::ostream& out = std::cout);

    int execute(const std::string& command, const std::vector<std::string>& args);

    static void print_usage(std::ostream& out);

private:
    int cmd_prep(const std::vector<std::string>& args, bool advertise);
    int cmd_serve(const std::vector<std::string>& args);
    int cmd_find(const std::vector<std::string>& args);
    int cmd_get(const std::vector<std::string>& args);
    int cmd_rm(const std::vector<std::string>& args);
    int cmd_videos(const std::vector<std::string>& args);
    int cmd_status(const std::vector<std::string>& args);

    void print_shell_help();
    // Returns false when the shell should exit.
    bool handle_shell_line(const std::string& line);
    void wait_for_signal();

    Node& node_;
    std::ostream& out_;
};

#endif // KNAPSACK_CLI_HPP
