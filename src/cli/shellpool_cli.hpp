#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <pool/pool_registry.hpp>

// ShellpoolCLI: loads the machine list, registers one pool per machine and
// dispatches a single subcommand.
//
//   shellpool [--config PATH] hosts
//   shellpool [--config PATH] exec <consumer-id> <command...>
class ShellpoolCLI {
public:
    ShellpoolCLI() = default;

    // Returns the process exit code
    int run(const std::vector<std::string>& args);

private:
    Config config_;
    std::unique_ptr<PoolRegistry> registry_;

    bool load(const std::string& config_path);
    int cmd_hosts();
    int cmd_exec(const std::string& consumer_id, const std::string& command);
};

void print_usage();
