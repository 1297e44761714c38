#include "shellpool_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <ssh/shell_executor.hpp>
#include <fmt/format.h>
#include <iostream>

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    shellpool hosts"
              << theme::color::RESET << theme::color::DIM
              << "                      List configured machines" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    shellpool exec "
              << theme::color::RESET << "<consumer> <command...>"
              << theme::color::DIM
              << "   Run a command on every machine" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config PATH         Config file (default ./shellpool.yaml, ~/.shellpool/config.yaml)\n"
              << "    --help                Show this help"
              << theme::color::RESET << "\n\n";
}

int ShellpoolCLI::run(const std::vector<std::string>& args) {
    std::string config_path;
    std::vector<std::string> rest;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                std::cout << theme::fail("--config needs a path");
                return 1;
            }
            config_path = args[++i];
        } else if (args[i] == "--help" || args[i] == "-h") {
            print_usage();
            return 0;
        } else {
            rest.push_back(args[i]);
        }
    }

    if (rest.empty()) {
        print_usage();
        return 1;
    }

    if (!load(config_path)) return 1;

    const std::string& cmd = rest[0];
    if (cmd == "hosts") {
        return cmd_hosts();
    }
    if (cmd == "exec") {
        if (rest.size() < 3) {
            std::cout << theme::fail("Usage: shellpool exec <consumer> <command...>");
            return 1;
        }
        std::string command;
        for (size_t i = 2; i < rest.size(); i++) {
            if (i > 2) command += " ";
            command += rest[i];
        }
        return cmd_exec(rest[1], command);
    }

    std::cout << theme::fail("Unknown command: " + cmd);
    print_usage();
    return 1;
}

bool ShellpoolCLI::load(const std::string& config_path) {
    auto loaded = config_path.empty() ? Config::load_default() : Config::load_file(config_path);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return false;
    }
    config_ = loaded.value;

    if (!config_.pool().log_file.empty()) {
        set_log_path(config_.pool().log_file);
    }
    shellpool_log(fmt::format("[cli] loaded {} machine(s) from {}",
                              config_.machines().size(), config_.source().string()));

    int capacity = config_.pool().channel_capacity;
    int timeout = config_.pool().connect_timeout;
    registry_ = std::make_unique<PoolRegistry>([capacity, timeout]() {
        return std::make_unique<ShellExecutor>(capacity, timeout);
    });

    for (const auto& machine : config_.machines()) {
        auto registered = registry_->register_host(machine);
        if (registered.is_err()) {
            std::cout << theme::fail(registered.error);
            return false;
        }
    }
    return true;
}

int ShellpoolCLI::cmd_hosts() {
    std::cout << theme::section("Machines");
    if (config_.machines().empty()) {
        std::cout << theme::info("No machines configured");
        return 0;
    }
    for (const auto& key : registry_->hosts()) {
        const auto& d = registry_->pool(key)->descriptor();
        std::string auth = d.uses_key_auth() ? "key " + *d.ssh_key_path() : "password";
        std::string gpus = d.gpu_indices().value_or("all");
        std::cout << theme::info(fmt::format("{}@{}  auth={}  gpus={}  per-gpu={}{}",
                                             d.username(), key, auth, gpus,
                                             d.max_trial_num_per_gpu(),
                                             d.use_active_gpu() ? "  active-ok" : ""));
    }
    std::cout << "\n";
    return 0;
}

int ShellpoolCLI::cmd_exec(const std::string& consumer_id, const std::string& command) {
    if (config_.machines().empty()) {
        std::cout << theme::fail("No machines configured");
        return 1;
    }

    int failures = 0;
    AcquireOptions options;
    options.callback = [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    };

    for (const auto& key : registry_->hosts()) {
        ChannelPool* pool = registry_->pool(key);
        std::cout << theme::section(key);

        auto acquired = pool->acquire(consumer_id, options);
        if (acquired.is_err()) {
            std::cout << theme::fail(fmt::format("{} ({})", acquired.error,
                                                 error_code_name(acquired.code)));
            failures++;
            continue;
        }

        auto result = acquired.value->run(command);
        if (!result.stdout_data.empty()) std::cout << theme::output(result.stdout_data);
        if (!result.stderr_data.empty()) std::cout << theme::output(result.stderr_data);
        if (result.success()) {
            std::cout << theme::ok("exit 0");
        } else {
            std::cout << theme::fail(fmt::format("exit {}", result.exit_code));
            failures++;
        }

        auto released = pool->release(consumer_id);
        if (released.is_err()) {
            std::cout << theme::warn(released.error);
        }
    }

    registry_->release_all();
    for (const auto& key : registry_->hosts()) {
        for (const auto& err : registry_->pool(key)->last_teardown_errors()) {
            std::cout << theme::warn(key + ": " + err);
        }
    }

    return failures == 0 ? 0 : 1;
}
