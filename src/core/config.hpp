#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from an explicit file
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and tests)
    static Result<Config> load_string(const std::string& yaml);

    // ./shellpool.yaml, else ~/.shellpool/config.yaml
    static Result<Config> load_default();

    const PoolSettings& pool() const { return pool_; }
    const std::vector<HostConfig>& machines() const { return machines_; }
    const fs::path& source() const { return source_; }

public:
    Config() = default;

private:
    PoolSettings pool_;
    std::vector<HostConfig> machines_;
    fs::path source_;
};

fs::path get_global_config_path();
fs::path get_local_config_path(const fs::path& dir = fs::current_path());

// Check a single machine entry. Returns a human-readable reason on failure.
Result<void> validate_host_config(const HostConfig& host);
