#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <stdexcept>

fs::path get_global_config_path() {
    return platform::home_dir() / ".shellpool" / "config.yaml";
}

fs::path get_local_config_path(const fs::path& dir) {
    return dir / CONFIG_FILE_NAME;
}

static PoolSettings parse_pool_settings(const YAML::Node& node) {
    PoolSettings pool;
    pool.channel_capacity = node["channel_capacity"].as<int>(DEFAULT_CHANNEL_CAPACITY);
    pool.connect_timeout = node["connect_timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);
    pool.log_file = node["log_file"].as<std::string>("");
    return pool;
}

static HostConfig parse_host_config(const YAML::Node& node) {
    HostConfig host;
    host.host = node["host"].as<std::string>("");
    host.port = node["port"].as<int>(DEFAULT_SSH_PORT);
    // "user" is canonical; "username" accepted for compat
    host.user = node["user"].as<std::string>(node["username"].as<std::string>(""));

    if (node["password"]) {
        host.password = node["password"].as<std::string>();
    }
    if (node["ssh_key_file"]) {
        host.ssh_key_file = node["ssh_key_file"].as<std::string>();
    }
    if (node["ssh_passphrase"]) {
        host.ssh_passphrase = node["ssh_passphrase"].as<std::string>();
    }

    // gpu_indices: list [0, 1] or comma string "0,1"
    auto gpus = node["gpu_indices"];
    if (gpus) {
        std::vector<int> indices;
        if (gpus.IsSequence()) {
            for (const auto& g : gpus) indices.push_back(g.as<int>());
        } else if (gpus.IsScalar()) {
            std::string text = gpus.as<std::string>();
            size_t start = 0;
            while (start <= text.size()) {
                size_t comma = text.find(',', start);
                std::string part = text.substr(start, comma == std::string::npos
                                                          ? std::string::npos : comma - start);
                trim(part);
                if (!part.empty()) {
                    int idx = safe_stoi(part, -1);
                    if (idx < 0) {
                        throw std::invalid_argument(fmt::format("bad GPU index '{}'", part));
                    }
                    indices.push_back(idx);
                }
                if (comma == std::string::npos) break;
                start = comma + 1;
            }
        }
        host.gpu_indices = indices;
    }

    host.use_active_gpu = node["use_active_gpu"].as<bool>(false);
    host.max_trial_number_per_gpu = node["max_trial_number_per_gpu"].as<int>(DEFAULT_TRIALS_PER_GPU);

    if (node["python_path"]) {
        host.python_path = node["python_path"].as<std::string>();
    }

    return host;
}

Result<void> validate_host_config(const HostConfig& host) {
    if (host.host.empty()) {
        return Result<void>::Err("missing 'host'", ErrorCode::ConfigError);
    }
    if (host.user.empty()) {
        return Result<void>::Err("missing 'user'", ErrorCode::ConfigError);
    }
    if (host.port < 1 || host.port > 65535) {
        return Result<void>::Err(fmt::format("port {} out of range", host.port),
                                 ErrorCode::ConfigError);
    }
    if (!host.password.has_value() && !host.ssh_key_file.has_value()) {
        return Result<void>::Err("needs either 'password' or 'ssh_key_file'",
                                 ErrorCode::ConfigError);
    }
    if (host.max_trial_number_per_gpu < 1) {
        return Result<void>::Err("'max_trial_number_per_gpu' must be at least 1",
                                 ErrorCode::ConfigError);
    }
    if (host.gpu_indices.has_value()) {
        for (int idx : *host.gpu_indices) {
            if (idx < 0) {
                return Result<void>::Err(fmt::format("negative GPU index {}", idx),
                                         ErrorCode::ConfigError);
            }
        }
    }
    return Result<void>::Ok();
}

Result<Config> Config::load_string(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);

        Config config;
        config.pool_ = parse_pool_settings(root["pool"] ? root["pool"] : YAML::Node());
        if (config.pool_.channel_capacity < 1) {
            return Result<Config>::Err("pool.channel_capacity must be at least 1",
                                       ErrorCode::ConfigError);
        }
        if (config.pool_.connect_timeout < 1) {
            return Result<Config>::Err("pool.connect_timeout must be at least 1",
                                       ErrorCode::ConfigError);
        }

        // "machines" is canonical; "machine_list" accepted for compat
        YAML::Node machines = root["machines"] ? root["machines"] : root["machine_list"];
        if (machines) {
            if (!machines.IsSequence()) {
                return Result<Config>::Err("'machines' must be a list", ErrorCode::ConfigError);
            }
            size_t index = 0;
            for (const auto& m : machines) {
                HostConfig host = parse_host_config(m);
                auto valid = validate_host_config(host);
                if (valid.is_err()) {
                    return Result<Config>::Err(fmt::format("machines[{}]: {}", index, valid.error),
                                               ErrorCode::ConfigError);
                }
                config.machines_.push_back(host);
                index++;
            }
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorCode::ConfigError);
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string(), ErrorCode::ConfigError);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto result = load_string(YAML::Dump(root));
        if (result.is_ok()) result.value.source_ = path;
        else result.error = path.string() + ": " + result.error;
        return result;
    } catch (const std::exception& e) {
        return Result<Config>::Err(fmt::format("Failed to read {}: {}", path.string(), e.what()),
                                   ErrorCode::ConfigError);
    }
}

Result<Config> Config::load_default() {
    fs::path local = get_local_config_path();
    if (fs::exists(local)) return load_file(local);
    return load_file(get_global_config_path());
}
