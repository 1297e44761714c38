#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Per-GPU status as last reported by the host
struct GpuInfo {
    int index = 0;
    int active_process_num = 0;
    double gpu_mem_util = 0.0;   // 0..1
    double gpu_util = 0.0;       // 0..1
};

struct GpuSummary {
    int gpu_count = 0;
    std::string timestamp;       // ISO time of the report
    std::vector<GpuInfo> gpu_infos;
};

// RemoteHostDescriptor: connection parameters for one remote host, plus the
// GPU bookkeeping the scheduler keeps about it.
//
// The config part never changes after construction. The GPU occupancy map
// and summary are written by the scheduler and read by whoever owns the
// descriptor; both sit behind the descriptor's mutex.
class RemoteHostDescriptor {
public:
    explicit RemoteHostDescriptor(HostConfig config);

    const HostConfig& config() const { return config_; }

    // "host:port", unique per registered machine
    std::string key() const;

    const std::string& ip() const { return config_.host; }
    int port() const { return config_.port; }
    const std::string& username() const { return config_.user; }
    std::string password() const { return config_.password.value_or(""); }
    const std::optional<std::string>& ssh_key_path() const { return config_.ssh_key_file; }
    const std::optional<std::string>& passphrase() const { return config_.ssh_passphrase; }
    bool use_active_gpu() const { return config_.use_active_gpu; }
    int max_trial_num_per_gpu() const { return config_.max_trial_number_per_gpu; }
    const std::optional<std::string>& python_path() const { return config_.python_path; }

    // Comma-joined GPU restriction ("0,2"), nullopt when every GPU is usable.
    std::optional<std::string> gpu_indices() const;

    bool uses_key_auth() const { return config_.ssh_key_file.has_value(); }

    // ── GPU occupancy ──────────────────────────────────────────
    void occupy_gpu(int index);
    // Drops the count for one GPU; the entry disappears at zero.
    void release_gpu(int index);
    int gpu_occupancy(int index) const;
    std::map<int, int> occupied_gpus() const;

    // ── GPU summary ────────────────────────────────────────────
    void set_gpu_summary(GpuSummary summary);
    std::optional<GpuSummary> gpu_summary() const;

private:
    const HostConfig config_;
    mutable std::mutex gpu_mutex_;
    std::map<int, int> occupied_gpu_index_map_;
    std::optional<GpuSummary> gpu_summary_;
};
