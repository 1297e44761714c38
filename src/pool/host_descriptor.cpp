#include "host_descriptor.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

RemoteHostDescriptor::RemoteHostDescriptor(HostConfig config)
    : config_(std::move(config)) {}

std::string RemoteHostDescriptor::key() const {
    return fmt::format("{}:{}", config_.host, config_.port);
}

std::optional<std::string> RemoteHostDescriptor::gpu_indices() const {
    if (!config_.gpu_indices.has_value()) return std::nullopt;
    return join_ints(*config_.gpu_indices);
}

void RemoteHostDescriptor::occupy_gpu(int index) {
    std::lock_guard<std::mutex> lock(gpu_mutex_);
    occupied_gpu_index_map_[index]++;
}

void RemoteHostDescriptor::release_gpu(int index) {
    std::lock_guard<std::mutex> lock(gpu_mutex_);
    auto it = occupied_gpu_index_map_.find(index);
    if (it == occupied_gpu_index_map_.end()) return;
    if (--it->second <= 0) occupied_gpu_index_map_.erase(it);
}

int RemoteHostDescriptor::gpu_occupancy(int index) const {
    std::lock_guard<std::mutex> lock(gpu_mutex_);
    auto it = occupied_gpu_index_map_.find(index);
    return it == occupied_gpu_index_map_.end() ? 0 : it->second;
}

std::map<int, int> RemoteHostDescriptor::occupied_gpus() const {
    std::lock_guard<std::mutex> lock(gpu_mutex_);
    return occupied_gpu_index_map_;
}

void RemoteHostDescriptor::set_gpu_summary(GpuSummary summary) {
    std::lock_guard<std::mutex> lock(gpu_mutex_);
    gpu_summary_ = std::move(summary);
}

std::optional<GpuSummary> RemoteHostDescriptor::gpu_summary() const {
    std::lock_guard<std::mutex> lock(gpu_mutex_);
    return gpu_summary_;
}
