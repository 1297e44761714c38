#include "pool_registry.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

PoolRegistry::PoolRegistry(ChannelFactory factory)
    : factory_(std::move(factory)) {}

PoolRegistry::~PoolRegistry() {
    release_all();
}

Result<ChannelPool*> PoolRegistry::register_host(const HostConfig& config) {
    return register_host(std::make_shared<RemoteHostDescriptor>(config));
}

Result<ChannelPool*> PoolRegistry::register_host(std::shared_ptr<RemoteHostDescriptor> descriptor) {
    if (!descriptor) {
        return Result<ChannelPool*>::Err("No host descriptor given", ErrorCode::InvalidArgument);
    }
    if (descriptor->ip().empty()) {
        return Result<ChannelPool*>::Err("Host address is empty", ErrorCode::InvalidArgument);
    }

    std::string key = descriptor->key();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : pools_) {
        if (p->descriptor().key() == key) {
            return Result<ChannelPool*>::Err(fmt::format("Host {} is already registered", key),
                                             ErrorCode::InvalidArgument);
        }
    }

    pools_.push_back(std::make_unique<ChannelPool>(std::move(descriptor), factory_));
    shellpool_log(fmt::format("[registry] registered {}", key));
    return Result<ChannelPool*>::Ok(pools_.back().get());
}

ChannelPool* PoolRegistry::pool(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : pools_) {
        if (p->descriptor().key() == key) return p.get();
    }
    return nullptr;
}

std::vector<std::string> PoolRegistry::hosts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(pools_.size());
    for (const auto& p : pools_) keys.push_back(p->descriptor().key());
    return keys;
}

size_t PoolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pools_.size();
}

void PoolRegistry::release_all() {
    std::vector<ChannelPool*> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& p : pools_) snapshot.push_back(p.get());
    }
    for (auto* p : snapshot) p->release_all();
}
