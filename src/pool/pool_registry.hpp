#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "channel_pool.hpp"

// PoolRegistry: one ChannelPool per registered machine for an orchestration
// session. Machines are keyed "host:port"; the same key cannot be registered
// twice. Pools live until the registry is destroyed.
class PoolRegistry {
public:
    explicit PoolRegistry(ChannelFactory factory);
    ~PoolRegistry();

    PoolRegistry(const PoolRegistry&) = delete;
    PoolRegistry& operator=(const PoolRegistry&) = delete;

    Result<ChannelPool*> register_host(const HostConfig& config);
    Result<ChannelPool*> register_host(std::shared_ptr<RemoteHostDescriptor> descriptor);

    // nullptr when the key is unknown
    ChannelPool* pool(const std::string& key) const;

    // Keys in registration order
    std::vector<std::string> hosts() const;
    size_t size() const;

    // Tear down every pool. Pools stay registered and can be reused.
    void release_all();

private:
    ChannelFactory factory_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<ChannelPool>> pools_;
};
