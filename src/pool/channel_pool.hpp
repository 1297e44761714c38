#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "host_descriptor.hpp"
#include "execution_channel.hpp"

// Builds an uninitialized channel. The pool calls initialize() on it.
using ChannelFactory = std::function<std::unique_ptr<ExecutionChannel>()>;

struct AcquireOptions {
    int timeout_secs = 0;                       // 0 = host default
    const std::atomic<bool>* cancel = nullptr;
    StatusCallback callback = nullptr;
};

// ChannelPool: shares the execution channels of one remote host among many
// consumers (job IDs).
//
//   acquire(id)  : existing assignment, else first live channel with a free
//                  slot (creation order), else a freshly built channel
//   release(id)  : frees the slot; the channel stays live for reuse
//   release_all(): drops every assignment and closes every channel
//
// All bookkeeping sits behind one mutex. Channel construction runs with the
// lock released; the consumer ID is marked in-flight so a second acquire for
// the same ID waits instead of building another channel.
//
// release_all() does not wait for consumers still using their channel: it
// closes under them, and their later release() reports NotFound.
class ChannelPool {
public:
    ChannelPool(const HostConfig& config, ChannelFactory factory);
    ChannelPool(std::shared_ptr<RemoteHostDescriptor> descriptor, ChannelFactory factory);
    ~ChannelPool();

    ChannelPool(const ChannelPool&) = delete;
    ChannelPool& operator=(const ChannelPool&) = delete;

    Result<std::shared_ptr<ExecutionChannel>> acquire(const std::string& consumer_id,
                                                      const AcquireOptions& options = {});

    Result<void> release(const std::string& consumer_id);

    void release_all();

    // Close errors collected by the most recent release_all()
    std::vector<std::string> last_teardown_errors() const;

    size_t channel_count() const;
    size_t assignment_count() const;
    bool is_assigned(const std::string& consumer_id) const;
    std::shared_ptr<ExecutionChannel> channel_for(const std::string& consumer_id) const;

    const RemoteHostDescriptor& descriptor() const { return *descriptor_; }
    std::shared_ptr<RemoteHostDescriptor> shared_descriptor() const { return descriptor_; }

private:
    std::shared_ptr<RemoteHostDescriptor> descriptor_;
    ChannelFactory factory_;

    mutable std::mutex mutex_;
    std::condition_variable creation_done_;
    std::vector<std::shared_ptr<ExecutionChannel>> channels_;        // creation order
    std::map<std::string, std::shared_ptr<ExecutionChannel>> assignments_;
    std::set<std::string> creating_;                                 // IDs mid-construction
    uint64_t generation_ = 0;                                        // bumped by release_all
    std::vector<std::string> teardown_errors_;

    // Caller must hold mutex_
    std::shared_ptr<ExecutionChannel> find_free_unlocked();

    // Build and initialize a channel with the lock released
    Result<std::shared_ptr<ExecutionChannel>> create_channel(const std::string& consumer_id,
                                                            const AcquireOptions& options);
};
