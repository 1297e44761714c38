#include "channel_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <stdexcept>

ChannelPool::ChannelPool(const HostConfig& config, ChannelFactory factory)
    : descriptor_(std::make_shared<RemoteHostDescriptor>(config)),
      factory_(std::move(factory)) {}

ChannelPool::ChannelPool(std::shared_ptr<RemoteHostDescriptor> descriptor, ChannelFactory factory)
    : descriptor_(std::move(descriptor)), factory_(std::move(factory)) {
    if (!descriptor_) {
        throw std::invalid_argument("ChannelPool: descriptor must not be null");
    }
}

ChannelPool::~ChannelPool() {
    release_all();
}

// ── Acquire / release ──────────────────────────────────────────

Result<std::shared_ptr<ExecutionChannel>> ChannelPool::acquire(const std::string& consumer_id,
                                                               const AcquireOptions& options) {
    using R = Result<std::shared_ptr<ExecutionChannel>>;
    std::unique_lock<std::mutex> lock(mutex_);

    // Already assigned, or another thread is building a channel for this ID
    while (true) {
        auto it = assignments_.find(consumer_id);
        if (it != assignments_.end()) {
            return R::Ok(it->second);
        }
        if (creating_.find(consumer_id) == creating_.end()) break;
        creation_done_.wait(lock);
    }

    auto free_channel = find_free_unlocked();
    if (free_channel) {
        assignments_[consumer_id] = free_channel;
        shellpool_log(fmt::format("[pool {}] {} reuses channel #{} ({}/{})",
                                  descriptor_->key(), consumer_id, free_channel->id(),
                                  free_channel->usage(), free_channel->capacity()));
        return R::Ok(free_channel);
    }

    if (options.cancel && options.cancel->load()) {
        return R::Err("Canceled before channel construction", ErrorCode::ConstructionFailed);
    }

    creating_.insert(consumer_id);
    uint64_t generation = generation_;
    lock.unlock();

    R created = R::Err("Channel construction did not run", ErrorCode::ConstructionFailed);
    try {
        created = create_channel(consumer_id, options);
    } catch (...) {
        // Waiters on this ID must not block on a construction that is gone
        lock.lock();
        creating_.erase(consumer_id);
        creation_done_.notify_all();
        throw;
    }

    lock.lock();
    creating_.erase(consumer_id);
    creation_done_.notify_all();

    if (created.is_err()) {
        return created;
    }

    auto channel = created.value;

    if (generation != generation_) {
        // release_all() ran while we were connecting
        lock.unlock();
        auto closed = channel->close();
        if (closed.is_err()) {
            shellpool_log(fmt::format("[pool {}] close of orphaned channel #{} failed: {}",
                                      descriptor_->key(), channel->id(), closed.error));
        }
        return R::Err("Pool was torn down during channel construction",
                      ErrorCode::ConstructionFailed);
    }

    if (!channel->try_reserve_slot()) {
        lock.unlock();
        std::string msg = fmt::format("[pool {}] fresh channel #{} refused its first slot (capacity {})",
                                      descriptor_->key(), channel->id(), channel->capacity());
        shellpool_log(msg);
        auto closed = channel->close();
        if (closed.is_err()) shellpool_log("  close failed: " + closed.error);
        throw std::logic_error(msg);
    }

    channels_.push_back(channel);
    assignments_[consumer_id] = channel;
    shellpool_log(fmt::format("[pool {}] {} gets new channel #{} ({} live)",
                              descriptor_->key(), consumer_id, channel->id(), channels_.size()));
    return R::Ok(channel);
}

Result<void> ChannelPool::release(const std::string& consumer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = assignments_.find(consumer_id);
    if (it == assignments_.end()) {
        shellpool_log(fmt::format("[pool {}] release of unassigned consumer {}",
                                  descriptor_->key(), consumer_id));
        return Result<void>::Err(fmt::format("executor for {} is not found", consumer_id),
                                 ErrorCode::NotFound);
    }

    auto channel = it->second;
    channel->release_slot();
    assignments_.erase(it);
    shellpool_log(fmt::format("[pool {}] {} released channel #{} ({}/{})",
                              descriptor_->key(), consumer_id, channel->id(),
                              channel->usage(), channel->capacity()));
    return Result<void>::Ok();
}

void ChannelPool::release_all() {
    std::vector<std::shared_ptr<ExecutionChannel>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        assignments_.clear();
        to_close.swap(channels_);
        generation_++;
        teardown_errors_.clear();
    }

    if (to_close.empty()) return;

    shellpool_log(fmt::format("[pool {}] closing {} channel(s)",
                              descriptor_->key(), to_close.size()));

    // Best effort: one failing close must not leave the rest open
    std::vector<std::string> errors;
    for (auto& channel : to_close) {
        Result<void> closed = Result<void>::Ok();
        try {
            closed = channel->close();
        } catch (const std::exception& e) {
            closed = Result<void>::Err(e.what());
        } catch (...) {
            closed = Result<void>::Err("unknown exception during close");
        }
        if (closed.is_err()) {
            std::string msg = fmt::format("channel #{}: {}", channel->id(), closed.error);
            shellpool_log(fmt::format("[pool {}] close failed: {}", descriptor_->key(), msg));
            errors.push_back(msg);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    teardown_errors_ = std::move(errors);
}

std::vector<std::string> ChannelPool::last_teardown_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return teardown_errors_;
}

// ── Introspection ──────────────────────────────────────────────

size_t ChannelPool::channel_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

size_t ChannelPool::assignment_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assignments_.size();
}

bool ChannelPool::is_assigned(const std::string& consumer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assignments_.count(consumer_id) > 0;
}

std::shared_ptr<ExecutionChannel> ChannelPool::channel_for(const std::string& consumer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = assignments_.find(consumer_id);
    return it == assignments_.end() ? nullptr : it->second;
}

// ── Internal ───────────────────────────────────────────────────

std::shared_ptr<ExecutionChannel> ChannelPool::find_free_unlocked() {
    for (auto& channel : channels_) {
        if (channel->try_reserve_slot()) return channel;
    }
    return nullptr;
}

Result<std::shared_ptr<ExecutionChannel>> ChannelPool::create_channel(const std::string& consumer_id,
                                                                     const AcquireOptions& options) {
    using R = Result<std::shared_ptr<ExecutionChannel>>;

    std::unique_ptr<ExecutionChannel> built;
    try {
        if (options.callback)
            options.callback(fmt::format("[pool] Opening new channel to {} for {}",
                                         descriptor_->key(), consumer_id));
        built = factory_();
    } catch (const std::exception& e) {
        return R::Err(fmt::format("Failed to create channel to {}: {}", descriptor_->key(), e.what()),
                      ErrorCode::ConstructionFailed);
    } catch (...) {
        return R::Err(fmt::format("Failed to create channel to {}: unknown exception",
                                  descriptor_->key()),
                      ErrorCode::ConstructionFailed);
    }
    if (!built) {
        return R::Err("Channel factory returned no channel", ErrorCode::ConstructionFailed);
    }
    std::shared_ptr<ExecutionChannel> channel(std::move(built));

    ChannelInit init;
    init.timeout_secs = options.timeout_secs;
    init.cancel = options.cancel;
    init.callback = options.callback;

    Result<void> ready = Result<void>::Ok();
    try {
        ready = channel->initialize(*descriptor_, init);
    } catch (const std::exception& e) {
        ready = Result<void>::Err(e.what());
    } catch (...) {
        ready = Result<void>::Err("unknown exception during initialize");
    }

    if (ready.is_ok() && init.canceled()) {
        ready = Result<void>::Err("Canceled during channel construction");
    }

    if (ready.is_err()) {
        Result<void> closed = Result<void>::Ok();
        try {
            closed = channel->close();
        } catch (const std::exception& e) {
            closed = Result<void>::Err(e.what());
        } catch (...) {
            closed = Result<void>::Err("unknown exception during close");
        }
        if (closed.is_err()) {
            shellpool_log(fmt::format("[pool {}] cleanup close failed: {}",
                                      descriptor_->key(), closed.error));
        }
        shellpool_log(fmt::format("[pool {}] channel construction for {} failed: {}",
                                  descriptor_->key(), consumer_id, ready.error));
        return R::Err(fmt::format("Failed to create channel to {}: {}",
                                  descriptor_->key(), ready.error),
                      ErrorCode::ConstructionFailed);
    }

    return R::Ok(channel);
}
