#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <core/types.hpp>

class RemoteHostDescriptor;

// Construction parameters handed to ExecutionChannel::initialize.
struct ChannelInit {
    int timeout_secs = 0;                       // 0 = host default
    const std::atomic<bool>* cancel = nullptr;  // set by the caller to abandon construction
    StatusCallback callback = nullptr;

    bool canceled() const { return cancel && cancel->load(); }
};

// ExecutionChannel: a capacity-bounded handle that executes commands on one
// host. Concrete channels provide initialize/run/close; slot accounting lives
// here so every channel enforces usage <= capacity the same way.
class ExecutionChannel {
public:
    explicit ExecutionChannel(int capacity);
    virtual ~ExecutionChannel() = default;

    ExecutionChannel(const ExecutionChannel&) = delete;
    ExecutionChannel& operator=(const ExecutionChannel&) = delete;

    // Connect, authenticate and prepare the remote side. Blocking.
    virtual Result<void> initialize(const RemoteHostDescriptor& host,
                                    const ChannelInit& init) = 0;

    virtual SSHResult run(const std::string& command, int timeout_secs = 0) = 0;

    // Terminal. A closed channel refuses further commands.
    virtual Result<void> close() = 0;
    virtual bool is_closed() const = 0;

    // Take one slot if usage < capacity. Lock-free compare-and-increment.
    bool try_reserve_slot();

    // Give one slot back. Never drops below zero.
    void release_slot();

    int usage() const { return usage_.load(); }
    int capacity() const { return capacity_; }

    // Process-wide sequence number, for log lines
    uint64_t id() const { return id_; }

private:
    const int capacity_;
    std::atomic<int> usage_{0};
    const uint64_t id_;
};
