#include "execution_channel.hpp"

static std::atomic<uint64_t> next_channel_id{1};

ExecutionChannel::ExecutionChannel(int capacity)
    : capacity_(capacity > 0 ? capacity : 1), id_(next_channel_id.fetch_add(1)) {}

bool ExecutionChannel::try_reserve_slot() {
    int current = usage_.load();
    while (current < capacity_) {
        if (usage_.compare_exchange_weak(current, current + 1)) return true;
    }
    return false;
}

void ExecutionChannel::release_slot() {
    int current = usage_.load();
    while (current > 0) {
        if (usage_.compare_exchange_weak(current, current - 1)) return;
    }
}
