#include <gtest/gtest.h>
#include <pool/execution_channel.hpp>
#include <ssh/shell_executor.hpp>
#include "fake_channel.hpp"
#include <atomic>
#include <thread>
#include <vector>

static std::unique_ptr<FakeChannel> make_channel(int capacity) {
    return std::make_unique<FakeChannel>(capacity, std::make_shared<FakeChannelState>());
}

TEST(ExecutionChannel, ReserveUpToCapacity) {
    auto ch = make_channel(2);
    EXPECT_TRUE(ch->try_reserve_slot());
    EXPECT_TRUE(ch->try_reserve_slot());
    EXPECT_FALSE(ch->try_reserve_slot());
    EXPECT_EQ(ch->usage(), 2);
}

TEST(ExecutionChannel, ReleaseNeverGoesNegative) {
    auto ch = make_channel(2);
    ch->release_slot();
    EXPECT_EQ(ch->usage(), 0);

    ASSERT_TRUE(ch->try_reserve_slot());
    ch->release_slot();
    ch->release_slot();
    EXPECT_EQ(ch->usage(), 0);
}

TEST(ExecutionChannel, NonPositiveCapacityClampsToOne) {
    auto ch = make_channel(0);
    EXPECT_EQ(ch->capacity(), 1);
    EXPECT_TRUE(ch->try_reserve_slot());
    EXPECT_FALSE(ch->try_reserve_slot());
}

TEST(ExecutionChannel, IdsAreUnique) {
    auto a = make_channel(1);
    auto b = make_channel(1);
    EXPECT_NE(a->id(), b->id());
}

TEST(ExecutionChannel, ConcurrentReserveStopsAtCapacity) {
    auto ch = make_channel(7);
    std::atomic<int> granted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; i++) {
                if (ch->try_reserve_slot()) granted++;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(granted, 7);
    EXPECT_EQ(ch->usage(), 7);
}

// ── ShellExecutor without a network ────────────────────────

TEST(ShellExecutor, PathPrefixWrapsCommand) {
    EXPECT_EQ(ShellExecutor::with_path_prefix("python3 -V", "/opt/conda/bin"),
              "export PATH='/opt/conda/bin':$PATH && python3 -V");
}

TEST(ShellExecutor, EmptyPathPrefixLeavesCommand) {
    EXPECT_EQ(ShellExecutor::with_path_prefix("hostname", ""), "hostname");
}

TEST(ShellExecutor, RunBeforeInitializeFails) {
    ShellExecutor exec(2);
    auto r = exec.run("hostname");
    EXPECT_TRUE(r.failed());
    EXPECT_FALSE(r.stderr_data.empty());
}

TEST(ShellExecutor, CloseIsIdempotentWithoutSession) {
    ShellExecutor exec(2);
    EXPECT_TRUE(exec.close().is_ok());
    EXPECT_TRUE(exec.close().is_ok());
    EXPECT_TRUE(exec.is_closed());
    EXPECT_TRUE(exec.run("hostname").failed());
}

TEST(ShellExecutor, InitializeAfterCloseIsRefused) {
    ShellExecutor exec(2);
    ASSERT_TRUE(exec.close().is_ok());

    RemoteHostDescriptor host(fake_host());
    auto r = exec.initialize(host, ChannelInit{});
    EXPECT_EQ(r.code, ErrorCode::ConstructionFailed);
}

TEST(ShellExecutor, UnreachableHostIsConstructionFailure) {
    // Port 1 on loopback: nothing listens there, connect is refused quickly
    ShellExecutor exec(2, 2);
    RemoteHostDescriptor host(fake_host("127.0.0.1", 1));

    auto r = exec.initialize(host, ChannelInit{});
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::ConstructionFailed);
    EXPECT_TRUE(exec.run("hostname").failed());
}

TEST(ShellExecutor, SshLibraryInitFromManyThreads) {
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            if (init_ssh_library().is_ok()) ok++;
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(ok, 8);
    EXPECT_TRUE(init_ssh_library().is_ok());
}

TEST(ShellExecutor, ConcurrentFailedConnectsStayIndependent) {
    // Failed setups tear down their own session only; the library stays usable
    RemoteHostDescriptor host(fake_host("127.0.0.1", 1));
    std::vector<std::thread> threads;
    std::atomic<int> construction_failures{0};
    for (int t = 0; t < 6; t++) {
        threads.emplace_back([&]() {
            ShellExecutor exec(2, 2);
            auto r = exec.initialize(host, ChannelInit{});
            if (r.code == ErrorCode::ConstructionFailed) construction_failures++;
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(construction_failures, 6);
    EXPECT_TRUE(init_ssh_library().is_ok());
}
