#include <gtest/gtest.h>
#include <pool/host_descriptor.hpp>

static HostConfig key_host() {
    HostConfig cfg;
    cfg.host = "gpu01.lab";
    cfg.port = 2200;
    cfg.user = "bob";
    cfg.ssh_key_file = "/home/bob/.ssh/id_ed25519";
    cfg.ssh_passphrase = "hunter2";
    cfg.gpu_indices = std::vector<int>{0, 2, 3};
    cfg.use_active_gpu = true;
    cfg.max_trial_number_per_gpu = 2;
    cfg.python_path = "/opt/conda/bin";
    return cfg;
}

TEST(HostDescriptor, ExposesConnectionParameters) {
    RemoteHostDescriptor d(key_host());

    EXPECT_EQ(d.ip(), "gpu01.lab");
    EXPECT_EQ(d.port(), 2200);
    EXPECT_EQ(d.username(), "bob");
    EXPECT_EQ(d.password(), "");
    EXPECT_TRUE(d.uses_key_auth());
    EXPECT_EQ(d.ssh_key_path().value(), "/home/bob/.ssh/id_ed25519");
    EXPECT_EQ(d.passphrase().value(), "hunter2");
    EXPECT_TRUE(d.use_active_gpu());
    EXPECT_EQ(d.max_trial_num_per_gpu(), 2);
    EXPECT_EQ(d.python_path().value(), "/opt/conda/bin");
    EXPECT_EQ(d.key(), "gpu01.lab:2200");
}

TEST(HostDescriptor, GpuIndicesJoined) {
    RemoteHostDescriptor d(key_host());
    EXPECT_EQ(d.gpu_indices().value(), "0,2,3");
}

TEST(HostDescriptor, GpuIndicesUnsetMeansAll) {
    HostConfig cfg;
    cfg.host = "h";
    cfg.user = "u";
    cfg.password = "p";
    RemoteHostDescriptor d(cfg);

    EXPECT_FALSE(d.gpu_indices().has_value());
    EXPECT_FALSE(d.uses_key_auth());
    EXPECT_EQ(d.password(), "p");
    EXPECT_EQ(d.port(), 22);
}

TEST(HostDescriptor, OccupancyCountsPerGpu) {
    RemoteHostDescriptor d(key_host());
    d.occupy_gpu(0);
    d.occupy_gpu(0);
    d.occupy_gpu(3);

    EXPECT_EQ(d.gpu_occupancy(0), 2);
    EXPECT_EQ(d.gpu_occupancy(3), 1);
    EXPECT_EQ(d.gpu_occupancy(2), 0);

    auto snapshot = d.occupied_gpus();
    EXPECT_EQ(snapshot.size(), 2u);
}

TEST(HostDescriptor, ReleaseDropsEntryAtZero) {
    RemoteHostDescriptor d(key_host());
    d.occupy_gpu(2);
    d.release_gpu(2);
    d.release_gpu(2);   // already gone: no-op

    EXPECT_EQ(d.gpu_occupancy(2), 0);
    EXPECT_TRUE(d.occupied_gpus().empty());
}

TEST(HostDescriptor, GpuSummaryRoundTrip) {
    RemoteHostDescriptor d(key_host());
    EXPECT_FALSE(d.gpu_summary().has_value());

    GpuSummary summary;
    summary.gpu_count = 2;
    summary.timestamp = "2026-10-18T09:00:00";
    summary.gpu_infos = {{0, 1, 0.5, 0.9}, {1, 0, 0.0, 0.0}};
    d.set_gpu_summary(summary);

    auto got = d.gpu_summary();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->gpu_count, 2);
    EXPECT_EQ(got->gpu_infos[0].active_process_num, 1);
    EXPECT_EQ(got->gpu_infos[1].index, 1);
}
