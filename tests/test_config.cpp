#include <gtest/gtest.h>
#include <core/config.hpp>
#include <fstream>

TEST(Config, ParsesMachinesAndPool) {
    auto r = Config::load_string(R"(
pool:
  channel_capacity: 3
  connect_timeout: 10
  log_file: /tmp/pool.log
machines:
  - host: 10.0.0.5
    user: alice
    password: secret
    gpu_indices: [0, 1]
    max_trial_number_per_gpu: 2
    python_path: /opt/conda/bin
  - host: gpu02
    port: 2222
    user: bob
    ssh_key_file: /home/bob/.ssh/id_rsa
    ssh_passphrase: pp
    use_active_gpu: true
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& cfg = r.value;

    EXPECT_EQ(cfg.pool().channel_capacity, 3);
    EXPECT_EQ(cfg.pool().connect_timeout, 10);
    EXPECT_EQ(cfg.pool().log_file, "/tmp/pool.log");
    ASSERT_EQ(cfg.machines().size(), 2u);

    const auto& a = cfg.machines()[0];
    EXPECT_EQ(a.host, "10.0.0.5");
    EXPECT_EQ(a.port, 22);
    EXPECT_EQ(a.password.value(), "secret");
    EXPECT_EQ(a.gpu_indices.value(), (std::vector<int>{0, 1}));
    EXPECT_EQ(a.max_trial_number_per_gpu, 2);
    EXPECT_EQ(a.python_path.value(), "/opt/conda/bin");
    EXPECT_FALSE(a.use_active_gpu);

    const auto& b = cfg.machines()[1];
    EXPECT_EQ(b.port, 2222);
    EXPECT_FALSE(b.password.has_value());
    EXPECT_EQ(b.ssh_key_file.value(), "/home/bob/.ssh/id_rsa");
    EXPECT_EQ(b.ssh_passphrase.value(), "pp");
    EXPECT_TRUE(b.use_active_gpu);
    EXPECT_FALSE(b.gpu_indices.has_value());
}

TEST(Config, DefaultsWhenPoolSectionMissing) {
    auto r = Config::load_string("machines: []\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.pool().channel_capacity, 5);
    EXPECT_EQ(r.value.pool().connect_timeout, 30);
    EXPECT_TRUE(r.value.machines().empty());
}

TEST(Config, GpuIndicesAsCommaString) {
    auto r = Config::load_string(R"(
machines:
  - host: h
    user: u
    password: p
    gpu_indices: "1,3"
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.machines()[0].gpu_indices.value(), (std::vector<int>{1, 3}));
}

TEST(Config, GpuIndicesStringToleratesSpaces) {
    auto r = Config::load_string(R"(
machines:
  - host: h
    user: u
    password: p
    gpu_indices: "0, 2"
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.machines()[0].gpu_indices.value(), (std::vector<int>{0, 2}));
}

TEST(Config, GpuIndicesWithTrailingJunkRejected) {
    auto r = Config::load_string(R"(
machines:
  - host: h
    user: u
    password: p
    gpu_indices: "0,1x"
)");
    EXPECT_EQ(r.code, ErrorCode::ConfigError);
    EXPECT_NE(r.error.find("1x"), std::string::npos);
}

TEST(Config, LegacyKeysAccepted) {
    auto r = Config::load_string(R"(
machine_list:
  - host: h
    username: carol
    password: p
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.machines()[0].user, "carol");
}

TEST(Config, MissingCredentialRejected) {
    auto r = Config::load_string(R"(
machines:
  - host: h
    user: u
)");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::ConfigError);
    EXPECT_NE(r.error.find("machines[0]"), std::string::npos);
}

TEST(Config, MissingHostRejected) {
    auto r = Config::load_string(R"(
machines:
  - user: u
    password: p
)");
    EXPECT_EQ(r.code, ErrorCode::ConfigError);
    EXPECT_NE(r.error.find("host"), std::string::npos);
}

TEST(Config, BadPortRejected) {
    auto r = Config::load_string(R"(
machines:
  - host: h
    port: 70000
    user: u
    password: p
)");
    EXPECT_EQ(r.code, ErrorCode::ConfigError);
}

TEST(Config, ZeroCapacityRejected) {
    auto r = Config::load_string("pool:\n  channel_capacity: 0\n");
    EXPECT_EQ(r.code, ErrorCode::ConfigError);
}

TEST(Config, MachinesMustBeList) {
    auto r = Config::load_string("machines:\n  host: h\n");
    EXPECT_EQ(r.code, ErrorCode::ConfigError);
}

TEST(Config, MalformedYamlIsConfigError) {
    auto r = Config::load_string("machines: [\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::ConfigError);
}

TEST(Config, MissingFileIsConfigError) {
    auto r = Config::load_file("/nonexistent/shellpool.yaml");
    EXPECT_EQ(r.code, ErrorCode::ConfigError);
}

TEST(Config, LoadFileRecordsSource) {
    fs::path path = fs::temp_directory_path() / "shellpool_test_config.yaml";
    {
        std::ofstream out(path);
        out << "machines:\n  - host: h\n    user: u\n    password: p\n";
    }
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.source(), path);
    EXPECT_EQ(r.value.machines().size(), 1u);
    fs::remove(path);
}
