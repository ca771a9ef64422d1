#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, EmptyDocumentGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;

    EXPECT_EQ(c.pool().idle_timeout_secs, 300);
    EXPECT_EQ(c.pool().sweep_interval_secs, 60);
    EXPECT_EQ(c.dial().dial_timeout_secs, 10);
    EXPECT_EQ(c.dial().keepalive_secs, 30);
    EXPECT_EQ(c.dial().host_key_policy, HostKeyPolicy::AcceptNew);
    EXPECT_EQ(c.session().stop_grace_ms, 2000);
    EXPECT_EQ(c.transfer().chunk_size, 1024u * 1024u);
    EXPECT_EQ(c.forward().remote_bind_host, "localhost");
    EXPECT_EQ(c.events().queue_capacity, 1024u);
    EXPECT_EQ(c.events().stall_warn_ms, 500);
    EXPECT_EQ(c.profiles_dir(), get_global_config_dir() / "profiles");
    EXPECT_EQ(c.history_dir(), get_global_config_dir() / "history");
}

TEST(Config, OverridesApply) {
    auto r = Config::parse(R"(
pool:
  idle_timeout: 120
  sweep_interval: 15
  dial_timeout: 5
  keepalive_interval: 0
session:
  stop_grace_ms: 500
transfer:
  chunk_size: 65536
forward:
  remote_bind_host: "0.0.0.0"
security:
  host_key_policy: strict
  known_hosts: /etc/ssh/ssh_known_hosts
events:
  queue_capacity: 16
  stall_warn_ms: 20
profiles_dir: /opt/deck/profiles
history_dir: /opt/deck/history
log_file: /var/log/deck.log
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;

    EXPECT_EQ(c.pool().idle_timeout_secs, 120);
    EXPECT_EQ(c.pool().sweep_interval_secs, 15);
    EXPECT_EQ(c.dial().dial_timeout_secs, 5);
    EXPECT_EQ(c.dial().keepalive_secs, 0);
    EXPECT_EQ(c.dial().host_key_policy, HostKeyPolicy::Strict);
    EXPECT_EQ(c.dial().known_hosts_path, "/etc/ssh/ssh_known_hosts");
    EXPECT_EQ(c.session().stop_grace_ms, 500);
    EXPECT_EQ(c.transfer().chunk_size, 65536u);
    EXPECT_EQ(c.forward().remote_bind_host, "0.0.0.0");
    EXPECT_EQ(c.events().queue_capacity, 16u);
    EXPECT_EQ(c.events().stall_warn_ms, 20);
    EXPECT_EQ(c.profiles_dir(), fs::path("/opt/deck/profiles"));
    EXPECT_EQ(c.history_dir(), fs::path("/opt/deck/history"));
    EXPECT_EQ(c.log_file(), "/var/log/deck.log");
}

TEST(Config, UnknownHostKeyPolicyRejected) {
    auto r = Config::parse("security:\n  host_key_policy: yolo\n");
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST(Config, NonPositiveTimeoutsRejected) {
    EXPECT_EQ(Config::parse("pool:\n  idle_timeout: 0\n").kind, ErrorKind::Config);
    EXPECT_EQ(Config::parse("transfer:\n  chunk_size: 0\n").kind, ErrorKind::Config);
    EXPECT_EQ(Config::parse("events:\n  queue_capacity: 0\n").kind, ErrorKind::Config);
}

TEST(Config, MalformedYamlIsConfigError) {
    EXPECT_EQ(Config::parse("pool: [unclosed").kind, ErrorKind::Config);
    EXPECT_EQ(Config::parse("- just\n- a list\n").kind, ErrorKind::Config);
}

TEST(Config, MissingFileGivesDefaults) {
    auto r = Config::load_file(fs::temp_directory_path() / "sshdeck_no_such_config.yaml");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.pool().idle_timeout_secs, 300);
}

TEST(Config, LoadFileReadsYaml) {
    auto path = fs::temp_directory_path() / "sshdeck_config_test.yaml";
    std::ofstream(path) << "session:\n  stop_grace_ms: 750\n";

    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.session().stop_grace_ms, 750);
    fs::remove(path);
}

TEST(HostKeyPolicyNames, RoundTripAndAliases) {
    EXPECT_EQ(parse_host_key_policy("accept_new"), HostKeyPolicy::AcceptNew);
    EXPECT_EQ(parse_host_key_policy("tofu"), HostKeyPolicy::AcceptNew);
    EXPECT_EQ(parse_host_key_policy("strict"), HostKeyPolicy::Strict);
    EXPECT_EQ(parse_host_key_policy("off"), HostKeyPolicy::Off);
    EXPECT_FALSE(parse_host_key_policy("maybe").has_value());
    EXPECT_STREQ(host_key_policy_name(HostKeyPolicy::Strict), "strict");
}
