#include <gtest/gtest.h>
#include <core/profile_store.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ProfileStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sshdeck_profile_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_profile(const std::string& name, const std::string& content) {
        std::ofstream(test_dir / (name + ".yaml")) << content;
    }
};

TEST_F(ProfileStoreTest, LoadsKeyProfile) {
    write_profile("web", "host: web.example.org\nport: 2222\nusername: deploy\nssh_key_path: /keys/id\n");
    ProfileStore store(test_dir);

    auto r = store.load("web");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.name, "web");
    EXPECT_EQ(r.value.host, "web.example.org");
    EXPECT_EQ(r.value.port, 2222);
    EXPECT_EQ(r.value.username, "deploy");
    EXPECT_EQ(r.value.ssh_key_path, std::optional<std::string>("/keys/id"));
    EXPECT_FALSE(r.value.password.has_value());
}

TEST_F(ProfileStoreTest, PortDefaultsTo22) {
    write_profile("db", "host: db\nusername: root\npassword: hunter2\n");
    auto r = ProfileStore(test_dir).load("db");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.port, 22);
    EXPECT_EQ(r.value.password, std::optional<std::string>("hunter2"));
}

TEST_F(ProfileStoreTest, MissingProfileIsConfigError) {
    EXPECT_EQ(ProfileStore(test_dir).load("ghost").kind, ErrorKind::Config);
}

TEST_F(ProfileStoreTest, BothAuthMethodsRejected) {
    write_profile("both", "host: h\nusername: u\npassword: p\nssh_key_path: /k\n");
    EXPECT_EQ(ProfileStore(test_dir).load("both").kind, ErrorKind::Config);
}

TEST_F(ProfileStoreTest, NoAuthMethodRejected) {
    write_profile("none", "host: h\nusername: u\n");
    EXPECT_EQ(ProfileStore(test_dir).load("none").kind, ErrorKind::Config);
}

TEST_F(ProfileStoreTest, LoadAllSkipsInvalidAndSorts) {
    write_profile("zeta", "host: z\nusername: u\npassword: p\n");
    write_profile("alpha", "host: a\nusername: u\npassword: p\n");
    write_profile("broken", "host: [\n");
    write_profile("noauth", "host: x\nusername: u\n");
    std::ofstream(test_dir / "notes.txt") << "ignored";

    auto all = ProfileStore(test_dir).load_all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].name, "alpha");
    EXPECT_EQ(all[1].name, "zeta");
}

TEST_F(ProfileStoreTest, LoadAllOnMissingDirIsEmpty) {
    EXPECT_TRUE(ProfileStore(test_dir / "nowhere").load_all().empty());
}

TEST_F(ProfileStoreTest, SaveThenLoadAndRemove) {
    ProfileStore store(test_dir / "nested");
    Profile p;
    p.name = "ci";
    p.host = "ci.internal";
    p.port = 2022;
    p.username = "runner";
    p.ssh_key_path = "/keys/ci";
    ASSERT_TRUE(store.save(p).is_ok());

    auto r = store.load("ci");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.host, "ci.internal");
    EXPECT_EQ(r.value.port, 2022);

    EXPECT_TRUE(store.remove("ci").is_ok());
    EXPECT_EQ(store.load("ci").kind, ErrorKind::Config);
    EXPECT_EQ(store.remove("ci").kind, ErrorKind::Config);
}

TEST_F(ProfileStoreTest, SaveRejectsInvalidProfile) {
    Profile p;
    p.name = "bad";
    p.host = "h";
    p.username = "u";
    EXPECT_EQ(ProfileStore(test_dir).save(p).kind, ErrorKind::Config);
    EXPECT_FALSE(fs::exists(test_dir / "bad.yaml"));
}

TEST(ValidateProfile, ChecksAddressFields) {
    Profile p;
    p.name = "x";
    p.host = "h";
    p.username = "u";
    p.password = "p";
    EXPECT_TRUE(validate_profile(p).is_ok());

    Profile no_host = p;
    no_host.host.clear();
    EXPECT_EQ(validate_profile(no_host).kind, ErrorKind::Config);

    Profile bad_port = p;
    bad_port.port = 0;
    EXPECT_EQ(validate_profile(bad_port).kind, ErrorKind::Config);

    Profile no_user = p;
    no_user.username.clear();
    EXPECT_EQ(validate_profile(no_user).kind, ErrorKind::Config);

    Profile empty_password = p;
    empty_password.password = "";
    EXPECT_EQ(validate_profile(empty_password).kind, ErrorKind::Config);
}
