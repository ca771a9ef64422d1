#include <gtest/gtest.h>
#include <managers/deck_service.hpp>
#include "mock_transport.hpp"
#include <filesystem>
#include <fstream>
#include <fmt/format.h>

namespace fs = std::filesystem;
using namespace mock;

class DeckServiceTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::shared_ptr<MockDialer> dialer = std::make_shared<MockDialer>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    std::unique_ptr<DeckService> service;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sshdeck_service_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "profiles");
        std::ofstream(test_dir / "profiles" / "web.yaml")
            << "host: web.example.org\nusername: deploy\npassword: secret\n";

        auto config = Config::parse(fmt::format(
            "profiles_dir: {}\nhistory_dir: {}\nsession:\n  stop_grace_ms: 200\n",
            (test_dir / "profiles").string(), (test_dir / "history").string()));
        ASSERT_TRUE(config.is_ok()) << config.error;

        service = std::make_unique<DeckService>(config.value, dialer);
        service->set_sink(sink);
    }

    void TearDown() override {
        service.reset();
        fs::remove_all(test_dir);
    }
};

TEST_F(DeckServiceTest, ConnectUsesStoredProfile) {
    ASSERT_TRUE(service->connect("web").is_ok());
    EXPECT_EQ(service->active_connections(), std::vector<std::string>{"web"});

    ASSERT_TRUE(service->connect("web").is_ok());
    EXPECT_EQ(dialer->dials.load(), 1);
}

TEST_F(DeckServiceTest, UnknownProfileIsConfigError) {
    EXPECT_EQ(service->connect("ghost").kind, ErrorKind::Config);
    EXPECT_EQ(dialer->dials.load(), 0);
}

TEST_F(DeckServiceTest, ExecuteRecordsHistory) {
    ASSERT_TRUE(service->connect("web").is_ok());
    ASSERT_TRUE(service->execute("web", "uname -a").is_ok());
    ASSERT_TRUE(sink->wait_for_terminal("web"));
    ASSERT_TRUE(eventually([&] { return service->session_state("web") == SessionState::Idle; }));
    ASSERT_TRUE(service->execute("web", "clear").is_ok());

    auto history = service->history("web");
    ASSERT_TRUE(history.is_ok());
    EXPECT_EQ(history.value, (std::vector<std::string>{"clear", "uname -a"}));
}

TEST_F(DeckServiceTest, RejectedCommandNotRecorded) {
    auto r = service->execute("web", "ls");
    EXPECT_EQ(r.kind, ErrorKind::Dial);
    EXPECT_TRUE(service->history("web").value.empty());
}

TEST_F(DeckServiceTest, SavedCommandRunsThroughSession) {
    ASSERT_TRUE(service->save_command("kernel", "uname -r").is_ok());
    ASSERT_TRUE(service->connect("web").is_ok());

    auto r = service->execute_saved("web", "kernel");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "uname -r");
    ASSERT_TRUE(sink->wait_for_terminal("web"));
    EXPECT_EQ(dialer->last("web")->commands(), std::vector<std::string>{"uname -r"});
    EXPECT_EQ(service->history("web").value, std::vector<std::string>{"uname -r"});

    auto saved = service->saved_commands();
    ASSERT_TRUE(saved.is_ok());
    ASSERT_EQ(saved.value.size(), 1u);
    EXPECT_EQ(saved.value[0].name, "kernel");
}

TEST_F(DeckServiceTest, UnknownSavedCommandNeverRuns) {
    ASSERT_TRUE(service->connect("web").is_ok());
    ASSERT_TRUE(service->save_command("kernel", "uname -r").is_ok());
    ASSERT_TRUE(service->delete_saved("kernel").is_ok());

    auto r = service->execute_saved("web", "kernel");
    EXPECT_EQ(r.kind, ErrorKind::Config);
    EXPECT_TRUE(dialer->last("web")->commands().empty());
    EXPECT_EQ(service->delete_saved("kernel").kind, ErrorKind::Config);
}

TEST_F(DeckServiceTest, DisconnectStopsEverything) {
    ASSERT_TRUE(service->connect("web").is_ok());
    auto transport = dialer->last("web");
    auto ch = std::make_shared<MockExecChannel>();
    ch->hang = true;
    transport->queue_exec(ch);
    ASSERT_TRUE(service->execute("web", "tail -f app.log").is_ok());
    PortForwardEntry entry{"web", 3000, 80, ForwardDirection::RemoteToLocal};
    ASSERT_TRUE(service->start_forward(entry).is_ok());

    service->disconnect("web");
    EXPECT_TRUE(transport->closed.load());
    EXPECT_TRUE(service->active_connections().empty());
    EXPECT_TRUE(service->list_forwards("web").empty());
    EXPECT_EQ(service->session_state("web"), SessionState::Idle);
    EXPECT_TRUE(ch->closed());
}

TEST_F(DeckServiceTest, FileOperationsEmitProgress) {
    ASSERT_TRUE(service->connect("web").is_ok());
    auto local = test_dir / "hello.txt";
    std::ofstream(local) << "hello";

    auto up = service->upload("web", local.string(), "/hello.txt");
    ASSERT_TRUE(up.is_ok()) << up.error;
    service->flush_events();
    ASSERT_EQ(sink->transfer_events().size(), 1u);
    EXPECT_DOUBLE_EQ(sink->transfer_events()[0].percent, 100.0);

    ASSERT_TRUE(service->mkdir("web", "/out").is_ok());
    ASSERT_TRUE(service->rename("web", "/hello.txt", "/out/hello.txt").is_ok());
    auto listing = service->list_dir("web", "/out");
    ASSERT_TRUE(listing.is_ok());
    ASSERT_EQ(listing.value.size(), 1u);
    EXPECT_EQ(listing.value[0].name, "hello.txt");
    EXPECT_TRUE(service->remove("web", "/out/hello.txt").is_ok());
}

TEST_F(DeckServiceTest, ProfilesAndSynonyms) {
    auto profiles = service->profiles();
    ASSERT_EQ(profiles.size(), 1u);
    EXPECT_EQ(profiles[0].name, "web");

    auto syn = service->create_synonym("tail -f app.log");
    ASSERT_TRUE(syn.is_ok());
    EXPECT_EQ(syn.value, "tfa");
    EXPECT_EQ(service->resolve_synonym("tfa"), std::optional<std::string>("tail -f app.log"));
}

TEST_F(DeckServiceTest, ShutdownIsIdempotent) {
    ASSERT_TRUE(service->connect("web").is_ok());
    auto transport = dialer->last("web");
    service->shutdown();
    service->shutdown();
    EXPECT_TRUE(transport->closed.load());
}
