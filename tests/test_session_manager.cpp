#include <gtest/gtest.h>
#include <managers/session_manager.hpp>
#include "mock_transport.hpp"
#include <future>

using namespace mock;

class SessionManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<MockDialer> dialer = std::make_shared<MockDialer>();
    ConnectionPool pool{dialer};
    RecordingSink sink;
    std::unique_ptr<SessionManager> sessions;
    std::shared_ptr<MockTransport> transport;

    void SetUp() override {
        SessionSettings settings;
        settings.stop_grace_ms = 200;
        sessions = std::make_unique<SessionManager>(pool, sink, settings);
        ASSERT_TRUE(pool.acquire(key_profile("web")).is_ok());
        transport = dialer->last("web");
    }

    void TearDown() override {
        sessions->shutdown();
    }

    std::shared_ptr<MockExecChannel> queue_channel() {
        auto ch = std::make_shared<MockExecChannel>();
        transport->queue_exec(ch);
        return ch;
    }

    SessionEvent last_event(const std::string& profile = "web") {
        auto events = sink.session_events(profile);
        return events.empty() ? SessionEvent{} : events.back();
    }

    bool becomes_idle(const std::string& profile = "web") {
        return eventually([&] { return sessions->state(profile) == SessionState::Idle; });
    }
};

TEST_F(SessionManagerTest, StreamsOutputThenCompletes) {
    auto r = sessions->execute("web", "  uptime  ");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "uptime");

    ASSERT_TRUE(sink.wait_for_terminal("web"));
    EXPECT_EQ(sink.text("web", SessionEventType::Stdout), "ran: uptime\n");
    EXPECT_EQ(last_event().type, SessionEventType::Info);
    EXPECT_EQ(last_event().data, "Command finished successfully");
    EXPECT_TRUE(becomes_idle());
    EXPECT_EQ(transport->commands(), std::vector<std::string>{"uptime"});
}

TEST_F(SessionManagerTest, ClearOpensNoChannel) {
    auto r = sessions->execute("web", "clear");
    ASSERT_TRUE(r.is_ok());

    auto events = sink.session_events("web");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, SessionEventType::Clear);
    EXPECT_EQ(transport->exec_opens.load(), 0);
    EXPECT_EQ(sessions->state("web"), SessionState::Idle);
}

TEST_F(SessionManagerTest, EmptyCommandRejected) {
    auto r = sessions->execute("web", "   ");
    EXPECT_EQ(r.kind, ErrorKind::Config);
    EXPECT_TRUE(sink.session_events().empty());
}

TEST_F(SessionManagerTest, NonZeroExitEndsWithOneErrorAfterOutput) {
    auto ch = queue_channel();
    ch->stdout_chunks = {"a", "b"};
    ch->stderr_chunks = {"warn\n"};
    ch->exit_code = 2;

    ASSERT_TRUE(sessions->execute("web", "make").is_ok());
    ASSERT_TRUE(sink.wait_for_terminal("web"));
    ASSERT_TRUE(becomes_idle());

    EXPECT_EQ(sink.text("web", SessionEventType::Stdout), "ab");
    EXPECT_EQ(sink.text("web", SessionEventType::Stderr), "warn\n");
    EXPECT_EQ(sink.terminal_count("web"), 1u);
    EXPECT_EQ(last_event().type, SessionEventType::Error);
    EXPECT_EQ(last_event().data, "Command exited with code 2");
}

TEST_F(SessionManagerTest, SignalTerminationReported) {
    auto ch = queue_channel();
    ch->exit_signal = "KILL";

    ASSERT_TRUE(sessions->execute("web", "sleep 100").is_ok());
    ASSERT_TRUE(sink.wait_for_terminal("web"));
    EXPECT_EQ(last_event().data, "Command terminated by signal KILL");
}

TEST_F(SessionManagerTest, UnknownExitStatusIsAnError) {
    auto ch = queue_channel();
    ch->status_lost = true;

    ASSERT_TRUE(sessions->execute("web", "true").is_ok());
    ASSERT_TRUE(sink.wait_for_terminal("web"));
    EXPECT_EQ(last_event().type, SessionEventType::Error);
    EXPECT_EQ(last_event().data, "Command failed: exit status unavailable (connection closed)");
}

TEST_F(SessionManagerTest, ReadFailureReportedBeforeTerminalEvent) {
    auto ch = queue_channel();
    ch->stdout_chunks = {"partial"};
    ch->read_error = true;

    ASSERT_TRUE(sessions->execute("web", "cat big").is_ok());
    ASSERT_TRUE(sink.wait_for_terminal("web"));

    bool saw_read_error = false;
    for (const auto& e : sink.session_events("web")) {
        if (e.type == SessionEventType::Error && e.data == "Error reading stdout: channel read failed") {
            saw_read_error = true;
        }
    }
    EXPECT_TRUE(saw_read_error);
    EXPECT_EQ(sink.terminal_count("web"), 1u);
    EXPECT_TRUE(RecordingSink::is_terminal(last_event()));
}

TEST_F(SessionManagerTest, ThrowingStderrReaderStillEndsCommand) {
    auto ch = queue_channel();
    ch->stdout_chunks = {"out\n"};
    ch->stderr_chunks = {"warn\n"};
    ch->stderr_throws = true;

    ASSERT_TRUE(sessions->execute("web", "make").is_ok());
    ASSERT_TRUE(sink.wait_for_terminal("web"));

    EXPECT_EQ(sink.text("web", SessionEventType::Stdout), "out\n");
    EXPECT_EQ(sink.text("web", SessionEventType::Stderr), "warn\n");
    EXPECT_EQ(sink.terminal_count("web"), 1u);
    EXPECT_TRUE(RecordingSink::is_terminal(last_event()));
    EXPECT_TRUE(becomes_idle());

    // Profile is usable again
    ASSERT_TRUE(sessions->execute("web", "true").is_ok());
    EXPECT_TRUE(eventually([&] { return sink.terminal_count("web") == 2u; }));
}

TEST_F(SessionManagerTest, SecondExecuteWhileRunningIsBusy) {
    auto ch = queue_channel();
    ch->hang = true;

    ASSERT_TRUE(sessions->execute("web", "tail -f log").is_ok());
    EXPECT_EQ(sessions->state("web"), SessionState::Running);

    auto busy = sessions->execute("web", "ls");
    EXPECT_EQ(busy.kind, ErrorKind::SessionBusy);
    EXPECT_EQ(transport->exec_opens.load(), 1);

    ASSERT_TRUE(sessions->stop("web").is_ok());
}

TEST_F(SessionManagerTest, StopWithoutCommandFails) {
    auto r = sessions->stop("web");
    EXPECT_EQ(r.kind, ErrorKind::NoActiveSession);
}

TEST_F(SessionManagerTest, StopInterruptsAndProfileIsReusable) {
    auto ch = queue_channel();
    ch->hang = true;
    ASSERT_TRUE(sessions->execute("web", "top").is_ok());

    ASSERT_TRUE(sessions->stop("web").is_ok());
    EXPECT_EQ(ch->signals(), std::vector<std::string>{"INT"});
    EXPECT_EQ(sessions->state("web"), SessionState::Idle);
    EXPECT_EQ(sink.terminal_count("web"), 1u);
    EXPECT_EQ(last_event().type, SessionEventType::Info);
    EXPECT_EQ(last_event().data, "Command stopped");

    ASSERT_TRUE(sessions->execute("web", "ls").is_ok());
    ASSERT_TRUE(sink.wait_for_terminal("web", 2));
    EXPECT_EQ(last_event().data, "Command finished successfully");
}

TEST_F(SessionManagerTest, StopClosesChannelWhenSignalIgnored) {
    auto ch = queue_channel();
    ch->hang = true;
    ch->honors_signal = false;
    ASSERT_TRUE(sessions->execute("web", "stubborn").is_ok());

    auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(sessions->stop("web").is_ok());
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(ch->closed());
    EXPECT_GE(elapsed, 200ms);
    EXPECT_EQ(last_event().data, "Command stopped");
    EXPECT_EQ(sessions->state("web"), SessionState::Idle);
}

TEST_F(SessionManagerTest, StopWhileChannelOpening) {
    transport->exec_open_delay_ms = 300;
    auto pending = std::async(std::launch::async, [&] { return sessions->execute("web", "slow"); });

    ASSERT_TRUE(eventually([&] { return sessions->state("web") == SessionState::Starting; }));
    ASSERT_TRUE(sessions->stop("web").is_ok());

    auto r = pending.get();
    EXPECT_TRUE(r.is_ok());
    EXPECT_EQ(sessions->state("web"), SessionState::Idle);
    EXPECT_EQ(sink.terminal_count("web"), 1u);
    EXPECT_EQ(last_event().data, "Command stopped");
}

TEST_F(SessionManagerTest, ExecuteWithoutConnectionFails) {
    auto r = sessions->execute("other", "ls");
    EXPECT_EQ(r.kind, ErrorKind::Dial);
    EXPECT_EQ(sessions->state("other"), SessionState::Idle);
}

TEST_F(SessionManagerTest, RefusedChannelLeavesProfileIdle) {
    transport->exec_error = ErrorKind::Protocol;
    auto r = sessions->execute("web", "ls");
    EXPECT_EQ(r.kind, ErrorKind::Protocol);
    EXPECT_EQ(sessions->state("web"), SessionState::Idle);
}

TEST_F(SessionManagerTest, ProfilesRunIndependently) {
    ASSERT_TRUE(pool.acquire(key_profile("db")).is_ok());
    auto db = dialer->last("db");
    auto web_ch = queue_channel();
    web_ch->hang = true;
    auto db_ch = std::make_shared<MockExecChannel>();
    db_ch->hang = true;
    db->queue_exec(db_ch);

    ASSERT_TRUE(sessions->execute("web", "a").is_ok());
    ASSERT_TRUE(sessions->execute("db", "b").is_ok());
    auto active = sessions->active_profiles();
    EXPECT_EQ(active.size(), 2u);

    ASSERT_TRUE(sessions->stop("web").is_ok());
    EXPECT_EQ(sessions->state("db"), SessionState::Running);
    ASSERT_TRUE(sessions->stop("db").is_ok());
}

TEST_F(SessionManagerTest, StopAllForceClosesWithoutGrace) {
    auto ch = queue_channel();
    ch->hang = true;
    ch->honors_signal = false;
    ASSERT_TRUE(sessions->execute("web", "server").is_ok());

    sessions->stop_all("web");
    EXPECT_TRUE(ch->closed());
    EXPECT_TRUE(ch->signals().empty());
    EXPECT_EQ(sessions->state("web"), SessionState::Idle);
    EXPECT_EQ(last_event().data, "Command stopped");
}
