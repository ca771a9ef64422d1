#include <gtest/gtest.h>
#include <managers/connection_pool.hpp>
#include "mock_transport.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mock;

class ConnectionPoolTest : public ::testing::Test {
protected:
    std::shared_ptr<MockDialer> dialer = std::make_shared<MockDialer>();
};

TEST_F(ConnectionPoolTest, AcquireReusesLiveConnection) {
    ConnectionPool pool(dialer);
    auto a = pool.acquire(key_profile("web"));
    auto b = pool.acquire(key_profile("web"));

    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value, b.value);
    EXPECT_EQ(dialer->dials.load(), 1);
}

TEST_F(ConnectionPoolTest, ConcurrentAcquiresShareOneDial) {
    dialer->delay_ms = 100;
    ConnectionPool pool(dialer);

    std::vector<std::shared_ptr<Transport>> got(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < got.size(); i++) {
        threads.emplace_back([&, i] {
            auto r = pool.acquire(key_profile("db"));
            if (r.is_ok()) got[i] = r.value;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(dialer->dials.load(), 1);
    for (const auto& t : got) {
        ASSERT_NE(t, nullptr);
        EXPECT_EQ(t, got[0]);
    }
}

TEST_F(ConnectionPoolTest, DistinctProfilesGetDistinctConnections) {
    ConnectionPool pool(dialer);
    auto a = pool.acquire(key_profile("a"));
    auto b = pool.acquire(key_profile("b"));

    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.value, b.value);
    EXPECT_EQ(pool.list_active(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(ConnectionPoolTest, FailedDialIsNotPooled) {
    dialer->fail_with = ErrorKind::Authentication;
    ConnectionPool pool(dialer);

    auto r = pool.acquire(key_profile("web"));
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Authentication);
    EXPECT_TRUE(pool.list_active().empty());

    // No automatic retry, but the next acquire dials again
    dialer->fail_with = ErrorKind::None;
    EXPECT_TRUE(pool.acquire(key_profile("web")).is_ok());
    EXPECT_EQ(dialer->dials.load(), 2);
}

TEST_F(ConnectionPoolTest, ThrowingDialDoesNotWedgeProfile) {
    dialer->throws_left = 1;
    ConnectionPool pool(dialer);

    EXPECT_THROW(pool.acquire(key_profile("web")), std::runtime_error);
    EXPECT_TRUE(pool.list_active().empty());

    auto r = pool.acquire(key_profile("web"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(dialer->dials.load(), 2);
}

TEST_F(ConnectionPoolTest, WaitersSeeTheDialException) {
    dialer->throws_left = 1;
    dialer->delay_ms = 150;
    ConnectionPool pool(dialer);

    std::atomic<int> threw{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; i++) {
        threads.emplace_back([&] {
            try {
                pool.acquire(key_profile("db"));
            } catch (const std::runtime_error&) {
                ++threw;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(threw.load(), 3);
    EXPECT_EQ(dialer->dials.load(), 1);
    EXPECT_TRUE(pool.acquire(key_profile("db")).is_ok());
}

TEST_F(ConnectionPoolTest, ReleaseDuringDialDiscardsConnection) {
    dialer->delay_ms = 200;
    ConnectionPool pool(dialer);

    Result<std::shared_ptr<Transport>> r;
    std::thread connecting([&] { r = pool.acquire(key_profile("web")); });
    ASSERT_TRUE(eventually([&] { return dialer->dials.load() == 1; }));
    pool.release("web");
    connecting.join();

    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Dial);
    EXPECT_TRUE(pool.list_active().empty());
    auto dialed = dialer->last("web");
    ASSERT_NE(dialed, nullptr);
    EXPECT_TRUE(dialed->closed.load());

    // A later connect is not affected by the old release
    dialer->delay_ms = 0;
    EXPECT_TRUE(pool.acquire(key_profile("web")).is_ok());
    EXPECT_EQ(pool.list_active(), (std::vector<std::string>{"web"}));
}

TEST_F(ConnectionPoolTest, InvalidProfileNeverDials) {
    ConnectionPool pool(dialer);
    Profile p = key_profile("web");
    p.password = "secret";   // both auth methods

    auto r = pool.acquire(p);
    EXPECT_EQ(r.kind, ErrorKind::Config);
    EXPECT_EQ(dialer->dials.load(), 0);
}

TEST_F(ConnectionPoolTest, DeadConnectionIsReplaced) {
    ConnectionPool pool(dialer);
    auto first = pool.acquire(key_profile("web"));
    ASSERT_TRUE(first.is_ok());
    auto old = dialer->last("web");
    old->alive = false;

    auto second = pool.acquire(key_profile("web"));
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(second.value, first.value);
    EXPECT_TRUE(old->closed.load());
    EXPECT_EQ(dialer->dials.load(), 2);
}

TEST_F(ConnectionPoolTest, LookupWithoutAcquireFails) {
    ConnectionPool pool(dialer);
    auto r = pool.lookup("web");
    EXPECT_EQ(r.kind, ErrorKind::Dial);
}

TEST_F(ConnectionPoolTest, LookupDropsLostConnection) {
    ConnectionPool pool(dialer);
    ASSERT_TRUE(pool.acquire(key_profile("web")).is_ok());
    dialer->last("web")->alive = false;

    auto r = pool.lookup("web");
    EXPECT_EQ(r.kind, ErrorKind::Dial);
    EXPECT_TRUE(pool.list_active().empty());
}

TEST_F(ConnectionPoolTest, ReleaseClosesAndForgets) {
    ConnectionPool pool(dialer);
    ASSERT_TRUE(pool.acquire(key_profile("web")).is_ok());
    auto t = dialer->last("web");

    pool.release("web");
    EXPECT_TRUE(t->closed.load());
    EXPECT_TRUE(pool.list_active().empty());

    // Unknown key is a no-op
    pool.release("missing");
}

TEST_F(ConnectionPoolTest, SweepClosesIdleConnections) {
    PoolSettings settings;
    settings.idle_timeout_secs = 0;
    ConnectionPool pool(dialer, settings);
    ASSERT_TRUE(pool.acquire(key_profile("web")).is_ok());
    auto t = dialer->last("web");

    EXPECT_EQ(pool.sweep_idle(), 1u);
    EXPECT_TRUE(t->closed.load());
    EXPECT_TRUE(pool.list_active().empty());
}

TEST_F(ConnectionPoolTest, SweepKeepsRecentlyUsed) {
    ConnectionPool pool(dialer);
    ASSERT_TRUE(pool.acquire(key_profile("web")).is_ok());

    EXPECT_EQ(pool.sweep_idle(), 0u);
    EXPECT_EQ(pool.list_active().size(), 1u);
    EXPECT_FALSE(dialer->last("web")->closed.load());
}

TEST_F(ConnectionPoolTest, SweepRemovesDeadSurvivors) {
    ConnectionPool pool(dialer);
    ASSERT_TRUE(pool.acquire(key_profile("web")).is_ok());
    dialer->last("web")->alive = false;

    EXPECT_EQ(pool.sweep_idle(), 1u);
    EXPECT_TRUE(pool.list_active().empty());
}

TEST_F(ConnectionPoolTest, BackgroundSweeperClosesIdle) {
    PoolSettings settings;
    settings.idle_timeout_secs = 0;
    settings.sweep_interval_secs = 1;
    ConnectionPool pool(dialer, settings);
    ASSERT_TRUE(pool.acquire(key_profile("web")).is_ok());

    pool.start_sweeper();
    EXPECT_TRUE(eventually([&] { return pool.list_active().empty(); }, 3000ms));
    pool.stop_sweeper();
}

TEST_F(ConnectionPoolTest, CloseAllClosesEverything) {
    ConnectionPool pool(dialer);
    ASSERT_TRUE(pool.acquire(key_profile("a")).is_ok());
    ASSERT_TRUE(pool.acquire(key_profile("b")).is_ok());
    auto a = dialer->last("a");
    auto b = dialer->last("b");

    pool.close_all();
    EXPECT_TRUE(a->closed.load());
    EXPECT_TRUE(b->closed.load());
    EXPECT_TRUE(pool.list_active().empty());
}
