#include <gtest/gtest.h>
#include <managers/history_store.hpp>
#include <core/constants.hpp>
#include <filesystem>

namespace fs = std::filesystem;

class HistoryStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sshdeck_history_test";
        fs::remove_all(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(HistoryStoreTest, NewestFirst) {
    HistoryStore store(test_dir);
    ASSERT_TRUE(store.add("web", "ls").is_ok());
    ASSERT_TRUE(store.add("web", "pwd").is_ok());
    ASSERT_TRUE(store.add("web", "whoami").is_ok());

    auto r = store.get("web");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, (std::vector<std::string>{"whoami", "pwd", "ls"}));
}

TEST_F(HistoryStoreTest, MissingHistoryIsEmpty) {
    auto r = HistoryStore(test_dir).get("never");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

TEST_F(HistoryStoreTest, ProfilesAreSeparate) {
    HistoryStore store(test_dir);
    ASSERT_TRUE(store.add("a", "one").is_ok());
    ASSERT_TRUE(store.add("b", "two").is_ok());

    EXPECT_EQ(store.get("a").value, std::vector<std::string>{"one"});
    EXPECT_EQ(store.get("b").value, std::vector<std::string>{"two"});
    EXPECT_TRUE(fs::exists(test_dir / "a_history.txt"));
}

TEST_F(HistoryStoreTest, CappedAtMaxSize) {
    HistoryStore store(test_dir);
    for (size_t i = 0; i < MAX_HISTORY_SIZE + 5; i++) {
        ASSERT_TRUE(store.add("web", "cmd" + std::to_string(i)).is_ok());
    }

    auto r = store.get("web");
    ASSERT_EQ(r.value.size(), MAX_HISTORY_SIZE);
    EXPECT_EQ(r.value.front(), "cmd" + std::to_string(MAX_HISTORY_SIZE + 4));
    EXPECT_EQ(r.value.back(), "cmd5");
}

TEST_F(HistoryStoreTest, BlankCommandsNotRecorded) {
    HistoryStore store(test_dir);
    ASSERT_TRUE(store.add("web", "   ").is_ok());
    EXPECT_TRUE(store.get("web").value.empty());
}

TEST_F(HistoryStoreTest, SynonymIsAcronym) {
    HistoryStore store(test_dir);
    auto r = store.create_synonym("git status --short");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "gs-");
    EXPECT_EQ(store.resolve_synonym("gs-"), std::optional<std::string>("git status --short"));
}

TEST_F(HistoryStoreTest, SingleWordGetsNoSynonym) {
    HistoryStore store(test_dir);
    auto r = store.create_synonym("htop");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "");
    EXPECT_FALSE(store.resolve_synonym("h").has_value());
}

TEST_F(HistoryStoreTest, CollisionsGetNumericSuffix) {
    HistoryStore store(test_dir);
    EXPECT_EQ(store.create_synonym("ls -la").value, "l-");
    EXPECT_EQ(store.create_synonym("less -R").value, "l-1");
    EXPECT_EQ(store.create_synonym("lsof -i").value, "l-2");
    EXPECT_EQ(store.resolve_synonym("l-1"), std::optional<std::string>("less -R"));
}

TEST_F(HistoryStoreTest, SynonymsPersist) {
    {
        HistoryStore store(test_dir);
        ASSERT_EQ(store.create_synonym("docker compose up").value, "dcu");
    }
    HistoryStore reopened(test_dir);
    EXPECT_EQ(reopened.resolve_synonym("dcu"), std::optional<std::string>("docker compose up"));
    EXPECT_EQ(reopened.create_synonym("du compose usage").value, "dcu1");
}
