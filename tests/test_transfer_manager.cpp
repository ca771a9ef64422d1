#include <gtest/gtest.h>
#include <managers/transfer_manager.hpp>
#include "mock_transport.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace mock;

class TransferManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<MockDialer> dialer = std::make_shared<MockDialer>();
    ConnectionPool pool{dialer};
    RecordingSink sink;
    std::unique_ptr<TransferManager> transfers;
    std::shared_ptr<MockTransport> transport;
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sshdeck_transfer_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        TransferSettings settings;
        settings.chunk_size = 4096;
        transfers = std::make_unique<TransferManager>(pool, sink, settings);
        ASSERT_TRUE(pool.acquire(key_profile("web")).is_ok());
        transport = dialer->last("web");
        transport->fs->put_dir("/srv");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_local(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::ofstream(path, std::ios::binary) << content;
        return path;
    }

    static std::string read_local(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static std::string pattern(size_t n) {
        std::string s(n, '\0');
        for (size_t i = 0; i < n; i++) s[i] = static_cast<char>((i * 31 + 7) % 251);
        return s;
    }

    void expect_progress_sane(TransferOp op, const std::string& filename) {
        auto events = sink.transfer_events();
        ASSERT_FALSE(events.empty());
        double last = -1;
        for (const auto& e : events) {
            EXPECT_EQ(e.operation, op);
            EXPECT_EQ(e.filename, filename);
            EXPECT_GE(e.percent, last);
            last = e.percent;
        }
        EXPECT_DOUBLE_EQ(events.back().percent, 100.0);
    }
};

TEST_F(TransferManagerTest, UploadThenDownloadIsByteIdentical) {
    std::string content = pattern(10000);
    auto local = write_local("data.bin", content);

    auto up = transfers->upload("web", local.string(), "/srv/data.bin");
    ASSERT_TRUE(up.is_ok()) << up.error;
    EXPECT_EQ(up.value, content.size());
    EXPECT_EQ(transport->fs->contents("/srv/data.bin"), content);
    expect_progress_sane(TransferOp::Upload, "data.bin");
    EXPECT_EQ(sink.transfer_events().size(), 3u);   // 4096 + 4096 + 1808

    auto back = test_dir / "back.bin";
    auto down = transfers->download("web", "/srv/data.bin", back.string());
    ASSERT_TRUE(down.is_ok()) << down.error;
    EXPECT_EQ(down.value, content.size());
    EXPECT_EQ(read_local(back), content);
    EXPECT_EQ(transport->open_sftp_channels.load(), 0);
}

TEST_F(TransferManagerTest, DownloadProgressEndsAtHundred) {
    transport->fs->put_file("/srv/log.txt", pattern(9000));
    auto out = test_dir / "log.txt";

    ASSERT_TRUE(transfers->download("web", "/srv/log.txt", out.string()).is_ok());
    expect_progress_sane(TransferOp::Download, "log.txt");
    EXPECT_EQ(sink.transfer_events().back().bytes_transferred, 9000u);
    EXPECT_EQ(sink.transfer_events().back().total_bytes, 9000u);
}

TEST_F(TransferManagerTest, EmptyFileReportsOneCompleteEvent) {
    auto local = write_local("empty", "");

    auto r = transfers->upload("web", local.string(), "/srv/empty");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, 0u);
    EXPECT_TRUE(transport->fs->exists("/srv/empty"));

    auto events = sink.transfer_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_DOUBLE_EQ(events[0].percent, 100.0);
}

TEST_F(TransferManagerTest, MissingLocalFileIsLocalIO) {
    auto r = transfers->upload("web", (test_dir / "nope").string(), "/srv/nope");
    EXPECT_EQ(r.kind, ErrorKind::LocalIO);
    EXPECT_TRUE(sink.transfer_events().empty());
}

TEST_F(TransferManagerTest, MissingRemoteFileIsRemoteIO) {
    auto r = transfers->download("web", "/srv/nope", (test_dir / "nope").string());
    EXPECT_EQ(r.kind, ErrorKind::RemoteIO);
    EXPECT_EQ(transport->open_sftp_channels.load(), 0);
}

TEST_F(TransferManagerTest, DownloadingDirectoryFails) {
    auto r = transfers->download("web", "/srv", (test_dir / "srv").string());
    EXPECT_EQ(r.kind, ErrorKind::RemoteIO);
}

TEST_F(TransferManagerTest, UnwritableLocalTargetIsLocalIO) {
    transport->fs->put_file("/srv/a", "abc");
    auto r = transfers->download("web", "/srv/a", (test_dir / "missing_dir" / "a").string());
    EXPECT_EQ(r.kind, ErrorKind::LocalIO);
}

TEST_F(TransferManagerTest, RemoteWriteFailureIsRemoteIO) {
    transport->fs->fail_writes = true;
    auto local = write_local("x", "payload");
    auto r = transfers->upload("web", local.string(), "/srv/x");
    EXPECT_EQ(r.kind, ErrorKind::RemoteIO);
    EXPECT_EQ(transport->open_sftp_channels.load(), 0);
}

TEST_F(TransferManagerTest, StalledRemoteReadIsRemoteIO) {
    transport->fs->put_file("/srv/big.bin", pattern(10000));
    transport->fs->fail_reads_after = 4096;
    auto out = test_dir / "big.bin";

    auto r = transfers->download("web", "/srv/big.bin", out.string());
    EXPECT_EQ(r.kind, ErrorKind::RemoteIO);
    ASSERT_FALSE(sink.transfer_events().empty());
    EXPECT_LT(sink.transfer_events().back().percent, 100.0);
    EXPECT_EQ(transport->open_sftp_channels.load(), 0);
}

TEST_F(TransferManagerTest, NotConnectedIsDialError) {
    auto local = write_local("x", "payload");
    EXPECT_EQ(transfers->upload("other", local.string(), "/srv/x").kind, ErrorKind::Dial);
    EXPECT_EQ(transfers->list("other", "/").kind, ErrorKind::Dial);
}

TEST_F(TransferManagerTest, ListPutsDirectoriesFirst) {
    transport->fs->put_file("/srv/b.txt", "1");
    transport->fs->put_dir("/srv/zdir");
    transport->fs->put_file("/srv/a.txt", "22");

    auto r = transfers->list("web", "/srv");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 3u);
    EXPECT_EQ(r.value[0].name, "zdir");
    EXPECT_TRUE(r.value[0].is_dir);
    EXPECT_EQ(r.value[1].name, "a.txt");
    EXPECT_EQ(r.value[1].size, 2u);
    EXPECT_EQ(r.value[2].name, "b.txt");
}

TEST_F(TransferManagerTest, RemoveHandlesFilesAndEmptyDirs) {
    transport->fs->put_file("/srv/f", "x");
    transport->fs->put_dir("/srv/d");

    EXPECT_TRUE(transfers->remove("web", "/srv/f").is_ok());
    EXPECT_TRUE(transfers->remove("web", "/srv/d").is_ok());
    EXPECT_FALSE(transport->fs->exists("/srv/f"));
    EXPECT_FALSE(transport->fs->exists("/srv/d"));
    EXPECT_EQ(transfers->remove("web", "/srv/f").kind, ErrorKind::RemoteIO);
}

TEST_F(TransferManagerTest, RemoveNonEmptyDirFails) {
    transport->fs->put_dir("/srv/d");
    transport->fs->put_file("/srv/d/f", "x");
    EXPECT_EQ(transfers->remove("web", "/srv/d").kind, ErrorKind::RemoteIO);
}

TEST_F(TransferManagerTest, RenameAndMkdir) {
    transport->fs->put_file("/srv/old", "x");

    ASSERT_TRUE(transfers->rename("web", "/srv/old", "/srv/new").is_ok());
    EXPECT_EQ(transport->fs->contents("/srv/new"), "x");
    EXPECT_FALSE(transport->fs->exists("/srv/old"));

    ASSERT_TRUE(transfers->mkdir("web", "/srv/logs").is_ok());
    EXPECT_EQ(transfers->mkdir("web", "/srv/logs").kind, ErrorKind::RemoteIO);
    EXPECT_EQ(transport->open_sftp_channels.load(), 0);
}
