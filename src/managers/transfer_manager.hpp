#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/channel.hpp>
#include "connection_pool.hpp"
#include "event_queue.hpp"

// SFTP file operations over pooled connections. Every call opens and closes
// its own SFTP channel. Partial files are left in place on failure.
class TransferManager {
public:
    TransferManager(ConnectionPool& pool, EventSink& sink, TransferSettings settings = {});

    // Bytes copied. LocalIO / RemoteIO / Dial errors.
    Result<uint64_t> upload(const std::string& profile,
                            const std::string& local_path, const std::string& remote_path);
    Result<uint64_t> download(const std::string& profile,
                              const std::string& remote_path, const std::string& local_path);

    // Directories first, then by name; "." and ".." omitted.
    Result<std::vector<RemoteFileInfo>> list(const std::string& profile, const std::string& remote_path);

    // File or empty directory.
    Result<void> remove(const std::string& profile, const std::string& remote_path);
    Result<void> rename(const std::string& profile, const std::string& from, const std::string& to);
    Result<void> mkdir(const std::string& profile, const std::string& remote_path);

private:
    ConnectionPool& pool_;
    EventSink& sink_;
    TransferSettings settings_;

    Result<std::shared_ptr<SftpChannel>> open_sftp(const std::string& profile);
    void progress(TransferOp op, const std::string& filename, uint64_t done, uint64_t total);
};
