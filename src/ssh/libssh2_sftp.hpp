#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "channel.hpp"
#include "session.hpp"

typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;
typedef struct _LIBSSH2_SFTP_HANDLE LIBSSH2_SFTP_HANDLE;

class Libssh2Sftp : public SftpChannel, public std::enable_shared_from_this<Libssh2Sftp> {
public:
    Libssh2Sftp(std::shared_ptr<SshSession> session, LIBSSH2_SFTP* sftp);
    ~Libssh2Sftp() override;

    Result<RemoteFileInfo> stat(const std::string& path) override;
    Result<std::vector<RemoteFileInfo>> list(const std::string& path) override;
    Result<std::shared_ptr<RemoteFile>> open_read(const std::string& path) override;
    Result<std::shared_ptr<RemoteFile>> open_write(const std::string& path) override;
    Result<void> unlink(const std::string& path) override;
    Result<void> rmdir(const std::string& path) override;
    Result<void> rename(const std::string& from, const std::string& to) override;
    Result<void> mkdir(const std::string& path) override;
    void close() override;

    SshSession& session() { return *session_; }

    // "<what>: <sftp status>" for the last failed call.
    std::string error_message(const std::string& what);

private:
    std::shared_ptr<SshSession> session_;
    LIBSSH2_SFTP* sftp_;   // guarded by the session I/O mutex
    std::atomic<bool> closed_{false};

    Result<std::shared_ptr<RemoteFile>> open(const std::string& path, unsigned long flags, long mode);
};

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(std::shared_ptr<Libssh2Sftp> sftp, LIBSSH2_SFTP_HANDLE* handle);
    ~Libssh2RemoteFile() override;

    long read(char* buf, size_t len) override;
    bool write_all(const char* data, size_t len) override;
    void close() override;

private:
    std::shared_ptr<Libssh2Sftp> sftp_;
    LIBSSH2_SFTP_HANDLE* handle_;   // guarded by the session I/O mutex
};
