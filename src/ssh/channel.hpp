#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <core/types.hpp>

// Sub-channels of one transport connection. Implementations serialize their
// I/O against the owning transport, so instances may be used from different
// threads, one reader per stream.
//
// Read calls return a byte count, or CHANNEL_EOF / CHANNEL_ERROR /
// CHANNEL_TIMEOUT (core/constants.hpp).

// Bidirectional byte stream (direct-tcpip or forwarded-tcpip).
class StreamChannel {
public:
    virtual ~StreamChannel() = default;

    virtual long read(char* buf, size_t len, int timeout_ms) = 0;
    virtual bool write_all(const char* data, size_t len) = 0;

    // Closes the channel; a concurrent read returns CHANNEL_EOF or CHANNEL_ERROR.
    virtual void close() = 0;
};

enum class ChannelStream { Stdout, Stderr };

struct ExitStatus {
    bool known = false;       // false when the channel was torn down first
    int code = 0;
    std::string signal;       // e.g. "INT" when killed by a signal
};

// A remote command started with an exec request.
class ExecChannel {
public:
    virtual ~ExecChannel() = default;

    virtual long read(ChannelStream stream, char* buf, size_t len, int timeout_ms) = 0;

    // Deliver a signal by name ("INT", "TERM"). False if the request fails.
    virtual bool send_signal(const std::string& name) = 0;

    // Wait for the remote side to close the channel and collect its status.
    virtual ExitStatus wait_exit(int timeout_ms) = 0;

    virtual void close() = 0;
};

// A remote port the server listens on for us (tcpip-forward).
class RemoteListener {
public:
    virtual ~RemoteListener() = default;

    // Ok(nullptr) when nothing arrived before the timeout.
    virtual Result<std::shared_ptr<StreamChannel>> accept(int timeout_ms) = 0;

    virtual int bound_port() const = 0;
    virtual void close() = 0;
};

// An open remote file handle.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Bytes read, 0 at end of file, negative on error.
    virtual long read(char* buf, size_t len) = 0;
    virtual bool write_all(const char* data, size_t len) = 0;
    virtual void close() = 0;
};

// An SFTP subsystem session. All failures are ErrorKind::RemoteIO.
class SftpChannel {
public:
    virtual ~SftpChannel() = default;

    virtual Result<RemoteFileInfo> stat(const std::string& path) = 0;
    virtual Result<std::vector<RemoteFileInfo>> list(const std::string& path) = 0;
    virtual Result<std::shared_ptr<RemoteFile>> open_read(const std::string& path) = 0;

    // Create or truncate.
    virtual Result<std::shared_ptr<RemoteFile>> open_write(const std::string& path) = 0;

    virtual Result<void> unlink(const std::string& path) = 0;
    virtual Result<void> rmdir(const std::string& path) = 0;
    virtual Result<void> rename(const std::string& from, const std::string& to) = 0;
    virtual Result<void> mkdir(const std::string& path) = 0;

    virtual void close() = 0;
};
