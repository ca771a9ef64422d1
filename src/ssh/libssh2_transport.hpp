#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "transport.hpp"
#include "session.hpp"

typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
typedef struct _LIBSSH2_LISTENER LIBSSH2_LISTENER;

// ── Channels ────────────────────────────────────────────────
// Each channel keeps its SshSession alive; the libssh2 handle is released in
// the destructor, never by close(), so a reader blocked in another thread
// only ever sees an error or EOF.

class Libssh2ExecChannel : public ExecChannel {
public:
    Libssh2ExecChannel(std::shared_ptr<SshSession> session, LIBSSH2_CHANNEL* channel);
    ~Libssh2ExecChannel() override;

    long read(ChannelStream stream, char* buf, size_t len, int timeout_ms) override;
    bool send_signal(const std::string& name) override;
    ExitStatus wait_exit(int timeout_ms) override;
    void close() override;

private:
    std::shared_ptr<SshSession> session_;
    LIBSSH2_CHANNEL* channel_;
    std::atomic<bool> closed_{false};
};

class Libssh2StreamChannel : public StreamChannel {
public:
    Libssh2StreamChannel(std::shared_ptr<SshSession> session, LIBSSH2_CHANNEL* channel);
    ~Libssh2StreamChannel() override;

    long read(char* buf, size_t len, int timeout_ms) override;
    bool write_all(const char* data, size_t len) override;
    void close() override;

private:
    std::shared_ptr<SshSession> session_;
    LIBSSH2_CHANNEL* channel_;
    std::atomic<bool> closed_{false};
};

class Libssh2RemoteListener : public RemoteListener {
public:
    Libssh2RemoteListener(std::shared_ptr<SshSession> session, LIBSSH2_LISTENER* listener,
                          int bound_port);
    ~Libssh2RemoteListener() override;

    Result<std::shared_ptr<StreamChannel>> accept(int timeout_ms) override;
    int bound_port() const override { return bound_port_; }
    void close() override;

private:
    std::shared_ptr<SshSession> session_;
    LIBSSH2_LISTENER* listener_;   // guarded by the session I/O mutex
    int bound_port_;
    std::atomic<bool> closed_{false};
};

// ── Transport ───────────────────────────────────────────────

class Libssh2Transport : public Transport {
public:
    explicit Libssh2Transport(std::shared_ptr<SshSession> session);
    ~Libssh2Transport() override;

    Result<std::shared_ptr<ExecChannel>> open_exec(const std::string& command) override;
    Result<std::shared_ptr<StreamChannel>> open_direct_tcpip(const std::string& host, int port) override;
    Result<std::shared_ptr<RemoteListener>> listen_remote(const std::string& bind_host, int port) override;
    Result<std::shared_ptr<SftpChannel>> open_sftp() override;
    bool is_alive() override;
    void close() override;
    std::string describe() const override;

private:
    std::shared_ptr<SshSession> session_;

    // Dial error when the session is gone, otherwise Protocol.
    ErrorKind open_failure_kind() const;
};

class Libssh2Dialer : public TransportDialer {
public:
    explicit Libssh2Dialer(DialSettings settings);

    Result<std::shared_ptr<Transport>> dial(const Profile& profile) override;

private:
    DialSettings settings_;
};
