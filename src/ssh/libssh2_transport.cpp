#include "libssh2_transport.hpp"
#include "libssh2_sftp.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <algorithm>
#include <chrono>

using Clock = std::chrono::steady_clock;

static constexpr int OPEN_TIMEOUT_MS = CHANNEL_OPEN_TIMEOUT_SECS * 1000;
static constexpr int TEARDOWN_TIMEOUT_MS = 1000;

// Milliseconds left until deadline (never negative).
static int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Shared read loop for exec and stream channels.
static long channel_read(SshSession& session, LIBSSH2_CHANNEL* channel, int stream_id,
                         const std::atomic<bool>& closed,
                         char* buf, size_t len, int timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (closed.load()) return CHANNEL_EOF;

        bool eof = false;
        int n = session.try_call([&](LIBSSH2_SESSION*) {
            ssize_t r = libssh2_channel_read_ex(channel, stream_id, buf, len);
            if (r == LIBSSH2_ERROR_EAGAIN) eof = libssh2_channel_eof(channel) != 0;
            return static_cast<int>(r);
        });

        if (n > 0) return n;
        if (n == 0 || eof) return CHANNEL_EOF;
        if (n != LIBSSH2_ERROR_EAGAIN) return closed.load() ? CHANNEL_EOF : CHANNEL_ERROR;

        int left = remaining_ms(deadline);
        if (left == 0) return CHANNEL_TIMEOUT;
        session.wait_socket(std::min(left, EAGAIN_BACKOFF_MS));
    }
}

// Mark closed and send a channel close. The handle stays allocated.
static void channel_close(SshSession& session, LIBSSH2_CHANNEL* channel,
                          std::atomic<bool>& closed) {
    if (closed.exchange(true)) return;
    session.teardown([channel](LIBSSH2_SESSION*) {
        return libssh2_channel_close(channel);
    }, TEARDOWN_TIMEOUT_MS);
}

static void channel_free(SshSession& session, LIBSSH2_CHANNEL* channel) {
    int rc = session.teardown([channel](LIBSSH2_SESSION*) {
        return libssh2_channel_free(channel);
    }, TEARDOWN_TIMEOUT_MS);
    if (rc != 0) {
        sshdeck_log(fmt::format("libssh2: channel_free failed ({}), handle left to the session", rc));
    }
}

// ── Libssh2ExecChannel ──────────────────────────────────────

Libssh2ExecChannel::Libssh2ExecChannel(std::shared_ptr<SshSession> session, LIBSSH2_CHANNEL* channel)
    : session_(std::move(session)), channel_(channel) {}

Libssh2ExecChannel::~Libssh2ExecChannel() {
    close();
    channel_free(*session_, channel_);
}

long Libssh2ExecChannel::read(ChannelStream stream, char* buf, size_t len, int timeout_ms) {
    int id = stream == ChannelStream::Stderr ? SSH_EXTENDED_DATA_STDERR : 0;
    return channel_read(*session_, channel_, id, closed_, buf, len, timeout_ms);
}

bool Libssh2ExecChannel::send_signal(const std::string& name) {
    if (closed_.load()) return false;
#if LIBSSH2_VERSION_NUM >= 0x010b01
    int rc = session_->call([&](LIBSSH2_SESSION*) {
        return libssh2_channel_signal_ex(channel_, name.c_str(), name.size());
    }, OPEN_TIMEOUT_MS);
    return rc == 0;
#else
    // Signal requests need libssh2 >= 1.11.1; callers fall back to closing
    (void)name;
    return false;
#endif
}

ExitStatus Libssh2ExecChannel::wait_exit(int timeout_ms) {
    ExitStatus status;
    if (closed_.load()) return status;

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    int rc = session_->call([this](LIBSSH2_SESSION*) {
        return libssh2_channel_close(channel_);
    }, remaining_ms(deadline));
    if (rc == 0) {
        rc = session_->call([this](LIBSSH2_SESSION*) {
            return libssh2_channel_wait_closed(channel_);
        }, remaining_ms(deadline));
    }
    if (rc != 0 || closed_.load()) return status;

    session_->try_call([&](LIBSSH2_SESSION* s) {
        status.code = libssh2_channel_get_exit_status(channel_);
        char* sig = nullptr;
        size_t sig_len = 0;
        libssh2_channel_get_exit_signal(channel_, &sig, &sig_len,
                                        nullptr, nullptr, nullptr, nullptr);
        if (sig) {
            status.signal.assign(sig, sig_len);
            libssh2_free(s, sig);
        }
        return 0;
    });
    status.known = true;
    return status;
}

void Libssh2ExecChannel::close() {
    channel_close(*session_, channel_, closed_);
}

// ── Libssh2StreamChannel ────────────────────────────────────

Libssh2StreamChannel::Libssh2StreamChannel(std::shared_ptr<SshSession> session, LIBSSH2_CHANNEL* channel)
    : session_(std::move(session)), channel_(channel) {}

Libssh2StreamChannel::~Libssh2StreamChannel() {
    close();
    channel_free(*session_, channel_);
}

long Libssh2StreamChannel::read(char* buf, size_t len, int timeout_ms) {
    return channel_read(*session_, channel_, 0, closed_, buf, len, timeout_ms);
}

bool Libssh2StreamChannel::write_all(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        if (closed_.load()) return false;
        int w = session_->try_call([&](LIBSSH2_SESSION*) {
            return static_cast<int>(libssh2_channel_write(channel_, data + sent, len - sent));
        });
        if (w == LIBSSH2_ERROR_EAGAIN) {
            session_->wait_socket(EAGAIN_BACKOFF_MS);
            continue;
        }
        if (w < 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

void Libssh2StreamChannel::close() {
    channel_close(*session_, channel_, closed_);
}

// ── Libssh2RemoteListener ───────────────────────────────────

Libssh2RemoteListener::Libssh2RemoteListener(std::shared_ptr<SshSession> session,
                                             LIBSSH2_LISTENER* listener, int bound_port)
    : session_(std::move(session)), listener_(listener), bound_port_(bound_port) {}

Libssh2RemoteListener::~Libssh2RemoteListener() {
    close();
}

Result<std::shared_ptr<StreamChannel>> Libssh2RemoteListener::accept(int timeout_ms) {
    using R = Result<std::shared_ptr<StreamChannel>>;
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    while (!closed_.load()) {
        LIBSSH2_CHANNEL* ch = nullptr;
        int rc = session_->try_call([&](LIBSSH2_SESSION* s) {
            if (!listener_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
            ch = libssh2_channel_forward_accept(listener_);
            return ch ? 0 : libssh2_session_last_errno(s);
        });

        if (ch) return R::Ok(std::make_shared<Libssh2StreamChannel>(session_, ch));
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            if (closed_.load()) break;
            return R::Err(ErrorKind::Listen,
                fmt::format("Remote listener on port {} failed: {}", bound_port_, session_->last_error()));
        }

        int left = remaining_ms(deadline);
        if (left == 0) return R::Ok(nullptr);
        session_->wait_socket(std::min(left, EAGAIN_BACKOFF_MS * 10));
    }
    return R::Err(ErrorKind::Listen, fmt::format("Remote listener on port {} closed", bound_port_));
}

void Libssh2RemoteListener::close() {
    if (closed_.exchange(true)) return;
    session_->teardown([this](LIBSSH2_SESSION*) {
        if (!listener_) return 0;
        int rc = libssh2_channel_forward_cancel(listener_);
        if (rc != LIBSSH2_ERROR_EAGAIN) listener_ = nullptr;
        return rc;
    }, TEARDOWN_TIMEOUT_MS);
}

// ── Libssh2Transport ────────────────────────────────────────

Libssh2Transport::Libssh2Transport(std::shared_ptr<SshSession> session)
    : session_(std::move(session)) {}

Libssh2Transport::~Libssh2Transport() {
    close();
}

ErrorKind Libssh2Transport::open_failure_kind() const {
    return session_->is_active() ? ErrorKind::Protocol : ErrorKind::Dial;
}

Result<std::shared_ptr<ExecChannel>> Libssh2Transport::open_exec(const std::string& command) {
    using R = Result<std::shared_ptr<ExecChannel>>;

    LIBSSH2_CHANNEL* ch = nullptr;
    int rc = session_->call([&](LIBSSH2_SESSION* s) {
        ch = libssh2_channel_open_session(s);
        return ch ? 0 : libssh2_session_last_errno(s);
    }, OPEN_TIMEOUT_MS);
    if (!ch) {
        return R::Err(open_failure_kind(),
            fmt::format("Failed to open session channel on {} ({})", describe(), rc));
    }

    // No PTY: output is binary-clean and stdout/stderr stay separate
    rc = session_->call([&](LIBSSH2_SESSION*) {
        return libssh2_channel_process_startup(ch, "exec", 4, command.c_str(),
                                               static_cast<unsigned int>(command.size()));
    }, OPEN_TIMEOUT_MS);
    if (rc != 0) {
        auto kind = open_failure_kind();
        channel_free(*session_, ch);
        return R::Err(kind, fmt::format("Remote refused exec request on {} ({})", describe(), rc));
    }

    return R::Ok(std::make_shared<Libssh2ExecChannel>(session_, ch));
}

Result<std::shared_ptr<StreamChannel>> Libssh2Transport::open_direct_tcpip(const std::string& host, int port) {
    using R = Result<std::shared_ptr<StreamChannel>>;

    LIBSSH2_CHANNEL* ch = nullptr;
    int rc = session_->call([&](LIBSSH2_SESSION* s) {
        ch = libssh2_channel_direct_tcpip_ex(s, host.c_str(), port, "127.0.0.1", 0);
        return ch ? 0 : libssh2_session_last_errno(s);
    }, OPEN_TIMEOUT_MS);
    if (!ch) {
        return R::Err(open_failure_kind(),
            fmt::format("direct-tcpip to {}:{} failed ({})", host, port, rc));
    }
    return R::Ok(std::make_shared<Libssh2StreamChannel>(session_, ch));
}

Result<std::shared_ptr<RemoteListener>> Libssh2Transport::listen_remote(const std::string& bind_host, int port) {
    using R = Result<std::shared_ptr<RemoteListener>>;

    LIBSSH2_LISTENER* listener = nullptr;
    int bound_port = 0;
    int rc = session_->call([&](LIBSSH2_SESSION* s) {
        listener = libssh2_channel_forward_listen_ex(s, bind_host.c_str(), port, &bound_port, 16);
        return listener ? 0 : libssh2_session_last_errno(s);
    }, OPEN_TIMEOUT_MS);
    if (!listener) {
        if (!session_->is_active()) {
            return R::Err(ErrorKind::Dial, fmt::format("{} is not connected", describe()));
        }
        return R::Err(ErrorKind::Listen,
            fmt::format("Remote refused to listen on {}:{} ({})", bind_host, port, rc));
    }
    return R::Ok(std::make_shared<Libssh2RemoteListener>(session_, listener,
                                                         bound_port > 0 ? bound_port : port));
}

Result<std::shared_ptr<SftpChannel>> Libssh2Transport::open_sftp() {
    using R = Result<std::shared_ptr<SftpChannel>>;

    LIBSSH2_SFTP* sftp = nullptr;
    int rc = session_->call([&](LIBSSH2_SESSION* s) {
        sftp = libssh2_sftp_init(s);
        return sftp ? 0 : libssh2_session_last_errno(s);
    }, OPEN_TIMEOUT_MS);
    if (!sftp) {
        return R::Err(open_failure_kind(),
            fmt::format("Failed to start SFTP subsystem on {} ({})", describe(), rc));
    }
    return R::Ok(std::make_shared<Libssh2Sftp>(session_, sftp));
}

bool Libssh2Transport::is_alive() {
    return session_->check_alive();
}

void Libssh2Transport::close() {
    session_->close();
}

std::string Libssh2Transport::describe() const {
    return session_->target();
}

// ── Libssh2Dialer ───────────────────────────────────────────

Libssh2Dialer::Libssh2Dialer(DialSettings settings) : settings_(std::move(settings)) {}

Result<std::shared_ptr<Transport>> Libssh2Dialer::dial(const Profile& profile) {
    using R = Result<std::shared_ptr<Transport>>;

    auto valid = validate_profile(profile);
    if (valid.is_err()) return R::Err(valid);

    auto session = std::make_shared<SshSession>(profile, settings_);
    auto established = session->establish([&profile](const std::string& msg) {
        sshdeck_log(fmt::format("Dial[{}]: {}", profile.name, msg));
    });
    if (established.is_err()) return R::Err(established);

    return R::Ok(std::make_shared<Libssh2Transport>(session));
}
