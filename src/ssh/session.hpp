#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// One non-blocking libssh2 session over a TCP socket.
//
// libssh2 is not thread-safe per session: every call goes through call(),
// which holds io_mutex for a single non-blocking attempt and backs off
// between EAGAIN retries outside the lock, so sub-channels on the same
// session can be driven from several threads at once.
//
// close() disconnects and shuts the socket down but leaves the libssh2
// handles allocated until destruction, so channels that still hold a
// pointer into the session fail cleanly instead of touching freed memory.
class SshSession {
public:
    SshSession(const Profile& profile, const DialSettings& settings);
    ~SshSession();

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // TCP connect, handshake, host key verification, authentication.
    Result<void> establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const { return active_.load(); }
    bool check_alive();

    // Run fn under the I/O mutex until it returns something other than
    // LIBSSH2_ERROR_EAGAIN. A negative timeout waits forever. Returns
    // LIBSSH2_ERROR_TIMEOUT on deadline and LIBSSH2_ERROR_SOCKET_DISCONNECT
    // once the session is closed.
    int call(const std::function<int(LIBSSH2_SESSION*)>& fn, int timeout_ms = -1);

    // Single attempt under the I/O mutex (no retry).
    int try_call(const std::function<int(LIBSSH2_SESSION*)>& fn);

    // Like call(), but also runs after close() so handles can be released.
    int teardown(const std::function<int(LIBSSH2_SESSION*)>& fn, int timeout_ms);

    // Block until the socket is ready in the direction libssh2 is waiting on.
    void wait_socket(int timeout_ms);

    std::string last_error();

    const std::string& target() const { return target_str_; }

private:
    Profile profile_;
    DialSettings settings_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    std::atomic<bool> active_;
    std::string target_str_;
    std::mutex io_mutex_;

    Result<void> userauth(StatusCallback callback);
    int call_impl(const std::function<int(LIBSSH2_SESSION*)>& fn, int timeout_ms, bool require_active);
    void discard();
};
