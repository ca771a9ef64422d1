#include "session.hpp"
#include "host_key.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#ifdef _WIN32
#  include <winsock2.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#endif
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static std::once_flag g_libssh2_init;

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

SshSession::SshSession(const Profile& profile, const DialSettings& settings)
    : profile_(profile), settings_(settings), session_(nullptr),
      sock_(SSHDECK_INVALID_SOCKET), active_(false),
      target_str_(fmt::format("{}@{}:{}", profile.username, profile.host, profile.port)) {
}

SshSession::~SshSession() {
    close();
    discard();
}

// Free the libssh2 handle and the socket.
void SshSession::discard() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (session_) {
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != SSHDECK_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SSHDECK_INVALID_SOCKET;
    }
}

Result<void> SshSession::establish(StatusCallback callback) {
    if (callback) callback("Connecting to " + profile_.host + "...");

    int rc = 0;
    std::call_once(g_libssh2_init, [&rc] { rc = libssh2_init(0); });
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Protocol, "Failed to initialize libssh2");
    }

    int timeout_ms = settings_.dial_timeout_secs * 1000;
    auto conn = platform::tcp_connect(profile_.host, profile_.port, timeout_ms);
    if (conn.is_err()) return Result<void>::Err(conn);
    sock_ = conn.value;

    // Set socket to non-blocking for libssh2
    platform::set_nonblocking(sock_);

    // Enable TCP keepalive on the socket
    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&tcp_keepalive), sizeof(tcp_keepalive));

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        discard();
        return Result<void>::Err(ErrorKind::Protocol, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    // Key exchange must finish within the dial timeout
    active_ = true;
    rc = call([this](LIBSSH2_SESSION* s) { return libssh2_session_handshake(s, sock_); },
              timeout_ms);
    if (rc != 0) {
        std::string why = rc == LIBSSH2_ERROR_TIMEOUT ? "timed out" : last_error();
        active_ = false;
        discard();
        return Result<void>::Err(ErrorKind::Protocol,
            fmt::format("SSH handshake with {}:{} failed: {}", profile_.host, profile_.port, why));
    }

    auto hk = verify_host_key(session_, profile_.host, profile_.port, settings_);
    if (hk.is_err()) {
        close();
        discard();
        return hk;
    }

    if (settings_.keepalive_secs > 0) {
        libssh2_keepalive_config(session_, 1, static_cast<unsigned>(settings_.keepalive_secs));
    }

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth = userauth(callback);
    if (auth.is_err()) {
        close();
        discard();
        return auth;
    }

    sshdeck_log(fmt::format("SshSession: connected {}", target_str_));
    if (callback) callback("Connected to " + profile_.host);
    return Result<void>::Ok();
}

Result<void> SshSession::userauth(StatusCallback callback) {
    const std::string& user = profile_.username;
    int rc;

    if (profile_.ssh_key_path) {
        const std::string& key = *profile_.ssh_key_path;
        std::error_code ec;
        bool regular = fs::is_regular_file(key, ec);
        std::ifstream key_file(key);
        if (ec || !regular || !key_file) {
            return Result<void>::Err(ErrorKind::Authentication,
                fmt::format("Unable to read private key {}", key));
        }
        if (callback) callback("Using public key auth...");
        rc = call([&](LIBSSH2_SESSION* s) {
            return libssh2_userauth_publickey_fromfile_ex(
                s, user.c_str(), static_cast<unsigned int>(user.length()),
                nullptr, key.c_str(), nullptr);
        });
        if (rc == 0) return Result<void>::Ok();
        return Result<void>::Err(ErrorKind::Authentication,
            fmt::format("Public key authentication failed for {}: {}", target_str_, last_error()));
    }

    const std::string password = profile_.password.value_or("");

    // Check what auth methods the server supports
    std::string methods;
    call([&](LIBSSH2_SESSION* s) {
        char* list = libssh2_userauth_list(s, user.c_str(), static_cast<unsigned int>(user.length()));
        if (list) {
            methods = list;
            return 0;
        }
        return libssh2_session_last_errno(s);
    });

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");
        rc = call([&](LIBSSH2_SESSION* s) {
            return libssh2_userauth_password(s, user.c_str(), password.c_str());
        });
        if (rc == 0) return Result<void>::Ok();
    }

    // Servers that only offer keyboard-interactive still take the password
    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");
        KbdAuthData kbd_data{password, 0};
        *libssh2_session_abstract(session_) = &kbd_data;
        rc = call([&](LIBSSH2_SESSION* s) {
            return libssh2_userauth_keyboard_interactive(s, user.c_str(), kbd_callback);
        });
        *libssh2_session_abstract(session_) = nullptr;
        if (rc == 0) return Result<void>::Ok();
    }

    return Result<void>::Err(ErrorKind::Authentication,
        fmt::format("Authentication failed for {} (check username/password)", target_str_));
}

int SshSession::try_call(const std::function<int(LIBSSH2_SESSION*)>& fn) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!active_ || !session_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
    return fn(session_);
}

int SshSession::call_impl(const std::function<int(LIBSSH2_SESSION*)>& fn,
                          int timeout_ms, bool require_active) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (!session_ || (require_active && !active_)) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
            rc = fn(session_);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (timeout_ms >= 0 && std::chrono::steady_clock::now() >= deadline) {
            return LIBSSH2_ERROR_TIMEOUT;
        }
        if (active_) {
            wait_socket(EAGAIN_BACKOFF_MS);
        } else {
            platform::sleep_ms(EAGAIN_BACKOFF_MS);
        }
    }
}

int SshSession::call(const std::function<int(LIBSSH2_SESSION*)>& fn, int timeout_ms) {
    return call_impl(fn, timeout_ms, true);
}

int SshSession::teardown(const std::function<int(LIBSSH2_SESSION*)>& fn, int timeout_ms) {
    return call_impl(fn, timeout_ms, false);
}

void SshSession::wait_socket(int timeout_ms) {
    short events = 0;
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (!active_ || !session_ || sock_ == SSHDECK_INVALID_SOCKET) return;
        int dir = libssh2_session_block_directions(session_);
        if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
        if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    }
    if (events == 0) {
        platform::sleep_ms(timeout_ms);
        return;
    }
    platform::poll_socket(sock_, events, timeout_ms);
}

std::string SshSession::last_error() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : "unknown error";
}

void SshSession::close() {
    // Mark inactive first so concurrent operations bail out early
    bool was_active = active_.exchange(false);
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (was_active && session_) {
        // Best effort: a non-blocking disconnect may not flush
        libssh2_session_disconnect(session_, "Normal disconnection");
        sshdeck_log(fmt::format("SshSession: closed {}", target_str_));
    }
    if (sock_ != SSHDECK_INVALID_SOCKET) {
        platform::shutdown_socket(sock_);
    }
}

bool SshSession::check_alive() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!active_ || !session_ || sock_ == SSHDECK_INVALID_SOCKET) return false;

    // Send SSH keepalive and check if connection is still up
    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        active_ = false;
        return false;
    }

    // Also check if the socket is still valid
    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }

    return true;
}
