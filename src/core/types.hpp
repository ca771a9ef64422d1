#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Failure categories surfaced to callers. Connection-level kinds (Authentication,
// Dial, Protocol) abort the operation; the rest are scoped to one sub-channel.
enum class ErrorKind {
    None,
    Authentication,
    Dial,
    Protocol,
    SessionBusy,
    NoActiveSession,
    Listen,
    ForwardNotFound,
    DuplicateForward,
    LocalIO,
    RemoteIO,
    Config,
};

// Stable name for an error kind, e.g. "DialError".
const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Re-wrap another result's failure as this type.
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// A named remote host plus credentials. Exactly one of ssh_key_path / password is set.
struct Profile {
    std::string name;
    std::string host;
    int port = 22;
    std::string username;
    std::optional<std::string> ssh_key_path;
    std::optional<std::string> password;
};

// Checks the auth descriptor and address fields.
Result<void> validate_profile(const Profile& profile);

enum class ForwardDirection {
    LocalToRemote,   // listen locally, dial through the transport
    RemoteToLocal,   // remote listens, dial locally
};

const char* direction_name(ForwardDirection dir);

struct PortForwardEntry {
    std::string profile;
    int local_port = 0;
    int remote_port = 0;
    ForwardDirection direction = ForwardDirection::LocalToRemote;

    bool operator==(const PortForwardEntry& o) const {
        return profile == o.profile && local_port == o.local_port &&
               remote_port == o.remote_port && direction == o.direction;
    }
    bool operator!=(const PortForwardEntry& o) const { return !(*this == o); }
};

// ── Events pushed to the presentation layer ─────────────────

enum class SessionEventType { Stdout, Stderr, Info, Error, Clear };

const char* event_type_name(SessionEventType type);

struct SessionEvent {
    std::string profile;
    SessionEventType type;
    std::string data;
};

enum class TransferOp { Upload, Download };

struct TransferEvent {
    TransferOp operation;
    std::string filename;            // basename of the file being copied
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;        // 0 when unknown
    double percent = 0.0;
};

struct RemoteFileInfo {
    std::string name;
    uint64_t size = 0;
    bool is_dir = false;
    uint32_t permissions = 0;
    int64_t mtime = 0;
};

// ── Configuration structures ────────────────────────────────

enum class HostKeyPolicy {
    Off,        // accept any host key
    AcceptNew,  // trust on first use, reject mismatches
    Strict,     // require a known_hosts match
};

const char* host_key_policy_name(HostKeyPolicy policy);
std::optional<HostKeyPolicy> parse_host_key_policy(const std::string& name);

struct DialSettings {
    int dial_timeout_secs = 10;
    int keepalive_secs = 30;
    HostKeyPolicy host_key_policy = HostKeyPolicy::AcceptNew;
    std::string known_hosts_path;     // "" disables known_hosts I/O
};

struct PoolSettings {
    int idle_timeout_secs = 300;
    int sweep_interval_secs = 60;
};

struct SessionSettings {
    int stop_grace_ms = 2000;
};

struct TransferSettings {
    size_t chunk_size = 1024 * 1024;
};

struct ForwardSettings {
    std::string remote_bind_host = "localhost";
};

struct EventSettings {
    size_t queue_capacity = 1024;
    int stall_warn_ms = 500;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
