#pragma once

#include <string>
#include <core/types.hpp>

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Outcome of looking the server key up in known_hosts.
enum class HostKeyCheck {
    Match,
    Mismatch,
    NotFound,
    Unavailable,   // known_hosts missing or unreadable
};

struct HostKeyDecision {
    bool accept = false;
    bool record = false;     // append the key to known_hosts
    std::string reason;      // set when rejected
};

HostKeyDecision decide_host_key(HostKeyPolicy policy, HostKeyCheck check);

// Checks the session's host key against settings.known_hosts_path under
// settings.host_key_policy. Rejections are ErrorKind::Protocol.
Result<void> verify_host_key(LIBSSH2_SESSION* session, const std::string& host, int port,
                             const DialSettings& settings);
