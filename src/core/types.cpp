#include "types.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:             return "None";
    case ErrorKind::Authentication:   return "AuthenticationError";
    case ErrorKind::Dial:             return "DialError";
    case ErrorKind::Protocol:         return "ProtocolError";
    case ErrorKind::SessionBusy:      return "SessionBusyError";
    case ErrorKind::NoActiveSession:  return "NoActiveSessionError";
    case ErrorKind::Listen:           return "ListenError";
    case ErrorKind::ForwardNotFound:  return "ForwardNotFoundError";
    case ErrorKind::DuplicateForward: return "DuplicateForwardError";
    case ErrorKind::LocalIO:          return "LocalIOError";
    case ErrorKind::RemoteIO:         return "RemoteIOError";
    case ErrorKind::Config:           return "ConfigError";
    }
    return "UnknownError";
}

const char* direction_name(ForwardDirection dir) {
    return dir == ForwardDirection::LocalToRemote ? "local->remote" : "remote->local";
}

const char* event_type_name(SessionEventType type) {
    switch (type) {
    case SessionEventType::Stdout: return "stdout";
    case SessionEventType::Stderr: return "stderr";
    case SessionEventType::Info:   return "info";
    case SessionEventType::Error:  return "error";
    case SessionEventType::Clear:  return "clear";
    }
    return "unknown";
}

Result<void> validate_profile(const Profile& profile) {
    if (profile.name.empty()) {
        return Result<void>::Err(ErrorKind::Config, "Profile has no name");
    }
    if (profile.host.empty()) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Profile '{}' has no host", profile.name));
    }
    if (profile.port <= 0 || profile.port > 65535) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Profile '{}' has invalid port {}", profile.name, profile.port));
    }
    if (profile.username.empty()) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Profile '{}' has no username", profile.name));
    }

    bool has_key = profile.ssh_key_path.has_value() && !profile.ssh_key_path->empty();
    bool has_password = profile.password.has_value() && !profile.password->empty();
    if (!has_key && !has_password) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Profile '{}' needs either ssh_key_path or password", profile.name));
    }
    if (has_key && has_password) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Profile '{}' sets both ssh_key_path and password", profile.name));
    }
    return Result<void>::Ok();
}

const char* host_key_policy_name(HostKeyPolicy policy) {
    switch (policy) {
    case HostKeyPolicy::Off:       return "off";
    case HostKeyPolicy::AcceptNew: return "accept_new";
    case HostKeyPolicy::Strict:    return "strict";
    }
    return "accept_new";
}

std::optional<HostKeyPolicy> parse_host_key_policy(const std::string& name) {
    if (name == "off" || name == "none") return HostKeyPolicy::Off;
    if (name == "accept_new" || name == "tofu") return HostKeyPolicy::AcceptNew;
    if (name == "strict") return HostKeyPolicy::Strict;
    return std::nullopt;
}
