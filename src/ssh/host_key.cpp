#include "host_key.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <filesystem>

namespace fs = std::filesystem;

HostKeyDecision decide_host_key(HostKeyPolicy policy, HostKeyCheck check) {
    HostKeyDecision d;
    if (policy == HostKeyPolicy::Off) {
        d.accept = true;
        return d;
    }

    switch (check) {
        case HostKeyCheck::Match:
            d.accept = true;
            break;
        case HostKeyCheck::Mismatch:
            d.reason = "host key does not match known_hosts entry";
            break;
        case HostKeyCheck::NotFound:
        case HostKeyCheck::Unavailable:
            if (policy == HostKeyPolicy::AcceptNew) {
                d.accept = true;
                d.record = true;
            } else {
                d.reason = check == HostKeyCheck::NotFound
                    ? "host not present in known_hosts (strict policy)"
                    : "known_hosts unavailable (strict policy)";
            }
            break;
    }
    return d;
}

static int knownhost_key_alg(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default: return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

Result<void> verify_host_key(LIBSSH2_SESSION* session, const std::string& host, int port,
                             const DialSettings& settings) {
    if (settings.host_key_policy == HostKeyPolicy::Off) return Result<void>::Ok();

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        return Result<void>::Err(ErrorKind::Protocol, "Server presented no host key");
    }

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session);
    if (!nh) {
        return Result<void>::Err(ErrorKind::Protocol, "Failed to initialize known_hosts");
    }

    const std::string& path = settings.known_hosts_path;
    std::error_code ec;
    bool exists = !path.empty() && fs::exists(path, ec);
    bool loaded = exists &&
        libssh2_knownhost_readfile(nh, path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;

    HostKeyCheck check = HostKeyCheck::Unavailable;
    int alg = knownhost_key_alg(keytype);
    if (loaded) {
        struct libssh2_knownhost* entry = nullptr;
        int rc = libssh2_knownhost_checkp(nh, host.c_str(), port, hostkey, keylen,
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &entry);
        switch (rc) {
            case LIBSSH2_KNOWNHOST_CHECK_MATCH: check = HostKeyCheck::Match; break;
            case LIBSSH2_KNOWNHOST_CHECK_MISMATCH: check = HostKeyCheck::Mismatch; break;
            case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND: check = HostKeyCheck::NotFound; break;
            default: check = HostKeyCheck::Unavailable; break;
        }
    }

    auto decision = decide_host_key(settings.host_key_policy, check);
    if (!decision.accept) {
        libssh2_knownhost_free(nh);
        return Result<void>::Err(ErrorKind::Protocol,
            fmt::format("Host key verification failed for {}:{}: {}", host, port, decision.reason));
    }

    // Never rewrite a known_hosts file we failed to parse
    if (decision.record && !path.empty() && (loaded || !exists)) {
        // OpenSSH writes non-default ports as "[host]:port"
        std::string name = port == 22 ? host : fmt::format("[{}]:{}", host, port);
        int addrc = libssh2_knownhost_addc(nh, name.c_str(), nullptr, hostkey, keylen,
            nullptr, 0, LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, nullptr);

        std::error_code ec;
        fs::create_directories(fs::path(path).parent_path(), ec);
        if (addrc != 0 ||
            libssh2_knownhost_writefile(nh, path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            // The key was accepted; failing to remember it is not fatal
            sshdeck_log(fmt::format("HostKey: could not record {} in {}", name, path));
        } else {
            sshdeck_log(fmt::format("HostKey: added {} to {}", name, path));
        }
    }

    libssh2_knownhost_free(nh);
    return Result<void>::Ok();
}
