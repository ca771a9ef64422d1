#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "channel.hpp"

// One authenticated, multiplexed connection to a remote host. Every
// sub-channel opened on it shares the underlying TCP connection.
//
// Channel opens fail with ErrorKind::Dial once the transport is closed and
// ErrorKind::Protocol when the server refuses the open. listen_remote()
// failures are ErrorKind::Listen.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::shared_ptr<ExecChannel>> open_exec(const std::string& command) = 0;
    virtual Result<std::shared_ptr<StreamChannel>> open_direct_tcpip(const std::string& host, int port) = 0;
    virtual Result<std::shared_ptr<RemoteListener>> listen_remote(const std::string& bind_host, int port) = 0;
    virtual Result<std::shared_ptr<SftpChannel>> open_sftp() = 0;

    // Sends a keepalive if one is due; false once the connection is gone.
    virtual bool is_alive() = 0;

    // Tear down the connection. Open sub-channels start failing.
    virtual void close() = 0;

    // "user@host:port"
    virtual std::string describe() const = 0;
};

// Creates transports. The pool owns one and never dials any other way.
class TransportDialer {
public:
    virtual ~TransportDialer() = default;

    // Authentication, Dial, Protocol or Config errors.
    virtual Result<std::shared_ptr<Transport>> dial(const Profile& profile) = 0;
};
