#include "port_forwarder.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

// ── ForwardHandle ─────────────────────────────────────────

ForwardHandle::~ForwardHandle() {
    shutdown();
}

void ForwardHandle::shutdown() {
    stop.store(true);
    // Wake the accept loop: poll/accept fail once the socket is shut down
    if (listen_fd != SSHDECK_INVALID_SOCKET) platform::shutdown_socket(listen_fd);
    if (remote_listener) remote_listener->close();
    if (thread.joinable()) {
        // Last reference may be dropped by the accept thread itself
        if (thread.get_id() == std::this_thread::get_id()) thread.detach();
        else thread.join();
    }
    if (listen_fd != SSHDECK_INVALID_SOCKET) {
        platform::close_socket(listen_fd);
        listen_fd = SSHDECK_INVALID_SOCKET;
    }
}

static std::string describe(const PortForwardEntry& e) {
    if (e.direction == ForwardDirection::LocalToRemote) {
        return fmt::format("[{}] localhost:{} -> remote:{}", e.profile, e.local_port, e.remote_port);
    }
    return fmt::format("[{}] remote:{} -> localhost:{}", e.profile, e.remote_port, e.local_port);
}

// ── Pipes ─────────────────────────────────────────────────

// One accepted connection: a local socket paired with a channel. The socket
// is closed when the last copy task lets go of it.
struct PipePair {
    socket_t fd;
    std::shared_ptr<StreamChannel> channel;
    std::shared_ptr<std::atomic<bool>> abort;
    std::atomic<bool> closed{false};

    PipePair(socket_t f, std::shared_ptr<StreamChannel> ch, std::shared_ptr<std::atomic<bool>> a)
        : fd(f), channel(std::move(ch)), abort(std::move(a)) {}

    ~PipePair() { platform::close_socket(fd); }

    bool running() const { return !closed.load() && !abort->load(); }

    // Either direction ending tears down both sides.
    void close_both() {
        if (closed.exchange(true)) return;
        platform::shutdown_socket(fd);
        channel->close();
    }
};

static void copy_local_to_channel(std::shared_ptr<PipePair> pipe) {
    char buf[FORWARD_BUF_SIZE];
    while (pipe->running()) {
        int revents = platform::poll_socket(pipe->fd, POLLIN, READ_POLL_MS);
        if (revents == 0) continue;
        long n = platform::recv_some(pipe->fd, buf, sizeof(buf));
        if (n <= 0) break;   // client closed
        if (!pipe->channel->write_all(buf, static_cast<size_t>(n))) break;
    }
    pipe->close_both();
}

static void copy_channel_to_local(std::shared_ptr<PipePair> pipe) {
    char buf[FORWARD_BUF_SIZE];
    while (pipe->running()) {
        long n = pipe->channel->read(buf, sizeof(buf), READ_POLL_MS);
        if (n == CHANNEL_TIMEOUT) continue;
        if (n <= 0) break;   // remote closed
        if (!platform::send_all(pipe->fd, buf, static_cast<size_t>(n))) break;
    }
    pipe->close_both();
}

// ── PortForwarder ─────────────────────────────────────────

PortForwarder::PortForwarder(ConnectionPool& pool, ForwardSettings settings)
    : pool_(pool), settings_(std::move(settings)) {}

PortForwarder::~PortForwarder() {
    shutdown();
}

bool PortForwarder::is_active_locked(const PortForwardEntry& entry) const {
    if (std::find(reserved_.begin(), reserved_.end(), entry) != reserved_.end()) return true;
    return std::any_of(forwards_.begin(), forwards_.end(), [&](const auto& h) {
        return h->entry == entry && !h->finished.load();
    });
}

std::shared_ptr<PortForwarder::PipeSet> PortForwarder::pipe_set(const std::string& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& set = pipes_[profile];
    if (!set) set = std::make_shared<PipeSet>(profile);
    return set;
}

void PortForwarder::spawn_pipes(const std::shared_ptr<ForwardHandle>& handle,
                                socket_t fd, std::shared_ptr<StreamChannel> channel) {
    auto set = pipe_set(handle->entry.profile);
    auto pipe = std::make_shared<PipePair>(fd, std::move(channel), set->abort);
    set->tasks.spawn([pipe]() { copy_local_to_channel(pipe); });
    set->tasks.spawn([pipe]() { copy_channel_to_local(pipe); });
}

Result<void> PortForwarder::start(const PortForwardEntry& entry) {
    if (entry.local_port < 1 || entry.local_port > 65535 ||
        entry.remote_port < 1 || entry.remote_port > 65535) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Invalid port pair {}:{}", entry.local_port, entry.remote_port));
    }

    // Reserve the tuple so duplicate checks hold while the network calls
    // below run without the registry lock
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_active_locked(entry)) {
            return Result<void>::Err(ErrorKind::DuplicateForward,
                fmt::format("Forward already active: {}", describe(entry)));
        }
        reserved_.push_back(entry);
    }

    auto handle = std::make_shared<ForwardHandle>();
    handle->entry = entry;
    auto opened = open_listener(*handle);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(reserved_.begin(), reserved_.end(), entry);
    bool cancelled = it == reserved_.end();
    if (!cancelled) reserved_.erase(it);
    if (opened.is_err()) return opened;

    // stop_all() for the profile ran meanwhile; the handle closes its listener
    if (cancelled) {
        return Result<void>::Err(ErrorKind::Dial,
            fmt::format("Profile '{}' was disconnected while starting {}", entry.profile,
                        describe(entry)));
    }

    if (entry.direction == ForwardDirection::LocalToRemote) {
        handle->thread = std::thread(&PortForwarder::accept_local, this, handle);
    } else {
        handle->thread = std::thread(&PortForwarder::accept_remote, this, handle);
    }
    forwards_.push_back(handle);

    sshdeck_log(fmt::format("PortForwarder: started {}", describe(entry)));
    return Result<void>::Ok();
}

Result<void> PortForwarder::open_listener(ForwardHandle& handle) {
    const auto& entry = handle.entry;
    auto transport = pool_.lookup(entry.profile);
    if (transport.is_err()) return Result<void>::Err(transport);

    if (entry.direction == ForwardDirection::LocalToRemote) {
        auto listener = platform::tcp_listen_loopback(entry.local_port);
        if (listener.is_err()) return Result<void>::Err(listener);
        handle.listen_fd = listener.value;
    } else {
        auto listener = transport.value->listen_remote(settings_.remote_bind_host, entry.remote_port);
        if (listener.is_err()) return Result<void>::Err(listener);
        handle.remote_listener = listener.value;
    }
    return Result<void>::Ok();
}

void PortForwarder::accept_local(std::shared_ptr<ForwardHandle> handle) {
    const auto& entry = handle->entry;

    while (!handle->stop.load()) {
        // Accept with timeout so we can check stop flag
        int revents = platform::poll_socket(handle->listen_fd, POLLIN, ACCEPT_POLL_MS);
        if (handle->stop.load()) break;
        if (revents == 0) continue;

        socket_t client = platform::accept_client(handle->listen_fd);
        if (client == SSHDECK_INVALID_SOCKET) {
            if (!handle->stop.load()) {
                sshdeck_log(fmt::format("PortForwarder: accept failed on {}: {}",
                                        describe(entry), std::strerror(errno)));
            }
            break;
        }

        auto transport = pool_.lookup(entry.profile);
        if (transport.is_err()) {
            sshdeck_log(fmt::format("PortForwarder: {}: {}", describe(entry), transport.error));
            platform::close_socket(client);
            continue;
        }

        auto channel = transport.value->open_direct_tcpip("localhost", entry.remote_port);
        if (channel.is_err()) {
            sshdeck_log(fmt::format("PortForwarder: {}: {}", describe(entry), channel.error));
            platform::close_socket(client);
            continue;
        }

        spawn_pipes(handle, client, channel.value);
    }

    handle->finished.store(true);
    sshdeck_log(fmt::format("PortForwarder: accept loop ended for {}", describe(entry)));
}

void PortForwarder::accept_remote(std::shared_ptr<ForwardHandle> handle) {
    const auto& entry = handle->entry;

    while (!handle->stop.load()) {
        auto accepted = handle->remote_listener->accept(ACCEPT_POLL_MS);
        if (accepted.is_err()) {
            if (!handle->stop.load()) {
                sshdeck_log(fmt::format("PortForwarder: {}: {}", describe(entry), accepted.error));
            }
            break;
        }
        if (!accepted.value) continue;

        // Counts as activity for the idle sweeper
        pool_.lookup(entry.profile);

        auto local = platform::tcp_connect("127.0.0.1", entry.local_port, DIAL_TIMEOUT_SECS * 1000);
        if (local.is_err()) {
            sshdeck_log(fmt::format("PortForwarder: {}: {}", describe(entry), local.error));
            accepted.value->close();
            continue;
        }

        spawn_pipes(handle, local.value, accepted.value);
    }

    handle->finished.store(true);
    sshdeck_log(fmt::format("PortForwarder: accept loop ended for {}", describe(entry)));
}

Result<void> PortForwarder::stop(const PortForwardEntry& entry) {
    std::shared_ptr<ForwardHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(forwards_.begin(), forwards_.end(), [&](const auto& h) {
            return h->entry == entry && !h->finished.load();
        });
        if (it == forwards_.end()) {
            return Result<void>::Err(ErrorKind::ForwardNotFound,
                fmt::format("No active forward {}", describe(entry)));
        }
        handle = *it;
        forwards_.erase(it);
    }

    handle->shutdown();
    sshdeck_log(fmt::format("PortForwarder: stopped {}", describe(entry)));
    return Result<void>::Ok();
}

std::vector<PortForwardEntry> PortForwarder::list(const std::string& profile) {
    std::vector<std::shared_ptr<ForwardHandle>> ended;
    std::vector<PortForwardEntry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = forwards_.begin(); it != forwards_.end();) {
            if ((*it)->finished.load()) {
                ended.push_back(*it);
                it = forwards_.erase(it);
                continue;
            }
            if ((*it)->entry.profile == profile) entries.push_back((*it)->entry);
            ++it;
        }
    }
    // Release dead listeners outside the lock
    for (auto& h : ended) h->shutdown();
    return entries;
}

void PortForwarder::stop_all(const std::string& profile) {
    std::vector<std::shared_ptr<ForwardHandle>> local;
    std::shared_ptr<PipeSet> set;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = forwards_.begin(); it != forwards_.end();) {
            if ((*it)->entry.profile == profile) {
                local.push_back(*it);
                it = forwards_.erase(it);
            } else {
                ++it;
            }
        }
        reserved_.erase(std::remove_if(reserved_.begin(), reserved_.end(),
                                       [&](const auto& e) { return e.profile == profile; }),
                        reserved_.end());
        auto pit = pipes_.find(profile);
        if (pit != pipes_.end()) {
            set = pit->second;
            pipes_.erase(pit);
        }
    }

    for (auto& h : local) h->shutdown();
    if (set) {
        set->abort->store(true);
        set->tasks.join_all();
    }
    if (!local.empty()) {
        sshdeck_log(fmt::format("PortForwarder: [{}] stopped {} forward(s)", profile, local.size()));
    }
}

size_t PortForwarder::active_pipes(const std::string& profile) const {
    std::shared_ptr<PipeSet> set;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pipes_.find(profile);
        if (it == pipes_.end()) return 0;
        set = it->second;
    }
    return set->tasks.size();
}

void PortForwarder::shutdown() {
    std::vector<std::string> profiles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& h : forwards_) profiles.push_back(h->entry.profile);
        for (const auto& kv : pipes_) profiles.push_back(kv.first);
        for (const auto& e : reserved_) profiles.push_back(e.profile);
    }
    std::sort(profiles.begin(), profiles.end());
    profiles.erase(std::unique(profiles.begin(), profiles.end()), profiles.end());
    for (const auto& p : profiles) stop_all(p);
}
