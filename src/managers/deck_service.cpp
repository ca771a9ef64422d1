#include "deck_service.hpp"
#include <core/log.hpp>
#include <ssh/libssh2_transport.hpp>
#include <fmt/format.h>

DeckService::DeckService(Config config)
    : DeckService(config, std::make_shared<Libssh2Dialer>(config.dial())) {}

DeckService::DeckService(Config config, std::shared_ptr<TransportDialer> dialer)
    : config_(std::move(config)),
      profiles_(config_.profiles_dir()),
      history_(config_.history_dir()),
      saved_(config_.history_dir()),
      dialer_(std::move(dialer)),
      events_(config_.events()) {
    pool_ = std::make_unique<ConnectionPool>(dialer_, config_.pool());
    sessions_ = std::make_unique<SessionManager>(*pool_, events_, config_.session());
    forwards_ = std::make_unique<PortForwarder>(*pool_, config_.forward());
    transfers_ = std::make_unique<TransferManager>(*pool_, events_, config_.transfer());
    pool_->start_sweeper();
}

DeckService::~DeckService() {
    shutdown();
}

void DeckService::set_sink(std::shared_ptr<EventSink> sink) {
    events_.set_sink(std::move(sink));
}

// ── Connection lifecycle ──────────────────────────────────────

Result<void> DeckService::connect(const std::string& profile_name) {
    auto profile = profiles_.load(profile_name);
    if (profile.is_err()) return Result<void>::Err(profile);

    auto transport = pool_->acquire(profile.value);
    if (transport.is_err()) return Result<void>::Err(transport);
    return Result<void>::Ok();
}

void DeckService::disconnect(const std::string& profile_name) {
    sessions_->stop_all(profile_name);
    forwards_->stop_all(profile_name);
    pool_->release(profile_name);
    sshdeck_log(fmt::format("DeckService: disconnected {}", profile_name));
}

std::vector<std::string> DeckService::active_connections() const {
    return pool_->list_active();
}

// ── Commands ──────────────────────────────────────────────────

Result<std::string> DeckService::execute(const std::string& profile, const std::string& command) {
    auto result = sessions_->execute(profile, command);
    if (result.is_ok()) {
        auto recorded = history_.add(profile, result.value);
        if (recorded.is_err()) {
            sshdeck_log(fmt::format("DeckService: history not saved: {}", recorded.error));
        }
    }
    return result;
}

Result<void> DeckService::stop(const std::string& profile) {
    return sessions_->stop(profile);
}

SessionState DeckService::session_state(const std::string& profile) const {
    return sessions_->state(profile);
}

// ── Port forwarding ───────────────────────────────────────────

Result<void> DeckService::start_forward(const PortForwardEntry& entry) {
    return forwards_->start(entry);
}

Result<void> DeckService::stop_forward(const PortForwardEntry& entry) {
    return forwards_->stop(entry);
}

std::vector<PortForwardEntry> DeckService::list_forwards(const std::string& profile) {
    return forwards_->list(profile);
}

// ── Files ─────────────────────────────────────────────────────

Result<uint64_t> DeckService::upload(const std::string& profile, const std::string& local_path,
                                     const std::string& remote_path) {
    return transfers_->upload(profile, local_path, remote_path);
}

Result<uint64_t> DeckService::download(const std::string& profile, const std::string& remote_path,
                                       const std::string& local_path) {
    return transfers_->download(profile, remote_path, local_path);
}

Result<std::vector<RemoteFileInfo>> DeckService::list_dir(const std::string& profile,
                                                          const std::string& path) {
    return transfers_->list(profile, path);
}

Result<void> DeckService::remove(const std::string& profile, const std::string& path) {
    return transfers_->remove(profile, path);
}

Result<void> DeckService::rename(const std::string& profile, const std::string& from,
                                 const std::string& to) {
    return transfers_->rename(profile, from, to);
}

Result<void> DeckService::mkdir(const std::string& profile, const std::string& path) {
    return transfers_->mkdir(profile, path);
}

// ── Saved commands ────────────────────────────────────────────

Result<std::vector<SavedCommand>> DeckService::saved_commands() const {
    return saved_.list();
}

Result<void> DeckService::save_command(const std::string& name, const std::string& command) {
    return saved_.save(name, command);
}

Result<void> DeckService::delete_saved(const std::string& name) {
    return saved_.remove(name);
}

Result<std::string> DeckService::execute_saved(const std::string& profile, const std::string& name) {
    auto command = saved_.find(name);
    if (command.is_err()) return command;
    sshdeck_log(fmt::format("DeckService: [{}] running saved command '{}'", profile, name));
    return execute(profile, command.value);
}

// ── History & profiles ────────────────────────────────────────

Result<std::vector<std::string>> DeckService::history(const std::string& profile) const {
    return history_.get(profile);
}

Result<std::string> DeckService::create_synonym(const std::string& command) {
    return history_.create_synonym(command);
}

std::optional<std::string> DeckService::resolve_synonym(const std::string& name) {
    return history_.resolve_synonym(name);
}

std::vector<Profile> DeckService::profiles() const {
    return profiles_.load_all();
}

// ── Shutdown ──────────────────────────────────────────────────

void DeckService::flush_events() {
    events_.flush();
}

void DeckService::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    sessions_->shutdown();
    forwards_->shutdown();
    pool_->close_all();
    events_.stop();
    sshdeck_log("DeckService: shut down");
}
