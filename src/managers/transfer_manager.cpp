#include "transfer_manager.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static std::string base_name(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

TransferManager::TransferManager(ConnectionPool& pool, EventSink& sink, TransferSettings settings)
    : pool_(pool), sink_(sink), settings_(settings) {
    if (settings_.chunk_size == 0) settings_.chunk_size = TransferSettings{}.chunk_size;
}

Result<std::shared_ptr<SftpChannel>> TransferManager::open_sftp(const std::string& profile) {
    auto transport = pool_.lookup(profile);
    if (transport.is_err()) return Result<std::shared_ptr<SftpChannel>>::Err(transport);
    return transport.value->open_sftp();
}

void TransferManager::progress(TransferOp op, const std::string& filename,
                               uint64_t done, uint64_t total) {
    TransferEvent ev;
    ev.operation = op;
    ev.filename = filename;
    ev.bytes_transferred = done;
    ev.total_bytes = total;
    ev.percent = total > 0 ? std::min(100.0, static_cast<double>(done) * 100.0 / static_cast<double>(total))
                           : 100.0;
    sink_.on_transfer_event(ev);
}

// ── Upload / download ───────────────────────────────────────

Result<uint64_t> TransferManager::upload(const std::string& profile,
                                         const std::string& local_path,
                                         const std::string& remote_path) {
    using R = Result<uint64_t>;

    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        return R::Err(ErrorKind::LocalIO, fmt::format("Not a readable file: {}", local_path));
    }
    uint64_t total = fs::file_size(local_path, ec);
    if (ec) {
        return R::Err(ErrorKind::LocalIO, fmt::format("Cannot stat {}: {}", local_path, ec.message()));
    }
    std::ifstream in(local_path, std::ios::binary);
    if (!in) return R::Err(ErrorKind::LocalIO, fmt::format("Cannot open {}", local_path));

    auto sftp = open_sftp(profile);
    if (sftp.is_err()) return R::Err(sftp);

    auto remote = sftp.value->open_write(remote_path);
    if (remote.is_err()) {
        sftp.value->close();
        return R::Err(remote);
    }

    std::string filename = base_name(local_path);
    std::vector<char> buf(settings_.chunk_size);
    uint64_t copied = 0;
    bool emitted = false;

    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = static_cast<size_t>(in.gcount());
        if (n == 0) break;
        if (!remote.value->write_all(buf.data(), n)) {
            remote.value->close();
            sftp.value->close();
            return R::Err(ErrorKind::RemoteIO,
                fmt::format("Write to {} failed after {} bytes", remote_path, copied));
        }
        copied += n;
        progress(TransferOp::Upload, filename, copied, total);
        emitted = true;
    }

    if (in.bad()) {
        remote.value->close();
        sftp.value->close();
        return R::Err(ErrorKind::LocalIO,
            fmt::format("Read from {} failed after {} bytes", local_path, copied));
    }

    if (!emitted) progress(TransferOp::Upload, filename, 0, 0);

    remote.value->close();
    sftp.value->close();
    sshdeck_log(fmt::format("TransferManager: [{}] uploaded {} -> {} ({} bytes)",
                            profile, local_path, remote_path, copied));
    return R::Ok(copied);
}

Result<uint64_t> TransferManager::download(const std::string& profile,
                                           const std::string& remote_path,
                                           const std::string& local_path) {
    using R = Result<uint64_t>;

    auto sftp = open_sftp(profile);
    if (sftp.is_err()) return R::Err(sftp);

    auto info = sftp.value->stat(remote_path);
    if (info.is_err()) {
        sftp.value->close();
        return R::Err(info);
    }
    if (info.value.is_dir) {
        sftp.value->close();
        return R::Err(ErrorKind::RemoteIO, fmt::format("{} is a directory", remote_path));
    }
    uint64_t total = info.value.size;

    auto remote = sftp.value->open_read(remote_path);
    if (remote.is_err()) {
        sftp.value->close();
        return R::Err(remote);
    }

    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        remote.value->close();
        sftp.value->close();
        return R::Err(ErrorKind::LocalIO, fmt::format("Cannot create {}", local_path));
    }

    std::string filename = base_name(remote_path);
    std::vector<char> buf(settings_.chunk_size);
    uint64_t copied = 0;
    bool emitted = false;
    bool eof = false;

    while (!eof) {
        // Fill one chunk; SFTP reads return less than asked
        size_t filled = 0;
        while (filled < buf.size()) {
            long n = remote.value->read(buf.data() + filled, buf.size() - filled);
            if (n == 0) {
                eof = true;
                break;
            }
            if (n < 0) {
                remote.value->close();
                sftp.value->close();
                return R::Err(ErrorKind::RemoteIO,
                    fmt::format("Read from {} failed after {} bytes", remote_path, copied + filled));
            }
            filled += static_cast<size_t>(n);
        }
        if (filled == 0) break;

        out.write(buf.data(), static_cast<std::streamsize>(filled));
        if (!out) {
            remote.value->close();
            sftp.value->close();
            return R::Err(ErrorKind::LocalIO,
                fmt::format("Write to {} failed after {} bytes", local_path, copied));
        }
        copied += filled;
        progress(TransferOp::Download, filename, copied, std::max(total, copied));
        emitted = true;
    }

    if (!emitted) progress(TransferOp::Download, filename, 0, 0);

    remote.value->close();
    sftp.value->close();
    sshdeck_log(fmt::format("TransferManager: [{}] downloaded {} -> {} ({} bytes)",
                            profile, remote_path, local_path, copied));
    return R::Ok(copied);
}

// ── Remote file management ──────────────────────────────────

Result<std::vector<RemoteFileInfo>> TransferManager::list(const std::string& profile,
                                                          const std::string& remote_path) {
    auto sftp = open_sftp(profile);
    if (sftp.is_err()) return Result<std::vector<RemoteFileInfo>>::Err(sftp);
    auto entries = sftp.value->list(remote_path);
    sftp.value->close();
    return entries;
}

Result<void> TransferManager::remove(const std::string& profile, const std::string& remote_path) {
    auto sftp = open_sftp(profile);
    if (sftp.is_err()) return Result<void>::Err(sftp);

    auto info = sftp.value->stat(remote_path);
    Result<void> result = info.is_err()
        ? Result<void>::Err(info)
        : (info.value.is_dir ? sftp.value->rmdir(remote_path) : sftp.value->unlink(remote_path));
    sftp.value->close();
    return result;
}

Result<void> TransferManager::rename(const std::string& profile,
                                     const std::string& from, const std::string& to) {
    auto sftp = open_sftp(profile);
    if (sftp.is_err()) return Result<void>::Err(sftp);
    auto result = sftp.value->rename(from, to);
    sftp.value->close();
    return result;
}

Result<void> TransferManager::mkdir(const std::string& profile, const std::string& remote_path) {
    auto sftp = open_sftp(profile);
    if (sftp.is_err()) return Result<void>::Err(sftp);
    auto result = sftp.value->mkdir(remote_path);
    sftp.value->close();
    return result;
}
