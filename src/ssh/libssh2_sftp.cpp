#include "libssh2_sftp.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <algorithm>

static constexpr int TEARDOWN_TIMEOUT_MS = 1000;
// A stalled server fails the request with LIBSSH2_ERROR_TIMEOUT.
static constexpr int SFTP_IO_TIMEOUT_MS = SFTP_IO_TIMEOUT_SECS * 1000;

static const char* sftp_status_name(unsigned long code) {
    switch (code) {
        case LIBSSH2_FX_OK: return "ok";
        case LIBSSH2_FX_EOF: return "end of file";
        case LIBSSH2_FX_NO_SUCH_FILE: return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
        case LIBSSH2_FX_FAILURE: return "failure";
        case LIBSSH2_FX_BAD_MESSAGE: return "bad message";
        case LIBSSH2_FX_NO_CONNECTION: return "no connection";
        case LIBSSH2_FX_CONNECTION_LOST: return "connection lost";
        case LIBSSH2_FX_OP_UNSUPPORTED: return "operation unsupported";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_WRITE_PROTECT: return "write protected";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
        case LIBSSH2_FX_DIR_NOT_EMPTY: return "directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY: return "not a directory";
        case LIBSSH2_FX_INVALID_FILENAME: return "invalid filename";
        default: return "sftp error";
    }
}

static RemoteFileInfo to_file_info(const std::string& name, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    RemoteFileInfo info;
    info.name = name;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) info.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        info.permissions = static_cast<uint32_t>(attrs.permissions & 07777);
        info.is_dir = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) info.mtime = static_cast<int64_t>(attrs.mtime);
    return info;
}

// ── Libssh2Sftp ─────────────────────────────────────────────

Libssh2Sftp::Libssh2Sftp(std::shared_ptr<SshSession> session, LIBSSH2_SFTP* sftp)
    : session_(std::move(session)), sftp_(sftp) {}

Libssh2Sftp::~Libssh2Sftp() {
    close();
}

std::string Libssh2Sftp::error_message(const std::string& what) {
    if (!session_->is_active()) return what + ": connection closed";
    unsigned long code = 0;
    session_->teardown([&](LIBSSH2_SESSION*) {
        if (sftp_) code = libssh2_sftp_last_error(sftp_);
        return 0;
    }, TEARDOWN_TIMEOUT_MS);
    if (code != LIBSSH2_FX_OK) return fmt::format("{}: {}", what, sftp_status_name(code));
    return fmt::format("{}: {}", what, session_->last_error());
}

Result<RemoteFileInfo> Libssh2Sftp::stat(const std::string& path) {
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    int rc = session_->call([&](LIBSSH2_SESSION*) {
        if (!sftp_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
        return libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                    LIBSSH2_SFTP_STAT, &attrs);
    }, SFTP_IO_TIMEOUT_MS);
    if (rc != 0) {
        return Result<RemoteFileInfo>::Err(ErrorKind::RemoteIO, error_message("stat " + path));
    }
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return Result<RemoteFileInfo>::Ok(to_file_info(name, attrs));
}

Result<std::vector<RemoteFileInfo>> Libssh2Sftp::list(const std::string& path) {
    using R = Result<std::vector<RemoteFileInfo>>;
    std::string dir_path = path.empty() ? "." : path;

    LIBSSH2_SFTP_HANDLE* dir = nullptr;
    session_->call([&](LIBSSH2_SESSION* s) {
        if (!sftp_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
        dir = libssh2_sftp_open_ex(sftp_, dir_path.c_str(), static_cast<unsigned int>(dir_path.size()),
                                   0, 0, LIBSSH2_SFTP_OPENDIR);
        return dir ? 0 : libssh2_session_last_errno(s);
    }, SFTP_IO_TIMEOUT_MS);
    if (!dir) return R::Err(ErrorKind::RemoteIO, error_message("opendir " + dir_path));

    std::vector<RemoteFileInfo> entries;
    char filename[512];
    char longentry[1024];
    bool failed = false;

    while (true) {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        int rc = session_->call([&](LIBSSH2_SESSION*) {
            return libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                           longentry, sizeof(longentry), &attrs);
        }, SFTP_IO_TIMEOUT_MS);
        if (rc == 0) break;   // end of directory
        if (rc < 0) {
            failed = true;
            break;
        }
        std::string name(filename, static_cast<size_t>(rc));
        if (name == "." || name == "..") continue;
        entries.push_back(to_file_info(name, attrs));
    }

    std::string err = failed ? error_message("readdir " + dir_path) : "";
    session_->teardown([dir](LIBSSH2_SESSION*) { return libssh2_sftp_close_handle(dir); },
                       TEARDOWN_TIMEOUT_MS);
    if (failed) return R::Err(ErrorKind::RemoteIO, err);

    // Directories first, then by name
    std::sort(entries.begin(), entries.end(), [](const RemoteFileInfo& a, const RemoteFileInfo& b) {
        if (a.is_dir != b.is_dir) return a.is_dir;
        return a.name < b.name;
    });
    return R::Ok(entries);
}

Result<std::shared_ptr<RemoteFile>> Libssh2Sftp::open(const std::string& path, unsigned long flags, long mode) {
    using R = Result<std::shared_ptr<RemoteFile>>;
    LIBSSH2_SFTP_HANDLE* handle = nullptr;
    session_->call([&](LIBSSH2_SESSION* s) {
        if (!sftp_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
        handle = libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                      flags, mode, LIBSSH2_SFTP_OPENFILE);
        return handle ? 0 : libssh2_session_last_errno(s);
    }, SFTP_IO_TIMEOUT_MS);
    if (!handle) return R::Err(ErrorKind::RemoteIO, error_message("open " + path));
    return R::Ok(std::make_shared<Libssh2RemoteFile>(shared_from_this(), handle));
}

Result<std::shared_ptr<RemoteFile>> Libssh2Sftp::open_read(const std::string& path) {
    return open(path, LIBSSH2_FXF_READ, 0);
}

Result<std::shared_ptr<RemoteFile>> Libssh2Sftp::open_write(const std::string& path) {
    return open(path, LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH);
}

Result<void> Libssh2Sftp::unlink(const std::string& path) {
    int rc = session_->call([&](LIBSSH2_SESSION*) {
        if (!sftp_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
        return libssh2_sftp_unlink_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()));
    }, SFTP_IO_TIMEOUT_MS);
    if (rc != 0) return Result<void>::Err(ErrorKind::RemoteIO, error_message("unlink " + path));
    return Result<void>::Ok();
}

Result<void> Libssh2Sftp::rmdir(const std::string& path) {
    int rc = session_->call([&](LIBSSH2_SESSION*) {
        if (!sftp_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
        return libssh2_sftp_rmdir_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()));
    }, SFTP_IO_TIMEOUT_MS);
    if (rc != 0) return Result<void>::Err(ErrorKind::RemoteIO, error_message("rmdir " + path));
    return Result<void>::Ok();
}

Result<void> Libssh2Sftp::rename(const std::string& from, const std::string& to) {
    int rc = session_->call([&](LIBSSH2_SESSION*) {
        if (!sftp_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
        return libssh2_sftp_rename_ex(sftp_,
            from.c_str(), static_cast<unsigned int>(from.size()),
            to.c_str(), static_cast<unsigned int>(to.size()),
            LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE);
    }, SFTP_IO_TIMEOUT_MS);
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::RemoteIO,
            error_message(fmt::format("rename {} -> {}", from, to)));
    }
    return Result<void>::Ok();
}

Result<void> Libssh2Sftp::mkdir(const std::string& path) {
    int rc = session_->call([&](LIBSSH2_SESSION*) {
        if (!sftp_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
        return libssh2_sftp_mkdir_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                     LIBSSH2_SFTP_S_IRWXU | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IXGRP |
                                     LIBSSH2_SFTP_S_IROTH | LIBSSH2_SFTP_S_IXOTH);
    }, SFTP_IO_TIMEOUT_MS);
    if (rc != 0) return Result<void>::Err(ErrorKind::RemoteIO, error_message("mkdir " + path));
    return Result<void>::Ok();
}

void Libssh2Sftp::close() {
    if (closed_.exchange(true)) return;
    session_->teardown([this](LIBSSH2_SESSION*) {
        if (!sftp_) return 0;
        int rc = libssh2_sftp_shutdown(sftp_);
        if (rc != LIBSSH2_ERROR_EAGAIN) sftp_ = nullptr;
        return rc;
    }, TEARDOWN_TIMEOUT_MS);
}

// ── Libssh2RemoteFile ───────────────────────────────────────

Libssh2RemoteFile::Libssh2RemoteFile(std::shared_ptr<Libssh2Sftp> sftp, LIBSSH2_SFTP_HANDLE* handle)
    : sftp_(std::move(sftp)), handle_(handle) {}

Libssh2RemoteFile::~Libssh2RemoteFile() {
    close();
}

long Libssh2RemoteFile::read(char* buf, size_t len) {
    int n = sftp_->session().call([&](LIBSSH2_SESSION*) {
        if (!handle_) return LIBSSH2_ERROR_BAD_USE;
        return static_cast<int>(libssh2_sftp_read(handle_, buf, len));
    }, SFTP_IO_TIMEOUT_MS);
    return n;
}

bool Libssh2RemoteFile::write_all(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        int w = sftp_->session().call([&](LIBSSH2_SESSION*) {
            if (!handle_) return LIBSSH2_ERROR_BAD_USE;
            return static_cast<int>(libssh2_sftp_write(handle_, data + sent, len - sent));
        }, SFTP_IO_TIMEOUT_MS);
        if (w <= 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

void Libssh2RemoteFile::close() {
    sftp_->session().teardown([this](LIBSSH2_SESSION*) {
        if (!handle_) return 0;
        int rc = libssh2_sftp_close_handle(handle_);
        if (rc != LIBSSH2_ERROR_EAGAIN) handle_ = nullptr;
        return rc;
    }, TEARDOWN_TIMEOUT_MS);
}
