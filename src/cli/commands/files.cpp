#include "../base_cli.hpp"
#include "../theme.hpp"
#include <ctime>
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>

static void print_error(const std::string& error, ErrorKind kind) {
    std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(kind), error));
}

static std::string format_mtime(int64_t mtime) {
    std::time_t t = static_cast<std::time_t>(mtime);
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf);
    return buf;
}

// "drwxr-xr-x" from POSIX mode bits
static std::string format_mode(uint32_t mode, bool is_dir) {
    const char* chars = "rwxrwxrwx";
    std::string out(1, is_dir ? 'd' : '-');
    for (int i = 0; i < 9; i++) {
        out += (mode & (0400u >> i)) ? chars[i] : '-';
    }
    return out;
}

static void do_put(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto words = split_args(arg);
    if (words.size() != 2) {
        std::cout << "Usage: put <local_path> <remote_path>\n";
        return;
    }
    auto profile = cli.resolve_profile("");
    if (!profile) return;

    auto result = cli.service->upload(*profile, expand_home(words[0]), words[1]);
    cli.service->flush_events();
    if (result.is_err()) {
        print_error(result.error, result.kind);
        return;
    }
    std::cout << theme::ok(fmt::format("Uploaded {} bytes", result.value));
}

static void do_get(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto words = split_args(arg);
    if (words.size() != 2) {
        std::cout << "Usage: get <remote_path> <local_path>\n";
        return;
    }
    auto profile = cli.resolve_profile("");
    if (!profile) return;

    auto result = cli.service->download(*profile, words[0], expand_home(words[1]));
    cli.service->flush_events();
    if (result.is_err()) {
        print_error(result.error, result.kind);
        return;
    }
    std::cout << theme::ok(fmt::format("Downloaded {} bytes", result.value));
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto profile = cli.resolve_profile("");
    if (!profile) return;

    std::string path = trimmed(arg);
    if (path.empty()) path = ".";

    auto entries = cli.service->list_dir(*profile, path);
    if (entries.is_err()) {
        print_error(entries.error, entries.kind);
        return;
    }
    for (const auto& e : entries.value) {
        std::string name = e.is_dir ? theme::teal(e.name + "/") : e.name;
        std::cout << "    " << theme::dim(fmt::format("{}  {:>10}  {}  ",
                                                      format_mode(e.permissions, e.is_dir), e.size, format_mtime(e.mtime)))
                  << name << "\n";
    }
}

static void do_rm(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto words = split_args(arg);
    if (words.size() != 1) {
        std::cout << "Usage: rm <remote_path>\n";
        return;
    }
    auto profile = cli.resolve_profile("");
    if (!profile) return;

    auto result = cli.service->remove(*profile, words[0]);
    if (result.is_err()) print_error(result.error, result.kind);
    else std::cout << theme::ok("Removed " + words[0]);
}

static void do_mv(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto words = split_args(arg);
    if (words.size() != 2) {
        std::cout << "Usage: mv <from> <to>\n";
        return;
    }
    auto profile = cli.resolve_profile("");
    if (!profile) return;

    auto result = cli.service->rename(*profile, words[0], words[1]);
    if (result.is_err()) print_error(result.error, result.kind);
    else std::cout << theme::ok(words[0] + " -> " + words[1]);
}

static void do_mkdir(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto words = split_args(arg);
    if (words.size() != 1) {
        std::cout << "Usage: mkdir <remote_path>\n";
        return;
    }
    auto profile = cli.resolve_profile("");
    if (!profile) return;

    auto result = cli.service->mkdir(*profile, words[0]);
    if (result.is_err()) print_error(result.error, result.kind);
    else std::cout << theme::ok("Created " + words[0]);
}

void register_file_commands(BaseCLI& cli) {
    cli.add_command("put", do_put, "Upload a file (put <local> <remote>)");
    cli.add_command("get", do_get, "Download a file (get <remote> <local>)");
    cli.add_command("ls", do_ls, "List a remote directory");
    cli.add_command("rm", do_rm, "Remove a remote file or empty directory");
    cli.add_command("mv", do_mv, "Rename a remote path");
    cli.add_command("mkdir", do_mkdir, "Create a remote directory");
}
