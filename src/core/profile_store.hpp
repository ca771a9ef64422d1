#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Profiles are stored one per file: <dir>/<name>.yaml
//
//   host: example.org
//   port: 22
//   username: deploy
//   ssh_key_path: ~/.ssh/id_ed25519   # or: password: "..."
class ProfileStore {
public:
    explicit ProfileStore(fs::path dir);

    // All valid profiles, sorted by name. Invalid files are logged and skipped.
    std::vector<Profile> load_all() const;

    Result<Profile> load(const std::string& name) const;
    Result<void> save(const Profile& profile) const;
    Result<void> remove(const std::string& name) const;

    const fs::path& dir() const { return dir_; }

private:
    fs::path dir_;

    fs::path profile_path(const std::string& name) const;
    static Result<Profile> parse_file(const fs::path& path);
};
