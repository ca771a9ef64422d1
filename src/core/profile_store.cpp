#include "profile_store.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

ProfileStore::ProfileStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path ProfileStore::profile_path(const std::string& name) const {
    return dir_ / (name + ".yaml");
}

Result<Profile> ProfileStore::parse_file(const fs::path& path) {
    Profile profile;
    profile.name = path.stem().string();

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return Result<Profile>::Err(ErrorKind::Config,
                fmt::format("{}: expected a mapping", path.string()));
        }
        profile.host = root["host"].as<std::string>("");
        profile.port = root["port"].as<int>(22);
        profile.username = root["username"].as<std::string>("");

        if (root["ssh_key_path"]) {
            auto key = root["ssh_key_path"].as<std::string>("");
            if (!key.empty()) profile.ssh_key_path = expand_home(key);
        }
        if (root["password"]) {
            auto pw = root["password"].as<std::string>("");
            if (!pw.empty()) profile.password = pw;
        }
    } catch (const YAML::Exception& e) {
        return Result<Profile>::Err(ErrorKind::Config,
            fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    auto valid = validate_profile(profile);
    if (valid.is_err()) return Result<Profile>::Err(valid);
    return Result<Profile>::Ok(profile);
}

std::vector<Profile> ProfileStore::load_all() const {
    std::vector<Profile> profiles;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return profiles;

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".yaml") continue;
        auto result = parse_file(entry.path());
        if (result.is_err()) {
            sshdeck_log(fmt::format("ProfileStore: skipping {}: {}",
                                    entry.path().string(), result.error));
            continue;
        }
        profiles.push_back(std::move(result.value));
    }

    std::sort(profiles.begin(), profiles.end(),
              [](const Profile& a, const Profile& b) { return a.name < b.name; });
    return profiles;
}

Result<Profile> ProfileStore::load(const std::string& name) const {
    auto path = profile_path(name);
    if (!fs::exists(path)) {
        return Result<Profile>::Err(ErrorKind::Config,
            fmt::format("No profile named '{}' in {}", name, dir_.string()));
    }
    return parse_file(path);
}

Result<void> ProfileStore::save(const Profile& profile) const {
    auto valid = validate_profile(profile);
    if (valid.is_err()) return valid;

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "host" << YAML::Value << profile.host;
    out << YAML::Key << "port" << YAML::Value << profile.port;
    out << YAML::Key << "username" << YAML::Value << profile.username;
    if (profile.ssh_key_path) {
        out << YAML::Key << "ssh_key_path" << YAML::Value << *profile.ssh_key_path;
    }
    if (profile.password) {
        out << YAML::Key << "password" << YAML::Value << *profile.password;
    }
    out << YAML::EndMap;

    try {
        fs::create_directories(dir_);
        std::ofstream file(profile_path(profile.name));
        if (!file) {
            return Result<void>::Err(ErrorKind::LocalIO,
                "Cannot write " + profile_path(profile.name).string());
        }
        file << out.c_str() << "\n";
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::LocalIO,
            "Failed to save profile: " + std::string(e.what()));
    }
    return Result<void>::Ok();
}

Result<void> ProfileStore::remove(const std::string& name) const {
    std::error_code ec;
    if (!fs::remove(profile_path(name), ec)) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Failed to delete profile '{}'{}", name,
                        ec ? ": " + ec.message() : std::string()));
    }
    return Result<void>::Ok();
}
