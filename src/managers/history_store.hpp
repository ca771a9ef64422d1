#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Per-profile command history and command synonyms.
//
// History: <dir>/<profile>_history.txt, one command per line, capped at
// MAX_HISTORY_SIZE (oldest dropped). Synonyms: <dir>/synonyms.yaml.
class HistoryStore {
public:
    explicit HistoryStore(fs::path dir);

    Result<void> add(const std::string& profile, const std::string& command);

    // Most recent first.
    Result<std::vector<std::string>> get(const std::string& profile) const;

    // Acronym of the command's words ("git status -s" -> "gs-"). Commands of a
    // single word get no synonym (empty string). Collisions get a numeric suffix.
    Result<std::string> create_synonym(const std::string& command);

    std::optional<std::string> resolve_synonym(const std::string& synonym);

    const fs::path& dir() const { return dir_; }

private:
    fs::path dir_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> synonyms_;
    bool synonyms_loaded_ = false;

    fs::path history_path(const std::string& profile) const;
    fs::path synonyms_path() const;
    void load_synonyms();
    Result<void> save_synonyms() const;
};
