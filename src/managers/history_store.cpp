#include "history_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <sstream>

HistoryStore::HistoryStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path HistoryStore::history_path(const std::string& profile) const {
    return dir_ / (profile + "_history.txt");
}

fs::path HistoryStore::synonyms_path() const {
    return dir_ / "synonyms.yaml";
}

Result<void> HistoryStore::add(const std::string& profile, const std::string& command) {
    std::string line = trimmed(command);
    if (line.empty()) return Result<void>::Ok();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> lines;
    {
        std::ifstream in(history_path(profile));
        std::string l;
        while (std::getline(in, l)) {
            if (!l.empty()) lines.push_back(l);
        }
    }
    lines.push_back(line);
    if (lines.size() > MAX_HISTORY_SIZE) {
        lines.erase(lines.begin(), lines.end() - MAX_HISTORY_SIZE);
    }

    try {
        fs::create_directories(dir_);
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::LocalIO,
            "Failed to create history directory: " + std::string(e.what()));
    }

    std::ofstream out(history_path(profile), std::ios::trunc);
    if (!out) {
        return Result<void>::Err(ErrorKind::LocalIO,
            "Failed to open history file " + history_path(profile).string());
    }
    for (const auto& l : lines) out << l << "\n";
    return Result<void>::Ok();
}

Result<std::vector<std::string>> HistoryStore::get(const std::string& profile) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> history;

    auto path = history_path(profile);
    if (!fs::exists(path)) return Result<std::vector<std::string>>::Ok(history);

    std::ifstream in(path);
    if (!in) {
        return Result<std::vector<std::string>>::Err(ErrorKind::LocalIO,
            "Failed to open history file " + path.string());
    }
    std::string l;
    while (std::getline(in, l)) {
        if (!l.empty()) history.push_back(l);
    }
    std::reverse(history.begin(), history.end());
    return Result<std::vector<std::string>>::Ok(history);
}

void HistoryStore::load_synonyms() {
    if (synonyms_loaded_) return;
    synonyms_loaded_ = true;
    if (!fs::exists(synonyms_path())) return;

    try {
        YAML::Node root = YAML::LoadFile(synonyms_path().string());
        if (!root.IsMap()) return;
        for (const auto& kv : root) {
            synonyms_[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    } catch (const YAML::Exception& e) {
        // Corrupted synonyms file: start fresh
        sshdeck_log(fmt::format("HistoryStore: ignoring {}: {}",
                                synonyms_path().string(), e.what()));
        synonyms_.clear();
    }
}

Result<void> HistoryStore::save_synonyms() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& kv : synonyms_) {
        out << YAML::Key << kv.first << YAML::Value << kv.second;
    }
    out << YAML::EndMap;

    try {
        fs::create_directories(dir_);
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::LocalIO,
            "Failed to create history directory: " + std::string(e.what()));
    }
    std::ofstream file(synonyms_path(), std::ios::trunc);
    if (!file) {
        return Result<void>::Err(ErrorKind::LocalIO,
            "Failed to write " + synonyms_path().string());
    }
    file << out.c_str() << "\n";
    return Result<void>::Ok();
}

Result<std::string> HistoryStore::create_synonym(const std::string& command) {
    std::istringstream words(command);
    std::string word;
    std::string acronym;
    int count = 0;
    while (words >> word) {
        acronym += word[0];
        ++count;
    }
    if (count < 2) return Result<std::string>::Ok("");

    std::lock_guard<std::mutex> lock(mutex_);
    load_synonyms();

    std::string base = acronym;
    for (int n = 1; synonyms_.count(acronym); ++n) {
        acronym = base + std::to_string(n);
    }
    synonyms_[acronym] = trimmed(command);

    auto saved = save_synonyms();
    if (saved.is_err()) return Result<std::string>::Err(saved);
    return Result<std::string>::Ok(acronym);
}

std::optional<std::string> HistoryStore::resolve_synonym(const std::string& synonym) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_synonyms();
    auto it = synonyms_.find(synonym);
    if (it == synonyms_.end()) return std::nullopt;
    return it->second;
}
