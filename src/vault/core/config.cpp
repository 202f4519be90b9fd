// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/core/config.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace vault::core {

namespace {

fs::path data_root() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "vault";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".local" / "share" / "vault";
    }
    return fs::temp_directory_path() / "vault";
}

} // namespace

fs::path expand_home(const std::string& path) {
    if (path == "~" || path.starts_with("~/")) {
        if (const char* home = std::getenv("HOME"); home && *home) {
            return fs::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return fs::path(path);
}

//=============================================================================
// VaultConfig
//=============================================================================

VaultConfig VaultConfig::defaults() {
    VaultConfig config;
    auto root = data_root();
    config.vault_dir = root / "vault";
    return config;
}

Result<VaultConfig> VaultConfig::parse(const std::string& json_text) {
    VaultConfig config = defaults();

    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(Error(VaultErrc::invalid_input, "config root must be an object"));
        }

        if (j.contains("vault_dir")) {
            config.vault_dir = expand_home(j["vault_dir"].get<std::string>());
        }
        if (j.contains("secret_service")) {
            config.secret_service = j["secret_service"].get<std::string>();
            if (config.secret_service.empty()) {
                return std::unexpected(Error(VaultErrc::invalid_input, "secret_service must not be empty"));
            }
        }
        if (j.contains("encrypt_downloads")) {
            config.encrypt_downloads = j["encrypt_downloads"].get<bool>();
        }
        if (j.contains("disk_space_buffer_bytes")) {
            config.disk_space_buffer_bytes = j["disk_space_buffer_bytes"].get<std::uint64_t>();
        }
        if (j.contains("stale_lock_age_seconds")) {
            config.stale_lock_age = std::chrono::seconds(j["stale_lock_age_seconds"].get<std::int64_t>());
        }
        if (j.contains("progress_interval_ms")) {
            config.progress_interval = std::chrono::milliseconds(j["progress_interval_ms"].get<std::int64_t>());
        }
        if (j.contains("connect_timeout_seconds")) {
            config.connect_timeout_seconds = j["connect_timeout_seconds"].get<std::uint32_t>();
        }
        if (j.contains("server_threads")) {
            config.server_threads = j["server_threads"].get<std::uint32_t>();
            if (config.server_threads == 0) {
                config.server_threads = 1;
            }
        }
        if (j.contains("log_level")) {
            config.log_level = j["log_level"].get<std::string>();
        }
        if (j.contains("log_file")) {
            config.log_file = j["log_file"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(Error(VaultErrc::invalid_input, e.what()));
    }

    return config;
}

Result<VaultConfig> VaultConfig::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return defaults();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(Error(VaultErrc::io_error, "cannot open " + path.string()));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

std::string VaultConfig::to_json() const {
    nlohmann::json j;
    j["vault_dir"] = vault_dir.string();
    j["secret_service"] = secret_service;
    j["encrypt_downloads"] = encrypt_downloads;
    j["disk_space_buffer_bytes"] = disk_space_buffer_bytes;
    j["stale_lock_age_seconds"] = stale_lock_age.count();
    j["progress_interval_ms"] = progress_interval.count();
    j["connect_timeout_seconds"] = connect_timeout_seconds;
    j["server_threads"] = server_threads;
    j["log_level"] = log_level;
    j["log_file"] = log_file;
    return j.dump(2);
}

} // namespace vault::core
