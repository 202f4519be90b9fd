// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace vault::core {

// Identifies a transfer target. (claim_id, quality) names every vault file.
struct DownloadRequest {
    std::string claim_id;
    std::string quality;
    std::string source_url;

    // "claim_id-quality"
    [[nodiscard]] std::string key() const { return claim_id + "-" + quality; }
};

// Produced on a verified download, persisted by the metadata store
struct OfflineMetadata {
    std::string claim_id;
    std::string quality;
    std::string filename;
    std::uint64_t file_size{0};
    bool encrypted{false};
    std::chrono::system_clock::time_point added_at;
};

struct DownloadProgress {
    std::string claim_id;
    std::string quality;
    double percent{0.0};
    std::uint64_t bytes_written{0};
    std::uint64_t total_bytes{0};
    std::uint64_t speed_bytes_per_sec{0};
};

struct DownloadStats {
    std::uint64_t total_downloads{0};
    std::uint64_t total_bytes_downloaded{0};
    std::uint64_t total_duration_ms{0};
    std::uint64_t average_throughput_bytes_per_sec{0};
};

// nlohmann ADL hooks
void to_json(nlohmann::json& j, const DownloadRequest& r);
void from_json(const nlohmann::json& j, DownloadRequest& r);
void to_json(nlohmann::json& j, const OfflineMetadata& m);
void from_json(const nlohmann::json& j, OfflineMetadata& m);
void to_json(nlohmann::json& j, const DownloadProgress& p);
void to_json(nlohmann::json& j, const DownloadStats& s);

} // namespace vault::core
