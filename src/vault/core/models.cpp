// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/core/models.hpp>
#include <nlohmann/json.hpp>

namespace vault::core {

void to_json(nlohmann::json& j, const DownloadRequest& r) {
    j = nlohmann::json{
        {"claim_id", r.claim_id},
        {"quality", r.quality},
        {"source_url", r.source_url},
    };
}

void from_json(const nlohmann::json& j, DownloadRequest& r) {
    j.at("claim_id").get_to(r.claim_id);
    j.at("quality").get_to(r.quality);
    j.at("source_url").get_to(r.source_url);
}

void to_json(nlohmann::json& j, const OfflineMetadata& m) {
    auto added = std::chrono::duration_cast<std::chrono::seconds>(
        m.added_at.time_since_epoch()).count();
    j = nlohmann::json{
        {"claim_id", m.claim_id},
        {"quality", m.quality},
        {"filename", m.filename},
        {"file_size", m.file_size},
        {"encrypted", m.encrypted},
        {"added_at", added},
    };
}

void from_json(const nlohmann::json& j, OfflineMetadata& m) {
    j.at("claim_id").get_to(m.claim_id);
    j.at("quality").get_to(m.quality);
    j.at("filename").get_to(m.filename);
    j.at("file_size").get_to(m.file_size);
    j.at("encrypted").get_to(m.encrypted);
    m.added_at = std::chrono::system_clock::time_point(
        std::chrono::seconds(j.at("added_at").get<std::int64_t>()));
}

void to_json(nlohmann::json& j, const DownloadProgress& p) {
    j = nlohmann::json{
        {"claim_id", p.claim_id},
        {"quality", p.quality},
        {"percent", p.percent},
        {"bytes_written", p.bytes_written},
        {"total_bytes", p.total_bytes},
        {"speed_bytes_per_sec", p.speed_bytes_per_sec},
    };
}

void to_json(nlohmann::json& j, const DownloadStats& s) {
    j = nlohmann::json{
        {"total_downloads", s.total_downloads},
        {"total_bytes_downloaded", s.total_bytes_downloaded},
        {"total_duration_ms", s.total_duration_ms},
        {"average_throughput_bytes_per_sec", s.average_throughput_bytes_per_sec},
    };
}

} // namespace vault::core
