// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/core/events.hpp>
#include <nlohmann/json.hpp>

namespace vault::core {

std::string started_payload(const DownloadRequest& request,
                            std::uint64_t resume_from,
                            std::optional<std::uint64_t> total_bytes) {
    nlohmann::json j{
        {"claim_id", request.claim_id},
        {"quality", request.quality},
        {"resume_from", resume_from},
    };
    j["total_bytes"] = total_bytes ? nlohmann::json(*total_bytes) : nlohmann::json(nullptr);
    return j.dump();
}

std::string progress_payload(const DownloadProgress& progress) {
    return nlohmann::json(progress).dump();
}

std::string completed_payload(const OfflineMetadata& metadata) {
    return nlohmann::json(metadata).dump();
}

std::string error_payload(const DownloadRequest& request, const Error& error) {
    nlohmann::json j{
        {"claim_id", request.claim_id},
        {"quality", request.quality},
        {"category", std::string(error.category())},
        {"recoverable", error.recoverable()},
        {"user_message", error.user_message()},
        {"message", error.message()},
    };
    return j.dump();
}

std::string server_started_payload(std::uint16_t port, const std::string& base_url) {
    nlohmann::json j{
        {"port", port},
        {"url", base_url},
    };
    return j.dump();
}

//=============================================================================
// JsonLineEventSink
//=============================================================================

void JsonLineEventSink::emit(const char* name, const std::string& payload) {
    std::lock_guard lock(mutex_);
    out_ << name << ' ' << payload << '\n';
    out_.flush();
}

void JsonLineEventSink::on_download_started(const DownloadRequest& request,
                                            std::uint64_t resume_from,
                                            std::optional<std::uint64_t> total_bytes) {
    emit(EVENT_DOWNLOAD_STARTED, started_payload(request, resume_from, total_bytes));
}

void JsonLineEventSink::on_download_progress(const DownloadProgress& progress) {
    emit(EVENT_DOWNLOAD_PROGRESS, progress_payload(progress));
}

void JsonLineEventSink::on_download_completed(const OfflineMetadata& metadata) {
    emit(EVENT_DOWNLOAD_COMPLETE, completed_payload(metadata));
}

void JsonLineEventSink::on_download_failed(const DownloadRequest& request, const Error& error) {
    emit(EVENT_DOWNLOAD_ERROR, error_payload(request, error));
}

void JsonLineEventSink::on_server_started(std::uint16_t port, const std::string& base_url) {
    emit(EVENT_SERVER_STARTED, server_started_payload(port, base_url));
}

} // namespace vault::core
