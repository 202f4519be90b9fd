// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/error.hpp>
#include <vault/core/models.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace vault::core {

// Event names published to front ends
inline constexpr const char* EVENT_DOWNLOAD_STARTED = "download-started";
inline constexpr const char* EVENT_DOWNLOAD_PROGRESS = "download-progress";
inline constexpr const char* EVENT_DOWNLOAD_COMPLETE = "download-complete";
inline constexpr const char* EVENT_DOWNLOAD_ERROR = "download-error";
inline constexpr const char* EVENT_SERVER_STARTED = "local-server-started";

// Receiver for vault notifications. Callbacks run on the thread doing the
// work and must not block for long.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_download_started(const DownloadRequest& /*request*/,
                                     std::uint64_t /*resume_from*/,
                                     std::optional<std::uint64_t> /*total_bytes*/) {}
    virtual void on_download_progress(const DownloadProgress& /*progress*/) {}
    virtual void on_download_completed(const OfflineMetadata& /*metadata*/) {}
    virtual void on_download_failed(const DownloadRequest& /*request*/, const Error& /*error*/) {}
    virtual void on_server_started(std::uint16_t /*port*/, const std::string& /*base_url*/) {}
};

// Writes one "<event-name> <json>" line per event
class JsonLineEventSink final : public EventSink {
public:
    explicit JsonLineEventSink(std::ostream& out) : out_(out) {}

    void on_download_started(const DownloadRequest& request,
                             std::uint64_t resume_from,
                             std::optional<std::uint64_t> total_bytes) override;
    void on_download_progress(const DownloadProgress& progress) override;
    void on_download_completed(const OfflineMetadata& metadata) override;
    void on_download_failed(const DownloadRequest& request, const Error& error) override;
    void on_server_started(std::uint16_t port, const std::string& base_url) override;

private:
    void emit(const char* name, const std::string& payload);

    std::ostream& out_;
    std::mutex mutex_;
};

// JSON payloads, shared by sinks and tests
[[nodiscard]] std::string started_payload(const DownloadRequest& request,
                                          std::uint64_t resume_from,
                                          std::optional<std::uint64_t> total_bytes);
[[nodiscard]] std::string progress_payload(const DownloadProgress& progress);
[[nodiscard]] std::string completed_payload(const OfflineMetadata& metadata);
[[nodiscard]] std::string error_payload(const DownloadRequest& request, const Error& error);
[[nodiscard]] std::string server_started_payload(std::uint16_t port, const std::string& base_url);

} // namespace vault::core
