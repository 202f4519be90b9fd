// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/events.hpp>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace vault::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out, std::uint64_t total = 0, std::string_view label = {});

    // Redraws at most once per whole percent
    void update(std::uint64_t current, std::uint64_t speed_bps = 0);

    // Finish the progress bar
    void finish();

    // Clear the progress bar line
    void clear();

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    // Rearm after finish() for the next transfer
    void reset(std::uint64_t total, std::string_view label);

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] std::string render_bar(double percent) const;

    std::ostream& out_;
    std::uint64_t total_{0};
    int last_percent_{-1};
    std::string label_;
    bool finished_{false};
};

// Spinner for transfers of unknown length
class Spinner {
public:
    explicit Spinner(std::ostream& out) noexcept : out_(out) {}

    void update(std::uint64_t current);
    void clear();

private:
    std::ostream& out_;
    std::size_t frame_{0};
};

// Draws download events on a terminal
class ProgressEventSink final : public core::EventSink {
public:
    explicit ProgressEventSink(std::ostream& out);

    void on_download_started(const core::DownloadRequest& request,
                             std::uint64_t resume_from,
                             std::optional<std::uint64_t> total_bytes) override;
    void on_download_progress(const core::DownloadProgress& progress) override;
    void on_download_completed(const core::OfflineMetadata& metadata) override;
    void on_download_failed(const core::DownloadRequest& request, const core::Error& error) override;

private:
    std::mutex mutex_;
    ProgressBar bar_;
    Spinner spinner_;
};

} // namespace vault::cli
