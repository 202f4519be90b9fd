// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace vault::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

//=============================================================================
// Spinner
//=============================================================================

void Spinner::update(std::uint64_t current) {
    out_ << "\r" << SPINNER_FRAMES[frame_ % 4] << " " << ProgressBar::format_bytes(current)
         << std::string(10, ' ') << std::flush;
    ++frame_;
}

void Spinner::clear() {
    out_ << "\r" << std::string(40, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::ostream& out, std::uint64_t total, std::string_view label)
    : out_(out)
    , total_(total)
    , label_(label) {}

void ProgressBar::reset(std::uint64_t total, std::string_view label) {
    total_ = total;
    label_ = label;
    last_percent_ = -1;
    finished_ = false;
}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) {
    if (total_ == 0) return;

    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw if significant progress (every 1%)
    const int scaled = static_cast<int>(percent);
    if (scaled <= last_percent_ && !finished_) return;
    last_percent_ = scaled;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);

    line += " ";
    if (scaled < 10) line += "  ";
    else if (scaled < 100) line += " ";
    line += std::to_string(scaled) + "%";

    line += " (";
    line += format_bytes(current);
    line += "/";
    line += format_bytes(total_);
    line += ")";

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);
    }

    // ETA
    const std::uint64_t remaining = current < total_ ? total_ - current : 0;
    if (speed_bps > 0 && remaining > 0) {
        line += " ETA: ";
        line += format_time(remaining / speed_bps);
    }

    // Clear rest of line
    line += std::string(10, ' ');

    out_ << line << std::flush;
}

void ProgressBar::finish() {
    if (finished_) return;
    finished_ = true;
    update(total_, 0);
    out_ << std::endl;
}

void ProgressBar::clear() {
    out_ << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) const {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bps >= GB) {
        return fixed(static_cast<double>(bps) / GB, 1) + " GB/s";
    } else if (bps >= MB) {
        return fixed(static_cast<double>(bps) / MB, 1) + " MB/s";
    } else if (bps >= KB) {
        return fixed(static_cast<double>(bps) / KB, 1) + " KB/s";
    }
    return std::to_string(bps) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) {
        return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
    } else if (bytes >= GB) {
        return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    } else if (bytes >= MB) {
        return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    } else if (bytes >= KB) {
        return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    }
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
        return ss.str();
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

//=============================================================================
// ProgressEventSink
//=============================================================================

ProgressEventSink::ProgressEventSink(std::ostream& out)
    : bar_(out)
    , spinner_(out) {}

void ProgressEventSink::on_download_started(const core::DownloadRequest& request,
                                            std::uint64_t /*resume_from*/,
                                            std::optional<std::uint64_t> total_bytes) {
    std::lock_guard lock(mutex_);
    bar_.reset(total_bytes.value_or(0), request.key());
}

void ProgressEventSink::on_download_progress(const core::DownloadProgress& progress) {
    std::lock_guard lock(mutex_);
    if (bar_.total() == 0 && progress.total_bytes > 0) {
        bar_.total(progress.total_bytes);
    }
    if (bar_.total() == 0) {
        spinner_.update(progress.bytes_written);
        return;
    }
    bar_.update(progress.bytes_written, progress.speed_bytes_per_sec);
}

void ProgressEventSink::on_download_completed(const core::OfflineMetadata& /*metadata*/) {
    std::lock_guard lock(mutex_);
    if (bar_.total() == 0) {
        spinner_.clear();
        return;
    }
    bar_.finish();
}

void ProgressEventSink::on_download_failed(const core::DownloadRequest& /*request*/,
                                           const core::Error& /*error*/) {
    std::lock_guard lock(mutex_);
    bar_.clear();
}

} // namespace vault::cli
