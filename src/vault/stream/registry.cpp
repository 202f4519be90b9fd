// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/stream/registry.hpp>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <utility>

namespace vault::stream {

namespace {

struct MimeEntry {
    std::string_view extension;
    std::string_view type;
};

constexpr MimeEntry MIME_TYPES[] = {
    {".mp4", "video/mp4"},
    {".m4v", "video/x-m4v"},
    {".mkv", "video/x-matroska"},
    {".webm", "video/webm"},
    {".mov", "video/quicktime"},
    {".avi", "video/x-msvideo"},
    {".ts", "video/mp2t"},
    {".m3u8", "application/vnd.apple.mpegurl"},
    {".mp3", "audio/mpeg"},
    {".m4a", "audio/mp4"},
    {".ogg", "audio/ogg"},
    {".wav", "audio/wav"},
    {".flac", "audio/flac"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".webp", "image/webp"},
    {".json", "application/json"},
    {".txt", "text/plain"},
    {".vtt", "text/vtt"},
    {".srt", "application/x-subrip"},
};

} // namespace

std::string guess_content_type(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : MIME_TYPES) {
        if (entry.extension == ext) {
            return std::string(entry.type);
        }
    }
    return "application/octet-stream";
}

//=============================================================================
// StreamRegistry
//=============================================================================

void StreamRegistry::insert(StreamRegistration registration) {
    std::unique_lock lock(mutex_);
    auto key = registration.key;
    entries_.insert_or_assign(std::move(key), std::move(registration));
}

bool StreamRegistry::remove(std::string_view key) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

std::optional<StreamRegistration> StreamRegistry::find(std::string_view key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::size_t StreamRegistry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

RegistrySummary StreamRegistry::summary() const {
    std::shared_lock lock(mutex_);
    RegistrySummary s;
    s.active_streams = entries_.size();
    for (const auto& [key, entry] : entries_) {
        if (entry.encrypted) {
            ++s.encrypted_streams;
        } else {
            ++s.unencrypted_streams;
        }
        s.total_content_size_bytes += entry.file_size;
    }
    return s;
}

void StreamRegistry::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

} // namespace vault::stream
