// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <system_error>

namespace vault::disk {

struct SpaceInfo {
    std::uint64_t available{0};
    std::uint64_t capacity{0};
};

// Query the volume holding `path`. A path that does not exist yet is
// resolved through its nearest existing parent.
[[nodiscard]] std::expected<SpaceInfo, std::error_code>
query_space(const std::filesystem::path& path) noexcept;

} // namespace vault::disk
