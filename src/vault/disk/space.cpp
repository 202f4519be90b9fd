// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/disk/space.hpp>
#include <vault/disk/error.hpp>

namespace fs = std::filesystem;

namespace vault::disk {

std::expected<SpaceInfo, std::error_code>
query_space(const fs::path& path) noexcept {
    std::error_code ec;
    fs::path probe = path;
    while (!probe.empty() && !fs::exists(probe, ec)) {
        auto parent = probe.parent_path();
        if (parent == probe) break;
        probe = parent;
    }
    if (probe.empty()) {
        probe = fs::current_path(ec);
        if (ec) {
            return std::unexpected(make_error_code(DiskErrc::invalid_path));
        }
    }

    auto space = fs::space(probe, ec);
    if (ec) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
    return SpaceInfo{space.available, space.capacity};
}

} // namespace vault::disk
