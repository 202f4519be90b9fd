// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/stream/range.hpp>
#include <algorithm>
#include <limits>
#include <optional>
#include <string>

namespace vault::stream {

namespace {

std::optional<std::uint64_t> parse_number(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;

    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

core::Error invalid(std::string_view header) {
    return core::Error(core::VaultErrc::invalid_range, std::string(header));
}

} // namespace

core::Result<ByteRange> parse_range(std::string_view header, std::uint64_t size) {
    auto ranges = trim(header);
    if (!ranges.starts_with("bytes=")) {
        return std::unexpected(invalid(header));
    }
    ranges = trim(ranges.substr(6));

    // Single range only
    auto dash = ranges.find('-');
    if (dash == std::string_view::npos || ranges.find(',') != std::string_view::npos ||
        ranges.find('-', dash + 1) != std::string_view::npos) {
        return std::unexpected(invalid(header));
    }
    if (size == 0) {
        return std::unexpected(invalid(header));
    }

    auto first = trim(ranges.substr(0, dash));
    auto second = trim(ranges.substr(dash + 1));

    ByteRange range;
    if (first.empty()) {
        // Suffix: last n bytes
        auto suffix = parse_number(second);
        if (!suffix || *suffix == 0) {
            return std::unexpected(invalid(header));
        }
        range.start = *suffix >= size ? 0 : size - *suffix;
        range.end = size - 1;
        return range;
    }

    auto start = parse_number(first);
    if (!start) {
        return std::unexpected(invalid(header));
    }
    range.start = *start;

    if (second.empty()) {
        range.end = size - 1;
    } else {
        auto end = parse_number(second);
        if (!end) {
            return std::unexpected(invalid(header));
        }
        range.end = std::min(*end, size - 1);
    }

    if (range.start > range.end || range.start >= size) {
        return std::unexpected(invalid(header));
    }
    return range;
}

} // namespace vault::stream
