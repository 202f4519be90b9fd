// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/error.hpp>
#include <cstdint>
#include <string_view>

namespace vault::stream {

// Inclusive byte range
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] constexpr std::uint64_t length() const noexcept { return end - start + 1; }

    constexpr bool operator==(const ByteRange&) const = default;
};

// Parse a Range header value against a resource of `size` bytes.
// Accepts "bytes=a-b", "bytes=a-" and "bytes=-n". The end is clamped to
// size-1. Anything else, start > end, or start >= size is invalid_range.
[[nodiscard]] core::Result<ByteRange> parse_range(std::string_view header, std::uint64_t size);

// True when `range` covers less than the whole resource
[[nodiscard]] constexpr bool is_partial(const ByteRange& range, std::uint64_t size) noexcept {
    return range.start != 0 || range.end + 1 != size;
}

} // namespace vault::stream
