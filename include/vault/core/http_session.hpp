// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/config.hpp>
#include <vault/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <system_error>

namespace vault::core {

// Response metadata. Header names are lower-cased.
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::optional<std::uint64_t> content_length;
    std::optional<std::uint64_t> range_start;   // From Content-Range
    std::optional<std::uint64_t> range_total;   // From Content-Range
    bool accepts_ranges{false};
    std::string etag;
    std::string content_type;

    // Full resource size as far as this response tells
    [[nodiscard]] std::optional<std::uint64_t> resource_size() const noexcept;
};

struct HttpOptions {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
};

// Called once, before the first body byte, for a non-error status.
// A non-empty error_code aborts the transfer.
using ResponseHandler = std::function<std::error_code(const HttpResponse&)>;

// Called for each body fragment. A non-empty error_code aborts the transfer.
using DataHandler = std::function<std::error_code(const char* data, std::size_t size)>;

class HttpSession {
public:
    explicit HttpSession(HttpOptions options = {});

    // Metadata probe. Status >= 400 is http_error.
    [[nodiscard]] Result<HttpResponse> head(const std::string& url) const;

    // Streaming GET, sending "Range: bytes=<offset>-" when offset > 0.
    // Transport failures are network_error; a handler abort returns the
    // handler's error; status >= 400 is http_error and no handler runs.
    [[nodiscard]] Result<HttpResponse> get(const std::string& url,
                                           std::uint64_t offset,
                                           const ResponseHandler& on_response,
                                           const DataHandler& on_data) const;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

// Parse "bytes <start>-<end>/<total>" or "bytes */<total>"
[[nodiscard]] bool parse_content_range(const std::string& value,
                                       std::optional<std::uint64_t>& start,
                                       std::optional<std::uint64_t>& total) noexcept;

} // namespace vault::core
