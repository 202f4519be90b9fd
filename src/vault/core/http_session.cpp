// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/core/http_session.hpp>
#include <vault/version.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <string_view>

namespace vault::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::optional<std::uint64_t> parse_u64(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
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

// Header callback for HEAD/GET responses. A new status line (redirect hop or
// interim response) discards the headers collected so far.
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

void fill_response(CURL* curl, HttpResponse& response) {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    const auto& h = response.headers;

    if (auto it = h.find("content-length"); it != h.end()) {
        response.content_length = parse_u64(it->second);
    }
    if (auto it = h.find("content-range"); it != h.end()) {
        (void)parse_content_range(it->second, response.range_start, response.range_total);
    }
    if (auto it = h.find("accept-ranges"); it != h.end()) {
        response.accepts_ranges = it->second.find("bytes") != std::string::npos;
    }
    if (auto it = h.find("etag"); it != h.end()) {
        response.etag = it->second;
    }
    if (auto it = h.find("content-type"); it != h.end()) {
        response.content_type = it->second;
    }
}

void apply_common_options(CURL* curl, const std::string& url, const HttpOptions& options,
                          std::map<std::string, std::string>* headers) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    static const std::string agent = vault::user_agent();
    curl_easy_setopt(curl, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(options.max_redirects));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, headers);
}

// Streaming state for GET
struct StreamContext {
    CURL* curl{nullptr};
    HttpResponse* response{nullptr};
    const ResponseHandler* on_response{nullptr};
    const DataHandler* on_data{nullptr};
    bool started{false};
    bool error_status{false};
    std::error_code abort_error;
};

std::error_code begin_stream(StreamContext& ctx) {
    ctx.started = true;
    fill_response(ctx.curl, *ctx.response);
    if (ctx.response->status_code >= 400) {
        ctx.error_status = true;
        return {};
    }
    if (*ctx.on_response) {
        return (*ctx.on_response)(*ctx.response);
    }
    return {};
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (!ctx) return 0;

    std::size_t total = size * nitems;

    if (!ctx->started) {
        if (auto ec = begin_stream(*ctx)) {
            ctx->abort_error = ec;
            return 0;
        }
    }

    // Error bodies are drained and discarded
    if (ctx->error_status) return total;

    if (*ctx->on_data) {
        if (auto ec = (*ctx->on_data)(ptr, total)) {
            ctx->abort_error = ec;
            return 0;
        }
    }
    return total;
}

} // namespace

std::optional<std::uint64_t> HttpResponse::resource_size() const noexcept {
    if (range_total) return range_total;
    if (status_code == 200) return content_length;
    return std::nullopt;
}

bool parse_content_range(const std::string& value,
                         std::optional<std::uint64_t>& start,
                         std::optional<std::uint64_t>& total) noexcept {
    std::string_view v(value);
    if (!v.starts_with("bytes")) return false;
    v.remove_prefix(5);
    while (!v.empty() && v.front() == ' ') v.remove_prefix(1);

    auto slash = v.find('/');
    if (slash == std::string_view::npos) return false;

    auto range = v.substr(0, slash);
    auto size = v.substr(slash + 1);

    if (range != "*") {
        auto dash = range.find('-');
        if (dash == std::string_view::npos) return false;
        start = parse_u64(range.substr(0, dash));
        if (!start) return false;
    }
    if (size != "*") {
        total = parse_u64(size);
        if (!total) return false;
    }
    return true;
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(HttpOptions options)
    : options_(options) {}

Result<HttpResponse> HttpSession::head(const std::string& url) const {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(Error(VaultErrc::network_error, "curl_easy_init failed"));
    }

    HttpResponse response{};
    apply_common_options(curl.ptr, url, options_, &response.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        return std::unexpected(Error(VaultErrc::network_error, curl_easy_strerror(result)));
    }

    fill_response(curl.ptr, response);
    if (response.status_code >= 400) {
        return std::unexpected(Error::http_status(response.status_code));
    }
    return response;
}

Result<HttpResponse> HttpSession::get(const std::string& url,
                                      std::uint64_t offset,
                                      const ResponseHandler& on_response,
                                      const DataHandler& on_data) const {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(Error(VaultErrc::network_error, "curl_easy_init failed"));
    }

    HttpResponse response{};
    apply_common_options(curl.ptr, url, options_, &response.headers);

    std::string range;
    if (offset > 0) {
        range = std::to_string(offset) + "-";
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    // Abort when the transfer rate stays below 1 B/s for the stall window
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout_sec));

    StreamContext ctx;
    ctx.curl = curl.ptr;
    ctx.response = &response;
    ctx.on_response = &on_response;
    ctx.on_data = &on_data;

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.abort_error) {
        return std::unexpected(Error(ctx.abort_error, "transfer aborted"));
    }
    if (result != CURLE_OK) {
        return std::unexpected(Error(VaultErrc::network_error, curl_easy_strerror(result)));
    }

    // Empty body: the write callback never ran
    if (!ctx.started) {
        if (auto ec = begin_stream(ctx)) {
            return std::unexpected(Error(ec, "transfer aborted"));
        }
    }

    if (ctx.error_status) {
        return std::unexpected(Error::http_status(response.status_code));
    }
    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace vault::core
