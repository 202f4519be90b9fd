// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace vault::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(VaultErrc::invalid_input));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }

    auto rest_start = scheme_end + 3; // Skip "://"

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

    // Userinfo (user:pass@host)
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.rfind('@', host_end == 0 ? 0 : host_end - 1);
    if (at_pos != std::string_view::npos && at_pos >= rest_start && at_pos < host_end) {
        url.userinfo_ = std::string(url_str.substr(rest_start, at_pos - rest_start));
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(VaultErrc::invalid_input));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        auto rest = authority.substr(bracket_end + 1);
        if (!rest.empty() && rest.front() == ':') {
            url.port_ = std::string(rest.substr(1));
        }
    } else {
        auto colon = authority.find(':');
        if (colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(VaultErrc::invalid_input));
    }

    if (!std::all_of(url.port_.begin(), url.port_.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::unexpected(make_error_code(VaultErrc::invalid_input));
    }

    return url;
}

std::string Url::full() const {
    std::string result = scheme_;
    result += "://";
    if (!userinfo_.empty()) {
        result += userinfo_;
        result += "@";
    }
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string Url::redacted() const {
    return base() + path_;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

} // namespace vault::core
