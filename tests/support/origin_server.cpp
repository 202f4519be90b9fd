// Copyright (c) 2026 changcheng967. All rights reserved.

#include "support/origin_server.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <charconv>
#include <string_view>

namespace vault::test {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr std::size_t BODY_CHUNK = 16 * 1024;

std::optional<std::uint64_t> to_number(std::string_view text) {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

// "bytes=a-" or "bytes=a-b"; suffix ranges are not needed here
bool parse_simple_range(std::string_view header, std::uint64_t& start, std::optional<std::uint64_t>& end) {
    if (!header.starts_with("bytes=")) return false;
    header.remove_prefix(6);
    const auto dash = header.find('-');
    if (dash == std::string_view::npos || dash == 0) return false;
    auto first = to_number(header.substr(0, dash));
    if (!first) return false;
    start = *first;
    if (dash + 1 < header.size()) {
        end = to_number(header.substr(dash + 1));
        if (!end) return false;
    }
    return true;
}

} // namespace

OriginServer::OriginServer(std::string body, OriginOptions options)
    : acceptor_(ioc_, tcp::endpoint(net::ip::make_address_v4("127.0.0.1"), 0))
    , body_(std::move(body))
    , options_(std::move(options)) {
    port_ = acceptor_.local_endpoint().port();
    accept_thread_ = std::thread([this] { accept_loop(); });
}

OriginServer::~OriginServer() {
    stopping_ = true;

    // Wake the blocking accept
    beast::error_code ec;
    tcp::socket wake(ioc_);
    wake.connect(tcp::endpoint(net::ip::make_address_v4("127.0.0.1"), port_), ec);
    accept_thread_.join();
    wake.close(ec);
    acceptor_.close(ec);

    std::vector<std::thread> connections;
    {
        std::lock_guard lock(mutex_);
        connections.swap(connections_);
    }
    for (auto& t : connections) {
        t.join();
    }
}

std::string OriginServer::url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
}

void OriginServer::set_options(OriginOptions options) {
    std::lock_guard lock(mutex_);
    options_ = std::move(options);
}

void OriginServer::set_body(std::string body, std::string etag) {
    std::lock_guard lock(mutex_);
    body_ = std::move(body);
    options_.etag = std::move(etag);
}

std::vector<std::string> OriginServer::ranges() const {
    std::lock_guard lock(mutex_);
    return ranges_;
}

void OriginServer::accept_loop() {
    for (;;) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_.accept(socket, ec);
        if (stopping_) return;
        if (ec) continue;

        std::lock_guard lock(mutex_);
        connections_.emplace_back([this, s = std::move(socket)]() mutable { serve(std::move(s)); });
    }
}

void OriginServer::serve(tcp::socket socket) {
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    beast::error_code ec;
    http::read(socket, buffer, req, ec);
    if (ec) return;

    std::string body;
    OriginOptions options;
    const bool is_head = req.method() == http::verb::head;
    std::string range_header;
    if (auto it = req.find(http::field::range); it != req.end()) {
        range_header = std::string(it->value());
    }
    {
        std::lock_guard lock(mutex_);
        body = body_;
        options = options_;
        if (!is_head) ranges_.push_back(range_header);
    }
    if (is_head) {
        ++head_count_;
    } else {
        ++get_count_;
    }

    http::response<http::empty_body> res;
    res.version(req.version());
    res.keep_alive(false);
    res.set(http::field::server, "vault-test-origin");

    auto finish = [&] {
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    };
    auto send_empty = [&](http::status status) {
        res.result(status);
        res.content_length(0);
        http::write(socket, res, ec);
        finish();
    };

    if (options.status_override != 0) {
        res.result(static_cast<unsigned>(options.status_override));
        res.content_length(0);
        http::write(socket, res, ec);
        finish();
        return;
    }
    if (is_head && !options.support_head) {
        send_empty(http::status::method_not_allowed);
        return;
    }

    const std::uint64_t size = body.size();
    std::uint64_t start = 0;
    std::uint64_t end = size == 0 ? 0 : size - 1;
    bool partial = false;

    if (!is_head && options.support_ranges && !options.ignore_ranges && !range_header.empty()) {
        std::uint64_t first = 0;
        std::optional<std::uint64_t> last;
        if (!parse_simple_range(range_header, first, last) || first >= size) {
            res.set(http::field::content_range, "bytes */" + std::to_string(size));
            send_empty(http::status::range_not_satisfiable);
            return;
        }
        start = options.range_start.value_or(first);
        end = last ? std::min(*last, size - 1) : size - 1;
        partial = true;
    }

    res.result(partial ? http::status::partial_content : http::status::ok);
    res.set(http::field::content_type, "video/mp4");
    if (!options.etag.empty()) {
        res.set(http::field::etag, options.etag);
    }
    if (options.support_ranges) {
        res.set(http::field::accept_ranges, "bytes");
    }
    if (partial) {
        res.set(http::field::content_range,
                "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(size));
    }
    const std::size_t length = size == 0 ? 0 : static_cast<std::size_t>(end - start + 1);
    res.content_length(is_head && options.head_length ? *options.head_length : length);

    http::response_serializer<http::empty_body> serializer{res};
    http::write_header(socket, serializer, ec);
    if (ec || is_head) {
        finish();
        return;
    }

    std::size_t to_send = length;
    if (options.truncate_after) {
        to_send = std::min(to_send, *options.truncate_after);
    }

    std::size_t sent = 0;
    while (sent < to_send) {
        const std::size_t n = std::min(BODY_CHUNK, to_send - sent);
        net::write(socket, net::buffer(body.data() + start + sent, n), ec);
        if (ec) break;
        sent += n;
        if (options.chunk_delay.count() > 0) {
            std::this_thread::sleep_for(options.chunk_delay);
        }
    }
    finish();
}

} // namespace vault::test
