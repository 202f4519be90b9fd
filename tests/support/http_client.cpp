// Copyright (c) 2026 changcheng967. All rights reserved.

#include "support/http_client.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <cctype>

namespace vault::test {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string HttpReply::header(const std::string& name) const {
    auto it = headers.find(lowercase(name));
    return it == headers.end() ? std::string() : it->second;
}

bool HttpReply::has_header(const std::string& name) const {
    return headers.find(lowercase(name)) != headers.end();
}

HttpReply http_request(std::uint16_t port,
                       http::verb method,
                       const std::string& target,
                       const std::optional<std::string>& range) {
    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(tcp::endpoint(net::ip::make_address_v4("127.0.0.1"), port));

    http::request<http::empty_body> req{method, target, 11};
    req.set(http::field::host, "127.0.0.1:" + std::to_string(port));
    req.set(http::field::user_agent, "vault-tests");
    req.keep_alive(false);
    if (range) {
        req.set(http::field::range, *range);
    }
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);
    if (method == http::verb::head) {
        parser.skip(true);
    }
    http::read(stream, buffer, parser);

    const auto& res = parser.get();
    HttpReply reply;
    reply.status = res.result_int();
    for (const auto& field : res) {
        reply.headers[lowercase(std::string(field.name_string()))] = std::string(field.value());
    }
    reply.body = res.body();

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return reply;
}

} // namespace vault::test
