// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/stream/streaming_server.hpp>
#include <vault/disk/error.hpp>
#include <vault/disk/file.hpp>
#include <vault/stream/range.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <system_error>
#include <utility>

namespace vault::stream {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr const char* SERVICE_NAME = "vault-stream-server";
constexpr const char* CONTENT_PREFIX = "/content/";
constexpr auto REQUEST_TIMEOUT = std::chrono::seconds(30);

void apply_common_headers(Response& res, const Request& req) {
    res.set(http::field::server, SERVICE_NAME);
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::cache_control, "no-cache");
    res.keep_alive(req.keep_alive());
}

// Sets Content-Length from the body; a HEAD response keeps the length but
// drops the body
void finish_payload(Response& res, const Request& req) {
    const auto length = res.body().size();
    if (req.method() == http::verb::head) {
        res.body().clear();
    }
    res.content_length(length);
}

Response text_response(const Request& req, http::status status, std::string_view text) {
    Response res{status, req.version()};
    apply_common_headers(res, req);
    res.set(http::field::content_type, "text/plain");
    res.body().assign(text.begin(), text.end());
    finish_payload(res, req);
    return res;
}

Response json_response(const Request& req, const nlohmann::json& body) {
    Response res{http::status::ok, req.version()};
    apply_common_headers(res, req);
    res.set(http::field::content_type, "application/json");
    const auto text = body.dump();
    res.body().assign(text.begin(), text.end());
    finish_payload(res, req);
    return res;
}

std::string content_range(std::uint64_t start, std::uint64_t end, std::uint64_t size) {
    return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(size);
}

core::Result<std::vector<std::uint8_t>> read_plain_range(const std::filesystem::path& path,
                                                         const ByteRange& range) {
    auto file = disk::File::open_read(path.string());
    if (!file) {
        if (file.error() == disk::DiskErrc::file_not_found) {
            return std::unexpected(core::Error(core::VaultErrc::content_not_found, path.string()));
        }
        return std::unexpected(core::Error(core::VaultErrc::io_error,
                                           path.string() + ": " + file.error().message()));
    }

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(range.length()));
    auto n = file->read_at(range.start, buffer.data(), buffer.size());
    if (!n) {
        return std::unexpected(core::Error(core::VaultErrc::io_error,
                                           path.string() + ": " + n.error().message()));
    }
    buffer.resize(*n);
    return buffer;
}

} // namespace

//=============================================================================
// StreamingServer::Session
//=============================================================================

// One connection. Reads a request, hands it to the worker pool, writes the
// response back on the connection's strand and loops while keep-alive holds.
class StreamingServer::Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, const StreamingServer& server)
        : stream_(std::move(socket))
        , server_(server) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    void do_read() {
        request_ = {};
        stream_.expires_after(REQUEST_TIMEOUT);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
                spdlog::debug("StreamingServer: read failed: {}", ec.message());
            }
            return;
        }

        // No deadline while the worker builds the response
        stream_.expires_never();
        net::post(*server_.workers_, [self = shared_from_this()] {
            auto response = std::make_shared<Response>(self->server_.handle(self->request_));
            net::post(self->stream_.get_executor(), [self, response] {
                self->do_write(response);
            });
        });
    }

    void do_write(std::shared_ptr<Response> response) {
        response_ = std::move(response);
        stream_.expires_after(REQUEST_TIMEOUT);
        http::async_write(stream_, *response_,
                          beast::bind_front_handler(&Session::on_write, shared_from_this(),
                                                    response_->keep_alive()));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t /*bytes*/) {
        response_.reset();
        if (ec) {
            spdlog::debug("StreamingServer: write failed: {}", ec.message());
            return;
        }
        if (!keep_alive) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    Request request_;
    std::shared_ptr<Response> response_;
    const StreamingServer& server_;
};

//=============================================================================
// StreamingServer
//=============================================================================

StreamingServer::StreamingServer(std::shared_ptr<crypto::EncryptionManager> encryption,
                                 std::size_t threads,
                                 std::shared_ptr<core::EventSink> events)
    : encryption_(std::move(encryption))
    , events_(std::move(events))
    , thread_count_(threads == 0 ? 1 : threads) {}

StreamingServer::~StreamingServer() {
    stop();
}

core::Result<std::uint16_t> StreamingServer::start() {
    std::lock_guard lock(lifecycle_mutex_);
    if (running_) {
        return port_.load();
    }

    auto ioc = std::make_unique<net::io_context>(static_cast<int>(thread_count_));
    auto acceptor = std::make_unique<tcp::acceptor>(net::make_strand(*ioc));

    const tcp::endpoint endpoint(net::ip::make_address_v4("127.0.0.1"), 0);
    auto fail = [](const char* what, const beast::error_code& ec) {
        spdlog::error("StreamingServer: {} failed: {}", what, ec.message());
        return std::unexpected(core::Error(core::VaultErrc::server_error,
                                           std::string(what) + ": " + ec.message()));
    };

    beast::error_code ec;
    acceptor->open(endpoint.protocol(), ec);
    if (ec) return fail("open", ec);
    acceptor->set_option(net::socket_base::reuse_address(true), ec);
    if (ec) return fail("set_option", ec);
    acceptor->bind(endpoint, ec);
    if (ec) return fail("bind", ec);
    acceptor->listen(net::socket_base::max_listen_connections, ec);
    if (ec) return fail("listen", ec);
    const auto bound = acceptor->local_endpoint(ec);
    if (ec) return fail("local_endpoint", ec);

    ioc_ = std::move(ioc);
    acceptor_ = std::move(acceptor);
    workers_ = std::make_unique<net::thread_pool>(thread_count_);
    port_ = bound.port();

    do_accept();

    threads_.reserve(thread_count_);
    for (std::size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([ioc = ioc_.get()] { ioc->run(); });
    }
    running_ = true;

    const auto base_url = "http://127.0.0.1:" + std::to_string(port_.load());
    spdlog::info("StreamingServer: listening on {} ({} threads)", base_url, thread_count_);
    if (events_) {
        events_->on_server_started(port_.load(), base_url);
    }
    return port_.load();
}

void StreamingServer::stop() {
    std::lock_guard lock(lifecycle_mutex_);
    if (!running_) return;

    ioc_->stop();
    threads_.clear();  // jthread joins

    // In-flight workers finish and post into the stopped context
    workers_->stop();
    workers_->join();

    beast::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
    workers_.reset();
    ioc_.reset();

    running_ = false;
    spdlog::info("StreamingServer: stopped (port {})", port_.load());
    port_ = 0;
}

void StreamingServer::do_accept() {
    acceptor_->async_accept(net::make_strand(*ioc_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            spdlog::warn("StreamingServer: accept failed: {}", ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), *this)->run();
        }
        if (acceptor_ && acceptor_->is_open()) {
            do_accept();
        }
    });
}

core::Result<std::string> StreamingServer::content_url(std::string_view key) const {
    if (!running_) {
        return std::unexpected(core::Error(core::VaultErrc::server_error, "server not running"));
    }
    return "http://127.0.0.1:" + std::to_string(port_.load()) + CONTENT_PREFIX + std::string(key);
}

ServerStatus StreamingServer::status() const {
    return ServerStatus{running_.load(), port_.load(), registry_.size()};
}

core::Result<void> StreamingServer::register_content(std::string key,
                                                     const std::filesystem::path& file_path,
                                                     bool encrypted,
                                                     std::optional<std::string> content_type) {
    if (key.empty()) {
        return std::unexpected(core::Error(core::VaultErrc::invalid_input, "empty content key"));
    }

    std::error_code ec;
    const auto on_disk = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return std::unexpected(core::Error(core::VaultErrc::content_not_found,
                                           file_path.string() + ": " + ec.message()));
    }

    std::uint64_t size = on_disk;
    if (encrypted) {
        auto plain = crypto::EncryptionManager::plaintext_size(file_path);
        if (!plain) return std::unexpected(plain.error());
        size = *plain;
    }

    StreamRegistration entry;
    entry.key = std::move(key);
    entry.file_path = file_path;
    entry.encrypted = encrypted;
    entry.content_type = content_type ? std::move(*content_type) : guess_content_type(file_path);
    entry.file_size = size;

    spdlog::info("StreamingServer: registered {} ({} bytes, {}, encrypted: {})",
                 entry.key, entry.file_size, entry.content_type, entry.encrypted);
    registry_.insert(std::move(entry));
    return {};
}

bool StreamingServer::unregister_content(std::string_view key) {
    const bool removed = registry_.remove(key);
    if (removed) {
        spdlog::info("StreamingServer: unregistered {}", key);
    }
    return removed;
}

Response StreamingServer::handle(const Request& request) const {
    const auto target = request.target();
    std::string_view path(target.data(), target.size());
    path = path.substr(0, path.find('?'));

    if (path == "/health") {
        return health_response(request);
    }
    if (path == "/status") {
        return status_response(request);
    }
    if (path.starts_with(CONTENT_PREFIX)) {
        const auto key = path.substr(std::string_view(CONTENT_PREFIX).size());
        if (key.empty()) {
            return text_response(request, http::status::not_found, "Content not found");
        }

        switch (request.method()) {
            case http::verb::get:
            case http::verb::head:
                return serve_content(request, key);
            case http::verb::options: {
                Response res{http::status::no_content, request.version()};
                apply_common_headers(res, request);
                res.set(http::field::access_control_allow_methods, "GET, HEAD, OPTIONS");
                res.set(http::field::access_control_allow_headers, "Range");
                res.set(http::field::access_control_expose_headers,
                        "Content-Range, Content-Length, Accept-Ranges");
                return res;
            }
            default: {
                auto res = text_response(request, http::status::method_not_allowed, "Method not allowed");
                res.set(http::field::allow, "GET, HEAD, OPTIONS");
                return res;
            }
        }
    }
    return text_response(request, http::status::not_found, "Not found");
}

Response StreamingServer::serve_content(const Request& request, std::string_view key) const {
    auto entry = registry_.find(key);
    if (!entry) {
        return text_response(request, http::status::not_found, "Content not found");
    }

    const auto size = entry->file_size;
    ByteRange range{0, size == 0 ? 0 : size - 1};
    bool partial = false;

    if (auto it = request.find(http::field::range); it != request.end()) {
        const auto value = it->value();
        auto parsed = parse_range(std::string_view(value.data(), value.size()), size);
        if (!parsed) {
            spdlog::debug("StreamingServer: unsatisfiable range for {}: {}", key, parsed.error().message());
            auto res = text_response(request, http::status::range_not_satisfiable, "Range not satisfiable");
            res.set(http::field::content_range, "bytes */" + std::to_string(size));
            return res;
        }
        range = *parsed;
        partial = is_partial(range, size);
    }

    Response res{partial ? http::status::partial_content : http::status::ok, request.version()};
    apply_common_headers(res, request);
    res.set(http::field::content_type, entry->content_type);
    res.set(http::field::accept_ranges, "bytes");

    if (size == 0) {
        res.content_length(0);
        return res;
    }
    if (request.method() == http::verb::head) {
        if (partial) {
            res.set(http::field::content_range, content_range(range.start, range.end, size));
        }
        res.content_length(range.length());
        return res;
    }

    auto data = read_range(*entry, range);

    if (!data) {
        if (data.error().is(core::VaultErrc::content_not_found)) {
            spdlog::warn("StreamingServer: file of {} disappeared: {}", key, data.error().message());
            return text_response(request, http::status::not_found, "Content not found");
        }
        spdlog::error("StreamingServer: cannot serve {} [{}-{}]: {}",
                      key, range.start, range.end, data.error().message());
        return text_response(request, http::status::internal_server_error, "Failed to read content");
    }
    if (data->empty()) {
        spdlog::error("StreamingServer: {} is shorter than registered ({} bytes)", key, size);
        return text_response(request, http::status::internal_server_error, "Failed to read content");
    }
    if (data->size() < range.length()) {
        spdlog::warn("StreamingServer: short read for {}: {} of {} bytes", key, data->size(), range.length());
        range.end = range.start + data->size() - 1;
    }

    if (partial) {
        res.set(http::field::content_range, content_range(range.start, range.end, size));
    }
    res.body() = std::move(*data);
    res.content_length(res.body().size());
    return res;
}

core::Result<std::vector<std::uint8_t>>
StreamingServer::read_range(const StreamRegistration& entry, const ByteRange& range) const {
    if (!entry.encrypted) {
        return read_plain_range(entry.file_path, range);
    }
    if (!encryption_) {
        return std::unexpected(core::Error(core::VaultErrc::encryption_failed, "no encryption manager"));
    }
    return encryption_->decrypt_range(entry.file_path, range.start, range.end);
}

Response StreamingServer::health_response(const Request& request) const {
    return json_response(request, {{"status", "ok"}, {"service", SERVICE_NAME}});
}

Response StreamingServer::status_response(const Request& request) const {
    const auto summary = registry_.summary();
    return json_response(request, {
        {"status", "ok"},
        {"service", SERVICE_NAME},
        {"active_streams", summary.active_streams},
        {"encrypted_streams", summary.encrypted_streams},
        {"unencrypted_streams", summary.unencrypted_streams},
        {"total_content_size_bytes", summary.total_content_size_bytes},
    });
}

} // namespace vault::stream
