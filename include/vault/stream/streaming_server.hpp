// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/config.hpp>
#include <vault/core/error.hpp>
#include <vault/core/events.hpp>
#include <vault/crypto/encryption_manager.hpp>
#include <vault/stream/range.hpp>
#include <vault/stream/registry.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace vault::stream {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::vector_body<std::uint8_t>>;

struct ServerStatus {
    bool running{false};
    std::uint16_t port{0};
    std::size_t active_streams{0};
};

// Loopback HTTP server that plays vault content back with byte-range support.
//
// Routes:
//   GET|HEAD|OPTIONS /content/{key}
//   GET /health
//   GET /status
//
// Socket I/O runs on an io_context served by a fixed set of threads. File
// reads and decryption are posted to a separate worker pool.
class StreamingServer {
public:
    explicit StreamingServer(std::shared_ptr<crypto::EncryptionManager> encryption,
                             std::size_t threads = core::SERVER_THREADS,
                             std::shared_ptr<core::EventSink> events = nullptr);
    ~StreamingServer();

    StreamingServer(const StreamingServer&) = delete;
    StreamingServer& operator=(const StreamingServer&) = delete;

    // Bind 127.0.0.1 on an ephemeral port and start accepting.
    // Returns the existing port when already running.
    [[nodiscard]] core::Result<std::uint16_t> start();

    // Close the listener and join all threads. Safe to call when stopped.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] std::uint16_t port() const noexcept { return port_.load(); }

    // http://127.0.0.1:{port}/content/{key}; server_error when stopped
    [[nodiscard]] core::Result<std::string> content_url(std::string_view key) const;

    [[nodiscard]] ServerStatus status() const;

    // Stat the file and make it servable under `key`. Encrypted files are
    // registered with their plaintext size.
    [[nodiscard]] core::Result<void> register_content(std::string key,
                                                      const std::filesystem::path& file_path,
                                                      bool encrypted,
                                                      std::optional<std::string> content_type = std::nullopt);

    // Requests already being served keep their buffers
    bool unregister_content(std::string_view key);

    [[nodiscard]] const StreamRegistry& registry() const noexcept { return registry_; }

    // Build the response for one request. Blocks on disk and crypto.
    [[nodiscard]] Response handle(const Request& request) const;

private:
    class Session;

    void do_accept();

    [[nodiscard]] Response serve_content(const Request& request, std::string_view key) const;
    [[nodiscard]] core::Result<std::vector<std::uint8_t>>
    read_range(const StreamRegistration& entry, const ByteRange& range) const;
    [[nodiscard]] Response health_response(const Request& request) const;
    [[nodiscard]] Response status_response(const Request& request) const;

    std::shared_ptr<crypto::EncryptionManager> encryption_;
    std::shared_ptr<core::EventSink> events_;
    std::size_t thread_count_;

    StreamRegistry registry_;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<boost::asio::io_context> ioc_;
    std::unique_ptr<boost::asio::thread_pool> workers_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::vector<std::jthread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> port_{0};
};

} // namespace vault::stream
