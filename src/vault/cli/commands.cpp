// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/cli/commands.hpp>
#include <vault/cli/progress_bar.hpp>
#include <vault/core/config.hpp>
#include <vault/core/download_manager.hpp>
#include <vault/core/events.hpp>
#include <vault/core/http_session.hpp>
#include <vault/crypto/encryption_manager.hpp>
#include <vault/crypto/secret_store.hpp>
#include <vault/log/logging.hpp>
#include <vault/stream/streaming_server.hpp>
#include <vault/version.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

namespace vault::cli {

namespace {

struct Context {
    core::VaultConfig config;
    std::shared_ptr<crypto::EncryptionManager> encryption;
};

// curl_global_init/cleanup for the lifetime of a command
struct CurlGlobal {
    CurlGlobal() { core::HttpSession::global_init(); }
    ~CurlGlobal() { core::HttpSession::global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

core::Error usage(std::string_view text) {
    return core::Error(core::VaultErrc::invalid_input, "usage: vaultctl " + std::string(text));
}

fs::path default_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return fs::path(xdg) / "vault" / "config.json";
    }
    return core::expand_home("~/.config/vault/config.json");
}

core::Result<Context> open_context(const CliArgs& args) {
    const auto path = args.config_path.empty() ? default_config_path() : core::expand_home(args.config_path);
    auto config = core::VaultConfig::load(path);
    if (!config) return std::unexpected(config.error());

    log::LogConfig log_config;
    log_config.level = args.verbose ? "debug" : (args.quiet ? "warn" : config->log_level);
    log_config.file = config->log_file;
    log::init(log_config);

    Context ctx{std::move(*config), nullptr};
    auto secrets = std::make_shared<crypto::LibsecretSecretStore>(ctx.config.secret_service);
    ctx.encryption = std::make_shared<crypto::EncryptionManager>(secrets);

    auto loaded = ctx.encryption->load();
    if (!loaded) {
        spdlog::warn("vaultctl: encryption key unavailable: {}", loaded.error().message());
    } else if (*loaded) {
        spdlog::debug("vaultctl: encryption key loaded");
    }
    return ctx;
}

std::shared_ptr<core::EventSink> make_sink(const CliArgs& args) {
    if (args.events) {
        return std::make_shared<core::JsonLineEventSink>(std::cout);
    }
    if (!args.quiet) {
        return std::make_shared<ProgressEventSink>(std::cerr);
    }
    return nullptr;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            args.error = "missing value for " + std::string(option);
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--events") {
            args.events = true;
        } else if (arg == "--encrypt") {
            args.encrypt = true;
        } else if (arg == "--no-encrypt") {
            args.encrypt = false;
        } else if (arg == "-c" || arg == "--config") {
            auto value = value_of(i, arg);
            if (!value) return args;
            args.config_path = *value;
        } else if (arg == "--max-age") {
            auto value = value_of(i, arg);
            if (!value) return args;
            char* end = nullptr;
            const auto seconds = std::strtoull(value->c_str(), &end, 10);
            if (value->empty() || end == nullptr || *end != '\0') {
                args.error = "invalid --max-age: " + *value;
                return args;
            }
            args.max_age_seconds = seconds;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            args.error = "unknown option: " + arg;
            return args;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.operands.push_back(arg);
        }
    }

    return args;
}

CliResult run(const CliArgs& args) {
    if (args.command == "download") return download(args);
    if (args.command == "serve") return serve(args);
    if (args.command == "encrypt") return enable_encryption(args);
    if (args.command == "disable") return disable_encryption(args);
    if (args.command == "decrypt") return decrypt(args);
    if (args.command == "cleanup") return cleanup(args);
    if (args.command == "delete") return remove(args);
    if (args.command == "sweep") return sweep(args);
    if (args.command == "config") return show_config(args);
    return std::unexpected(core::Error(core::VaultErrc::invalid_input,
                                       "unknown command: " + args.command));
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) {
    if (args.operands.size() != 3) {
        return std::unexpected(usage("download <claim_id> <quality> <url>"));
    }
    auto ctx = open_context(args);
    if (!ctx) return std::unexpected(ctx.error());

    CurlGlobal curl;
    core::DownloadManager manager(ctx->config, ctx->encryption, make_sink(args));
    if (auto init = manager.initialize(); !init) {
        return std::unexpected(init.error());
    }

    core::DownloadRequest request{args.operands[0], args.operands[1], args.operands[2]};
    const bool encrypt = args.encrypt.value_or(ctx->config.encrypt_downloads);

    auto result = manager.download(request, encrypt);
    if (!result) {
        return std::unexpected(result.error());
    }

    if (!args.events) {
        nlohmann::json metadata = *result;
        std::cout << metadata.dump(2) << std::endl;
    }
    if (args.verbose) {
        nlohmann::json stats = manager.stats();
        std::cerr << "Stats: " << stats.dump() << std::endl;
    }
    return 0;
}

CliResult serve(const CliArgs& args) {
    if (args.operands.empty()) {
        return std::unexpected(usage("serve <vault-file>..."));
    }
    auto ctx = open_context(args);
    if (!ctx) return std::unexpected(ctx.error());

    core::DownloadManager manager(ctx->config, ctx->encryption);
    std::shared_ptr<core::EventSink> sink;
    if (args.events) {
        sink = std::make_shared<core::JsonLineEventSink>(std::cout);
    }
    stream::StreamingServer server(ctx->encryption, ctx->config.server_threads, sink);

    std::vector<std::string> keys;
    for (const auto& operand : args.operands) {
        fs::path path(operand);
        if (operand.find('/') == std::string::npos) {
            auto resolved = manager.content_path(operand);
            if (!resolved) return std::unexpected(resolved.error());
            path = *resolved;
        }

        // <key>.mp4 is plain, <token>.bin is an encrypted container
        const auto key = path.stem().string();
        const bool encrypted = path.extension() == ".bin";
        std::optional<std::string> content_type;
        if (encrypted) {
            content_type = "video/mp4";
        }
        if (auto registered = server.register_content(key, path, encrypted, content_type); !registered) {
            return std::unexpected(registered.error());
        }
        keys.push_back(key);
    }

    auto port = server.start();
    if (!port) return std::unexpected(port.error());

    if (!args.events) {
        for (const auto& key : keys) {
            auto url = server.content_url(key);
            if (url) {
                std::cout << key << " " << *url << std::endl;
            }
        }
        std::cout << "Press Ctrl+C to stop" << std::endl;
    }

    boost::asio::io_context signals_ctx;
    boost::asio::signal_set signals(signals_ctx, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& /*ec*/, int signal) {
        spdlog::info("vaultctl: received signal {}, shutting down", signal);
    });
    signals_ctx.run();

    server.stop();
    return 0;
}

CliResult enable_encryption(const CliArgs& args) {
    std::string passphrase;
    if (!args.operands.empty()) {
        passphrase = args.operands[0];
    } else if (const char* env = std::getenv("VAULT_PASSPHRASE"); env != nullptr) {
        passphrase = env;
    }
    if (passphrase.empty()) {
        return std::unexpected(usage("encrypt <passphrase> (or set VAULT_PASSPHRASE)"));
    }

    auto ctx = open_context(args);
    if (!ctx) return std::unexpected(ctx.error());

    if (auto enabled = ctx->encryption->enable(passphrase); !enabled) {
        return std::unexpected(enabled.error());
    }
    if (!args.quiet) {
        std::cout << "Encryption enabled" << std::endl;
    }
    return 0;
}

CliResult disable_encryption(const CliArgs& args) {
    auto ctx = open_context(args);
    if (!ctx) return std::unexpected(ctx.error());

    if (auto disabled = ctx->encryption->disable(); !disabled) {
        return std::unexpected(disabled.error());
    }
    if (!args.quiet) {
        std::cout << "Encryption disabled" << std::endl;
    }
    return 0;
}

CliResult decrypt(const CliArgs& args) {
    if (args.operands.size() != 2) {
        return std::unexpected(usage("decrypt <vault-file> <output>"));
    }
    auto ctx = open_context(args);
    if (!ctx) return std::unexpected(ctx.error());

    if (!ctx->encryption->is_enabled()) {
        return std::unexpected(core::Error(core::VaultErrc::encryption_failed,
                                           "no encryption key configured"));
    }
    if (auto result = ctx->encryption->decrypt_file(args.operands[0], args.operands[1]); !result) {
        return std::unexpected(result.error());
    }
    if (!args.quiet) {
        std::cout << "Decrypted to " << args.operands[1] << std::endl;
    }
    return 0;
}

CliResult cleanup(const CliArgs& args) {
    if (args.operands.size() != 2) {
        return std::unexpected(usage("cleanup <claim_id> <quality>"));
    }
    auto ctx = open_context(args);
    if (!ctx) return std::unexpected(ctx.error());

    core::DownloadManager manager(ctx->config, ctx->encryption);
    if (auto result = manager.cleanup_failed(args.operands[0], args.operands[1]); !result) {
        return std::unexpected(result.error());
    }
    return 0;
}

CliResult remove(const CliArgs& args) {
    if (args.operands.size() != 3) {
        return std::unexpected(usage("delete <claim_id> <quality> <filename>"));
    }
    auto ctx = open_context(args);
    if (!ctx) return std::unexpected(ctx.error());

    core::DownloadManager manager(ctx->config, ctx->encryption);
    auto result = manager.delete_content(args.operands[0], args.operands[1], args.operands[2]);
    if (!result) {
        return std::unexpected(result.error());
    }
    return 0;
}

CliResult sweep(const CliArgs& args) {
    auto ctx = open_context(args);
    if (!ctx) return std::unexpected(ctx.error());

    core::DownloadManager manager(ctx->config, ctx->encryption);
    auto removed = args.max_age_seconds
        ? manager.sweep_stale_locks(std::chrono::seconds(*args.max_age_seconds))
        : manager.sweep_stale_locks();
    if (!removed) {
        return std::unexpected(removed.error());
    }
    if (!args.quiet) {
        std::cout << "Removed " << *removed << " stale lock(s)" << std::endl;
    }
    return 0;
}

CliResult show_config(const CliArgs& args) {
    auto ctx = open_context(args);
    if (!ctx) return std::unexpected(ctx.error());

    std::cout << ctx->config.to_json() << std::endl;
    return 0;
}

void print_help(std::string_view program_name) {
    std::cout << "Vault " << vault::version.to_string() << " - offline media vault\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ARGS]...\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  download <claim_id> <quality> <url>     Download (or resume) into the vault\n";
    std::cout << "  serve <vault-file>...                   Stream vault files over loopback HTTP\n";
    std::cout << "  encrypt [passphrase]                    Enable encryption at rest\n";
    std::cout << "  disable                                 Forget the encryption key\n";
    std::cout << "  decrypt <vault-file> <output>           Decrypt a vault file\n";
    std::cout << "  cleanup <claim_id> <quality>            Remove partial, lock and validator files\n";
    std::cout << "  delete <claim_id> <quality> <filename>  Delete downloaded content\n";
    std::cout << "  sweep                                   Remove stale lock markers\n";
    std::cout << "  config                                  Print the effective configuration\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             No progress bar, warnings only\n";
    std::cout << "  -c, --config <FILE>     Configuration file (default: ~/.config/vault/config.json)\n";
    std::cout << "      --events            Print events as JSON lines on stdout\n";
    std::cout << "      --encrypt           Encrypt this download\n";
    std::cout << "      --no-encrypt        Do not encrypt this download\n";
    std::cout << "      --max-age <SECS>    Lock age for sweep (default: 3600)\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " download abc123 720p https://cdn.example.com/v.mp4\n";
    std::cout << "  " << program_name << " serve abc123-720p.mp4\n";
}

void print_version() {
    std::cout << "Vault " << vault::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << " with libcurl, OpenSSL, Boost.Beast\n";
}

} // namespace vault::cli
