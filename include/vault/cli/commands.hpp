// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vault::cli {

// Exit code, or the error that ended the command
using CliResult = std::expected<int, core::Error>;

// Command line arguments
struct CliArgs {
    std::string command;
    std::vector<std::string> operands;
    std::string config_path;
    std::optional<bool> encrypt;        // Overrides encrypt_downloads
    std::optional<std::uint64_t> max_age_seconds;
    bool events{false};                 // JSON event lines on stdout
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                  // Set when parsing failed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Dispatch to the named command
[[nodiscard]] CliResult run(const CliArgs& args);

// download <claim_id> <quality> <url>
[[nodiscard]] CliResult download(const CliArgs& args);

// serve <vault-file>...
[[nodiscard]] CliResult serve(const CliArgs& args);

// encrypt [passphrase]; falls back to $VAULT_PASSPHRASE
[[nodiscard]] CliResult enable_encryption(const CliArgs& args);

// disable
[[nodiscard]] CliResult disable_encryption(const CliArgs& args);

// decrypt <vault-file> <output>
[[nodiscard]] CliResult decrypt(const CliArgs& args);

// cleanup <claim_id> <quality>
[[nodiscard]] CliResult cleanup(const CliArgs& args);

// delete <claim_id> <quality> <filename>
[[nodiscard]] CliResult remove(const CliArgs& args);

// sweep [--max-age seconds]
[[nodiscard]] CliResult sweep(const CliArgs& args);

// config: print the effective configuration
[[nodiscard]] CliResult show_config(const CliArgs& args);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace vault::cli
