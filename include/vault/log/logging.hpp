// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace vault::log {

struct LogConfig {
    std::string level{"info"};  // trace, debug, info, warn, error, critical, off
    std::string file;           // empty disables the file sink
    bool console{true};
    std::size_t max_file_size{5 * 1024 * 1024};
    std::size_t max_files{3};
};

// Install the default logger and the "security" logger. Safe to call again
// to reconfigure.
void init(const LogConfig& config);

// Record an operation on key material. Never pass key bytes or passphrases.
void security_event(std::string_view operation, bool success, std::string_view details);

// Strip userinfo, query and fragment so signed tokens stay out of logs
[[nodiscard]] std::string redact_url(std::string_view url);

} // namespace vault::log
