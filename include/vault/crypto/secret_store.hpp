// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vault/core/error.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace vault::crypto {

// Named secrets persisted outside the vault. Failures are
// secret_store_unavailable.
class SecretStore {
public:
    virtual ~SecretStore() = default;

    // nullopt when no entry exists
    [[nodiscard]] virtual core::Result<std::optional<std::string>> get(std::string_view name) = 0;
    [[nodiscard]] virtual core::Result<void> set(std::string_view name, std::string_view value) = 0;

    // Removing a missing entry succeeds
    [[nodiscard]] virtual core::Result<void> remove(std::string_view name) = 0;
};

// Desktop keyring through the freedesktop Secret Service (libsecret).
// Entries live under the "vault" schema, keyed by service and name.
class LibsecretSecretStore final : public SecretStore {
public:
    explicit LibsecretSecretStore(std::string service = "vault");

    [[nodiscard]] core::Result<std::optional<std::string>> get(std::string_view name) override;
    [[nodiscard]] core::Result<void> set(std::string_view name, std::string_view value) override;
    [[nodiscard]] core::Result<void> remove(std::string_view name) override;

    [[nodiscard]] const std::string& service() const noexcept { return service_; }

private:
    std::string service_;
};

} // namespace vault::crypto
